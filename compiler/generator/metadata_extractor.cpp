#include "metadata_extractor.hpp"

#include "markers.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <string_view>
#include <utility>

namespace enumerant::generator
{
    namespace
    {
        struct MarkerSettings
        {
            std::string outputName;
            std::string outputNamespace;
            bool hasFlags{false};
        };

        MarkerSettings applyExtensionOptions(MarkerSettings settings, const semantic::AttributeData& attribute)
        {
            for (const auto& argument : attribute.namedArguments)
            {
                if (!argument.value.has_value())
                {
                    continue;
                }

                if (argument.name == kExtensionClassNamespaceOption)
                {
                    settings.outputNamespace = *argument.value;
                }
                else if (argument.name == kExtensionClassNameOption)
                {
                    settings.outputName = *argument.value;
                }
            }
            return settings;
        }

        MarkerSettings foldAttribute(MarkerSettings settings, const semantic::AttributeData& attribute)
        {
            if (!attribute.attributeClass.has_value())
            {
                return settings;
            }

            switch (classifyMarker(*attribute.attributeClass))
            {
            case MarkerKind::Flags:
                settings.hasFlags = true;
                return settings;
            case MarkerKind::EnumExtensions:
                return applyExtensionOptions(std::move(settings), attribute);
            case MarkerKind::None:
                break;
            }
            return settings;
        }

        bool isIdentifier(std::string_view text)
        {
            if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) != 0)
            {
                return false;
            }
            return std::all_of(text.begin(), text.end(), [](char ch) {
                return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
            });
        }

        // Empty, or identifiers joined by single dots.
        bool isQualifiedName(std::string_view text)
        {
            while (!text.empty())
            {
                const std::size_t dot = text.find('.');
                if (!isIdentifier(text.substr(0, dot)))
                {
                    return false;
                }
                if (dot == std::string_view::npos)
                {
                    return true;
                }
                text.remove_prefix(dot + 1);
                if (text.empty())
                {
                    return false;
                }
            }
            return true;
        }

        void reportSkip(const SyntaxCandidate& candidate,
                        std::string code,
                        std::string message,
                        std::vector<semantic::Diagnostic>& diagnostics)
        {
            semantic::Diagnostic diag;
            diag.code = std::move(code);
            diag.message = std::move(message);
            if (candidate.declaration != nullptr)
            {
                diag.span = candidate.declaration->span;
            }
            diag.sourcePath = candidate.tree != nullptr ? candidate.tree->path : std::string{};
            diag.isWarning = true;
            diagnostics.emplace_back(std::move(diag));
        }
    } // namespace

    EnumToGenerate describeEnumeration(const semantic::EnumerationSymbol& symbol)
    {
        MarkerSettings defaults;
        defaults.outputName = symbol.name + "Extensions";
        defaults.outputNamespace = symbol.containingScope;

        const MarkerSettings settings
            = std::accumulate(symbol.attributes.begin(), symbol.attributes.end(), std::move(defaults), foldAttribute);

        EnumToGenerate record;
        record.outputName = settings.outputName;
        record.declaredQualifiedName = symbol.qualifiedName();
        record.outputNamespace = settings.outputNamespace;
        record.isPublic = symbol.accessibility == semantic::Accessibility::Public;
        record.hasFlags = settings.hasFlags;
        record.underlyingType = symbol.underlyingType.value_or(kDefaultUnderlyingType);

        record.members.reserve(symbol.members.size());
        for (const auto& member : symbol.members)
        {
            if (member.constantValue.has_value())
            {
                record.members.emplace_back(member.name, *member.constantValue);
            }
        }
        return record;
    }

    std::optional<EnumToGenerate> extractDescription(const SyntaxCandidate& candidate,
                                                     const semantic::SymbolTable& symbols,
                                                     std::vector<semantic::Diagnostic>& diagnostics)
    {
        const semantic::EnumerationSymbol* symbol
            = candidate.declaration != nullptr ? symbols.declaredSymbol(*candidate.declaration) : nullptr;

        if (symbol == nullptr)
        {
            const std::string name = candidate.declaration != nullptr && !candidate.declaration->name.empty()
                ? candidate.declaration->name
                : std::string{"<unnamed>"};
            reportSkip(candidate,
                "ENR-W2301",
                "Enumeration '" + name + "' has no declared symbol; extension generation skipped.",
                diagnostics);
            return std::nullopt;
        }

        EnumToGenerate record = describeEnumeration(*symbol);
        if (!isIdentifier(record.outputName))
        {
            reportSkip(candidate,
                "ENR-W2303",
                "Extension class name '" + record.outputName + "' of enumeration '" + record.declaredQualifiedName
                    + "' is not an identifier; extension generation skipped.",
                diagnostics);
            return std::nullopt;
        }
        if (!isQualifiedName(record.outputNamespace))
        {
            reportSkip(candidate,
                "ENR-W2303",
                "Extension class namespace '" + record.outputNamespace + "' of enumeration '"
                    + record.declaredQualifiedName + "' is not a qualified name; extension generation skipped.",
                diagnostics);
            return std::nullopt;
        }
        return record;
    }
} // namespace enumerant::generator
