#include "binder.hpp"

#include "constant_evaluator.hpp"
#include "storage_types.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>
#include <utility>

namespace enumerant::semantic
{
    namespace
    {
        std::optional<std::string> argumentText(const frontend::AttributeArgument& argument)
        {
            switch (argument.valueKind)
            {
            case frontend::AttributeValueKind::String:
            case frontend::AttributeValueKind::Integer:
            case frontend::AttributeValueKind::Boolean:
                return argument.value;
            case frontend::AttributeValueKind::Null:
            case frontend::AttributeValueKind::Identifier:
            case frontend::AttributeValueKind::Missing:
                break;
            }
            return std::nullopt;
        }
    } // namespace

    Binder::Binder(std::vector<BindingUnit> units)
        : m_units(std::move(units))
    {
    }

    SymbolTable Binder::bind()
    {
        m_diagnostics.clear();
        m_typeSymbols.clear();

        SymbolTable table;

        std::vector<const BindingUnit*> accepted;
        accepted.reserve(m_units.size());
        for (const auto& unit : m_units)
        {
            if (registerUnit(unit, table))
            {
                accepted.push_back(&unit);
            }
        }

        for (const BindingUnit* unit : accepted)
        {
            checkImports(*unit, table);
        }

        for (const BindingUnit* unit : accepted)
        {
            const UnitScope* scope = table.unitScope(unit->sourcePath);
            if (scope == nullptr)
            {
                continue;
            }

            for (const auto& blueprint : unit->ast->blueprints)
            {
                if (!blueprint.name.empty())
                {
                    registerTypeName(qualify(scope->moduleName, blueprint.name), "blueprint", blueprint.span, unit->sourcePath);
                }
            }

            for (const auto& declaration : unit->ast->attributeTypes)
            {
                registerAttributeType(declaration, *scope, table);
            }
        }

        // Attribute names resolve against the complete set of attribute types.
        for (const BindingUnit* unit : accepted)
        {
            const UnitScope* scope = table.unitScope(unit->sourcePath);
            if (scope == nullptr)
            {
                continue;
            }

            for (const auto& declaration : unit->ast->enumerations)
            {
                registerEnumeration(declaration, *scope, table);
            }
        }

        return table;
    }

    const std::vector<Diagnostic>& Binder::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    bool Binder::registerUnit(const BindingUnit& unit, SymbolTable& table)
    {
        if (unit.ast == nullptr)
        {
            return false;
        }

        UnitScope scope;
        scope.sourcePath = unit.sourcePath;
        scope.moduleName = unit.ast->module.isDeclared ? unit.ast->module.moduleName : std::string{};

        std::unordered_set<std::string> seenImports;
        for (const auto& importDecl : unit.ast->imports)
        {
            if (importDecl.modulePath.empty())
            {
                continue;
            }

            if (!seenImports.insert(importDecl.modulePath).second)
            {
                emitError("ENR-E2218", "Duplicate import '" + importDecl.modulePath + "' in module.", importDecl.span, unit.sourcePath);
                continue;
            }

            scope.imports.emplace_back(importDecl.modulePath);
        }

        if (!table.m_unitIndex.emplace(scope.sourcePath, table.m_units.size()).second)
        {
            emitError("ENR-E2221", "Source unit '" + scope.sourcePath + "' was supplied more than once.", unit.ast->module.span, unit.sourcePath);
            return false;
        }

        if (!scope.moduleName.empty())
        {
            table.m_modules.insert(scope.moduleName);
        }
        table.m_units.emplace_back(std::move(scope));
        return true;
    }

    void Binder::checkImports(const BindingUnit& unit, const SymbolTable& table)
    {
        if (unit.ast == nullptr)
        {
            return;
        }

        const UnitScope* scope = table.unitScope(unit.sourcePath);
        if (scope == nullptr)
        {
            return;
        }

        for (const auto& importDecl : unit.ast->imports)
        {
            if (importDecl.modulePath.empty()
                || std::find(scope->imports.begin(), scope->imports.end(), importDecl.modulePath) == scope->imports.end())
            {
                continue;
            }

            if (!scope->moduleName.empty() && importDecl.modulePath == scope->moduleName)
            {
                emitError("ENR-E2219",
                    "Module '" + scope->moduleName + "' cannot import itself ('" + importDecl.modulePath + "').",
                    importDecl.span,
                    unit.sourcePath);
            }
            else if (!table.hasModule(importDecl.modulePath))
            {
                emitWarning("ENR-W2220",
                    "Import '" + importDecl.modulePath + "' does not name a module of this program.",
                    importDecl.span,
                    unit.sourcePath);
            }
        }
    }

    bool Binder::registerTypeName(const std::string& qualifiedName, std::string_view kind, SourceSpan span, const std::string& sourcePath)
    {
        auto inserted = m_typeSymbols.emplace(qualifiedName, span);
        if (!inserted.second)
        {
            emitError("ENR-E2211", "Duplicate " + std::string{kind} + " '" + qualifiedName + "' in program.", span, sourcePath);
            return false;
        }
        return true;
    }

    void Binder::registerAttributeType(const frontend::AttributeDeclaration& declaration, const UnitScope& scope, SymbolTable& table)
    {
        if (declaration.name.empty())
        {
            return;
        }

        const std::string qualifiedName = qualify(scope.moduleName, declaration.name);
        if (!registerTypeName(qualifiedName, "attribute", declaration.span, scope.sourcePath))
        {
            return;
        }

        AttributeTypeSymbol symbol;
        symbol.name = declaration.name;
        symbol.containingScope = scope.moduleName;
        symbol.sourcePath = scope.sourcePath;
        symbol.accessibility = accessibilityFromModifiers(declaration.modifiers);
        symbol.span = declaration.span;

        std::unordered_set<std::string> seenOptions;
        for (const auto& option : declaration.options)
        {
            if (option.name.empty())
            {
                continue;
            }
            if (!seenOptions.insert(option.name).second)
            {
                emitError("ENR-E2201",
                    "Duplicate option '" + option.name + "' in attribute '" + qualifiedName + "'.",
                    option.span,
                    scope.sourcePath);
                continue;
            }
            symbol.optionNames.emplace_back(option.name);
        }

        table.m_attributeTypeIndex.emplace(qualifiedName, table.m_attributeTypes.size());
        table.m_attributeTypes.emplace_back(std::move(symbol));
    }

    void Binder::registerEnumeration(const frontend::EnumerationDeclaration& declaration, const UnitScope& scope, SymbolTable& table)
    {
        if (declaration.name.empty())
        {
            return;
        }

        const std::string qualifiedName = qualify(scope.moduleName, declaration.name);
        if (!registerTypeName(qualifiedName, "enumeration", declaration.span, scope.sourcePath))
        {
            return;
        }

        EnumerationSymbol symbol;
        symbol.name = declaration.name;
        symbol.containingScope = scope.moduleName;
        symbol.sourcePath = scope.sourcePath;
        symbol.accessibility = accessibilityFromModifiers(declaration.modifiers);
        symbol.span = declaration.span;

        const StorageType* storage = declaration.underlyingType.has_value() ? findStorageType(*declaration.underlyingType) : nullptr;
        if (storage != nullptr)
        {
            symbol.underlyingType = std::string{storage->normalizedName};
        }
        else
        {
            symbol.underlyingType = declaration.underlyingType;
        }

        checkDuplicateAttributes(declaration.attributes, scope.sourcePath);
        for (const auto& attribute : declaration.attributes)
        {
            symbol.attributes.emplace_back(convertAttribute(attribute, scope.sourcePath, table));
        }

        if (declaration.underlyingType.has_value() && storage == nullptr)
        {
            emitError("ENR-E2215",
                "Enumeration '" + qualifiedName + "' storage type '" + *declaration.underlyingType + "' must be an integral type.",
                declaration.underlyingTypeSpan.value_or(declaration.span),
                scope.sourcePath);
        }

        symbol.members = bindMembers(declaration, declaration.underlyingType, scope.sourcePath);

        table.m_enumerationIndex.emplace(qualifiedName, table.m_enumerations.size());
        table.m_declarationIndex.emplace(&declaration, table.m_enumerations.size());
        table.m_enumerations.emplace_back(std::move(symbol));
    }

    AttributeData Binder::convertAttribute(const frontend::Attribute& attribute, const std::string& sourcePath, const SymbolTable& table)
    {
        AttributeData converted;
        converted.writtenName = attribute.name;
        converted.span = attribute.span;

        const AttributeTypeSymbol* attributeType = table.resolveAttributeType(attribute.name, sourcePath);
        if (attributeType != nullptr)
        {
            converted.attributeClass = attributeType->qualifiedName();
        }

        for (const auto& argument : attribute.arguments)
        {
            if (argument.name.empty())
            {
                converted.positionalArguments.emplace_back(argumentText(argument));
                continue;
            }

            if (attributeType != nullptr
                && std::find(attributeType->optionNames.begin(), attributeType->optionNames.end(), argument.name)
                       == attributeType->optionNames.end())
            {
                emitWarning("ENR-W2203",
                    "Attribute '" + *converted.attributeClass + "' has no option named '" + argument.name + "'.",
                    argument.span,
                    sourcePath);
            }

            NamedArgument named;
            named.name = argument.name;
            named.value = argumentText(argument);
            named.span = argument.span;
            converted.namedArguments.emplace_back(std::move(named));
        }

        return converted;
    }

    std::vector<EnumerationMemberSymbol> Binder::bindMembers(const frontend::EnumerationDeclaration& declaration,
                                                             const std::optional<std::string>& storageType,
                                                             const std::string& sourcePath)
    {
        std::vector<EnumerationMemberSymbol> members;
        members.reserve(declaration.members.size());

        const StorageType* storage = findStorageType(storageType.value_or("integer32"));
        const bool isUnsigned = storage != nullptr && storage->isUnsigned;
        const std::string typeName = storageType.value_or("integer32");

        ConstantEvaluator::MemberValues values;
        std::optional<std::int64_t> previous;
        bool isFirst = true;

        for (const auto& member : declaration.members)
        {
            std::optional<std::int64_t> value;

            if (member.initializer.has_value())
            {
                ConstantEvaluator evaluator{member.initializer->tokens, values, isUnsigned};
                value = evaluator.evaluate();
                if (!value.has_value())
                {
                    emitWarning("ENR-W2217",
                        "Member '" + member.name + "' of enumeration '" + declaration.name + "' has no constant value: "
                            + evaluator.failureReason() + ".",
                        member.initializer->span,
                        sourcePath);
                }
            }
            else if (isFirst)
            {
                value = 0;
            }
            else if (previous.has_value())
            {
                const bool atLimit = isUnsigned
                    ? static_cast<std::uint64_t>(*previous) == std::numeric_limits<std::uint64_t>::max()
                    : *previous == std::numeric_limits<std::int64_t>::max();
                if (atLimit)
                {
                    emitWarning("ENR-W2216",
                        "Member '" + member.name + "' of enumeration '" + declaration.name + "' overflows the implicit increment.",
                        member.span,
                        sourcePath);
                }
                else
                {
                    value = static_cast<std::int64_t>(static_cast<std::uint64_t>(*previous) + 1);
                }
            }
            else
            {
                emitWarning("ENR-W2217",
                    "Member '" + member.name + "' of enumeration '" + declaration.name
                        + "' follows a member without a constant value.",
                    member.span,
                    sourcePath);
            }

            if (value.has_value() && storage != nullptr && !fitsStorage(*storage, *value))
            {
                emitWarning("ENR-W2216",
                    "Member '" + member.name + "' value " + formatStorageValue(typeName, *value) + " does not fit storage type '"
                        + typeName + "'.",
                    member.span,
                    sourcePath);
                value.reset();
            }

            isFirst = false;
            previous = value;

            if (!values.emplace(member.name, value).second)
            {
                emitError("ENR-E2213",
                    "Duplicate member '" + member.name + "' in enumeration '" + declaration.name + "'.",
                    member.span,
                    sourcePath);
                continue;
            }

            EnumerationMemberSymbol symbol;
            symbol.name = member.name;
            symbol.constantValue = value;
            symbol.span = member.span;
            members.emplace_back(std::move(symbol));
        }

        return members;
    }

    template <typename AttributeRange>
    void Binder::checkDuplicateAttributes(const AttributeRange& attributes, const std::string& sourcePath)
    {
        std::unordered_map<std::string, SourceSpan> seen;
        for (const auto& attribute : attributes)
        {
            if (!seen.emplace(attribute.name, attribute.span).second)
            {
                emitError("ENR-E2200", "Duplicate attribute '" + attribute.name + "' is not allowed.", attribute.span, sourcePath);
            }
        }
    }

    void Binder::emitError(const std::string& code, const std::string& message, SourceSpan span, const std::string& sourcePath)
    {
        Diagnostic diag;
        diag.code = code;
        diag.message = message;
        diag.span = span;
        diag.sourcePath = sourcePath;
        m_diagnostics.emplace_back(std::move(diag));
    }

    void Binder::emitWarning(const std::string& code, const std::string& message, SourceSpan span, const std::string& sourcePath)
    {
        Diagnostic diag;
        diag.code = code;
        diag.message = message;
        diag.span = span;
        diag.sourcePath = sourcePath;
        diag.isWarning = true;
        m_diagnostics.emplace_back(std::move(diag));
    }

    template void Binder::checkDuplicateAttributes<std::vector<frontend::Attribute>>(
        const std::vector<frontend::Attribute>& attributes, const std::string& sourcePath);
} // namespace enumerant::semantic
