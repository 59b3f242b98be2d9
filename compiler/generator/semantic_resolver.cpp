#include "semantic_resolver.hpp"

#include "markers.hpp"

#include <unordered_set>
#include <utility>

namespace enumerant::generator
{
    std::optional<SyntaxCandidate> resolveSemanticTarget(const SyntaxCandidate& candidate,
                                                         const semantic::SymbolTable& symbols)
    {
        if (candidate.tree == nullptr || candidate.declaration == nullptr)
        {
            return std::nullopt;
        }

        for (const auto& attribute : candidate.declaration->attributes)
        {
            const semantic::AttributeTypeSymbol* attributeType
                = symbols.resolveAttributeType(attribute.name, candidate.tree->path);
            if (attributeType == nullptr)
            {
                continue;
            }

            if (classifyMarker(attributeType->qualifiedName()) == MarkerKind::EnumExtensions)
            {
                return candidate;
            }
        }

        return std::nullopt;
    }

    std::vector<SyntaxCandidate> deduplicateCandidates(std::vector<SyntaxCandidate> candidates)
    {
        std::vector<SyntaxCandidate> unique;
        unique.reserve(candidates.size());

        std::unordered_set<const frontend::EnumerationDeclaration*> seen;
        for (auto& candidate : candidates)
        {
            if (seen.insert(candidate.declaration).second)
            {
                unique.emplace_back(std::move(candidate));
            }
        }
        return unique;
    }
} // namespace enumerant::generator
