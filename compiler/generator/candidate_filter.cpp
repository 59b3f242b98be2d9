#include "candidate_filter.hpp"

#include <algorithm>
#include <tuple>

namespace enumerant::generator
{
    std::string SyntaxCandidate::identity() const
    {
        std::string result = tree != nullptr ? tree->path : std::string{};
        result += '#';
        result += std::to_string(ordinal);
        result += ':';
        if (declaration != nullptr)
        {
            result += declaration->name;
        }
        return result;
    }

    std::vector<DeclarationNode> collectDeclarations(const frontend::CompilationUnit& unit)
    {
        std::vector<DeclarationNode> nodes;
        nodes.reserve(unit.functions.size() + unit.blueprints.size() + unit.attributeTypes.size() + unit.enumerations.size());

        for (const auto& fn : unit.functions)
        {
            nodes.push_back(DeclarationNode{DeclarationKind::Function, &fn.attributes, nullptr, 0, fn.span});
        }
        for (const auto& bp : unit.blueprints)
        {
            nodes.push_back(DeclarationNode{DeclarationKind::Blueprint, &bp.attributes, nullptr, 0, bp.span});
        }
        for (const auto& declaration : unit.attributeTypes)
        {
            nodes.push_back(DeclarationNode{DeclarationKind::Attribute, &declaration.attributes, nullptr, 0, declaration.span});
        }
        for (std::size_t index = 0; index < unit.enumerations.size(); ++index)
        {
            const auto& enumeration = unit.enumerations[index];
            nodes.push_back(DeclarationNode{DeclarationKind::Enumeration, &enumeration.attributes, &enumeration, index, enumeration.span});
        }

        std::stable_sort(nodes.begin(), nodes.end(), [](const DeclarationNode& a, const DeclarationNode& b) {
            return std::tie(a.span.begin.line, a.span.begin.column) < std::tie(b.span.begin.line, b.span.begin.column);
        });
        return nodes;
    }

    bool isSyntaxCandidate(const DeclarationNode& node) noexcept
    {
        return node.kind == DeclarationKind::Enumeration
            && node.enumeration != nullptr
            && node.attributes != nullptr
            && !node.attributes->empty();
    }

    std::vector<SyntaxCandidate> collectSyntaxCandidates(const std::shared_ptr<const frontend::SyntaxTree>& tree)
    {
        std::vector<SyntaxCandidate> candidates;
        if (tree == nullptr)
        {
            return candidates;
        }

        for (const auto& node : collectDeclarations(tree->unit))
        {
            if (isSyntaxCandidate(node))
            {
                candidates.push_back(SyntaxCandidate{tree, node.enumeration, node.enumerationOrdinal});
            }
        }
        return candidates;
    }
} // namespace enumerant::generator
