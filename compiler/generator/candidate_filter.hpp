#pragma once

#include "syntax_tree.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace enumerant::generator
{
    enum class DeclarationKind
    {
        Function,
        Blueprint,
        Attribute,
        Enumeration
    };

    /// Uniform read-only view over one top-level declaration of a unit.
    struct DeclarationNode
    {
        DeclarationKind kind{DeclarationKind::Function};
        const std::vector<frontend::Attribute>* attributes{nullptr};
        const frontend::EnumerationDeclaration* enumeration{nullptr};
        // Position among the unit's enumerations; meaningful for enumeration nodes only.
        std::size_t enumerationOrdinal{0};
        frontend::SourceSpan span;
    };

    struct SyntaxCandidate
    {
        std::shared_ptr<const frontend::SyntaxTree> tree;
        const frontend::EnumerationDeclaration* declaration{nullptr};
        std::size_t ordinal{0};

        /// Stable identity of the declaration across passes: `<path>#<ordinal>:<name>`.
        [[nodiscard]] std::string identity() const;
    };

    /// Every declaration of `unit`, ordered by source position.
    [[nodiscard]] std::vector<DeclarationNode> collectDeclarations(const frontend::CompilationUnit& unit);

    /// Syntax-only test: an enumeration carrying at least one attribute.
    [[nodiscard]] bool isSyntaxCandidate(const DeclarationNode& node) noexcept;

    [[nodiscard]] std::vector<SyntaxCandidate> collectSyntaxCandidates(const std::shared_ptr<const frontend::SyntaxTree>& tree);
} // namespace enumerant::generator
