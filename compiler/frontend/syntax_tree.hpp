#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace enumerant::frontend
{
    /// One parsed source unit. Shared across passes while its text is unchanged, so node
    /// addresses inside `unit` stay stable for as long as any holder keeps the tree alive.
    struct SyntaxTree
    {
        std::string path;
        std::string text;
        CompilationUnit unit;
        std::vector<Diagnostic> diagnostics;
    };

    [[nodiscard]] std::shared_ptr<const SyntaxTree> parseSyntaxTree(std::string_view path, std::string_view text);
} // namespace enumerant::frontend
