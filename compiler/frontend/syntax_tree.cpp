#include "syntax_tree.hpp"

#include "parser.hpp"

#include <utility>

namespace enumerant::frontend
{
    std::shared_ptr<const SyntaxTree> parseSyntaxTree(std::string_view path, std::string_view text)
    {
        auto tree = std::make_shared<SyntaxTree>();
        tree->path = std::string{path};
        tree->text = std::string{text};

        Lexer lexer{tree->text};
        lexer.lex();
        tree->diagnostics = lexer.diagnostics();

        Parser parser{lexer.tokens(), tree->path};
        tree->unit = parser.parse();
        const auto& parserDiagnostics = parser.diagnostics();
        tree->diagnostics.insert(tree->diagnostics.end(), parserDiagnostics.begin(), parserDiagnostics.end());

        return tree;
    }
} // namespace enumerant::frontend
