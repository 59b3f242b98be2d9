#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace enumerant::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
    };

    /// Splits declaration source into tokens. Comments and whitespace are dropped; problems are
    /// collected as diagnostics and lexing always runs to the end of the text.
    class Lexer
    {
    public:
        explicit Lexer(std::string_view source);

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        bool skipTrivia();
        void lexWord();
        void lexNumber();
        void lexString();
        bool lexPunctuator();
        void pushToken(TokenKind kind, SourceLocation start, std::string text);
        void report(std::string code, std::string message, SourceLocation start);
        char peek() const;
        char advance();
        bool isAtEnd() const;

    private:
        std::string_view m_source;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_location{};
    };
} // namespace enumerant::frontend
