#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace enumerant::frontend
{
    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        IntegerLiteral,
        StringLiteral,

        // Keywords
        KeywordPackage,
        KeywordModule,
        KeywordImport,
        KeywordBlueprint,
        KeywordEnumeration,
        KeywordAttribute,
        KeywordFunction,
        KeywordPublic,
        KeywordInternal,
        KeywordPrivate,
        KeywordExtern,
        KeywordLink,
        KeywordTrue,
        KeywordFalse,
        KeywordNull,

        // Declaration punctuation
        LeftBrace,
        RightBrace,
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        Comma,
        Colon,
        Semicolon,
        Dot,
        Equals,
        Arrow,
        LessThan,
        GreaterThan,

        // Constant expression operators; '&' and '*' also appear in type names
        Plus,
        Minus,
        Asterisk,
        Slash,
        Percent,
        Ampersand,
        Pipe,
        Caret,
        Tilde,
        LessLess,
        GreaterGreater
    };

    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::string text{};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace enumerant::frontend
