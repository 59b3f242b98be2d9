#include "lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace enumerant::frontend
{
    namespace
    {
        struct Spelling
        {
            std::string_view text;
            TokenKind kind;
        };

        constexpr std::array<Spelling, 15> kKeywords{{
            {"package", TokenKind::KeywordPackage},
            {"module", TokenKind::KeywordModule},
            {"import", TokenKind::KeywordImport},
            {"blueprint", TokenKind::KeywordBlueprint},
            {"enumeration", TokenKind::KeywordEnumeration},
            {"attribute", TokenKind::KeywordAttribute},
            {"function", TokenKind::KeywordFunction},
            {"public", TokenKind::KeywordPublic},
            {"internal", TokenKind::KeywordInternal},
            {"private", TokenKind::KeywordPrivate},
            {"extern", TokenKind::KeywordExtern},
            {"link", TokenKind::KeywordLink},
            {"true", TokenKind::KeywordTrue},
            {"false", TokenKind::KeywordFalse},
            {"null", TokenKind::KeywordNull},
        }};

        // Two-character spellings first so '<<' is not read as two '<'.
        constexpr std::array<Spelling, 25> kPunctuators{{
            {"<<", TokenKind::LessLess},
            {">>", TokenKind::GreaterGreater},
            {"->", TokenKind::Arrow},
            {"[", TokenKind::LeftBracket},
            {"]", TokenKind::RightBracket},
            {"(", TokenKind::LeftParen},
            {")", TokenKind::RightParen},
            {"{", TokenKind::LeftBrace},
            {"}", TokenKind::RightBrace},
            {",", TokenKind::Comma},
            {":", TokenKind::Colon},
            {";", TokenKind::Semicolon},
            {".", TokenKind::Dot},
            {"=", TokenKind::Equals},
            {"<", TokenKind::LessThan},
            {">", TokenKind::GreaterThan},
            {"+", TokenKind::Plus},
            {"-", TokenKind::Minus},
            {"*", TokenKind::Asterisk},
            {"/", TokenKind::Slash},
            {"%", TokenKind::Percent},
            {"&", TokenKind::Ampersand},
            {"|", TokenKind::Pipe},
            {"^", TokenKind::Caret},
            {"~", TokenKind::Tilde},
        }};

        bool startsWith(std::string_view text, std::string_view prefix)
        {
            return text.substr(0, prefix.size()) == prefix;
        }

        TokenKind classifyWord(std::string_view word)
        {
            auto it = std::find_if(kKeywords.begin(), kKeywords.end(), [word](const Spelling& keyword) {
                return keyword.text == word;
            });
            return it == kKeywords.end() ? TokenKind::Identifier : it->kind;
        }

        char escapedCharacter(char ch)
        {
            switch (ch)
            {
            case 'n': return '\n';
            case 't': return '\t';
            case 'r': return '\r';
            case '0': return '\0';
            default: return ch;
            }
        }
    } // namespace

    Lexer::Lexer(std::string_view source)
        : m_source(source)
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = SourceLocation{};

        while (skipTrivia())
        {
            const char ch = peek();
            if (std::isalpha(static_cast<unsigned char>(ch)))
            {
                lexWord();
            }
            else if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                lexNumber();
            }
            else if (ch == '"')
            {
                lexString();
            }
            else if (!lexPunctuator())
            {
                const SourceLocation start = m_location;
                advance();
                report("ENR-E2000", "Unexpected character in source.", start);
            }
        }

        pushToken(TokenKind::EndOfFile, m_location, std::string{});
    }

    bool Lexer::skipTrivia()
    {
        while (!isAtEnd())
        {
            const std::string_view rest = m_source.substr(m_current);
            if (std::isspace(static_cast<unsigned char>(rest.front())))
            {
                advance();
            }
            else if (startsWith(rest, "//"))
            {
                while (!isAtEnd() && peek() != '\n')
                {
                    advance();
                }
            }
            else if (startsWith(rest, "/*"))
            {
                const SourceLocation start = m_location;
                const std::size_t close = rest.find("*/", 2);
                const std::size_t length = close == std::string_view::npos ? rest.size() : close + 2;
                for (std::size_t index = 0; index < length; ++index)
                {
                    advance();
                }
                if (close == std::string_view::npos)
                {
                    report("ENR-E2003", "Unterminated block comment.", start);
                }
            }
            else
            {
                return true;
            }
        }
        return false;
    }

    void Lexer::lexWord()
    {
        const SourceLocation start = m_location;
        const std::size_t first = m_current;
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            advance();
        }

        const std::string_view word = m_source.substr(first, m_current - first);
        if (word.find('_') != std::string_view::npos)
        {
            report("ENR-E2001", "Identifiers must avoid underscores and hyphens.", start);
        }
        pushToken(classifyWord(word), start, std::string{word});
    }

    void Lexer::lexNumber()
    {
        const SourceLocation start = m_location;
        const std::size_t first = m_current;

        const std::string_view rest = m_source.substr(m_current);
        std::string_view digits = "0123456789";
        if (startsWith(rest, "0x") || startsWith(rest, "0X"))
        {
            digits = "0123456789abcdefABCDEF";
            advance();
            advance();
        }
        else if (startsWith(rest, "0b") || startsWith(rest, "0B"))
        {
            digits = "01";
            advance();
            advance();
        }

        while (!isAtEnd() && digits.find(peek()) != std::string_view::npos)
        {
            advance();
        }

        pushToken(TokenKind::IntegerLiteral, start, std::string{m_source.substr(first, m_current - first)});
    }

    void Lexer::lexString()
    {
        const SourceLocation start = m_location;
        advance();

        std::string value;
        while (!isAtEnd() && peek() != '"')
        {
            const char ch = advance();
            if (ch == '\\' && !isAtEnd())
            {
                value.push_back(escapedCharacter(advance()));
            }
            else
            {
                value.push_back(ch);
            }
        }

        if (isAtEnd())
        {
            report("ENR-E2002", "Unterminated string literal.", start);
            return;
        }

        advance();
        pushToken(TokenKind::StringLiteral, start, std::move(value));
    }

    bool Lexer::lexPunctuator()
    {
        const std::string_view rest = m_source.substr(m_current);
        auto it = std::find_if(kPunctuators.begin(), kPunctuators.end(), [rest](const Spelling& punctuator) {
            return startsWith(rest, punctuator.text);
        });
        if (it == kPunctuators.end())
        {
            return false;
        }

        const SourceLocation start = m_location;
        for (std::size_t index = 0; index < it->text.size(); ++index)
        {
            advance();
        }
        pushToken(it->kind, start, std::string{it->text});
        return true;
    }

    void Lexer::pushToken(TokenKind kind, SourceLocation start, std::string text)
    {
        Token token;
        token.kind = kind;
        token.span = {start, m_location};
        token.text = std::move(text);
        m_tokens.emplace_back(std::move(token));
    }

    void Lexer::report(std::string code, std::string message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::move(code);
        diag.message = std::move(message);
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    char Lexer::peek() const
    {
        return isAtEnd() ? '\0' : m_source[m_current];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch == '\n')
        {
            ++m_location.line;
            m_location.column = 1;
        }
        else
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }
} // namespace enumerant::frontend
