#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <initializer_list>
#include <optional>
#include <utility>
#include <string_view>

namespace enumerant::frontend
{
    class Parser
    {
    public:
        Parser(const std::vector<Token>& tokens, std::string_view moduleName);

        [[nodiscard]] CompilationUnit parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        struct TypeCapture
        {
            std::string text;
            SourceSpan span{};
            bool valid{false};
        };

        const Token& peek() const;
        const Token& previous() const;
        const Token& advance();
        const Token& lookAhead(std::size_t offset) const;
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);
        const Token& consume(TokenKind kind, std::string_view messageCode, std::string_view messageText);
        void emitError(std::string_view code, std::string_view message, SourceSpan span);
        [[nodiscard]] SourceSpan spanFrom(const Token& begin, const Token& end) const;
        bool isTerminator(TokenKind kind, std::initializer_list<TokenKind> terminators, int angleDepth) const;
        void synchronize();

        ModuleDeclaration parseModule();
        ImportDeclaration parseImport();
        std::vector<std::string> parseModifiers();
        FunctionDeclaration parseFunction(std::vector<std::string> modifiers, TypeCapture returnTypeCapture);
        BlueprintDeclaration parseBlueprint(std::vector<std::string> modifiers);
        AttributeDeclaration parseAttributeDeclaration(std::vector<std::string> modifiers);
        EnumerationDeclaration parseEnumeration(std::vector<std::string> modifiers);
        EnumerationMember parseEnumerationMember();
        std::vector<BlueprintField> parseFieldBlock(std::string_view openCode, std::string_view closeCode, std::string_view subject);
        std::vector<Attribute> parseAttributes();
        Attribute parseAttribute();
        AttributeArgument parseAttributeArgument();
        Parameter parseParameter();
        BlueprintField parseField();
        std::pair<std::string, SourceSpan> parseQualifiedName(std::string_view code, std::string_view message);
        SourceSpan mergeSpans(const SourceSpan& a, const SourceSpan& b) const;

        TypeCapture parseTypeUntil(std::initializer_list<TokenKind> terminators);
        TypeCapture parseTypeBeforeName(std::initializer_list<TokenKind> terminators);

    private:
        const std::vector<Token>& m_tokens;
        std::string_view m_moduleName;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace enumerant::frontend
