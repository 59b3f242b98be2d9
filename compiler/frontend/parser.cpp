#include "parser.hpp"

#include <cctype>

namespace enumerant::frontend
{
    namespace
    {
        bool isPunctuation(TokenKind kind)
        {
            return kind == TokenKind::LessThan
                   || kind == TokenKind::GreaterThan
                   || kind == TokenKind::Dot
                   || kind == TokenKind::Ampersand
                   || kind == TokenKind::Asterisk
                   || kind == TokenKind::LeftBracket
                   || kind == TokenKind::RightBracket
                   || kind == TokenKind::Comma
                   || kind == TokenKind::Colon;
        }

        bool startsDeclaration(TokenKind kind)
        {
            return kind == TokenKind::LeftBracket
                   || kind == TokenKind::KeywordImport
                   || kind == TokenKind::KeywordBlueprint
                   || kind == TokenKind::KeywordAttribute
                   || kind == TokenKind::KeywordEnumeration
                   || kind == TokenKind::KeywordPublic
                   || kind == TokenKind::KeywordInternal
                   || kind == TokenKind::KeywordPrivate;
        }
    } // namespace

    Parser::Parser(const std::vector<Token>& tokens, std::string_view moduleName)
        : m_tokens(tokens)
        , m_moduleName(moduleName)
    {
    }

    CompilationUnit Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();

        CompilationUnit unit{};
        unit.module = parseModule();

        while (!isAtEnd())
        {
            std::vector<Attribute> attributes;
            if (check(TokenKind::LeftBracket))
            {
                attributes = parseAttributes();
            }

            std::vector<std::string> modifiers = parseModifiers();

            if (check(TokenKind::KeywordImport))
            {
                if (!attributes.empty())
                {
                    emitError("ENR-E2108", "Attributes are not allowed on import statements.", attributes.front().span);
                }

                if (!modifiers.empty())
                {
                    emitError("ENR-E2109", "Modifiers are not allowed before an import statement.", previous().span);
                }

                unit.imports.emplace_back(parseImport());
                continue;
            }

            if (match(TokenKind::KeywordBlueprint))
            {
                BlueprintDeclaration bp = parseBlueprint(std::move(modifiers));
                bp.attributes = std::move(attributes);
                unit.blueprints.emplace_back(std::move(bp));
                continue;
            }

            if (match(TokenKind::KeywordAttribute))
            {
                AttributeDeclaration declaration = parseAttributeDeclaration(std::move(modifiers));
                declaration.attributes = std::move(attributes);
                unit.attributeTypes.emplace_back(std::move(declaration));
                continue;
            }

            if (match(TokenKind::KeywordEnumeration))
            {
                EnumerationDeclaration enumeration = parseEnumeration(std::move(modifiers));
                enumeration.attributes = std::move(attributes);
                unit.enumerations.emplace_back(std::move(enumeration));
                continue;
            }

            TypeCapture returnTypeCapture = parseTypeUntil({
                TokenKind::KeywordFunction,
                TokenKind::LeftBrace,
                TokenKind::Semicolon,
                TokenKind::KeywordEnumeration,
                TokenKind::KeywordBlueprint,
                TokenKind::KeywordAttribute});
            if (!check(TokenKind::KeywordFunction))
            {
                emitError("ENR-E2115", "Expected a declaration (enumeration, attribute, blueprint or function).", peek().span);
                synchronize();
                continue;
            }

            advance();

            FunctionDeclaration fn = parseFunction(std::move(modifiers), returnTypeCapture);
            fn.attributes = std::move(attributes);
            unit.functions.emplace_back(std::move(fn));
        }

        return unit;
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current == 0 ? 0 : m_current - 1];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }

        const std::size_t index = (m_current == 0) ? 0 : (m_current - 1);
        return m_tokens[index];
    }

    const Token& Parser::lookAhead(std::size_t offset) const
    {
        const std::size_t index = m_current + offset;
        if (index >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[index];
    }

    bool Parser::isAtEnd() const
    {
        return m_tokens.empty() || peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    const Token& Parser::consume(TokenKind kind, std::string_view messageCode, std::string_view messageText)
    {
        if (check(kind))
        {
            return advance();
        }

        emitError(messageCode, messageText, peek().span);

        if (!isAtEnd())
        {
            advance();
        }

        return previous();
    }

    void Parser::emitError(std::string_view code, std::string_view message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    SourceSpan Parser::spanFrom(const Token& begin, const Token& end) const
    {
        SourceSpan span{};
        span.begin = begin.span.begin;
        span.end = end.span.end;
        return span;
    }

    bool Parser::isTerminator(TokenKind kind, std::initializer_list<TokenKind> terminators, int angleDepth) const
    {
        for (TokenKind terminator : terminators)
        {
            if (kind != terminator)
            {
                continue;
            }

            if ((terminator == TokenKind::Comma || terminator == TokenKind::RightParen) && angleDepth > 0)
            {
                return false;
            }

            return true;
        }
        return false;
    }

    void Parser::synchronize()
    {
        int depth = 0;
        while (!isAtEnd())
        {
            if (depth == 0 && startsDeclaration(peek().kind))
            {
                return;
            }

            const Token& token = advance();
            if (token.kind == TokenKind::LeftBrace)
            {
                ++depth;
            }
            else if (token.kind == TokenKind::RightBrace)
            {
                if (depth <= 1)
                {
                    return;
                }
                --depth;
            }
            else if (token.kind == TokenKind::Semicolon && depth == 0)
            {
                return;
            }
        }
    }

    ModuleDeclaration Parser::parseModule()
    {
        ModuleDeclaration module{};
        SourceSpan span{};
        bool packageSpecified = false;

        if (match(TokenKind::KeywordPackage))
        {
            const Token& keyword = previous();
            const auto packageName = parseQualifiedName("ENR-E2103", "Expected package identifier.");
            module.packageName = packageName.first;
            const Token& terminator = consume(TokenKind::Semicolon, "ENR-E2104", "Expected ';' after package declaration.");
            span.begin = keyword.span.begin;
            span.end = terminator.span.end;
            packageSpecified = true;
        }

        if (match(TokenKind::KeywordModule))
        {
            const Token& keyword = previous();
            if (!packageSpecified)
            {
                span.begin = keyword.span.begin;
            }
            const auto moduleName = parseQualifiedName("ENR-E2105", "Expected module identifier.");
            module.moduleName = moduleName.first;
            module.isDeclared = !module.moduleName.empty();
            const Token& terminator = consume(TokenKind::Semicolon, "ENR-E2106", "Expected ';' after module declaration.");
            span.end = terminator.span.end;
        }
        else if (packageSpecified)
        {
            emitError("ENR-E2105", "Missing 'module' declaration after 'package'.", peek().span);
        }

        module.span = span;
        if (!packageSpecified)
        {
            module.packageName = module.moduleName;
        }

        return module;
    }

    ImportDeclaration Parser::parseImport()
    {
        ImportDeclaration importDecl{};

        const Token& keyword = advance();
        importDecl.span.begin = keyword.span.begin;
        importDecl.span.end = keyword.span.end;

        auto [path, pathSpan] = parseQualifiedName("ENR-E2107", "Expected module path after 'import'.");
        if (!path.empty())
        {
            importDecl.modulePath = std::move(path);
            importDecl.span.end = pathSpan.end;
        }

        if (match(TokenKind::Semicolon))
        {
            importDecl.span.end = previous().span.end;
        }

        return importDecl;
    }

    std::vector<std::string> Parser::parseModifiers()
    {
        std::vector<std::string> modifiers;
        while (check(TokenKind::KeywordPublic)
               || check(TokenKind::KeywordInternal)
               || check(TokenKind::KeywordPrivate)
               || check(TokenKind::KeywordLink)
               || check(TokenKind::KeywordExtern))
        {
            const Token& token = advance();
            modifiers.emplace_back(token.text);
        }
        return modifiers;
    }

    FunctionDeclaration Parser::parseFunction(std::vector<std::string> modifiers, TypeCapture returnTypeCapture)
    {
        FunctionDeclaration fn{};
        fn.modifiers = std::move(modifiers);

        if (returnTypeCapture.valid)
        {
            fn.returnType = returnTypeCapture.text;
            fn.returnTypeSpan = returnTypeCapture.span;
        }
        else
        {
            emitError("ENR-E2117", "Expected return type before 'function'.", previous().span);
        }

        const Token& nameToken = consume(TokenKind::Identifier, "ENR-E2110", "Expected function name.");
        fn.name = nameToken.kind == TokenKind::Identifier ? nameToken.text : std::string{};

        consume(TokenKind::LeftParen, "ENR-E2111", "Expected '(' after function name.");

        while (!check(TokenKind::RightParen) && !isAtEnd())
        {
            fn.parameters.emplace_back(parseParameter());

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        consume(TokenKind::RightParen, "ENR-E2112", "Expected ')' after parameters.");

        if (match(TokenKind::Arrow))
        {
            emitError("ENR-E2118", "Return types must appear before 'function'.", previous().span);
            (void)parseTypeUntil({TokenKind::LeftBrace});
        }

        const Token& bodyStart = consume(TokenKind::LeftBrace, "ENR-E2114", "Expected '{' to begin function body.");
        int depth = 1;
        SourceSpan bodySpan = bodyStart.span;

        while (!isAtEnd() && depth > 0)
        {
            const Token& token = advance();
            if (token.kind == TokenKind::LeftBrace)
            {
                ++depth;
            }
            else if (token.kind == TokenKind::RightBrace)
            {
                --depth;
                bodySpan.end = token.span.end;
            }
        }

        if (depth != 0)
        {
            emitError("ENR-E2119", "Unterminated function body.", bodyStart.span);
        }

        fn.span = mergeSpans(nameToken.span, bodySpan);
        return fn;
    }

    BlueprintDeclaration Parser::parseBlueprint(std::vector<std::string> modifiers)
    {
        BlueprintDeclaration bp{};
        bp.modifiers = std::move(modifiers);

        const Token& nameToken = consume(TokenKind::Identifier, "ENR-E2120", "Expected blueprint name.");
        bp.name = nameToken.kind == TokenKind::Identifier ? nameToken.text : std::string{};

        bp.fields = parseFieldBlock("ENR-E2121", "ENR-E2122", "blueprint");
        bp.span = mergeSpans(nameToken.span, previous().span);
        return bp;
    }

    AttributeDeclaration Parser::parseAttributeDeclaration(std::vector<std::string> modifiers)
    {
        AttributeDeclaration declaration{};
        declaration.modifiers = std::move(modifiers);

        const Token& nameToken = consume(TokenKind::Identifier, "ENR-E2125", "Expected attribute type name.");
        declaration.name = nameToken.kind == TokenKind::Identifier ? nameToken.text : std::string{};

        declaration.options = parseFieldBlock("ENR-E2126", "ENR-E2127", "attribute");
        declaration.span = mergeSpans(nameToken.span, previous().span);
        return declaration;
    }

    std::vector<BlueprintField> Parser::parseFieldBlock(std::string_view openCode, std::string_view closeCode, std::string_view subject)
    {
        std::vector<BlueprintField> fields;

        const std::string subjectText{subject};
        consume(TokenKind::LeftBrace, openCode, "Expected '{' after " + subjectText + " name.");

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            std::vector<Attribute> attributes;
            if (check(TokenKind::LeftBracket))
            {
                attributes = parseAttributes();
            }

            const std::size_t before = m_current;
            BlueprintField field = parseField();
            field.attributes = std::move(attributes);
            fields.emplace_back(std::move(field));

            match(TokenKind::Semicolon);

            if (m_current == before)
            {
                // no progress; drop the offending token
                advance();
            }
        }

        consume(TokenKind::RightBrace, closeCode, "Expected '}' to close " + subjectText + ".");
        return fields;
    }

    EnumerationDeclaration Parser::parseEnumeration(std::vector<std::string> modifiers)
    {
        EnumerationDeclaration enumeration{};
        enumeration.modifiers = std::move(modifiers);

        // A missing name must not swallow the opening brace; members are still recovered.
        const Token& nameToken = check(TokenKind::Identifier) ? advance() : peek();
        if (nameToken.kind == TokenKind::Identifier)
        {
            enumeration.name = nameToken.text;
        }
        else
        {
            emitError("ENR-E2140", "Expected enumeration name.", nameToken.span);
        }

        if (match(TokenKind::Colon))
        {
            TypeCapture storage = parseTypeUntil({TokenKind::LeftBrace, TokenKind::Semicolon});
            if (storage.valid)
            {
                enumeration.underlyingType = storage.text;
                enumeration.underlyingTypeSpan = storage.span;
            }
            else
            {
                emitError("ENR-E2141", "Expected storage type after ':' in enumeration.", peek().span);
            }
        }

        consume(TokenKind::LeftBrace, "ENR-E2142", "Expected '{' after enumeration name.");

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            EnumerationMember member = parseEnumerationMember();
            if (!member.name.empty())
            {
                enumeration.members.emplace_back(std::move(member));
            }

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        const Token& closing = consume(TokenKind::RightBrace, "ENR-E2143", "Expected '}' to close enumeration.");
        match(TokenKind::Semicolon);

        enumeration.span = mergeSpans(nameToken.span, closing.span);
        return enumeration;
    }

    EnumerationMember Parser::parseEnumerationMember()
    {
        EnumerationMember member{};

        if (check(TokenKind::LeftBracket))
        {
            member.attributes = parseAttributes();
        }

        if (!check(TokenKind::Identifier))
        {
            emitError("ENR-E2144", "Expected enumeration member name.", peek().span);
            while (!isAtEnd() && !check(TokenKind::Comma) && !check(TokenKind::RightBrace))
            {
                advance();
            }
            return member;
        }

        const Token& nameToken = advance();
        member.name = nameToken.text;
        member.span = nameToken.span;

        if (match(TokenKind::Equals))
        {
            ExpressionCapture capture{};
            int parenDepth = 0;
            while (!isAtEnd())
            {
                const TokenKind kind = peek().kind;
                if (parenDepth == 0 && (kind == TokenKind::Comma || kind == TokenKind::RightBrace))
                {
                    break;
                }
                if (kind == TokenKind::LeftParen)
                {
                    ++parenDepth;
                }
                else if (kind == TokenKind::RightParen && parenDepth > 0)
                {
                    --parenDepth;
                }

                const Token& token = advance();
                if (capture.tokens.empty())
                {
                    capture.span.begin = token.span.begin;
                }
                capture.span.end = token.span.end;
                capture.tokens.push_back(token);
            }

            if (capture.tokens.empty())
            {
                emitError("ENR-E2145", "Expected constant expression after '=' in enumeration member.", peek().span);
            }
            else
            {
                member.span = mergeSpans(member.span, capture.span);
                member.initializer = std::move(capture);
            }
        }

        return member;
    }

    std::vector<Attribute> Parser::parseAttributes()
    {
        std::vector<Attribute> attributes;
        while (match(TokenKind::LeftBracket))
        {
            do
            {
                attributes.emplace_back(parseAttribute());
            } while (match(TokenKind::Comma));
            consume(TokenKind::RightBracket, "ENR-E2130", "Expected ']' after attribute.");
        }
        return attributes;
    }

    Attribute Parser::parseAttribute()
    {
        Attribute attribute{};
        auto [name, nameSpan] = parseQualifiedName("ENR-E2131", "Expected attribute identifier.");
        attribute.name = std::move(name);
        attribute.span = nameSpan;

        if (match(TokenKind::LeftParen))
        {
            while (!check(TokenKind::RightParen) && !isAtEnd())
            {
                attribute.arguments.emplace_back(parseAttributeArgument());
                if (!match(TokenKind::Comma))
                {
                    break;
                }
            }
            consume(TokenKind::RightParen, "ENR-E2132", "Expected ')' after attribute arguments.");
        }

        attribute.span.end = previous().span.end;
        return attribute;
    }

    AttributeArgument Parser::parseAttributeArgument()
    {
        AttributeArgument argument{};

        auto isValueToken = [this]() {
            return check(TokenKind::Identifier)
                   || check(TokenKind::IntegerLiteral)
                   || check(TokenKind::StringLiteral)
                   || check(TokenKind::KeywordTrue)
                   || check(TokenKind::KeywordFalse)
                   || check(TokenKind::KeywordNull)
                   || (check(TokenKind::Minus) && lookAhead(1).kind == TokenKind::IntegerLiteral);
        };

        auto readValue = [this](AttributeArgument& target) -> const Token& {
            std::string sign;
            if (match(TokenKind::Minus))
            {
                sign = "-";
            }

            const Token& valueToken = advance();
            target.value = sign + valueToken.text;
            switch (valueToken.kind)
            {
            case TokenKind::StringLiteral: target.valueKind = AttributeValueKind::String; break;
            case TokenKind::IntegerLiteral: target.valueKind = AttributeValueKind::Integer; break;
            case TokenKind::KeywordTrue:
            case TokenKind::KeywordFalse: target.valueKind = AttributeValueKind::Boolean; break;
            case TokenKind::KeywordNull: target.valueKind = AttributeValueKind::Null; break;
            default: target.valueKind = AttributeValueKind::Identifier; break;
            }
            return valueToken;
        };

        if (!isValueToken())
        {
            emitError("ENR-E2133", "Expected attribute argument.", peek().span);
            return argument;
        }

        if (check(TokenKind::Identifier) && lookAhead(1).kind == TokenKind::Equals)
        {
            const Token& nameToken = advance();
            advance(); // '='

            if (!isValueToken())
            {
                emitError("ENR-E2134", "Expected value after '=' in attribute argument.", peek().span);
                argument.name = nameToken.text;
                argument.span = nameToken.span;
                return argument;
            }

            const Token& valueToken = readValue(argument);
            argument.name = nameToken.text;
            argument.span = spanFrom(nameToken, valueToken);
            return argument;
        }

        const Token& firstToken = peek();
        const SourceLocation begin = firstToken.span.begin;
        const Token& valueToken = readValue(argument);
        argument.span.begin = begin;
        argument.span.end = valueToken.span.end;
        return argument;
    }

    Parameter Parser::parseParameter()
    {
        Parameter parameter{};

        TypeCapture typeCapture = parseTypeBeforeName({TokenKind::Comma, TokenKind::RightParen});
        if (!typeCapture.valid)
        {
            emitError("ENR-E2146", "Expected parameter type before name.", peek().span);
        }
        else
        {
            parameter.typeName = typeCapture.text;
            parameter.typeSpan = typeCapture.span;
        }

        if (check(TokenKind::Identifier))
        {
            const Token& nameToken = advance();
            parameter.name = nameToken.text;
            parameter.span = typeCapture.valid ? mergeSpans(typeCapture.span, nameToken.span) : nameToken.span;
        }
        else
        {
            emitError("ENR-E2147", "Expected parameter name after type.", peek().span);
            parameter.span = typeCapture.span;
        }

        return parameter;
    }

    BlueprintField Parser::parseField()
    {
        BlueprintField field{};

        TypeCapture typeCapture = parseTypeBeforeName({TokenKind::Semicolon, TokenKind::RightBrace, TokenKind::LeftBracket});
        if (!typeCapture.valid)
        {
            emitError("ENR-E2152", "Expected field type before name.", peek().span);
        }
        else
        {
            field.typeName = typeCapture.text;
            field.typeSpan = typeCapture.span;
        }

        if (check(TokenKind::Identifier))
        {
            const Token& nameToken = advance();
            field.name = nameToken.text;
            field.span = typeCapture.valid ? mergeSpans(typeCapture.span, nameToken.span) : nameToken.span;
        }
        else
        {
            emitError("ENR-E2153", "Expected field name after type.", peek().span);
            field.span = typeCapture.span;
        }

        return field;
    }

    std::pair<std::string, SourceSpan> Parser::parseQualifiedName(std::string_view code, std::string_view message)
    {
        std::pair<std::string, SourceSpan> result{};

        if (!check(TokenKind::Identifier))
        {
            emitError(code, message, peek().span);
            return result;
        }

        const Token& first = advance();
        result.first = first.text;
        result.second.begin = first.span.begin;
        result.second.end = first.span.end;

        while (match(TokenKind::Dot))
        {
            const Token& dot = previous();

            if (!check(TokenKind::Identifier))
            {
                emitError(code, "Expected identifier segment after '.'.", peek().span);
                break;
            }

            result.first.append(dot.text);
            const Token& part = advance();
            result.first.append(part.text);
            result.second.end = part.span.end;
        }

        return result;
    }

    SourceSpan Parser::mergeSpans(const SourceSpan& a, const SourceSpan& b) const
    {
        SourceSpan span = a;
        if (span.begin.line == 0 && span.begin.column == 0)
        {
            span.begin = b.begin;
        }
        if (b.begin.line < span.begin.line || (b.begin.line == span.begin.line && b.begin.column < span.begin.column))
        {
            span.begin = b.begin;
        }
        if (b.end.line > span.end.line || (b.end.line == span.end.line && b.end.column > span.end.column))
        {
            span.end = b.end;
        }
        return span;
    }

    Parser::TypeCapture Parser::parseTypeBeforeName(std::initializer_list<TokenKind> terminators)
    {
        TypeCapture capture{};
        bool lastWasPunctuation = true;
        int angleDepth = 0;

        while (!isAtEnd())
        {
            const Token& token = peek();

            if (token.kind == TokenKind::Identifier && angleDepth == 0)
            {
                const Token& next = lookAhead(1);
                if (next.kind == TokenKind::Comma
                    || next.kind == TokenKind::RightParen
                    || next.kind == TokenKind::Semicolon
                    || next.kind == TokenKind::RightBrace
                    || next.kind == TokenKind::Equals
                    || next.kind == TokenKind::LeftBracket
                    || next.kind == TokenKind::EndOfFile)
                {
                    break;
                }
            }

            if (isTerminator(token.kind, terminators, angleDepth))
            {
                break;
            }

            const Token& consumed = advance();

            if (consumed.kind == TokenKind::LessThan)
            {
                ++angleDepth;
            }
            else if (consumed.kind == TokenKind::GreaterThan && angleDepth > 0)
            {
                --angleDepth;
            }

            if (consumed.text.empty())
            {
                continue;
            }

            const bool punctuation = isPunctuation(consumed.kind);

            if (!capture.valid)
            {
                capture.span.begin = consumed.span.begin;
            }

            if (!capture.text.empty() && !punctuation && !lastWasPunctuation)
            {
                capture.text.push_back(' ');
            }

            capture.text.append(consumed.text);
            capture.span.end = consumed.span.end;
            capture.valid = true;
            lastWasPunctuation = punctuation;
        }

        return capture;
    }

    Parser::TypeCapture Parser::parseTypeUntil(std::initializer_list<TokenKind> terminators)
    {
        TypeCapture capture{};
        bool lastWasPunctuation = true;
        int angleDepth = 0;

        while (!isAtEnd())
        {
            const Token& token = peek();
            if (isTerminator(token.kind, terminators, angleDepth))
            {
                break;
            }

            const Token& consumed = advance();

            if (consumed.kind == TokenKind::LessThan)
            {
                ++angleDepth;
            }
            else if (consumed.kind == TokenKind::GreaterThan && angleDepth > 0)
            {
                --angleDepth;
            }

            if (consumed.text.empty())
            {
                continue;
            }

            const bool punctuation = isPunctuation(consumed.kind);

            if (!capture.valid)
            {
                capture.span.begin = consumed.span.begin;
            }

            if (!capture.text.empty() && !punctuation && !lastWasPunctuation)
            {
                capture.text.push_back(' ');
            }

            capture.text.append(consumed.text);
            capture.span.end = consumed.span.end;
            capture.valid = true;
            lastWasPunctuation = punctuation;
        }

        return capture;
    }
} // namespace enumerant::frontend
