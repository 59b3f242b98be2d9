#include "token.hpp"

namespace enumerant::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntegerLiteral: return "integerLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";

        case TokenKind::KeywordPackage: return "package";
        case TokenKind::KeywordModule: return "module";
        case TokenKind::KeywordImport: return "import";
        case TokenKind::KeywordBlueprint: return "blueprint";
        case TokenKind::KeywordEnumeration: return "enumeration";
        case TokenKind::KeywordAttribute: return "attribute";
        case TokenKind::KeywordFunction: return "function";
        case TokenKind::KeywordPublic: return "public";
        case TokenKind::KeywordInternal: return "internal";
        case TokenKind::KeywordPrivate: return "private";
        case TokenKind::KeywordExtern: return "extern";
        case TokenKind::KeywordLink: return "link";
        case TokenKind::KeywordTrue: return "true";
        case TokenKind::KeywordFalse: return "false";
        case TokenKind::KeywordNull: return "null";

        case TokenKind::LeftBrace: return "leftBrace";
        case TokenKind::RightBrace: return "rightBrace";
        case TokenKind::LeftParen: return "leftParen";
        case TokenKind::RightParen: return "rightParen";
        case TokenKind::LeftBracket: return "leftBracket";
        case TokenKind::RightBracket: return "rightBracket";
        case TokenKind::Comma: return "comma";
        case TokenKind::Colon: return "colon";
        case TokenKind::Semicolon: return "semicolon";
        case TokenKind::Dot: return "dot";
        case TokenKind::Arrow: return "arrow";
        case TokenKind::Equals: return "equals";
        case TokenKind::Plus: return "plus";
        case TokenKind::Minus: return "minus";
        case TokenKind::Asterisk: return "asterisk";
        case TokenKind::Slash: return "slash";
        case TokenKind::Percent: return "percent";
        case TokenKind::Ampersand: return "ampersand";
        case TokenKind::Pipe: return "pipe";
        case TokenKind::Caret: return "caret";
        case TokenKind::Tilde: return "tilde";
        case TokenKind::LessThan: return "lessThan";
        case TokenKind::GreaterThan: return "greaterThan";
        case TokenKind::LessLess: return "lessLess";
        case TokenKind::GreaterGreater: return "greaterGreater";
        }

        return "unknown";
    }
} // namespace enumerant::frontend
