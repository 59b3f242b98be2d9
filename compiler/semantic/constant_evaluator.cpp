#include "constant_evaluator.hpp"

#include <limits>
#include <utility>

namespace enumerant::semantic
{
    using frontend::TokenKind;

    namespace
    {
        constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
        constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
        constexpr std::uint64_t kNaturalMax = std::numeric_limits<std::uint64_t>::max();

        std::optional<std::int64_t> checkedAdd(std::int64_t a, std::int64_t b)
        {
            if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b))
            {
                return std::nullopt;
            }
            return a + b;
        }

        std::optional<std::int64_t> checkedSubtract(std::int64_t a, std::int64_t b)
        {
            if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b))
            {
                return std::nullopt;
            }
            return a - b;
        }

        std::optional<std::int64_t> checkedMultiply(std::int64_t a, std::int64_t b)
        {
            if (a == 0 || b == 0)
            {
                return 0;
            }

            if (a > 0)
            {
                if (b > 0 ? a > kMax / b : b < kMin / a)
                {
                    return std::nullopt;
                }
            }
            else
            {
                if (b > 0 ? a < kMin / b : b < kMax / a)
                {
                    return std::nullopt;
                }
            }
            return a * b;
        }

        int digitValue(char ch)
        {
            if (ch >= '0' && ch <= '9') return ch - '0';
            if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
            if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
            return -1;
        }
    } // namespace

    std::optional<std::uint64_t> parseNaturalLiteral(std::string_view text)
    {
        unsigned base = 10;
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        {
            base = 16;
            text.remove_prefix(2);
        }
        else if (text.size() > 2 && text[0] == '0' && (text[1] == 'b' || text[1] == 'B'))
        {
            base = 2;
            text.remove_prefix(2);
        }

        if (text.empty())
        {
            return std::nullopt;
        }

        std::uint64_t value = 0;
        for (char ch : text)
        {
            const int digit = digitValue(ch);
            if (digit < 0 || static_cast<unsigned>(digit) >= base)
            {
                return std::nullopt;
            }
            if (value > (kNaturalMax - static_cast<std::uint64_t>(digit)) / base)
            {
                return std::nullopt;
            }
            value = value * base + static_cast<std::uint64_t>(digit);
        }
        return value;
    }

    std::optional<std::int64_t> parseIntegerLiteral(std::string_view text)
    {
        const auto value = parseNaturalLiteral(text);
        if (!value.has_value() || *value > static_cast<std::uint64_t>(kMax))
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(*value);
    }

    ConstantEvaluator::ConstantEvaluator(const std::vector<frontend::Token>& tokens, const MemberValues& members, bool isUnsigned)
        : m_tokens(tokens)
        , m_members(members)
        , m_isUnsigned(isUnsigned)
    {
    }

    std::optional<std::int64_t> ConstantEvaluator::evaluate()
    {
        m_index = 0;
        m_failureReason.clear();

        if (m_tokens.empty())
        {
            return fail("empty expression");
        }

        auto value = parseBitOr();
        if (value.has_value() && !atEnd())
        {
            return fail("unexpected '" + m_tokens[m_index].text + "' in constant expression");
        }
        return value;
    }

    const std::string& ConstantEvaluator::failureReason() const noexcept
    {
        return m_failureReason;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseBitOr()
    {
        auto left = parseBitXor();
        while (left.has_value() && match(TokenKind::Pipe))
        {
            auto right = parseBitXor();
            if (!right.has_value())
            {
                return std::nullopt;
            }
            left = *left | *right;
        }
        return left;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseBitXor()
    {
        auto left = parseBitAnd();
        while (left.has_value() && match(TokenKind::Caret))
        {
            auto right = parseBitAnd();
            if (!right.has_value())
            {
                return std::nullopt;
            }
            left = *left ^ *right;
        }
        return left;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseBitAnd()
    {
        auto left = parseShift();
        while (left.has_value() && match(TokenKind::Ampersand))
        {
            auto right = parseShift();
            if (!right.has_value())
            {
                return std::nullopt;
            }
            left = *left & *right;
        }
        return left;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseShift()
    {
        auto left = parseAdditive();
        while (left.has_value())
        {
            const bool isLeft = match(TokenKind::LessLess);
            if (!isLeft && !match(TokenKind::GreaterGreater))
            {
                break;
            }

            auto right = parseAdditive();
            if (!right.has_value())
            {
                return std::nullopt;
            }
            if (static_cast<std::uint64_t>(*right) > 63)
            {
                return fail("shift count out of range");
            }

            const int count = static_cast<int>(*right);
            if (m_isUnsigned)
            {
                const auto bits = static_cast<std::uint64_t>(*left);
                const std::uint64_t shifted = isLeft ? bits << count : bits >> count;
                if (isLeft && (shifted >> count) != bits)
                {
                    return fail("constant overflow in '<<'");
                }
                left = static_cast<std::int64_t>(shifted);
            }
            else if (isLeft)
            {
                const auto shifted = static_cast<std::int64_t>(static_cast<std::uint64_t>(*left) << count);
                const std::int64_t restored = shifted >= 0 ? (shifted >> count) : ~(~shifted >> count);
                if (restored != *left)
                {
                    return fail("constant overflow in '<<'");
                }
                left = shifted;
            }
            else
            {
                left = *left >= 0 ? (*left >> count) : ~(~*left >> count);
            }
        }
        return left;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseAdditive()
    {
        auto left = parseMultiplicative();
        while (left.has_value())
        {
            const bool isPlus = match(TokenKind::Plus);
            if (!isPlus && !match(TokenKind::Minus))
            {
                break;
            }

            auto right = parseMultiplicative();
            if (!right.has_value())
            {
                return std::nullopt;
            }

            left = isPlus ? add(*left, *right) : subtract(*left, *right);
            if (!left.has_value())
            {
                return fail("constant overflow");
            }
        }
        return left;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseMultiplicative()
    {
        auto left = parseUnary();
        while (left.has_value())
        {
            TokenKind op = TokenKind::Asterisk;
            if (match(TokenKind::Asterisk))
            {
                op = TokenKind::Asterisk;
            }
            else if (match(TokenKind::Slash))
            {
                op = TokenKind::Slash;
            }
            else if (match(TokenKind::Percent))
            {
                op = TokenKind::Percent;
            }
            else
            {
                break;
            }

            auto right = parseUnary();
            if (!right.has_value())
            {
                return std::nullopt;
            }

            if (op == TokenKind::Asterisk)
            {
                left = multiply(*left, *right);
                if (!left.has_value())
                {
                    return fail("constant overflow");
                }
                continue;
            }

            if (*right == 0)
            {
                return fail("division by zero");
            }
            if (m_isUnsigned)
            {
                const auto dividend = static_cast<std::uint64_t>(*left);
                const auto divisor = static_cast<std::uint64_t>(*right);
                left = static_cast<std::int64_t>(op == TokenKind::Slash ? dividend / divisor : dividend % divisor);
                continue;
            }
            if (*left == kMin && *right == -1)
            {
                return fail("constant overflow");
            }
            left = op == TokenKind::Slash ? *left / *right : *left % *right;
        }
        return left;
    }

    std::optional<std::int64_t> ConstantEvaluator::parseUnary()
    {
        if (match(TokenKind::Minus))
        {
            // Negated literals may reach the minimum value without overflowing.
            if (!m_isUnsigned && !atEnd() && m_tokens[m_index].kind == TokenKind::IntegerLiteral
                && m_tokens[m_index].text == "9223372036854775808")
            {
                ++m_index;
                return kMin;
            }

            auto operand = parseUnary();
            if (!operand.has_value())
            {
                return std::nullopt;
            }
            if (m_isUnsigned && *operand != 0)
            {
                return fail("negative constant for unsigned storage");
            }
            if (*operand == kMin)
            {
                return fail("constant overflow");
            }
            return -*operand;
        }

        if (match(TokenKind::Tilde))
        {
            auto operand = parseUnary();
            if (!operand.has_value())
            {
                return std::nullopt;
            }
            return ~*operand;
        }

        if (match(TokenKind::Plus))
        {
            return parseUnary();
        }

        return parsePrimary();
    }

    std::optional<std::int64_t> ConstantEvaluator::parsePrimary()
    {
        if (atEnd())
        {
            return fail("incomplete constant expression");
        }

        const frontend::Token& token = m_tokens[m_index];

        if (token.kind == TokenKind::IntegerLiteral)
        {
            ++m_index;
            if (m_isUnsigned)
            {
                const auto natural = parseNaturalLiteral(token.text);
                if (!natural.has_value())
                {
                    return fail("integer literal '" + token.text + "' is out of range");
                }
                return static_cast<std::int64_t>(*natural);
            }

            auto value = parseIntegerLiteral(token.text);
            if (!value.has_value())
            {
                return fail("integer literal '" + token.text + "' is out of range");
            }
            return value;
        }

        if (token.kind == TokenKind::Identifier)
        {
            ++m_index;
            auto it = m_members.find(token.text);
            if (it == m_members.end())
            {
                return fail("'" + token.text + "' does not name an earlier member");
            }
            if (!it->second.has_value())
            {
                return fail("member '" + token.text + "' has no constant value");
            }
            return it->second;
        }

        if (match(TokenKind::LeftParen))
        {
            auto value = parseBitOr();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            if (!match(TokenKind::RightParen))
            {
                return fail("expected ')' in constant expression");
            }
            return value;
        }

        return fail("unexpected '" + token.text + "' in constant expression");
    }

    bool ConstantEvaluator::match(TokenKind kind)
    {
        if (!atEnd() && m_tokens[m_index].kind == kind)
        {
            ++m_index;
            return true;
        }
        return false;
    }

    bool ConstantEvaluator::atEnd() const
    {
        return m_index >= m_tokens.size();
    }

    std::optional<std::int64_t> ConstantEvaluator::add(std::int64_t left, std::int64_t right) const
    {
        if (!m_isUnsigned)
        {
            return checkedAdd(left, right);
        }
        const auto a = static_cast<std::uint64_t>(left);
        const auto b = static_cast<std::uint64_t>(right);
        if (a > kNaturalMax - b)
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(a + b);
    }

    std::optional<std::int64_t> ConstantEvaluator::subtract(std::int64_t left, std::int64_t right) const
    {
        if (!m_isUnsigned)
        {
            return checkedSubtract(left, right);
        }
        const auto a = static_cast<std::uint64_t>(left);
        const auto b = static_cast<std::uint64_t>(right);
        if (a < b)
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(a - b);
    }

    std::optional<std::int64_t> ConstantEvaluator::multiply(std::int64_t left, std::int64_t right) const
    {
        if (!m_isUnsigned)
        {
            return checkedMultiply(left, right);
        }
        const auto a = static_cast<std::uint64_t>(left);
        const auto b = static_cast<std::uint64_t>(right);
        if (a != 0 && b > kNaturalMax / a)
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(a * b);
    }

    std::optional<std::int64_t> ConstantEvaluator::fail(std::string reason)
    {
        if (m_failureReason.empty())
        {
            m_failureReason = std::move(reason);
        }
        return std::nullopt;
    }
} // namespace enumerant::semantic
