#pragma once

#include "token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace enumerant::semantic
{
    [[nodiscard]] std::optional<std::int64_t> parseIntegerLiteral(std::string_view text);
    [[nodiscard]] std::optional<std::uint64_t> parseNaturalLiteral(std::string_view text);

    /// Folds an enumeration member initializer to a 64-bit constant.
    /// Grammar, loosest binding first: '|', '^', '&', '<<' '>>', '+' '-', '*' '/' '%',
    /// unary '-' '~' '+', then literals, earlier member names and parentheses.
    /// Unsigned evaluation works on the full natural64 range and returns the bit pattern.
    class ConstantEvaluator
    {
    public:
        using MemberValues = std::unordered_map<std::string, std::optional<std::int64_t>>;

        ConstantEvaluator(const std::vector<frontend::Token>& tokens, const MemberValues& members, bool isUnsigned = false);

        [[nodiscard]] std::optional<std::int64_t> evaluate();
        [[nodiscard]] const std::string& failureReason() const noexcept;

    private:
        std::optional<std::int64_t> parseBitOr();
        std::optional<std::int64_t> parseBitXor();
        std::optional<std::int64_t> parseBitAnd();
        std::optional<std::int64_t> parseShift();
        std::optional<std::int64_t> parseAdditive();
        std::optional<std::int64_t> parseMultiplicative();
        std::optional<std::int64_t> parseUnary();
        std::optional<std::int64_t> parsePrimary();

        bool match(frontend::TokenKind kind);
        [[nodiscard]] bool atEnd() const;
        std::optional<std::int64_t> fail(std::string reason);

        std::optional<std::int64_t> add(std::int64_t left, std::int64_t right) const;
        std::optional<std::int64_t> subtract(std::int64_t left, std::int64_t right) const;
        std::optional<std::int64_t> multiply(std::int64_t left, std::int64_t right) const;

        const std::vector<frontend::Token>& m_tokens;
        const MemberValues& m_members;
        bool m_isUnsigned{false};
        std::size_t m_index{0};
        std::string m_failureReason;
    };
} // namespace enumerant::semantic
