#include <gtest/gtest.h>

#include "constant_evaluator.hpp"
#include "lexer.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace enumerant::semantic
{
namespace
{
    std::vector<frontend::Token> tokenize(const std::string& expression)
    {
        frontend::Lexer lexer{expression};
        lexer.lex();
        std::vector<frontend::Token> tokens = lexer.tokens();
        if (!tokens.empty() && tokens.back().kind == frontend::TokenKind::EndOfFile)
        {
            tokens.pop_back();
        }
        return tokens;
    }

    std::optional<std::int64_t> evaluate(const std::string& expression,
                                         const ConstantEvaluator::MemberValues& members = {})
    {
        const auto tokens = tokenize(expression);
        ConstantEvaluator evaluator{tokens, members};
        return evaluator.evaluate();
    }

    std::optional<std::uint64_t> evaluateNatural(const std::string& expression)
    {
        const auto tokens = tokenize(expression);
        const ConstantEvaluator::MemberValues members;
        ConstantEvaluator evaluator{tokens, members, true};
        const auto bits = evaluator.evaluate();
        if (!bits.has_value())
        {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(*bits);
    }

    TEST(ConstantEvaluatorTest, ParsesIntegerLiteralBases)
    {
        EXPECT_EQ(parseIntegerLiteral("42"), 42);
        EXPECT_EQ(parseIntegerLiteral("0x1F"), 31);
        EXPECT_EQ(parseIntegerLiteral("0b101"), 5);
        EXPECT_FALSE(parseIntegerLiteral("0x").has_value());
        EXPECT_FALSE(parseIntegerLiteral("9223372036854775808").has_value());
        EXPECT_EQ(parseNaturalLiteral("0xFFFFFFFFFFFFFFFF"), std::numeric_limits<std::uint64_t>::max());
        EXPECT_FALSE(parseNaturalLiteral("18446744073709551616").has_value());
    }

    TEST(ConstantEvaluatorTest, RespectsOperatorPrecedence)
    {
        EXPECT_EQ(evaluate("1 + 2 * 3"), 7);
        EXPECT_EQ(evaluate("(1 + 2) * 3"), 9);
        EXPECT_EQ(evaluate("1 << 2 + 1"), 8);
        EXPECT_EQ(evaluate("1 | 2 & 3"), 3);
        EXPECT_EQ(evaluate("6 ^ 3"), 5);
        EXPECT_EQ(evaluate("-4 + ~0"), -5);
        EXPECT_EQ(evaluate("17 % 5 - 8 / 4"), 0);
    }

    TEST(ConstantEvaluatorTest, ResolvesEarlierMembers)
    {
        ConstantEvaluator::MemberValues members;
        members.emplace("Read", 1);
        members.emplace("Write", 2);

        EXPECT_EQ(evaluate("Read | Write", members), 3);
        EXPECT_EQ(evaluate("Write << 2", members), 8);
    }

    TEST(ConstantEvaluatorTest, FailsOnUnknownOrValuelessMembers)
    {
        ConstantEvaluator::MemberValues members;
        members.emplace("Broken", std::nullopt);

        const auto unknownTokens = tokenize("Missing + 1");
        ConstantEvaluator unknown{unknownTokens, members};
        EXPECT_FALSE(unknown.evaluate().has_value());
        EXPECT_NE(unknown.failureReason().find("Missing"), std::string::npos);

        const auto valuelessTokens = tokenize("Broken");
        ConstantEvaluator valueless{valuelessTokens, members};
        EXPECT_FALSE(valueless.evaluate().has_value());
        EXPECT_NE(valueless.failureReason().find("no constant value"), std::string::npos);
    }

    TEST(ConstantEvaluatorTest, DetectsArithmeticFaults)
    {
        EXPECT_FALSE(evaluate("1 / 0").has_value());
        EXPECT_FALSE(evaluate("1 % 0").has_value());
        EXPECT_FALSE(evaluate("1 << 64").has_value());
        EXPECT_FALSE(evaluate("9223372036854775807 + 1").has_value());
        EXPECT_FALSE(evaluate("0x4000000000000000 * 2").has_value());
        EXPECT_FALSE(evaluate("(1 + 2").has_value());
        EXPECT_FALSE(evaluate("1 2").has_value());
    }

    TEST(ConstantEvaluatorTest, AcceptsMinimumSignedLiteral)
    {
        EXPECT_EQ(evaluate("-9223372036854775808"), std::numeric_limits<std::int64_t>::min());
    }

    TEST(ConstantEvaluatorTest, UnsignedEvaluationCoversFullRange)
    {
        EXPECT_EQ(evaluateNatural("0x8000000000000000"), 0x8000000000000000ULL);
        EXPECT_EQ(evaluateNatural("1 << 63"), 0x8000000000000000ULL);
        EXPECT_EQ(evaluateNatural("~0"), std::numeric_limits<std::uint64_t>::max());
        EXPECT_EQ(evaluateNatural("18446744073709551615 >> 60"), 15u);
        EXPECT_EQ(evaluateNatural("0xFFFFFFFFFFFFFFFF / 0xFFFFFFFFFFFFFFFF"), 1u);
        EXPECT_EQ(evaluateNatural("-0"), 0u);
    }

    TEST(ConstantEvaluatorTest, UnsignedEvaluationRejectsNegativesAndOverflow)
    {
        EXPECT_FALSE(evaluateNatural("-1").has_value());
        EXPECT_FALSE(evaluateNatural("1 - 2").has_value());
        EXPECT_FALSE(evaluateNatural("0xFFFFFFFFFFFFFFFF + 1").has_value());
        EXPECT_FALSE(evaluateNatural("0x8000000000000000 * 2").has_value());
        EXPECT_FALSE(evaluateNatural("3 << 63").has_value());
    }
} // namespace
} // namespace enumerant::semantic
