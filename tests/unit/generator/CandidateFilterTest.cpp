#include <gtest/gtest.h>

#include "candidate_filter.hpp"

#include <string>

namespace enumerant::generator
{
namespace
{
    TEST(CandidateFilterTest, RejectsEnumerationWithoutAttributes)
    {
        auto tree = frontend::parseSyntaxTree("plain.bolt", "module demo; enumeration Plain { A, B }");
        ASSERT_TRUE(tree->diagnostics.empty());

        const auto nodes = collectDeclarations(tree->unit);
        ASSERT_EQ(nodes.size(), 1u);
        EXPECT_EQ(nodes.front().kind, DeclarationKind::Enumeration);
        EXPECT_FALSE(isSyntaxCandidate(nodes.front()));
        EXPECT_TRUE(collectSyntaxCandidates(tree).empty());
    }

    TEST(CandidateFilterTest, AcceptsAnyDecoratedEnumeration)
    {
        auto tree = frontend::parseSyntaxTree("decorated.bolt", "module demo; [Unrelated] enumeration Decorated { A }");
        ASSERT_TRUE(tree->diagnostics.empty());

        const auto nodes = collectDeclarations(tree->unit);
        ASSERT_EQ(nodes.size(), 1u);
        EXPECT_TRUE(isSyntaxCandidate(nodes.front()));
    }

    TEST(CandidateFilterTest, IgnoresDecoratedDeclarationsOfOtherKinds)
    {
        const std::string source = R"(module demo;
[EnumExtensions] blueprint Point { integer32 x; }
[EnumExtensions] public void function run() { }
[EnumExtensions] attribute Marker { }
[EnumExtensions] enumeration Kind { A }
)";

        auto tree = frontend::parseSyntaxTree("mixed.bolt", source);
        ASSERT_TRUE(tree->diagnostics.empty()) << tree->diagnostics.front().code << " - " << tree->diagnostics.front().message;

        const auto nodes = collectDeclarations(tree->unit);
        ASSERT_EQ(nodes.size(), 4u);
        EXPECT_EQ(nodes[0].kind, DeclarationKind::Blueprint);
        EXPECT_EQ(nodes[1].kind, DeclarationKind::Function);
        EXPECT_EQ(nodes[2].kind, DeclarationKind::Attribute);
        EXPECT_EQ(nodes[3].kind, DeclarationKind::Enumeration);

        const auto candidates = collectSyntaxCandidates(tree);
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_EQ(candidates.front().declaration->name, "Kind");
    }

    TEST(CandidateFilterTest, CandidateIdentityCombinesPathOrdinalAndName)
    {
        const std::string source = R"(module demo;
enumeration Skipped { A }
[Marker] enumeration First { A }
[Marker] enumeration Second { B }
)";

        auto tree = frontend::parseSyntaxTree("units/colors.bolt", source);
        const auto candidates = collectSyntaxCandidates(tree);
        ASSERT_EQ(candidates.size(), 2u);
        EXPECT_EQ(candidates[0].identity(), "units/colors.bolt#1:First");
        EXPECT_EQ(candidates[1].identity(), "units/colors.bolt#2:Second");
        EXPECT_EQ(candidates[0].tree, tree);
    }
} // namespace
} // namespace enumerant::generator
