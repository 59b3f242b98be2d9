#include <gtest/gtest.h>

#include "binder.hpp"
#include "markers.hpp"
#include "metadata_extractor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace enumerant::generator
{
namespace
{
    struct BoundProgram
    {
        std::vector<std::shared_ptr<const frontend::SyntaxTree>> trees;
        semantic::SymbolTable symbols;
    };

    BoundProgram bindProgram(const std::string& path, const std::string& text)
    {
        BoundProgram program;
        program.trees.push_back(frontend::parseSyntaxTree(kMarkerUnitPath, markerUnitSource()));
        program.trees.push_back(frontend::parseSyntaxTree(path, text));

        std::vector<semantic::BindingUnit> units;
        for (const auto& tree : program.trees)
        {
            units.push_back(semantic::BindingUnit{tree->path, &tree->unit});
        }
        semantic::Binder binder{std::move(units)};
        program.symbols = binder.bind();
        return program;
    }

    std::optional<EnumToGenerate> extractFirst(const BoundProgram& program, std::vector<semantic::Diagnostic>& diagnostics)
    {
        const auto candidates = collectSyntaxCandidates(program.trees[1]);
        if (candidates.empty())
        {
            return std::nullopt;
        }
        return extractDescription(candidates.front(), program.symbols, diagnostics);
    }

    TEST(MetadataExtractorTest, AppliesDefaultsWithoutOverrides)
    {
        auto program = bindProgram("colors.bolt", R"(module demo.colors;
import enumerant.markers;
[EnumExtensions] enumeration Color { Red, Green }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());
        EXPECT_TRUE(diagnostics.empty());

        EXPECT_EQ(record->outputName, "ColorExtensions");
        EXPECT_EQ(record->outputNamespace, "demo.colors");
        EXPECT_EQ(record->declaredQualifiedName, "demo.colors.Color");
        EXPECT_EQ(record->underlyingType, "integer32");
        EXPECT_FALSE(record->isPublic);
        EXPECT_FALSE(record->hasFlags);
        EXPECT_EQ(outputUnitName(*record), "ColorExtensions_EnumExtensions");
    }

    TEST(MetadataExtractorTest, UsesEmptyNamespaceAtOutermostLevel)
    {
        auto program = bindProgram("global.bolt", R"([enumerant.markers.EnumExtensions] public enumeration Global : integer16 { A })");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());

        EXPECT_EQ(record->outputNamespace, "");
        EXPECT_EQ(record->declaredQualifiedName, "Global");
        EXPECT_EQ(record->underlyingType, "integer16");
        EXPECT_TRUE(record->isPublic);
    }

    TEST(MetadataExtractorTest, ExtensionClassNameOverridesDeclaredName)
    {
        auto program = bindProgram("colors.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions(ExtensionClassName = "Foo")] enumeration Color { Red }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->outputName, "Foo");
        EXPECT_EQ(record->outputNamespace, "demo");
        EXPECT_EQ(outputUnitName(*record), "Foo_EnumExtensions");
    }

    TEST(MetadataExtractorTest, LaterOverridesWinAndAbsentValuesAreIgnored)
    {
        auto program = bindProgram("colors.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions(ExtensionClassNamespace = "first.space", ExtensionClassName = "First", ExtensionClassNamespace = "second.space", ExtensionClassName = null)]
enumeration Color { Red }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->outputName, "First");
        EXPECT_EQ(record->outputNamespace, "second.space");
    }

    TEST(MetadataExtractorTest, DetectsFlagsMarker)
    {
        auto withFlags = bindProgram("access.bolt", R"(module demo;
import enumerant.markers;
[Flags]
[EnumExtensions] enumeration Access { Read = 1, Write = 2 }
)");
        auto withoutFlags = bindProgram("access.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions] enumeration Access { Read = 1, Write = 2 }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto flagged = extractFirst(withFlags, diagnostics);
        const auto plain = extractFirst(withoutFlags, diagnostics);
        ASSERT_TRUE(flagged.has_value());
        ASSERT_TRUE(plain.has_value());
        EXPECT_TRUE(flagged->hasFlags);
        EXPECT_FALSE(plain->hasFlags);
        EXPECT_NE(*flagged, *plain);
    }

    TEST(MetadataExtractorTest, PreservesMemberOrderAndResolvedValues)
    {
        auto program = bindProgram("letters.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions] enumeration Letters { A, B = 5, C }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());

        const std::vector<std::pair<std::string, std::int64_t>> expected{{"A", 0}, {"B", 5}, {"C", 6}};
        EXPECT_EQ(record->members, expected);
    }

    TEST(MetadataExtractorTest, SkipsMembersWithoutConstantValues)
    {
        auto program = bindProgram("mixed.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions] enumeration Mixed : natural8 { Low, Broken = Missing, Big = 256, High = 9 }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());

        const std::vector<std::pair<std::string, std::int64_t>> expected{{"Low", 0}, {"High", 9}};
        EXPECT_EQ(record->members, expected);
        EXPECT_EQ(record->underlyingType, "natural8");
    }

    TEST(MetadataExtractorTest, SkipsDeclarationWithoutSymbol)
    {
        auto program = bindProgram("dupes.bolt", R"(module demo;
import enumerant.markers;
enumeration Color { Red }
[EnumExtensions] enumeration Color { Blue }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        EXPECT_FALSE(record.has_value());
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "ENR-W2301");
        EXPECT_TRUE(diagnostics.front().isWarning);
        EXPECT_EQ(diagnostics.front().sourcePath, "dupes.bolt");
    }

    TEST(MetadataExtractorTest, ExtractionIsRepeatable)
    {
        const std::string source = R"(module demo;
import enumerant.markers;
[Flags, EnumExtensions(ExtensionClassName = "Bits")] public enumeration Bits : natural16 { One = 1, Two = 2, Both = One | Two }
)";
        auto firstPass = bindProgram("bits.bolt", source);
        auto secondPass = bindProgram("bits.bolt", source);

        std::vector<semantic::Diagnostic> diagnostics;
        const auto first = extractFirst(firstPass, diagnostics);
        const auto second = extractFirst(secondPass, diagnostics);
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(*first, *second);
        EXPECT_EQ(canonicalHash(*first), canonicalHash(*second));
    }

    TEST(MetadataExtractorTest, KeepsHighBitMembersOfNatural64Storage)
    {
        auto program = bindProgram("wide.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions, Flags] public enumeration Wide : natural64 { None = 0, Low = 1, Top = 0x8000000000000000, All = ~None }
)");

        std::vector<semantic::Diagnostic> diagnostics;
        const auto record = extractFirst(program, diagnostics);
        ASSERT_TRUE(record.has_value());
        EXPECT_TRUE(diagnostics.empty());

        ASSERT_EQ(record->members.size(), 4u);
        EXPECT_EQ(record->members[2].first, "Top");
        EXPECT_EQ(static_cast<std::uint64_t>(record->members[2].second), 0x8000000000000000ULL);
        EXPECT_EQ(static_cast<std::uint64_t>(record->members[3].second), 0xFFFFFFFFFFFFFFFFULL);

        const std::string canonical = canonicalPrint(*record);
        EXPECT_NE(canonical.find("    Top = 9223372036854775808\n"), std::string::npos);
        EXPECT_NE(canonical.find("    All = 18446744073709551615\n"), std::string::npos);
    }

    TEST(MetadataExtractorTest, RecordsNormalizedStorageTypeName)
    {
        auto program = bindProgram("aliases.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions] enumeration Small : byte { A }
[EnumExtensions] enumeration Plain : integer { B }
)");

        const auto candidates = collectSyntaxCandidates(program.trees[1]);
        ASSERT_EQ(candidates.size(), 2u);

        std::vector<semantic::Diagnostic> diagnostics;
        const auto small = extractDescription(candidates[0], program.symbols, diagnostics);
        const auto plain = extractDescription(candidates[1], program.symbols, diagnostics);
        ASSERT_TRUE(small.has_value());
        ASSERT_TRUE(plain.has_value());
        EXPECT_EQ(small->underlyingType, "natural8");
        EXPECT_EQ(plain->underlyingType, "integer32");
    }

    TEST(MetadataExtractorTest, SkipsExtensionClassNamesThatAreNotIdentifiers)
    {
        auto program = bindProgram("paths.bolt", R"(module demo;
import enumerant.markers;
[EnumExtensions(ExtensionClassName = "../../escaped")] enumeration Relative { A }
[EnumExtensions(ExtensionClassName = "/tmp/absolute")] enumeration Absolute { A }
[EnumExtensions(ExtensionClassNamespace = "demo..generated")] enumeration Spaced { A }
[EnumExtensions(ExtensionClassName = "Fine_2", ExtensionClassNamespace = "demo.generated")] enumeration Fine { A }
)");

        const auto candidates = collectSyntaxCandidates(program.trees[1]);
        ASSERT_EQ(candidates.size(), 4u);

        std::vector<semantic::Diagnostic> diagnostics;
        EXPECT_FALSE(extractDescription(candidates[0], program.symbols, diagnostics).has_value());
        EXPECT_FALSE(extractDescription(candidates[1], program.symbols, diagnostics).has_value());
        EXPECT_FALSE(extractDescription(candidates[2], program.symbols, diagnostics).has_value());
        ASSERT_EQ(diagnostics.size(), 3u);
        for (const auto& diagnostic : diagnostics)
        {
            EXPECT_EQ(diagnostic.code, "ENR-W2303");
            EXPECT_TRUE(diagnostic.isWarning);
            EXPECT_EQ(diagnostic.sourcePath, "paths.bolt");
        }

        const auto fine = extractDescription(candidates[3], program.symbols, diagnostics);
        ASSERT_TRUE(fine.has_value());
        EXPECT_EQ(outputUnitName(*fine), "Fine_2_EnumExtensions");
        EXPECT_EQ(diagnostics.size(), 3u);
    }
} // namespace
} // namespace enumerant::generator
