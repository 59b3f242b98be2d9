#include <gtest/gtest.h>

#include "markers.hpp"
#include "pipeline.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace enumerant::generator
{
namespace
{
    class RecordingEmitter final : public ExtensionEmitter
    {
    public:
        std::string render(const EnumToGenerate& record) override
        {
            rendered.push_back(record.outputName);
            return "// " + record.declaredQualifiedName + "\n";
        }

        std::vector<std::string> rendered;
    };

    // Requests cancellation once the emitter is first reached, which only happens after extraction.
    class CancellingEmitter final : public ExtensionEmitter
    {
    public:
        explicit CancellingEmitter(CancellationToken& token)
            : m_token(token)
        {
        }

        std::string render(const EnumToGenerate& record) override
        {
            m_token.requestCancellation();
            return record.outputName;
        }

    private:
        CancellationToken& m_token;
    };

    bool hasDiagnostic(const PassResult& result, const std::string& code)
    {
        return std::any_of(result.diagnostics.begin(), result.diagnostics.end(), [&code](const semantic::Diagnostic& diagnostic) {
            return diagnostic.code == code;
        });
    }

    const std::string kColors = R"(module demo.colors;
import enumerant.markers;

[EnumExtensions] public enumeration Color : natural8 { Red, Green = 5, Blue }
[Flags, EnumExtensions(ExtensionClassName = "AccessHelpers")] enumeration Access { Read = 1, Write = 2 }
enumeration Plain { One }
)";

    TEST(PipelineTest, ProducesOneUnitPerOptedInEnumeration)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};

        const PassResult result = pipeline.supply(ProgramSnapshot{{SourceText{"colors.bolt", kColors}}});
        EXPECT_FALSE(result.cancelled);
        EXPECT_TRUE(result.diagnostics.empty()) << result.diagnostics.front().code << " - " << result.diagnostics.front().message;

        ASSERT_EQ(result.outputs.size(), 2u);
        EXPECT_EQ(result.outputs[0].name, "ColorExtensions_EnumExtensions");
        EXPECT_EQ(result.outputs[0].content, "// demo.colors.Color\n");
        EXPECT_FALSE(result.outputs[0].reused);
        EXPECT_EQ(result.outputs[1].name, "AccessHelpers_EnumExtensions");
        EXPECT_TRUE(result.outputs[1].description.hasFlags);
        EXPECT_EQ(result.candidates, 2u);
        EXPECT_EQ(result.emitted, 2u);
        EXPECT_EQ(result.parsedUnits, 2u);
        EXPECT_EQ(emitter.rendered.size(), 2u);
    }

    TEST(PipelineTest, UnchangedSnapshotIsNotReEmitted)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};
        const ProgramSnapshot snapshot{{SourceText{"colors.bolt", kColors}}};

        const PassResult first = pipeline.supply(snapshot);
        const PassResult second = pipeline.supply(snapshot);

        EXPECT_EQ(emitter.rendered.size(), 2u);
        ASSERT_EQ(second.outputs.size(), 2u);
        EXPECT_TRUE(second.outputs[0].reused);
        EXPECT_TRUE(second.outputs[1].reused);
        EXPECT_EQ(second.outputs[0].description, first.outputs[0].description);
        EXPECT_EQ(second.outputs[0].content, first.outputs[0].content);
        EXPECT_EQ(second.emitted, 0u);
        EXPECT_EQ(second.reused, 2u);
        EXPECT_EQ(second.parsedUnits, 0u);
        EXPECT_EQ(second.reusedUnits, 2u);
    }

    TEST(PipelineTest, UnrelatedEditOnlyReEmitsChangedDeclarations)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};

        const std::string other = "module demo.other; import enumerant.markers; [EnumExtensions] enumeration Other { A }";
        (void)pipeline.supply(ProgramSnapshot{{SourceText{"colors.bolt", kColors}, SourceText{"other.bolt", other}}});
        ASSERT_EQ(emitter.rendered.size(), 3u);

        const std::string edited = "module demo.other; import enumerant.markers; [EnumExtensions] enumeration Other { A, B }";
        const PassResult result
            = pipeline.supply(ProgramSnapshot{{SourceText{"colors.bolt", kColors}, SourceText{"other.bolt", edited}}});

        ASSERT_EQ(emitter.rendered.size(), 4u);
        EXPECT_EQ(emitter.rendered.back(), "OtherExtensions");
        EXPECT_EQ(result.emitted, 1u);
        EXPECT_EQ(result.reused, 2u);
        EXPECT_EQ(result.parsedUnits, 1u);
    }

    TEST(PipelineTest, EmptyProgramProducesNothing)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};

        const PassResult result = pipeline.supply(ProgramSnapshot{});
        EXPECT_FALSE(result.cancelled);
        EXPECT_TRUE(result.outputs.empty());
        EXPECT_TRUE(result.diagnostics.empty());
        EXPECT_TRUE(emitter.rendered.empty());
    }

    TEST(PipelineTest, UnresolvableDeclarationDoesNotStopOthers)
    {
        const std::string source = R"(module demo;
import enumerant.markers;
enumeration Color { Red }
[EnumExtensions] enumeration Color { Blue }
[EnumExtensions] enumeration Shade { Dark }
)";

        RecordingEmitter emitter;
        Pipeline pipeline{emitter};
        const PassResult result = pipeline.supply(ProgramSnapshot{{SourceText{"dupes.bolt", source}}});

        EXPECT_TRUE(hasDiagnostic(result, "ENR-W2301"));
        const auto skipped = std::count_if(result.diagnostics.begin(), result.diagnostics.end(), [](const semantic::Diagnostic& diagnostic) {
            return diagnostic.code == "ENR-W2301";
        });
        EXPECT_EQ(skipped, 1);
        ASSERT_EQ(result.outputs.size(), 1u);
        EXPECT_EQ(result.outputs.front().name, "ShadeExtensions_EnumExtensions");
    }

    TEST(PipelineTest, CoalescesOutputNameCollisions)
    {
        const std::string source = R"(module demo;
import enumerant.markers;
[EnumExtensions(ExtensionClassName = "Shared")] enumeration First { A }
[EnumExtensions(ExtensionClassName = "Shared")] enumeration Second { B }
)";

        RecordingEmitter emitter;
        Pipeline pipeline{emitter};
        const PassResult result = pipeline.supply(ProgramSnapshot{{SourceText{"shared.bolt", source}}});

        EXPECT_TRUE(hasDiagnostic(result, "ENR-W2302"));
        ASSERT_EQ(result.outputs.size(), 1u);
        EXPECT_EQ(result.outputs.front().description.declaredQualifiedName, "demo.First");
    }

    TEST(PipelineTest, CancelledPassLeavesCacheUntouched)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};
        const ProgramSnapshot snapshot{{SourceText{"colors.bolt", kColors}}};

        CancellationToken token;
        token.requestCancellation();
        const PassResult cancelled = pipeline.supply(snapshot, &token);

        EXPECT_TRUE(cancelled.cancelled);
        EXPECT_TRUE(cancelled.outputs.empty());
        EXPECT_TRUE(emitter.rendered.empty());
        EXPECT_EQ(pipeline.cache().recordCount(), 0u);
        EXPECT_EQ(pipeline.cache().treeCount(), 0u);

        token.reset();
        const PassResult resumed = pipeline.supply(snapshot, &token);
        EXPECT_FALSE(resumed.cancelled);
        EXPECT_EQ(resumed.outputs.size(), 2u);
        EXPECT_EQ(resumed.emitted, 2u);
    }

    TEST(PipelineTest, CancellationAfterCommitKeepsPreviousPass)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};
        const ProgramSnapshot snapshot{{SourceText{"colors.bolt", kColors}}};
        (void)pipeline.supply(snapshot);
        ASSERT_EQ(pipeline.cache().recordCount(), 2u);

        CancellationToken token;
        token.requestCancellation();
        const ProgramSnapshot edited{{SourceText{"colors.bolt", "module demo.colors; enumeration Plain { One }"}}};
        const PassResult cancelled = pipeline.supply(edited, &token);
        EXPECT_TRUE(cancelled.cancelled);
        EXPECT_EQ(pipeline.cache().recordCount(), 2u);

        const PassResult again = pipeline.supply(snapshot);
        EXPECT_EQ(again.reused, 2u);
        EXPECT_EQ(again.emitted, 0u);
    }

    TEST(PipelineTest, CancellationDuringDispatchDoesNotAbortEmission)
    {
        CancellationToken token;
        CancellingEmitter emitter{token};
        Pipeline pipeline{emitter};

        const PassResult result = pipeline.supply(ProgramSnapshot{{SourceText{"colors.bolt", kColors}}}, &token);
        EXPECT_FALSE(result.cancelled);
        EXPECT_EQ(result.outputs.size(), 2u);
        EXPECT_TRUE(token.isCancellationRequested());
    }

    TEST(PipelineTest, MarkerUnitCanBeDisabled)
    {
        RecordingEmitter emitter;
        PipelineOptions options;
        options.injectMarkerUnit = false;
        Pipeline pipeline{emitter, options};

        const PassResult result = pipeline.supply(ProgramSnapshot{{SourceText{"colors.bolt", kColors}}});
        EXPECT_TRUE(result.outputs.empty());
        EXPECT_TRUE(hasDiagnostic(result, "ENR-W2220"));
        EXPECT_EQ(result.parsedUnits, 1u);
    }

    TEST(PipelineTest, SuppliedMarkerUnitIsNotDuplicated)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};

        const PassResult result = pipeline.supply(ProgramSnapshot{{
            SourceText{std::string{kMarkerUnitPath}, std::string{markerUnitSource()}},
            SourceText{"colors.bolt", kColors}}});

        EXPECT_FALSE(hasDiagnostic(result, "ENR-E2221"));
        EXPECT_FALSE(hasDiagnostic(result, "ENR-E2211"));
        EXPECT_EQ(result.parsedUnits, 2u);
        EXPECT_EQ(result.outputs.size(), 2u);
    }

    TEST(PipelineTest, ReportsSyntaxDiagnosticsWithSourcePath)
    {
        RecordingEmitter emitter;
        Pipeline pipeline{emitter};

        const PassResult result
            = pipeline.supply(ProgramSnapshot{{SourceText{"broken.bolt", "module demo; enumeration Broken { A = }"}}});

        ASSERT_TRUE(hasDiagnostic(result, "ENR-E2145"));
        const auto it = std::find_if(result.diagnostics.begin(), result.diagnostics.end(), [](const semantic::Diagnostic& diagnostic) {
            return diagnostic.code == "ENR-E2145";
        });
        EXPECT_EQ(it->sourcePath, "broken.bolt");
        EXPECT_FALSE(it->isWarning);
    }
} // namespace
} // namespace enumerant::generator
