#pragma once

#include "cancellation.hpp"
#include "description_cache.hpp"
#include "diagnostic.hpp"
#include "emitter.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace enumerant::generator
{
    struct SourceText
    {
        std::string path;
        std::string text;
    };

    /// The whole program as seen by one pass.
    struct ProgramSnapshot
    {
        std::vector<SourceText> sources;
    };

    struct PipelineOptions
    {
        bool injectMarkerUnit{true};
    };

    struct PassResult
    {
        std::vector<OutputUnit> outputs;
        std::vector<semantic::Diagnostic> diagnostics;
        bool cancelled{false};
        std::size_t parsedUnits{0};
        std::size_t reusedUnits{0};
        std::size_t candidates{0};
        std::size_t emitted{0};
        std::size_t reused{0};
    };

    /// Pull-based extension generator. Each supply() call is one pass over an immutable
    /// snapshot; only the description cache survives between passes. Passes on the same
    /// pipeline must not overlap.
    class Pipeline
    {
    public:
        explicit Pipeline(ExtensionEmitter& emitter, PipelineOptions options = {});

        [[nodiscard]] PassResult supply(const ProgramSnapshot& snapshot, const CancellationToken* cancellation = nullptr);

        [[nodiscard]] const DescriptionCache& cache() const noexcept;

    private:
        ExtensionEmitter& m_emitter;
        PipelineOptions m_options;
        DescriptionCache m_cache;
    };
} // namespace enumerant::generator
