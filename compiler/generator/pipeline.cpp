#include "pipeline.hpp"

#include "binder.hpp"
#include "candidate_filter.hpp"
#include "markers.hpp"
#include "metadata_extractor.hpp"
#include "semantic_resolver.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>

namespace enumerant::generator
{
    namespace
    {
        bool isCancelled(const CancellationToken* cancellation)
        {
            return cancellation != nullptr && cancellation->isCancellationRequested();
        }

        void appendSyntaxDiagnostics(const frontend::SyntaxTree& tree, std::vector<semantic::Diagnostic>& diagnostics)
        {
            for (const auto& source : tree.diagnostics)
            {
                semantic::Diagnostic diag;
                diag.code = source.code;
                diag.message = source.message;
                diag.span = source.span;
                diag.sourcePath = tree.path;
                diag.isWarning = source.code.rfind("ENR-W", 0) == 0;
                diagnostics.emplace_back(std::move(diag));
            }
        }

        struct ExtractedRecord
        {
            std::string identity;
            EnumToGenerate record;
        };

        PassResult cancelledPass(PassResult result)
        {
            result.outputs.clear();
            result.cancelled = true;
            result.emitted = 0;
            result.reused = 0;
            return result;
        }
    } // namespace

    Pipeline::Pipeline(ExtensionEmitter& emitter, PipelineOptions options)
        : m_emitter(emitter)
        , m_options(options)
    {
    }

    PassResult Pipeline::supply(const ProgramSnapshot& snapshot, const CancellationToken* cancellation)
    {
        PassResult result;
        m_cache.discardStaged();

        std::vector<SourceText> sources = snapshot.sources;
        if (m_options.injectMarkerUnit)
        {
            const bool supplied = std::any_of(sources.begin(), sources.end(), [](const SourceText& source) {
                return source.path == kMarkerUnitPath;
            });
            if (!supplied)
            {
                sources.push_back(SourceText{std::string{kMarkerUnitPath}, std::string{markerUnitSource()}});
            }
        }

        std::vector<std::shared_ptr<const frontend::SyntaxTree>> trees;
        trees.reserve(sources.size());
        for (const auto& source : sources)
        {
            std::shared_ptr<const frontend::SyntaxTree> tree = m_cache.findTree(source.path, source.text);
            if (tree != nullptr)
            {
                ++result.reusedUnits;
            }
            else
            {
                tree = frontend::parseSyntaxTree(source.path, source.text);
                ++result.parsedUnits;
            }

            appendSyntaxDiagnostics(*tree, result.diagnostics);
            m_cache.stageTree(tree);
            trees.emplace_back(std::move(tree));
        }

        std::vector<semantic::BindingUnit> bindingUnits;
        bindingUnits.reserve(trees.size());
        for (const auto& tree : trees)
        {
            bindingUnits.push_back(semantic::BindingUnit{tree->path, &tree->unit});
        }

        semantic::Binder binder{std::move(bindingUnits)};
        const semantic::SymbolTable symbols = binder.bind();
        const auto& binderDiagnostics = binder.diagnostics();
        result.diagnostics.insert(result.diagnostics.end(), binderDiagnostics.begin(), binderDiagnostics.end());

        std::vector<SyntaxCandidate> syntaxCandidates;
        for (const auto& tree : trees)
        {
            std::vector<SyntaxCandidate> found = collectSyntaxCandidates(tree);
            syntaxCandidates.insert(syntaxCandidates.end(),
                std::make_move_iterator(found.begin()),
                std::make_move_iterator(found.end()));
        }
        syntaxCandidates = deduplicateCandidates(std::move(syntaxCandidates));

        std::vector<ExtractedRecord> extracted;
        std::unordered_map<std::string, std::size_t> byOutputName;

        for (const auto& candidate : syntaxCandidates)
        {
            if (isCancelled(cancellation))
            {
                m_cache.discardStaged();
                return cancelledPass(std::move(result));
            }

            const std::optional<SyntaxCandidate> resolved = resolveSemanticTarget(candidate, symbols);
            if (!resolved.has_value())
            {
                continue;
            }
            ++result.candidates;

            std::optional<EnumToGenerate> record = extractDescription(*resolved, symbols, result.diagnostics);
            if (!record.has_value())
            {
                continue;
            }

            const std::string unitName = outputUnitName(*record);
            auto existing = byOutputName.find(unitName);
            if (existing != byOutputName.end())
            {
                if (extracted[existing->second].record != *record)
                {
                    semantic::Diagnostic diag;
                    diag.code = "ENR-W2302";
                    diag.message = "Output unit '" + unitName + "' is already produced by '"
                        + extracted[existing->second].record.declaredQualifiedName + "'; '"
                        + record->declaredQualifiedName + "' is skipped.";
                    diag.span = resolved->declaration->span;
                    diag.sourcePath = resolved->tree->path;
                    diag.isWarning = true;
                    result.diagnostics.emplace_back(std::move(diag));
                }
                continue;
            }

            byOutputName.emplace(unitName, extracted.size());
            extracted.push_back(ExtractedRecord{resolved->identity(), std::move(*record)});
        }

        if (isCancelled(cancellation))
        {
            m_cache.discardStaged();
            return cancelledPass(std::move(result));
        }

        result.outputs.reserve(extracted.size());
        for (auto& entry : extracted)
        {
            OutputUnit output;
            if (m_cache.classify(entry.identity, entry.record) == ChangeKind::Unchanged)
            {
                output = *m_cache.previousOutput(entry.identity);
                output.reused = true;
                ++result.reused;
            }
            else
            {
                output.name = outputUnitName(entry.record);
                output.content = m_emitter.render(entry.record);
                output.description = std::move(entry.record);
                output.reused = false;
                ++result.emitted;
            }

            m_cache.stageOutput(entry.identity, output);
            result.outputs.emplace_back(std::move(output));
        }

        m_cache.commit();
        return result;
    }

    const DescriptionCache& Pipeline::cache() const noexcept
    {
        return m_cache;
    }
} // namespace enumerant::generator
