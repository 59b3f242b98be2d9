#pragma once

#include "emitter.hpp"
#include "enum_to_generate.hpp"
#include "syntax_tree.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace enumerant::generator
{
    enum class ChangeKind
    {
        New,
        Changed,
        Unchanged
    };

    [[nodiscard]] std::string_view toString(ChangeKind kind) noexcept;

    /// Cross-pass state of the pipeline. A pass reads the committed state of the previous
    /// pass and stages its own; commit() makes the staged state current, discardStaged()
    /// drops it. Trees and records not staged again are evicted at commit.
    class DescriptionCache
    {
    public:
        /// Committed tree for `path` when its text is byte-identical to `text`.
        [[nodiscard]] std::shared_ptr<const frontend::SyntaxTree> findTree(std::string_view path, std::string_view text) const;
        void stageTree(std::shared_ptr<const frontend::SyntaxTree> tree);

        [[nodiscard]] ChangeKind classify(const std::string& identity, const EnumToGenerate& record) const;
        [[nodiscard]] const OutputUnit* previousOutput(const std::string& identity) const;
        void stageOutput(const std::string& identity, OutputUnit output);

        void commit();
        void discardStaged();

        [[nodiscard]] std::size_t treeCount() const noexcept;
        [[nodiscard]] std::size_t recordCount() const noexcept;

    private:
        std::unordered_map<std::string, std::shared_ptr<const frontend::SyntaxTree>> m_trees;
        std::unordered_map<std::string, std::shared_ptr<const frontend::SyntaxTree>> m_stagedTrees;
        std::unordered_map<std::string, OutputUnit> m_outputs;
        std::unordered_map<std::string, OutputUnit> m_stagedOutputs;
    };
} // namespace enumerant::generator
