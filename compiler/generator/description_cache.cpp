#include "description_cache.hpp"

#include <utility>

namespace enumerant::generator
{
    std::string_view toString(ChangeKind kind) noexcept
    {
        switch (kind)
        {
        case ChangeKind::New:
            return "new";
        case ChangeKind::Changed:
            return "changed";
        case ChangeKind::Unchanged:
            return "unchanged";
        }
        return "unknown";
    }

    std::shared_ptr<const frontend::SyntaxTree> DescriptionCache::findTree(std::string_view path, std::string_view text) const
    {
        auto it = m_trees.find(std::string{path});
        if (it == m_trees.end() || it->second == nullptr || it->second->text != text)
        {
            return nullptr;
        }
        return it->second;
    }

    void DescriptionCache::stageTree(std::shared_ptr<const frontend::SyntaxTree> tree)
    {
        if (tree == nullptr)
        {
            return;
        }
        const std::string path = tree->path;
        m_stagedTrees.emplace(path, std::move(tree));
    }

    ChangeKind DescriptionCache::classify(const std::string& identity, const EnumToGenerate& record) const
    {
        auto it = m_outputs.find(identity);
        if (it == m_outputs.end())
        {
            return ChangeKind::New;
        }
        return it->second.description == record ? ChangeKind::Unchanged : ChangeKind::Changed;
    }

    const OutputUnit* DescriptionCache::previousOutput(const std::string& identity) const
    {
        auto it = m_outputs.find(identity);
        return it == m_outputs.end() ? nullptr : &it->second;
    }

    void DescriptionCache::stageOutput(const std::string& identity, OutputUnit output)
    {
        m_stagedOutputs[identity] = std::move(output);
    }

    void DescriptionCache::commit()
    {
        m_trees = std::move(m_stagedTrees);
        m_outputs = std::move(m_stagedOutputs);
        m_stagedTrees.clear();
        m_stagedOutputs.clear();
    }

    void DescriptionCache::discardStaged()
    {
        m_stagedTrees.clear();
        m_stagedOutputs.clear();
    }

    std::size_t DescriptionCache::treeCount() const noexcept
    {
        return m_trees.size();
    }

    std::size_t DescriptionCache::recordCount() const noexcept
    {
        return m_outputs.size();
    }
} // namespace enumerant::generator
