#pragma once

#include "candidate_filter.hpp"
#include "symbols.hpp"

#include <optional>
#include <vector>

namespace enumerant::generator
{
    /// Returns the candidate unchanged when one of its attributes resolves to the opt-in
    /// marker. Attributes that do not resolve are skipped silently.
    [[nodiscard]] std::optional<SyntaxCandidate> resolveSemanticTarget(const SyntaxCandidate& candidate,
                                                                       const semantic::SymbolTable& symbols);

    /// Drops repeated visits of the same declaration node, keeping first-seen order.
    [[nodiscard]] std::vector<SyntaxCandidate> deduplicateCandidates(std::vector<SyntaxCandidate> candidates);
} // namespace enumerant::generator
