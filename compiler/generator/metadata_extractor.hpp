#pragma once

#include "candidate_filter.hpp"
#include "diagnostic.hpp"
#include "enum_to_generate.hpp"
#include "symbols.hpp"

#include <optional>
#include <vector>

namespace enumerant::generator
{
    /// Reduces a resolved candidate to its description record. Returns nullopt and appends
    /// ENR-W2301 when the declaration has no symbol in `symbols`, or ENR-W2303 when the
    /// extension class name is not an identifier or its namespace is not a qualified name.
    [[nodiscard]] std::optional<EnumToGenerate> extractDescription(const SyntaxCandidate& candidate,
                                                                   const semantic::SymbolTable& symbols,
                                                                   std::vector<semantic::Diagnostic>& diagnostics);

    /// Builds the record of a bound enumeration symbol. Pure: reads only `symbol`.
    [[nodiscard]] EnumToGenerate describeEnumeration(const semantic::EnumerationSymbol& symbol);
} // namespace enumerant::generator
