#pragma once

#include "fracktal/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace fracktal {

// Position i links to i-1; position 0 has no predecessor
struct OntologyLink {
    SymbolId symbol;
    int64_t predecessor;   // -1 for the first position

    bool has_predecessor() const noexcept { return predecessor >= 0; }
};

/**
 * Descriptive adjacency over a symbol stream.
 *
 * Flat array of (symbol, predecessor) pairs addressed by position, plus
 * the occurrence list of each distinct symbol id. Never consulted when
 * decoding.
 */
class Ontology {
public:
    Ontology() = default;

    const std::vector<OntologyLink>& links() const noexcept { return links_; }

    // Distinct id -> ascending positions. Ordered map so iteration is stable.
    const std::map<SymbolId, std::vector<size_t>>& occurrences() const noexcept { return occurrences_; }

    size_t size() const noexcept { return links_.size(); }
    size_t distinct_count() const noexcept { return occurrences_.size(); }

    size_t occurrence_count(SymbolId id) const;

    std::vector<SymbolId> distinct_symbols() const;

    // Most frequent id; ties go to the smallest id. Empty for an empty stream.
    std::optional<SymbolId> most_frequent() const;

private:
    friend class OntologyLinker;

    std::vector<OntologyLink> links_;
    std::map<SymbolId, std::vector<size_t>> occurrences_;
};

class OntologyLinker {
public:
    static Ontology link(std::span<const SymbolId> symbols);
};

/**
 * Jaccard similarity of the distinct symbol ids of two ontologies:
 * |A ∩ B| / |A ∪ B|. 0.0 when either side is empty.
 */
double structural_similarity(const Ontology& a, const Ontology& b);

} // namespace fracktal
