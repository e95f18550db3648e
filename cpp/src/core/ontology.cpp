#include "fracktal/ontology.hpp"

namespace fracktal {

Ontology OntologyLinker::link(std::span<const SymbolId> symbols) {
    Ontology ontology;
    ontology.links_.reserve(symbols.size());

    for (size_t i = 0; i < symbols.size(); ++i) {
        int64_t predecessor = i > 0 ? static_cast<int64_t>(i - 1) : -1;
        ontology.links_.push_back(OntologyLink{symbols[i], predecessor});
        ontology.occurrences_[symbols[i]].push_back(i);
    }
    return ontology;
}

size_t Ontology::occurrence_count(SymbolId id) const {
    auto it = occurrences_.find(id);
    return it == occurrences_.end() ? 0 : it->second.size();
}

std::vector<SymbolId> Ontology::distinct_symbols() const {
    std::vector<SymbolId> ids;
    ids.reserve(occurrences_.size());
    for (const auto& [id, positions] : occurrences_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<SymbolId> Ontology::most_frequent() const {
    std::optional<SymbolId> best;
    size_t best_count = 0;
    for (const auto& [id, positions] : occurrences_) {
        // Ascending id order, strict > keeps the smallest id on ties
        if (positions.size() > best_count) {
            best = id;
            best_count = positions.size();
        }
    }
    return best;
}

double structural_similarity(const Ontology& a, const Ontology& b) {
    if (a.distinct_count() == 0 || b.distinct_count() == 0) {
        return 0.0;
    }

    // Both maps iterate in ascending id order: merge-count the intersection
    const auto& lhs = a.occurrences();
    const auto& rhs = b.occurrences();
    auto li = lhs.begin();
    auto ri = rhs.begin();
    size_t intersection = 0;
    while (li != lhs.end() && ri != rhs.end()) {
        if (li->first < ri->first) {
            ++li;
        } else if (ri->first < li->first) {
            ++ri;
        } else {
            ++intersection;
            ++li;
            ++ri;
        }
    }

    size_t union_size = lhs.size() + rhs.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

} // namespace fracktal
