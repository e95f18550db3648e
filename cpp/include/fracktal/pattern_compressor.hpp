/**
 * Repeated sub-sequence substitution over a symbol stream
 *
 * Candidate lengths are evaluated longest first. For each length every
 * distinct window is grouped with all of its start positions (overlapping
 * starts included). A candidate is accepted when
 *
 *     savings = occurrences * length - length - occurrences
 *
 * (one dictionary symbol per pattern element, one reference token per
 * occurrence) is positive, exceeds min_savings_threshold, and occurrences
 * reach min_occurrences. Only occurrences lying entirely in positions not
 * yet consumed by an earlier pattern are counted. Accepted patterns replace
 * every non-overlapping occurrence, left to right, and mark it consumed.
 *
 * Order of acceptance: longer length first; within one length, larger
 * savings first, then earliest first occurrence. Candidate evaluation per
 * length is read-only and may run in parallel; acceptance is one sequential
 * pass, so the output does not depend on the thread count.
 */

#pragma once

#include "fracktal/types.hpp"
#include "fracktal/config.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace fracktal {

struct CompressionStats {
    size_t original_symbols = 0;
    size_t rewritten_tokens = 0;
    size_t pattern_count = 0;
    size_t dictionary_symbols = 0;      // Sum of pattern lengths
    size_t symbols_saved = 0;           // original_symbols - rewritten_tokens
    int64_t net_savings = 0;            // symbols_saved - dictionary_symbols
    double overall_compression_ratio = 1.0;   // original_symbols / rewritten_tokens
    size_t lengths_evaluated = 0;
    size_t lengths_skipped = 0;         // Dropped by the search budget

    bool operator==(const CompressionStats& other) const = default;
};

struct CompressionResult {
    std::vector<Token> rewritten;
    std::vector<Pattern> dictionary;
    CompressionStats stats;
};

class PatternCompressor {
public:
    explicit PatternCompressor(const CodecConfig& config = CodecConfig{});

    CompressionResult compress(std::span<const SymbolId> symbols) const;

    /**
     * Replace every reference token with its dictionary entry.
     * Throws DecodeError (MISSING_PATTERN) for a reference without an entry.
     */
    static std::vector<SymbolId> expand(std::span<const Token> rewritten,
                                        std::span<const Pattern> dictionary);

    static int64_t estimated_savings(size_t occurrences, size_t length) noexcept;

    // Longest candidate length considered for a stream of n symbols
    size_t max_candidate_length(size_t n) const noexcept;

private:
    struct Candidate {
        size_t length = 0;
        std::vector<size_t> positions;   // Ascending, may overlap
        int64_t savings = 0;
    };

    std::vector<Candidate> evaluate_length(std::span<const SymbolId> symbols, size_t length) const;

    CodecConfig config_;
};

} // namespace fracktal
