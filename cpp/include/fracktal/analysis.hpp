#pragma once

#include "fracktal/codex.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fracktal {

/**
 * Shannon entropy, in bits per byte, of the input, of the concatenated
 * symbol texts, and of the concatenated collapsed hashes.
 */
struct EntropyReport {
    double original_entropy = 0.0;
    double symbolic_entropy = 0.0;
    double fractal_entropy = 0.0;
    double entropy_preservation = 1.0;   // symbolic / original, 1.0 when original is 0
};

struct CompressionSummary {
    size_t original_length = 0;
    size_t symbol_count = 0;
    size_t distinct_symbols = 0;
    size_t rewritten_tokens = 0;
    size_t dictionary_symbols = 0;
    size_t pattern_count = 0;
    double compression_ratio = 1.0;
    int64_t net_savings = 0;
    double savings_percentage = 0.0;   // symbols_saved / symbol_count * 100
    std::optional<SymbolId> most_frequent_symbol;
    std::string fingerprint;
};

/**
 * Read-only reports over an artifact. All methods are static and pure.
 */
class CodexAnalyzer {
public:
    static double shannon_entropy(std::string_view data) noexcept;

    static EntropyReport analyze_entropy(std::string_view input, const Codex& codex);

    static CompressionSummary summarize(const Codex& codex);

    // One-line human-readable form of summarize(), for logs
    static std::string describe(const Codex& codex);
};

} // namespace fracktal
