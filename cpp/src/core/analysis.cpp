#include "fracktal/analysis.hpp"
#include "fracktal/fingerprint.hpp"
#include "fracktal/ontology.hpp"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fracktal {

double CodexAnalyzer::shannon_entropy(std::string_view data) noexcept {
    if (data.empty()) return 0.0;

    std::array<size_t, 256> freq{};
    for (char c : data) {
        ++freq[static_cast<unsigned char>(c)];
    }

    const double length = static_cast<double>(data.size());
    double entropy = 0.0;
    for (size_t count : freq) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / length;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

EntropyReport CodexAnalyzer::analyze_entropy(std::string_view input, const Codex& codex) {
    std::string symbol_stream;
    symbol_stream.reserve(codex.symbols().size() * 6);
    for (SymbolId id : codex.symbols()) {
        symbol_stream += symbol_text(id);
    }

    FractalFingerprinter fingerprinter(codex.hash_depth());
    std::string hash_stream;
    for (const auto& h : fingerprinter.collapse_all(codex.symbols())) {
        hash_stream += h;
    }

    EntropyReport report;
    report.original_entropy = shannon_entropy(input);
    report.symbolic_entropy = shannon_entropy(symbol_stream);
    report.fractal_entropy = shannon_entropy(hash_stream);
    report.entropy_preservation = report.original_entropy > 0.0
        ? report.symbolic_entropy / report.original_entropy
        : 1.0;
    return report;
}

CompressionSummary CodexAnalyzer::summarize(const Codex& codex) {
    const CompressionStats& stats = codex.stats();
    Ontology ontology = OntologyLinker::link(codex.symbols());

    CompressionSummary summary;
    summary.original_length = codex.original_length();
    summary.symbol_count = codex.symbols().size();
    summary.distinct_symbols = ontology.distinct_count();
    summary.rewritten_tokens = codex.rewritten().size();
    summary.dictionary_symbols = stats.dictionary_symbols;
    summary.pattern_count = codex.dictionary().size();
    summary.compression_ratio = stats.overall_compression_ratio;
    summary.net_savings = stats.net_savings;
    summary.savings_percentage = summary.symbol_count > 0
        ? 100.0 * static_cast<double>(stats.symbols_saved) / static_cast<double>(summary.symbol_count)
        : 0.0;
    summary.most_frequent_symbol = ontology.most_frequent();
    summary.fingerprint = codex.fingerprint();
    return summary;
}

std::string CodexAnalyzer::describe(const Codex& codex) {
    CompressionSummary s = summarize(codex);
    std::ostringstream out;
    out << s.original_length << " bytes, "
        << s.symbol_count << " symbols (" << s.distinct_symbols << " distinct) -> "
        << s.rewritten_tokens << " tokens + " << s.pattern_count << " patterns, ratio "
        << std::fixed << std::setprecision(3) << s.compression_ratio
        << ", fingerprint " << s.fingerprint.substr(0, 16);
    return out.str();
}

} // namespace fracktal
