#include "fracktal/pattern_compressor.hpp"
#include "fracktal/error.hpp"
#include "fracktal/logging.hpp"
#include "fracktal/thread_pool.hpp"

#include <algorithm>
#include <unordered_map>

namespace fracktal {

namespace {

// Smallest total scan (in windows) evaluated on worker threads
constexpr uint64_t PARALLEL_MIN_WINDOWS = 1 << 16;

constexpr int32_t NO_PATTERN = -1;

// Hash/equality over a window identified by its start position
struct WindowHasher {
    const SymbolId* data;
    size_t length;

    size_t operator()(size_t start) const noexcept {
        uint64_t h = 0xcbf29ce484222325ULL;
        for (size_t i = 0; i < length; ++i) {
            h ^= data[start + i];
            h *= 0x100000001b3ULL;
        }
        return static_cast<size_t>(h);
    }
};

struct WindowEqual {
    const SymbolId* data;
    size_t length;

    bool operator()(size_t a, size_t b) const noexcept {
        return std::equal(data + a, data + a + length, data + b);
    }
};

bool span_is_free(const std::vector<bool>& consumed, size_t start, size_t length) {
    for (size_t i = start; i < start + length; ++i) {
        if (consumed[i]) return false;
    }
    return true;
}

} // anonymous namespace

PatternCompressor::PatternCompressor(const CodecConfig& config)
    : config_(config) {
    config_.validate();
}

int64_t PatternCompressor::estimated_savings(size_t occurrences, size_t length) noexcept {
    auto occ = static_cast<int64_t>(occurrences);
    auto len = static_cast<int64_t>(length);
    return occ * len - len - occ;
}

size_t PatternCompressor::max_candidate_length(size_t n) const noexcept {
    return std::min(config_.max_pattern_length, (n + 1) / 2);
}

std::vector<PatternCompressor::Candidate>
PatternCompressor::evaluate_length(std::span<const SymbolId> symbols, size_t length) const {
    const size_t windows = symbols.size() - length + 1;

    WindowHasher hasher{symbols.data(), length};
    WindowEqual equal{symbols.data(), length};
    std::unordered_map<size_t, size_t, WindowHasher, WindowEqual> groups(windows, hasher, equal);

    std::vector<Candidate> candidates;
    for (size_t start = 0; start < windows; ++start) {
        auto [it, inserted] = groups.try_emplace(start, candidates.size());
        if (inserted) {
            candidates.push_back(Candidate{length, {start}, 0});
        } else {
            candidates[it->second].positions.push_back(start);
        }
    }

    const int64_t floor = std::max<int64_t>(0, config_.min_savings_threshold);

    std::vector<Candidate> viable;
    for (auto& c : candidates) {
        if (c.positions.size() < config_.min_occurrences) continue;
        c.savings = estimated_savings(c.positions.size(), length);
        if (c.savings <= floor) continue;
        viable.push_back(std::move(c));
    }

    // Candidates were created in first-occurrence order, so positions[0] is unique
    std::sort(viable.begin(), viable.end(), [](const Candidate& a, const Candidate& b) {
        if (a.savings != b.savings) return a.savings > b.savings;
        return a.positions.front() < b.positions.front();
    });
    return viable;
}

CompressionResult PatternCompressor::compress(std::span<const SymbolId> symbols) const {
    CompressionResult result;
    const size_t n = symbols.size();
    result.stats.original_symbols = n;

    // Lengths to scan, longest first, cut off once the window budget runs out
    std::vector<size_t> lengths;
    const size_t max_len = max_candidate_length(n);
    uint64_t budget_used = 0;
    for (size_t len = max_len; len >= config_.min_pattern_length && len > 0; --len) {
        uint64_t cost = n - len + 1;
        if (budget_used + cost > config_.search_budget) {
            result.stats.lengths_skipped = len - config_.min_pattern_length + 1;
            LOG_WARN("Pattern search budget exhausted: skipping lengths ",
                     config_.min_pattern_length, "..", len, " for ", n, " symbols");
            break;
        }
        budget_used += cost;
        lengths.push_back(len);
    }
    result.stats.lengths_evaluated = lengths.size();

    // Read-only evaluation, one slot per length
    std::vector<std::vector<Candidate>> evaluated(lengths.size());
    const size_t threads = bounded_thread_count(config_.num_threads, lengths.size());
    if (threads > 1 && budget_used >= PARALLEL_MIN_WINDOWS) {
        ThreadPool pool(threads);
        pool.parallel_for_index(0, lengths.size(), [&](size_t i) {
            evaluated[i] = evaluate_length(symbols, lengths[i]);
        });
    } else {
        for (size_t i = 0; i < lengths.size(); ++i) {
            evaluated[i] = evaluate_length(symbols, lengths[i]);
        }
    }

    // Sequential acceptance in the fixed order
    std::vector<bool> consumed(n, false);
    std::vector<int32_t> substitution_at(n, NO_PATTERN);
    const int64_t floor = std::max<int64_t>(0, config_.min_savings_threshold);
    bool dictionary_full = false;

    for (auto& per_length : evaluated) {
        for (auto& candidate : per_length) {
            if (result.dictionary.size() >= config_.max_patterns) {
                dictionary_full = true;
                break;
            }

            const size_t len = candidate.length;
            std::vector<size_t> live;
            for (size_t p : candidate.positions) {
                if (span_is_free(consumed, p, len)) live.push_back(p);
            }
            if (live.size() < config_.min_occurrences) continue;
            if (estimated_savings(live.size(), len) <= floor) continue;

            const auto index = static_cast<uint32_t>(result.dictionary.size());
            Pattern pattern;
            pattern.token = reference_text(index);
            pattern.symbols.assign(symbols.begin() + live.front(), symbols.begin() + live.front() + len);
            pattern.occurrences = static_cast<uint32_t>(live.size());
            pattern.first_position = live.front();

            size_t next_free = 0;
            for (size_t p : live) {
                if (p < next_free) continue;
                std::fill(consumed.begin() + p, consumed.begin() + p + len, true);
                substitution_at[p] = static_cast<int32_t>(index);
                next_free = p + len;
                ++pattern.substitutions;
            }

            LOG_DEBUG("Accepted ", pattern.token, " length=", len, " occurrences=", pattern.occurrences,
                      " substitutions=", pattern.substitutions);
            result.dictionary.push_back(std::move(pattern));
        }
        if (dictionary_full) {
            LOG_WARN("Pattern dictionary reached max_patterns=", config_.max_patterns);
            break;
        }
    }

    result.rewritten.reserve(n);
    for (size_t i = 0; i < n;) {
        if (substitution_at[i] != NO_PATTERN) {
            const auto index = static_cast<uint32_t>(substitution_at[i]);
            result.rewritten.push_back(Token::reference(index));
            i += result.dictionary[index].symbols.size();
        } else {
            result.rewritten.push_back(Token::symbol(symbols[i]));
            ++i;
        }
    }

    auto& stats = result.stats;
    stats.rewritten_tokens = result.rewritten.size();
    stats.pattern_count = result.dictionary.size();
    for (const auto& p : result.dictionary) {
        stats.dictionary_symbols += p.symbols.size();
    }
    stats.symbols_saved = n - stats.rewritten_tokens;
    stats.net_savings = static_cast<int64_t>(stats.symbols_saved) - static_cast<int64_t>(stats.dictionary_symbols);
    stats.overall_compression_ratio = stats.rewritten_tokens > 0
        ? static_cast<double>(n) / static_cast<double>(stats.rewritten_tokens)
        : 1.0;

    return result;
}

std::vector<SymbolId> PatternCompressor::expand(std::span<const Token> rewritten,
                                                std::span<const Pattern> dictionary) {
    std::vector<SymbolId> expanded;
    expanded.reserve(rewritten.size());

    for (size_t i = 0; i < rewritten.size(); ++i) {
        const Token& token = rewritten[i];
        if (!token.is_reference()) {
            expanded.push_back(token.value);
            continue;
        }

        if (token.value >= dictionary.size()) {
            throw DecodeError("Reference " + reference_text(token.value) + " at token " +
                              std::to_string(i) + " has no dictionary entry (dictionary size " +
                              std::to_string(dictionary.size()) + ")",
                              "PatternCompressor::expand", ErrorCode::MISSING_PATTERN);
        }
        const Pattern& pattern = dictionary[token.value];
        if (pattern.symbols.empty()) {
            throw DecodeError("Dictionary entry " + pattern.token + " is empty",
                              "PatternCompressor::expand", ErrorCode::INCONSISTENT_ARTIFACT);
        }
        expanded.insert(expanded.end(), pattern.symbols.begin(), pattern.symbols.end());
    }
    return expanded;
}

} // namespace fracktal
