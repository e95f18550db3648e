#pragma once

#include "fracktal/types.hpp"
#include "fracktal/pattern_compressor.hpp"
#include <string>
#include <vector>

namespace fracktal {

/**
 * Encoded artifact
 *
 * Immutable bundle produced by Codec::encode(): chunk table, symbol stream,
 * pattern dictionary, rewritten stream, fingerprint and statistics, plus the
 * symbol range and hash depth they were produced with.
 *
 * Input shorter than one chunk produces an empty artifact whose only payload
 * is `residual` (the zero or one input byte), so every input round-trips.
 *
 * The public constructor exists so a persistence layer can rehydrate a
 * stored artifact; it performs no validation. Codec::decode() is where
 * consistency is checked.
 */
class Codex {
public:
    Codex() = default;

    Codex(std::vector<Chunk> chunks,
          std::vector<SymbolId> symbols,
          std::vector<Pattern> dictionary,
          std::vector<Token> rewritten,
          std::string fingerprint,
          CompressionStats stats,
          uint32_t symbol_range,
          uint32_t hash_depth,
          std::string residual = {});

    const std::vector<Chunk>& chunks() const noexcept { return chunks_; }
    const std::vector<SymbolId>& symbols() const noexcept { return symbols_; }
    const std::vector<Pattern>& dictionary() const noexcept { return dictionary_; }
    const std::vector<Token>& rewritten() const noexcept { return rewritten_; }
    const std::string& fingerprint() const noexcept { return fingerprint_; }
    const CompressionStats& stats() const noexcept { return stats_; }
    uint32_t symbol_range() const noexcept { return symbol_range_; }
    uint32_t hash_depth() const noexcept { return hash_depth_; }
    const std::string& residual() const noexcept { return residual_; }

    bool empty() const noexcept { return chunks_.empty(); }

    // Length of the input this artifact decodes to
    size_t original_length() const noexcept {
        return chunks_.empty() ? residual_.size() : chunks_.size() + (CHUNK_WIDTH - 1);
    }

    // Rewritten stream in text form, e.g. "P_000 S_0042 S_1234"
    std::string rewritten_text() const;

    bool operator==(const Codex& other) const = default;

private:
    std::vector<Chunk> chunks_;
    std::vector<SymbolId> symbols_;
    std::vector<Pattern> dictionary_;
    std::vector<Token> rewritten_;
    std::string fingerprint_;
    CompressionStats stats_;
    uint32_t symbol_range_ = DEFAULT_SYMBOL_RANGE;
    uint32_t hash_depth_ = DEFAULT_HASH_DEPTH;
    std::string residual_;
};

} // namespace fracktal
