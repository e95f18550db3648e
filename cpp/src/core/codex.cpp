#include "fracktal/codex.hpp"

#include <utility>

namespace fracktal {

Codex::Codex(std::vector<Chunk> chunks,
             std::vector<SymbolId> symbols,
             std::vector<Pattern> dictionary,
             std::vector<Token> rewritten,
             std::string fingerprint,
             CompressionStats stats,
             uint32_t symbol_range,
             uint32_t hash_depth,
             std::string residual)
    : chunks_(std::move(chunks))
    , symbols_(std::move(symbols))
    , dictionary_(std::move(dictionary))
    , rewritten_(std::move(rewritten))
    , fingerprint_(std::move(fingerprint))
    , stats_(stats)
    , symbol_range_(symbol_range)
    , hash_depth_(hash_depth)
    , residual_(std::move(residual)) {}

std::string Codex::rewritten_text() const {
    std::string out;
    out.reserve(rewritten_.size() * 7);
    for (size_t i = 0; i < rewritten_.size(); ++i) {
        if (i > 0) out.push_back(' ');
        const Token& t = rewritten_[i];
        out += t.is_reference() ? reference_text(t.value) : symbol_text(t.value);
    }
    return out;
}

} // namespace fracktal
