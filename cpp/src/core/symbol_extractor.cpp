#include "fracktal/symbol_extractor.hpp"
#include "fracktal/blake3.hpp"
#include "fracktal/error.hpp"

#include <cstdio>

namespace fracktal {

std::string symbol_text(SymbolId id) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "S_%04u", static_cast<unsigned>(id));
    return buf;
}

std::string reference_text(uint32_t index) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "P_%03u", static_cast<unsigned>(index));
    return buf;
}

SymbolExtractor::SymbolExtractor(uint32_t symbol_range)
    : symbol_range_(symbol_range) {
    FRACKTAL_CHECK_ARGUMENT(symbol_range > 0, "symbol_range must be positive");
}

SymbolId SymbolExtractor::symbol_for(const Chunk& chunk) const noexcept {
    Blake3Hash h = Blake3Hasher::hash(chunk.view());
    return static_cast<SymbolId>(h.prefix_u64() % symbol_range_);
}

Extraction SymbolExtractor::extract(std::string_view input) const {
    Extraction out;
    if (input.size() < CHUNK_WIDTH) {
        return out;
    }

    const size_t count = input.size() - (CHUNK_WIDTH - 1);
    out.chunks.reserve(count);
    out.symbols.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        Chunk chunk(input[i], input[i + 1]);
        out.symbols.push_back(symbol_for(chunk));
        out.chunks.push_back(chunk);
    }
    return out;
}

} // namespace fracktal
