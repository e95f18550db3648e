#pragma once

#include "fracktal/types.hpp"
#include <string_view>
#include <vector>

namespace fracktal {

struct Extraction {
    std::vector<Chunk> chunks;       // chunk i = input[i, i+1]
    std::vector<SymbolId> symbols;   // symbol i = BLAKE3(chunk i) mod R
};

/**
 * Slides a width-2 window over the input and derives one bounded-range
 * symbol per window.
 *
 * Input shorter than the window yields empty sequences. Distinct chunks may
 * map to the same symbol; nothing downstream relies on symbol uniqueness.
 */
class SymbolExtractor {
public:
    explicit SymbolExtractor(uint32_t symbol_range = DEFAULT_SYMBOL_RANGE);

    Extraction extract(std::string_view input) const;

    SymbolId symbol_for(const Chunk& chunk) const noexcept;

    uint32_t symbol_range() const noexcept { return symbol_range_; }

private:
    uint32_t symbol_range_;
};

} // namespace fracktal
