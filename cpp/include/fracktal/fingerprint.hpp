#pragma once

#include "fracktal/types.hpp"
#include <span>
#include <string>
#include <vector>

namespace fracktal {

/**
 * Iterated-hash content signature.
 *
 * collapse() hashes a symbol's text `depth` times in a bounded loop; the
 * fingerprint hashes all symbol texts followed by all collapsed hashes, in
 * stream order. Deterministic across processes and platforms. Carries no
 * reconstruction information.
 */
class FractalFingerprinter {
public:
    explicit FractalFingerprinter(uint32_t depth = DEFAULT_HASH_DEPTH) : depth_(depth) {}

    // Lowercase hex after `depth` rounds; depth 0 returns the symbol text
    static std::string collapse(SymbolId symbol, uint32_t depth);

    std::string collapse(SymbolId symbol) const { return collapse(symbol, depth_); }

    // One collapsed hash per position. Each distinct id is hashed once.
    std::vector<std::string> collapse_all(std::span<const SymbolId> symbols) const;

    static std::string fingerprint(std::span<const SymbolId> symbols,
                                   std::span<const std::string> collapsed);

    // collapse_all() followed by fingerprint()
    std::string fingerprint(std::span<const SymbolId> symbols) const;

    uint32_t depth() const noexcept { return depth_; }

private:
    uint32_t depth_;
};

} // namespace fracktal
