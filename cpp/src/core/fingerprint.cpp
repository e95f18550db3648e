#include "fracktal/fingerprint.hpp"
#include "fracktal/blake3.hpp"
#include "fracktal/error.hpp"

#include <unordered_map>

namespace fracktal {

std::string FractalFingerprinter::collapse(SymbolId symbol, uint32_t depth) {
    std::string h = symbol_text(symbol);
    for (uint32_t round = 0; round < depth; ++round) {
        h = Blake3Hasher::hash_hex(h);
    }
    return h;
}

std::vector<std::string> FractalFingerprinter::collapse_all(std::span<const SymbolId> symbols) const {
    std::unordered_map<SymbolId, std::string> memo;
    std::vector<std::string> collapsed;
    collapsed.reserve(symbols.size());

    for (SymbolId id : symbols) {
        auto it = memo.find(id);
        if (it == memo.end()) {
            it = memo.emplace(id, collapse(id, depth_)).first;
        }
        collapsed.push_back(it->second);
    }
    return collapsed;
}

std::string FractalFingerprinter::fingerprint(std::span<const SymbolId> symbols,
                                              std::span<const std::string> collapsed) {
    FRACKTAL_CHECK_ARGUMENT(symbols.size() == collapsed.size(),
        "collapsed hash count " + std::to_string(collapsed.size()) +
        " does not match symbol count " + std::to_string(symbols.size()));

    Blake3Hasher::Incremental hasher;
    for (SymbolId id : symbols) {
        hasher.update(symbol_text(id));
    }
    for (const auto& h : collapsed) {
        hasher.update(h);
    }
    return hasher.finalize().to_hex();
}

std::string FractalFingerprinter::fingerprint(std::span<const SymbolId> symbols) const {
    std::vector<std::string> collapsed = collapse_all(symbols);
    return fingerprint(symbols, collapsed);
}

} // namespace fracktal
