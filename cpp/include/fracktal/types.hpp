#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace fracktal {

// Overlapping window width. Fixed: reconstruction stitches the last unit of
// every chunk after the first, which only works for width 2.
inline constexpr size_t CHUNK_WIDTH = 2;

// Default symbol-space size R
inline constexpr uint32_t DEFAULT_SYMBOL_RANGE = 10000;

// Default number of iterated hash rounds per symbol
inline constexpr uint32_t DEFAULT_HASH_DEPTH = 4;

// Bounded-range identifier derived from a chunk. Collisions are expected.
using SymbolId = uint32_t;

// BLAKE3 digest (32 bytes)
struct Blake3Hash {
    std::array<uint8_t, 32> bytes;

    constexpr Blake3Hash() noexcept : bytes{} {}

    bool operator==(const Blake3Hash& other) const noexcept {
        return bytes == other.bytes;
    }

    bool operator!=(const Blake3Hash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Blake3Hash& other) const noexcept {
        return bytes < other.bytes;
    }

    // Lowercase hex, 64 characters
    std::string to_hex() const {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(64);
        for (uint8_t b : bytes) {
            result.push_back(hex_chars[b >> 4]);
            result.push_back(hex_chars[b & 0x0F]);
        }
        return result;
    }

    constexpr const uint8_t* data() const noexcept { return bytes.data(); }
    static constexpr size_t size() noexcept { return 32; }

    constexpr bool is_zero() const noexcept {
        for (uint8_t b : bytes) if (b != 0) return false;
        return true;
    }

    // First 8 bytes read little-endian. Byte order is explicit so symbol ids
    // do not depend on host endianness.
    constexpr uint64_t prefix_u64() const noexcept {
        uint64_t result = 0;
        for (size_t i = 0; i < 8; ++i) {
            result |= static_cast<uint64_t>(bytes[i]) << (8 * i);
        }
        return result;
    }
};

// One fixed-width window of the original input. The reconstruction key.
struct Chunk {
    std::array<char, CHUNK_WIDTH> units{};

    constexpr Chunk() noexcept = default;
    constexpr Chunk(char first, char second) noexcept : units{first, second} {}

    constexpr char first() const noexcept { return units[0]; }
    constexpr char last() const noexcept { return units[CHUNK_WIDTH - 1]; }

    std::string_view view() const noexcept {
        return std::string_view(units.data(), units.size());
    }

    bool operator==(const Chunk& other) const noexcept { return units == other.units; }
    bool operator!=(const Chunk& other) const noexcept { return !(*this == other); }
};

// Element of the rewritten stream: either a literal symbol or a reference
// into the pattern dictionary.
struct Token {
    enum class Kind : uint8_t {
        Symbol = 0,
        Reference = 1
    };

    Kind kind = Kind::Symbol;
    uint32_t value = 0;   // SymbolId for literals, dictionary index for references

    static constexpr Token symbol(SymbolId id) noexcept { return Token{Kind::Symbol, id}; }
    static constexpr Token reference(uint32_t index) noexcept { return Token{Kind::Reference, index}; }

    constexpr bool is_reference() const noexcept { return kind == Kind::Reference; }

    bool operator==(const Token& other) const noexcept {
        return kind == other.kind && value == other.value;
    }
    bool operator!=(const Token& other) const noexcept { return !(*this == other); }
};

// Dictionary entry: a literal run of symbols registered under a reference token
struct Pattern {
    std::string token;               // "P_000", "P_001", ... in acceptance order
    std::vector<SymbolId> symbols;   // Literal sub-sequence, length >= min_pattern_length
    uint32_t occurrences = 0;        // Occurrences counted when the pattern was accepted
    uint32_t substitutions = 0;      // Spans actually replaced in the rewritten stream
    size_t first_position = 0;       // Index of the first occurrence in the symbol stream

    bool operator==(const Pattern& other) const noexcept {
        return token == other.token && symbols == other.symbols &&
               occurrences == other.occurrences && substitutions == other.substitutions &&
               first_position == other.first_position;
    }
};

// Textual form of a symbol: "S_" + id zero-padded to four digits
std::string symbol_text(SymbolId id);

// Textual form of a reference token: "P_" + index zero-padded to three digits
std::string reference_text(uint32_t index);

} // namespace fracktal
