#pragma once

#include "fracktal/types.hpp"
#include <span>
#include <string>
#include <string_view>
#include <memory>

namespace fracktal {

/**
 * BLAKE3 hashing (unkeyed mode, 32-byte output)
 *
 * Used for:
 * 1. Symbol derivation: hash of the two chunk bytes, reduced mod R
 * 2. Collapse rounds: hash of the previous round's hex text
 * 3. Fingerprint: hash of the concatenated symbol texts and collapsed hashes
 */
class Blake3Hasher {
public:
    static Blake3Hash hash(std::span<const uint8_t> data) noexcept;

    static Blake3Hash hash(std::string_view str) noexcept;

    // Lowercase hex of hash(str)
    static std::string hash_hex(std::string_view str);

    /**
     * Incremental hasher for streaming data. Feeding the same bytes in any
     * split yields the same digest as one-shot hash().
     */
    class Incremental {
    public:
        Incremental() noexcept;
        ~Incremental();

        Incremental(const Incremental&) = delete;
        Incremental& operator=(const Incremental&) = delete;
        Incremental(Incremental&&) noexcept;
        Incremental& operator=(Incremental&&) noexcept;

        void update(std::span<const uint8_t> data) noexcept;
        void update(std::string_view str) noexcept;
        Blake3Hash finalize() const noexcept;
        void reset() noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
};

} // namespace fracktal
