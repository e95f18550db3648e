#include "fracktal/blake3.hpp"

#include <algorithm>
#include <iterator>
#include <cstring>

// Portable BLAKE3 (unkeyed hash mode only, 32-byte output).
// Follows the structure of the official reference implementation: a chunk
// state absorbing up to 1024 bytes, and a stack of chaining values merged
// into parent nodes as chunks complete.

namespace {

constexpr size_t OUT_LEN = 32;
constexpr size_t BLOCK_LEN = 64;
constexpr size_t CHUNK_LEN = 1024;
constexpr size_t MAX_DEPTH = 54;

constexpr uint32_t IV[8] = {
    0x6A09E667, 0xBB67AE85, 0x3C6EF372, 0xA54FF53A,
    0x510E527F, 0x9B05688C, 0x1F83D9AB, 0x5BE0CD19
};

constexpr uint8_t MSG_SCHEDULE[7][16] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
    {2, 6, 3, 10, 7, 0, 4, 13, 1, 11, 12, 5, 9, 14, 15, 8},
    {3, 4, 10, 12, 13, 2, 7, 14, 6, 5, 9, 0, 11, 15, 8, 1},
    {10, 7, 12, 9, 14, 3, 13, 15, 4, 0, 11, 2, 5, 8, 1, 6},
    {12, 13, 9, 11, 15, 10, 14, 8, 7, 2, 5, 3, 0, 1, 6, 4},
    {9, 14, 11, 5, 8, 12, 15, 1, 13, 3, 0, 10, 2, 6, 4, 7},
    {11, 15, 5, 0, 1, 9, 8, 6, 14, 10, 2, 12, 3, 4, 7, 13},
};

enum Flags : uint32_t {
    CHUNK_START = 1 << 0,
    CHUNK_END = 1 << 1,
    PARENT = 1 << 2,
    ROOT = 1 << 3,
};

using ChainingValue = std::array<uint32_t, 8>;

inline uint32_t rotr32(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store32_le(uint8_t* p, uint32_t x) {
    p[0] = static_cast<uint8_t>(x);
    p[1] = static_cast<uint8_t>(x >> 8);
    p[2] = static_cast<uint8_t>(x >> 16);
    p[3] = static_cast<uint8_t>(x >> 24);
}

inline void mix(uint32_t* s, size_t a, size_t b, size_t c, size_t d, uint32_t mx, uint32_t my) {
    s[a] = s[a] + s[b] + mx;
    s[d] = rotr32(s[d] ^ s[a], 16);
    s[c] = s[c] + s[d];
    s[b] = rotr32(s[b] ^ s[c], 12);
    s[a] = s[a] + s[b] + my;
    s[d] = rotr32(s[d] ^ s[a], 8);
    s[c] = s[c] + s[d];
    s[b] = rotr32(s[b] ^ s[c], 7);
}

// Returns the first 8 words of the compression output, which is all the
// 32-byte digest and the chaining values need.
ChainingValue compress(const ChainingValue& cv, const uint8_t block[BLOCK_LEN],
                       uint32_t block_len, uint64_t counter, uint32_t flags) {
    uint32_t msg[16];
    for (size_t i = 0; i < 16; ++i) {
        msg[i] = load32_le(&block[i * 4]);
    }

    uint32_t s[16] = {
        cv[0], cv[1], cv[2], cv[3],
        cv[4], cv[5], cv[6], cv[7],
        IV[0], IV[1], IV[2], IV[3],
        static_cast<uint32_t>(counter),
        static_cast<uint32_t>(counter >> 32),
        block_len,
        flags
    };

    for (const auto& sched : MSG_SCHEDULE) {
        mix(s, 0, 4, 8, 12, msg[sched[0]], msg[sched[1]]);
        mix(s, 1, 5, 9, 13, msg[sched[2]], msg[sched[3]]);
        mix(s, 2, 6, 10, 14, msg[sched[4]], msg[sched[5]]);
        mix(s, 3, 7, 11, 15, msg[sched[6]], msg[sched[7]]);
        mix(s, 0, 5, 10, 15, msg[sched[8]], msg[sched[9]]);
        mix(s, 1, 6, 11, 12, msg[sched[10]], msg[sched[11]]);
        mix(s, 2, 7, 8, 13, msg[sched[12]], msg[sched[13]]);
        mix(s, 3, 4, 9, 14, msg[sched[14]], msg[sched[15]]);
    }

    ChainingValue out;
    for (size_t i = 0; i < 8; ++i) {
        out[i] = s[i] ^ s[i + 8];
    }
    return out;
}

ChainingValue initial_key() {
    ChainingValue key;
    std::copy(std::begin(IV), std::end(IV), key.begin());
    return key;
}

ChainingValue parent_cv(const ChainingValue& left, const ChainingValue& right,
                        const ChainingValue& key, uint32_t extra_flags) {
    uint8_t block[BLOCK_LEN];
    for (size_t i = 0; i < 8; ++i) {
        store32_le(&block[i * 4], left[i]);
        store32_le(&block[32 + i * 4], right[i]);
    }
    return compress(key, block, BLOCK_LEN, 0, PARENT | extra_flags);
}

struct ChunkState {
    ChainingValue cv = initial_key();
    uint64_t counter = 0;
    uint8_t block[BLOCK_LEN] = {};
    size_t block_len = 0;
    size_t blocks_compressed = 0;

    void reset(const ChainingValue& key, uint64_t chunk_counter) {
        cv = key;
        counter = chunk_counter;
        std::memset(block, 0, BLOCK_LEN);
        block_len = 0;
        blocks_compressed = 0;
    }

    size_t length() const {
        return BLOCK_LEN * blocks_compressed + block_len;
    }

    uint32_t start_flag() const {
        return blocks_compressed == 0 ? CHUNK_START : 0;
    }

    void update(const uint8_t* input, size_t len) {
        while (len > 0) {
            // A full block is only compressed once more input arrives, so the
            // last block of the chunk is left for finalization with CHUNK_END.
            if (block_len == BLOCK_LEN) {
                cv = compress(cv, block, BLOCK_LEN, counter, start_flag());
                ++blocks_compressed;
                std::memset(block, 0, BLOCK_LEN);
                block_len = 0;
            }
            size_t take = std::min(BLOCK_LEN - block_len, len);
            std::memcpy(&block[block_len], input, take);
            block_len += take;
            input += take;
            len -= take;
        }
    }

    ChainingValue finish(bool is_root) const {
        uint32_t flags = start_flag() | CHUNK_END;
        if (is_root) flags |= ROOT;
        return compress(cv, block, static_cast<uint32_t>(block_len), counter, flags);
    }
};

struct HasherState {
    ChainingValue key = initial_key();
    ChunkState chunk;
    ChainingValue cv_stack[MAX_DEPTH];
    size_t cv_stack_len = 0;

    void reset() {
        key = initial_key();
        chunk.reset(key, 0);
        cv_stack_len = 0;
    }

    // Merge completed subtrees: one merge per trailing zero bit of the
    // total chunk count.
    void push_chunk_cv(ChainingValue cv, uint64_t total_chunks) {
        while ((total_chunks & 1) == 0) {
            cv = parent_cv(cv_stack[--cv_stack_len], cv, key, 0);
            total_chunks >>= 1;
        }
        cv_stack[cv_stack_len++] = cv;
    }

    void update(const uint8_t* input, size_t len) {
        while (len > 0) {
            if (chunk.length() == CHUNK_LEN) {
                ChainingValue cv = chunk.finish(false);
                uint64_t total_chunks = chunk.counter + 1;
                push_chunk_cv(cv, total_chunks);
                chunk.reset(key, total_chunks);
            }
            size_t take = std::min(CHUNK_LEN - chunk.length(), len);
            chunk.update(input, take);
            input += take;
            len -= take;
        }
    }

    fracktal::Blake3Hash finalize() const {
        ChainingValue cv = chunk.finish(cv_stack_len == 0);
        for (size_t i = cv_stack_len; i-- > 0;) {
            cv = parent_cv(cv_stack[i], cv, key, i == 0 ? ROOT : 0);
        }

        fracktal::Blake3Hash result;
        for (size_t i = 0; i < 8; ++i) {
            store32_le(&result.bytes[i * 4], cv[i]);
        }
        static_assert(OUT_LEN == fracktal::Blake3Hash::size());
        return result;
    }
};

} // anonymous namespace

namespace fracktal {

Blake3Hash Blake3Hasher::hash(std::span<const uint8_t> data) noexcept {
    HasherState state;
    state.update(data.data(), data.size());
    return state.finalize();
}

Blake3Hash Blake3Hasher::hash(std::string_view str) noexcept {
    return hash(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

std::string Blake3Hasher::hash_hex(std::string_view str) {
    return hash(str).to_hex();
}

struct Blake3Hasher::Incremental::Impl {
    HasherState state;
};

Blake3Hasher::Incremental::Incremental() noexcept
    : impl_(std::make_unique<Impl>()) {}

Blake3Hasher::Incremental::~Incremental() = default;

Blake3Hasher::Incremental::Incremental(Incremental&&) noexcept = default;
Blake3Hasher::Incremental& Blake3Hasher::Incremental::operator=(Incremental&&) noexcept = default;

void Blake3Hasher::Incremental::update(std::span<const uint8_t> data) noexcept {
    impl_->state.update(data.data(), data.size());
}

void Blake3Hasher::Incremental::update(std::string_view str) noexcept {
    impl_->state.update(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

Blake3Hash Blake3Hasher::Incremental::finalize() const noexcept {
    return impl_->state.finalize();
}

void Blake3Hasher::Incremental::reset() noexcept {
    impl_->state.reset();
}

} // namespace fracktal
