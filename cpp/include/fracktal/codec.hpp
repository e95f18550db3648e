/**
 * Symbolic codec facade
 *
 * encode: SymbolExtractor -> PatternCompressor -> FractalFingerprinter,
 *         bundled into an immutable Codex.
 * decode: expand pattern references, check them against the stored symbol
 *         stream and chunk table, then stitch the chunks back together
 *         (first chunk whole, last unit of every following chunk).
 *
 * All operations are pure and hold no mutable state: one Codec may be used
 * from any number of threads at once. Reconstruction depends only on the
 * chunk table, so symbol collisions never affect the output.
 */

#pragma once

#include "fracktal/codex.hpp"
#include "fracktal/config.hpp"
#include "fracktal/ontology.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fracktal {

class Codec {
public:
    explicit Codec(const CodecConfig& config = CodecConfig{});

    Codex encode(std::string_view input) const;

    /**
     * Reconstruct the original input.
     * Throws DecodeError if a reference has no dictionary entry, the
     * expansion disagrees with the symbol stream, or the chunk table is
     * inconsistent. Never returns partial output.
     */
    std::string decode(const Codex& codex) const;

    /**
     * decode(), then re-derive the symbol stream from the output with the
     * artifact's own range and depth and compare fingerprints.
     * Throws IntegrityError on mismatch.
     */
    std::string decode_verified(const Codex& codex) const;

    // Stored fingerprint; does not decode
    std::string fingerprint(const Codex& codex) const;

    // Fingerprint recomputed from the artifact's symbol stream
    std::string recompute_fingerprint(const Codex& codex) const;

    // True when codex decodes to exactly `input`
    bool verify_reconstruction(std::string_view input, const Codex& codex) const;

    /**
     * Encode independent inputs on up to num_threads workers. Results are
     * in input order and equal to sequential encode() calls.
     */
    std::vector<Codex> encode_batch(const std::vector<std::string>& inputs) const;

    // Structural metadata over the artifact's symbol stream
    Ontology ontology(const Codex& codex) const;

    const CodecConfig& config() const noexcept { return config_; }

private:
    CodecConfig config_;
};

} // namespace fracktal
