#include "fracktal/codec.hpp"
#include "fracktal/error.hpp"
#include "fracktal/fingerprint.hpp"
#include "fracktal/logging.hpp"
#include "fracktal/pattern_compressor.hpp"
#include "fracktal/symbol_extractor.hpp"
#include "fracktal/thread_pool.hpp"

namespace fracktal {

Codec::Codec(const CodecConfig& config)
    : config_(config) {
    config_.validate();
}

Codex Codec::encode(std::string_view input) const {
    SymbolExtractor extractor(config_.symbol_range);
    Extraction extraction = extractor.extract(input);

    PatternCompressor compressor(config_);
    CompressionResult compressed = compressor.compress(extraction.symbols);

    FractalFingerprinter fingerprinter(config_.hash_depth);
    std::string fp = fingerprinter.fingerprint(extraction.symbols);

    // Sub-window input keeps its bytes so it still round-trips
    std::string residual;
    if (extraction.chunks.empty()) {
        residual.assign(input.begin(), input.end());
    }

    LOG_DEBUG("Encoded ", input.size(), " bytes: ", extraction.symbols.size(), " symbols -> ",
              compressed.stats.rewritten_tokens, " tokens, ", compressed.stats.pattern_count,
              " patterns, ratio ", compressed.stats.overall_compression_ratio);

    return Codex(std::move(extraction.chunks),
                 std::move(extraction.symbols),
                 std::move(compressed.dictionary),
                 std::move(compressed.rewritten),
                 std::move(fp),
                 compressed.stats,
                 config_.symbol_range,
                 config_.hash_depth,
                 std::move(residual));
}

std::string Codec::decode(const Codex& codex) const {
    const auto& chunks = codex.chunks();
    const auto& symbols = codex.symbols();

    try {
        if (chunks.empty()) {
            FRACKTAL_CHECK_DECODE(symbols.empty() && codex.rewritten().empty(),
                ErrorCode::INCONSISTENT_ARTIFACT,
                "Artifact has no chunks but carries " + std::to_string(symbols.size()) +
                " symbols and " + std::to_string(codex.rewritten().size()) + " tokens");
            FRACKTAL_CHECK_DECODE(codex.residual().size() < CHUNK_WIDTH,
                ErrorCode::INCONSISTENT_ARTIFACT,
                "Residual of " + std::to_string(codex.residual().size()) + " bytes is not shorter than a chunk");
            return codex.residual();
        }

        FRACKTAL_CHECK_DECODE(codex.residual().empty(), ErrorCode::INCONSISTENT_ARTIFACT,
            "Artifact carries both chunks and a residual");

        std::vector<SymbolId> expanded = PatternCompressor::expand(codex.rewritten(), codex.dictionary());

        FRACKTAL_CHECK_DECODE(symbols.size() == chunks.size(), ErrorCode::INCONSISTENT_ARTIFACT,
            "Symbol count " + std::to_string(symbols.size()) +
            " does not match chunk count " + std::to_string(chunks.size()));
        FRACKTAL_CHECK_DECODE(expanded.size() == symbols.size(), ErrorCode::INCONSISTENT_ARTIFACT,
            "Expanded stream has " + std::to_string(expanded.size()) +
            " symbols, expected " + std::to_string(symbols.size()));
        FRACKTAL_CHECK_DECODE(expanded == symbols, ErrorCode::INCONSISTENT_ARTIFACT,
            "Expanded stream differs from the stored symbol stream");

        std::string output;
        output.reserve(chunks.size() + CHUNK_WIDTH - 1);
        output.append(chunks.front().view());
        for (size_t i = 1; i < chunks.size(); ++i) {
            FRACKTAL_CHECK_DECODE(chunks[i].first() == chunks[i - 1].last(),
                ErrorCode::INCONSISTENT_ARTIFACT,
                "Chunk " + std::to_string(i) + " does not overlap its predecessor");
            output.push_back(chunks[i].last());
        }

        LOG_DEBUG("Decoded ", chunks.size(), " chunks into ", output.size(), " bytes");
        return output;
    } catch (const DecodeError& e) {
        LOG_ERROR("Decode failed: ", e.what());
        throw;
    }
}

std::string Codec::decode_verified(const Codex& codex) const {
    std::string output = decode(codex);

    SymbolExtractor extractor(codex.symbol_range());
    Extraction extraction = extractor.extract(output);
    FractalFingerprinter fingerprinter(codex.hash_depth());
    std::string actual = fingerprinter.fingerprint(extraction.symbols);

    if (actual != codex.fingerprint()) {
        LOG_ERROR("Integrity check failed: stored ", codex.fingerprint(), ", recomputed ", actual);
        throw IntegrityError(codex.fingerprint(), actual, "Codec::decode_verified");
    }
    return output;
}

std::string Codec::fingerprint(const Codex& codex) const {
    return codex.fingerprint();
}

std::string Codec::recompute_fingerprint(const Codex& codex) const {
    FractalFingerprinter fingerprinter(codex.hash_depth());
    return fingerprinter.fingerprint(codex.symbols());
}

bool Codec::verify_reconstruction(std::string_view input, const Codex& codex) const {
    return decode(codex) == input;
}

std::vector<Codex> Codec::encode_batch(const std::vector<std::string>& inputs) const {
    std::vector<Codex> results(inputs.size());
    if (inputs.empty()) return results;

    // Parallelism lives at the batch level; each inner encode runs sequentially
    CodecConfig inner_config = config_;
    inner_config.num_threads = 1;
    const Codec inner(inner_config);

    const size_t threads = bounded_thread_count(config_.num_threads, inputs.size());
    if (threads == 1) {
        for (size_t i = 0; i < inputs.size(); ++i) {
            results[i] = inner.encode(inputs[i]);
        }
    } else {
        ThreadPool pool(threads);
        pool.parallel_for_index(0, inputs.size(), [&](size_t i) {
            results[i] = inner.encode(inputs[i]);
        });
    }

    LOG_DEBUG("Batch-encoded ", inputs.size(), " inputs on ", threads, " threads");
    return results;
}

Ontology Codec::ontology(const Codex& codex) const {
    return OntologyLinker::link(codex.symbols());
}

} // namespace fracktal
