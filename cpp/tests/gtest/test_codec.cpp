// =============================================================================
// Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fracktal/codec.hpp"
#include "fracktal/blake3.hpp"
#include "fracktal/error.hpp"
#include "fracktal/fingerprint.hpp"
#include "fracktal/symbol_extractor.hpp"
#include "fracktal/thread_pool.hpp"
#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

using namespace fracktal;

class CodecTest : public ::testing::Test {
protected:
    Codec codec;

    static std::string repetitive_text() {
        std::string s;
        for (int i = 0; i < 50; ++i) {
            s += "the quick brown fox jumps over the lazy dog. ";
        }
        return s;
    }

    static std::string all_bytes() {
        std::string s;
        for (int i = 0; i < 256; ++i) {
            s.push_back(static_cast<char>(i));
        }
        return s;
    }

    // Copy of `codex` with only its chunk table replaced
    static Codex with_chunks(const Codex& codex, std::vector<Chunk> chunks) {
        return Codex(std::move(chunks), codex.symbols(), codex.dictionary(), codex.rewritten(),
                     codex.fingerprint(), codex.stats(), codex.symbol_range(), codex.hash_depth());
    }
};

TEST_F(CodecTest, EmptyInput) {
    Codex codex = codec.encode("");
    EXPECT_TRUE(codex.empty());
    EXPECT_TRUE(codex.symbols().empty());
    EXPECT_TRUE(codex.dictionary().empty());
    EXPECT_TRUE(codex.rewritten().empty());
    EXPECT_EQ(codex.fingerprint(), Blake3Hasher::hash_hex(""));
    EXPECT_EQ(codec.decode(codex), "");
}

TEST_F(CodecTest, SingleChunkInput) {
    Codex codex = codec.encode("aa");
    ASSERT_EQ(codex.chunks().size(), 1u);
    EXPECT_EQ(codex.chunks()[0].view(), "aa");
    ASSERT_EQ(codex.symbols().size(), 1u);
    EXPECT_TRUE(codex.dictionary().empty());
    EXPECT_EQ(codec.decode(codex), "aa");
}

TEST_F(CodecTest, SingleByteKeptAsResidual) {
    Codex codex = codec.encode("x");
    EXPECT_TRUE(codex.empty());
    EXPECT_EQ(codex.residual(), "x");
    EXPECT_EQ(codex.original_length(), 1u);
    EXPECT_EQ(codec.decode(codex), "x");
    EXPECT_EQ(codec.decode_verified(codex), "x");
}

TEST_F(CodecTest, AlternatingInputIsCompressed) {
    CodecConfig config;
    config.min_pattern_length = 4;
    config.min_occurrences = 2;
    Codec c(config);

    Codex codex = c.encode("abababab");
    ASSERT_EQ(codex.symbols().size(), 7u);
    ASSERT_FALSE(codex.dictionary().empty());

    const Pattern& p = codex.dictionary()[0];
    ASSERT_EQ(p.symbols.size(), 4u);
    EXPECT_TRUE(std::equal(p.symbols.begin(), p.symbols.end(), codex.symbols().begin()));
    EXPECT_LT(codex.rewritten().size(), codex.symbols().size());
    EXPECT_EQ(codex.rewritten().size(), 4u);
    EXPECT_EQ(codex.rewritten_text().substr(0, 5), "P_000");
    EXPECT_EQ(c.decode(codex), "abababab");
}

TEST_F(CodecTest, RoundTripsArbitraryInput) {
    std::vector<std::string> inputs = {
        "",
        "a",
        "ab",
        "Hello, World!",
        repetitive_text(),
        "h\xc3\xa9llo w\xc3\xb6rld \xe2\x9c\x93 \xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e",
        std::string("nul\0inside\0bytes", 16),
        all_bytes(),
        std::string(1000, 'z'),
    };

    for (const auto& input : inputs) {
        Codex codex = codec.encode(input);
        EXPECT_EQ(codec.decode(codex), input) << "input size " << input.size();
        EXPECT_EQ(codec.decode_verified(codex), input) << "input size " << input.size();
        EXPECT_EQ(codex.original_length(), input.size());
        EXPECT_TRUE(codec.verify_reconstruction(input, codex));
    }
}

TEST_F(CodecTest, RepetitiveInputShrinks) {
    Codex codex = codec.encode(repetitive_text());
    EXPECT_FALSE(codex.dictionary().empty());
    EXPECT_LT(codex.rewritten().size(), codex.symbols().size());
    EXPECT_GT(codex.stats().overall_compression_ratio, 1.0);
    EXPECT_GT(codex.stats().net_savings, 0);
}

TEST_F(CodecTest, EncodeIsDeterministic) {
    std::string input = repetitive_text();
    Codex a = codec.encode(input);
    Codex b = Codec().encode(input);
    EXPECT_EQ(a, b);
    EXPECT_EQ(codec.fingerprint(a), codec.fingerprint(b));
}

TEST_F(CodecTest, FingerprintMatchesSymbolStream) {
    Codex codex = codec.encode("fingerprint me");
    EXPECT_EQ(codex.fingerprint().size(), 64u);
    EXPECT_EQ(codec.recompute_fingerprint(codex), codex.fingerprint());

    SymbolExtractor extractor;
    FractalFingerprinter fingerprinter;
    EXPECT_EQ(codex.fingerprint(), fingerprinter.fingerprint(extractor.extract("fingerprint me").symbols));
}

TEST_F(CodecTest, FingerprintDependsOnDepth) {
    CodecConfig shallow;
    shallow.hash_depth = 1;
    EXPECT_NE(Codec(shallow).encode("depth").fingerprint(), codec.encode("depth").fingerprint());
}

// Distinct chunks sharing a symbol id still decode to their own bytes
TEST_F(CodecTest, SymbolCollisionDoesNotAffectReconstruction) {
    SymbolExtractor extractor;
    std::unordered_map<SymbolId, std::string> seen;
    std::string first, second;
    for (int a = 0; a < 256 && first.empty(); ++a) {
        for (int b = 0; b < 256; ++b) {
            std::string chunk{static_cast<char>(a), static_cast<char>(b)};
            SymbolId id = extractor.extract(chunk).symbols.at(0);
            auto [it, inserted] = seen.try_emplace(id, chunk);
            if (!inserted) {
                first = it->second;
                second = chunk;
                break;
            }
        }
    }
    ASSERT_FALSE(first.empty());
    ASSERT_NE(first, second);

    Codex c1 = codec.encode(first);
    Codex c2 = codec.encode(second);
    EXPECT_EQ(c1.symbols(), c2.symbols());
    EXPECT_EQ(c1.fingerprint(), c2.fingerprint());
    EXPECT_EQ(codec.decode(c1), first);
    EXPECT_EQ(codec.decode(c2), second);
}

TEST_F(CodecTest, FullCollisionRange) {
    CodecConfig config;
    config.symbol_range = 1;
    Codec c(config);

    Codex hello = c.encode("hello");
    Codex world = c.encode("world");
    EXPECT_EQ(hello.fingerprint(), world.fingerprint());
    EXPECT_EQ(c.decode(hello), "hello");
    EXPECT_EQ(c.decode(world), "world");
    EXPECT_EQ(c.decode_verified(world), "world");
}

TEST_F(CodecTest, MissingPatternIsDecodeError) {
    Codex good = codec.encode("abcd");
    Codex broken(good.chunks(), good.symbols(), {}, {Token::reference(0)},
                 good.fingerprint(), good.stats(), good.symbol_range(), good.hash_depth());
    try {
        codec.decode(broken);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MISSING_PATTERN);
        EXPECT_EQ(e.context(), "PatternCompressor::expand");
        EXPECT_FALSE(e.suggestion().empty());
    }
}

TEST_F(CodecTest, SymbolChunkCountMismatchIsDecodeError) {
    Codex good = codec.encode("abcd");
    std::vector<Chunk> fewer(good.chunks().begin(), good.chunks().end() - 1);
    try {
        codec.decode(with_chunks(good, fewer));
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INCONSISTENT_ARTIFACT);
    }
}

TEST_F(CodecTest, RewrittenStreamMismatchIsDecodeError) {
    Codex good = codec.encode("abcd");
    std::vector<Token> rewritten = good.rewritten();
    rewritten.pop_back();
    Codex broken(good.chunks(), good.symbols(), good.dictionary(), rewritten,
                 good.fingerprint(), good.stats(), good.symbol_range(), good.hash_depth());
    EXPECT_THROW(codec.decode(broken), DecodeError);
}

TEST_F(CodecTest, BrokenChunkOverlapIsDecodeError) {
    Codex good = codec.encode("abcd");
    std::vector<Chunk> chunks = good.chunks();
    chunks[1] = Chunk('x', 'c');
    EXPECT_THROW(codec.decode(with_chunks(good, chunks)), DecodeError);
}

TEST_F(CodecTest, ResidualAlongsideChunksIsDecodeError) {
    Codex good = codec.encode("abcd");
    Codex broken(good.chunks(), good.symbols(), good.dictionary(), good.rewritten(),
                 good.fingerprint(), good.stats(), good.symbol_range(), good.hash_depth(), "z");
    EXPECT_THROW(codec.decode(broken), DecodeError);
}

TEST_F(CodecTest, TamperedFingerprintIsIntegrityError) {
    Codex good = codec.encode("hello world");
    std::string forged(64, '0');
    Codex tampered(good.chunks(), good.symbols(), good.dictionary(), good.rewritten(),
                   forged, good.stats(), good.symbol_range(), good.hash_depth());

    // Plain decode does not look at the fingerprint
    EXPECT_EQ(codec.decode(tampered), "hello world");
    try {
        codec.decode_verified(tampered);
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INTEGRITY_VIOLATION);
        EXPECT_EQ(e.context(), "Codec::decode_verified");
        EXPECT_FALSE(e.suggestion().empty());
        EXPECT_EQ(e.expected(), forged);
        EXPECT_EQ(e.actual(), good.fingerprint());
    }
}

// Chunk table swapped for other bytes that still stitch together
TEST_F(CodecTest, SwappedChunksAreIntegrityError) {
    Codex good = codec.encode("hello world");
    Codex other = codec.encode("HELLO WORLD");
    Codex tampered = with_chunks(good, other.chunks());

    EXPECT_EQ(codec.decode(tampered), "HELLO WORLD");
    EXPECT_THROW(codec.decode_verified(tampered), IntegrityError);
    EXPECT_FALSE(codec.verify_reconstruction("hello world", tampered));
}

TEST_F(CodecTest, VerifyReconstructionRejectsOtherInput) {
    Codex codex = codec.encode("alpha");
    EXPECT_TRUE(codec.verify_reconstruction("alpha", codex));
    EXPECT_FALSE(codec.verify_reconstruction("alphA", codex));
}

TEST_F(CodecTest, BatchMatchesSequential) {
    std::vector<std::string> inputs = {"", "a", "abababab", repetitive_text(), all_bytes(), "tail"};
    std::vector<Codex> batch = codec.encode_batch(inputs);

    ASSERT_EQ(batch.size(), inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        EXPECT_EQ(batch[i], codec.encode(inputs[i])) << "input " << i;
        EXPECT_EQ(codec.decode(batch[i]), inputs[i]);
    }
    EXPECT_TRUE(codec.encode_batch({}).empty());
}

TEST_F(CodecTest, BatchHonorsConfiguredThreadCount) {
    std::vector<std::string> inputs;
    for (int i = 0; i < 12; ++i) {
        inputs.push_back(repetitive_text() + std::to_string(i));
    }

    CodecConfig two_threads;
    two_threads.num_threads = 2;
    Codec batch_codec(two_threads);
    EXPECT_EQ(bounded_thread_count(two_threads.num_threads, inputs.size()), 2u);

    std::vector<Codex> batch = batch_codec.encode_batch(inputs);
    ASSERT_EQ(batch.size(), inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        EXPECT_EQ(batch[i], codec.encode(inputs[i])) << "input " << i;
    }

    // A batch may be started from inside another pool's task
    ThreadPool outer(1);
    auto nested = outer.submit([&] { return batch_codec.encode_batch(inputs); });
    EXPECT_EQ(nested.get(), batch);
}

// Pinned output: symbol ids and fingerprint must not drift across builds or hosts
TEST_F(CodecTest, HelloWorldGoldenFingerprint) {
    Codex codex = codec.encode("hello world");
    EXPECT_EQ(codex.symbols(), (std::vector<SymbolId>{8383, 5212, 1046, 3979, 288, 7145, 9011, 7273, 7928, 9304}));
    EXPECT_EQ(codex.fingerprint(), "c604afee0115d85d41d1ad152529f5cf732069afbdd44a62b7f9636c98c8b3cb");

    CodecConfig shallow;
    shallow.hash_depth = 1;
    EXPECT_EQ(Codec(shallow).encode("hello world").fingerprint(),
              "b51793cde22ac746de65f54a8627cc6701372eb6bd5031b2eff71d1194c8ce15");
}

TEST_F(CodecTest, ThreadCountDoesNotChangeOutput) {
    std::string input;
    for (int i = 0; i < 800; ++i) {
        input += "block-" + std::to_string(i % 37) + ";";
    }

    CodecConfig sequential;
    sequential.num_threads = 1;
    CodecConfig parallel;
    parallel.num_threads = 4;

    Codex a = Codec(sequential).encode(input);
    Codex b = Codec(parallel).encode(input);
    EXPECT_EQ(a, b);
    EXPECT_EQ(Codec(parallel).decode(b), input);
}

TEST_F(CodecTest, OntologyCoversSymbolStream) {
    Codex codex = codec.encode("banana");
    Ontology o = codec.ontology(codex);
    EXPECT_EQ(o.size(), codex.symbols().size());
    // "an" and "na" both repeat
    EXPECT_LE(o.distinct_count(), 3u);
    EXPECT_GE(o.occurrence_count(codex.symbols()[1]), 2u);
}

TEST_F(CodecTest, InvalidConfigRejected) {
    CodecConfig config;
    config.symbol_range = 0;
    EXPECT_THROW(Codec{config}, InvalidArgumentError);
}
