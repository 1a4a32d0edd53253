#include <gtest/gtest.h>

#include "valkyrie/compressor.hpp"
#include "valkyrie/errors.hpp"

#include <string>
#include <vector>

using namespace valkyrie;
using compressor::Codec;

namespace {

compressor::Bytes ToBytes(const std::string& text) {
    return compressor::Bytes(text.begin(), text.end());
}

std::vector<compressor::Bytes> SampleInputs() {
    std::vector<compressor::Bytes> inputs;
    inputs.push_back({});
    inputs.push_back(ToBytes("a"));
    inputs.push_back(ToBytes(std::string(100000, 'z')));
    compressor::Bytes noisy(70000);
    std::uint32_t state = 2463534242u;
    for (auto& byte : noisy) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        byte = static_cast<std::uint8_t>(state);
    }
    inputs.push_back(std::move(noisy));
    return inputs;
}

}  // namespace

class CompressorCodecTest : public ::testing::TestWithParam<Codec> {};

TEST_P(CompressorCodecTest, RoundTrips) {
    Codec codec = GetParam();
    if (!compressor::IsAvailable(codec)) {
        GTEST_SKIP() << compressor::CodecName(codec) << " not built";
    }
    for (const auto& input : SampleInputs()) {
        compressor::Bytes packed = compressor::Compress(input, codec);
        EXPECT_EQ(compressor::Decompress(packed, codec), input) << "size " << input.size();
    }
}

TEST_P(CompressorCodecTest, NameRoundTrips) {
    Codec codec = GetParam();
    std::string name = compressor::CodecName(codec);
    EXPECT_LE(name.size(), 5u);
    EXPECT_EQ(compressor::CodecFromName(name), codec);
}

TEST_P(CompressorCodecTest, UnavailableCodecIsUnsupported) {
    Codec codec = GetParam();
    if (compressor::IsAvailable(codec)) {
        GTEST_SKIP() << compressor::CodecName(codec) << " is built";
    }
    EXPECT_THROW(compressor::Compress(ToBytes("data"), codec), UnsupportedCodec);
    EXPECT_THROW(compressor::Decompress(ToBytes("data"), codec), UnsupportedCodec);
}

TEST_P(CompressorCodecTest, CorruptInputFails) {
    Codec codec = GetParam();
    if (codec == Codec::None || !compressor::IsAvailable(codec)) {
        GTEST_SKIP();
    }
    compressor::Bytes packed = compressor::Compress(ToBytes(std::string(4096, 'q')), codec);
    packed.resize(packed.size() / 2);
    EXPECT_THROW(compressor::Decompress(packed, codec), CompressionError);
}

INSTANTIATE_TEST_SUITE_P(AllCodecs, CompressorCodecTest, ::testing::ValuesIn(compressor::kAllCodecs));

TEST(CompressorTest, NoneIsPassthrough) {
    compressor::Bytes input = ToBytes("left as is");
    EXPECT_EQ(compressor::Compress(input, Codec::None), input);
    EXPECT_EQ(compressor::Decompress(input, Codec::None), input);
}

TEST(CompressorTest, GzipWritesGzipMember) {
    compressor::Bytes packed = compressor::Compress(ToBytes(std::string(1000, 'x')), Codec::Gzip);
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(packed[0], 0x1f);
    EXPECT_EQ(packed[1], 0x8b);
    EXPECT_LT(packed.size(), 1000u);
}

TEST(CompressorTest, GzipReadsConcatenatedMembers) {
    compressor::Bytes first = compressor::Compress(ToBytes("hello "), Codec::Gzip);
    compressor::Bytes second = compressor::Compress(ToBytes("world"), Codec::Gzip);
    first.insert(first.end(), second.begin(), second.end());
    EXPECT_EQ(compressor::Decompress(first, Codec::Gzip), ToBytes("hello world"));
}

TEST(CompressorTest, GarbageIsNotGzip) {
    EXPECT_THROW(compressor::Decompress(ToBytes("definitely not gzip"), Codec::Gzip), CompressionError);
}

TEST(CompressorTest, UnknownNameIsUnsupported) {
    EXPECT_FALSE(compressor::TryCodecFromName("brotli").has_value());
    EXPECT_THROW(compressor::Compress(ToBytes("x"), std::string_view("brotli")), UnsupportedCodec);
    EXPECT_THROW(compressor::Decompress(ToBytes("x"), std::string_view("ZSTD")), UnsupportedCodec);
}

TEST(CompressorTest, NameKeyedOverloadMatchesEnum) {
    compressor::Bytes input = ToBytes("by name");
    EXPECT_EQ(compressor::Decompress(compressor::Compress(input, std::string_view("gzip")), Codec::Gzip), input);
}
