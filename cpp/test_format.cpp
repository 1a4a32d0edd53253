#include <gtest/gtest.h>

#include "valkyrie/errors.hpp"
#include "valkyrie/format.hpp"

#include <string>

using namespace valkyrie;

namespace {

Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

TEST(FormatTest, LengthPrefixLayout) {
    Bytes packed = format::PackLengthPrefixed({ToBytes("ab"), {}, ToBytes("c")});
    Bytes expected = {0, 0, 0, 2, 'a', 'b', 0, 0, 0, 0, 0, 0, 0, 1, 'c'};
    EXPECT_EQ(packed, expected);
    auto parts = format::UnpackLengthPrefixed(packed, 3);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], ToBytes("ab"));
    EXPECT_TRUE(parts[1].empty());
    EXPECT_EQ(parts[2], ToBytes("c"));
}

TEST(FormatTest, UnpackRejectsTruncatedAndCountMismatch) {
    Bytes packed = format::PackLengthPrefixed({ToBytes("abc")});
    EXPECT_THROW(format::UnpackLengthPrefixed(packed, 2), std::runtime_error);
    packed.pop_back();
    EXPECT_THROW(format::UnpackLengthPrefixed(packed, 1), std::runtime_error);
}

TEST(FormatTest, EnvelopeWithTag) {
    crypto::EncryptedEnvelope envelope{"00ff", "0102", std::string("aabb")};
    crypto::EncryptedEnvelope decoded = format::DecodeEnvelope(format::EncodeEnvelope(envelope));
    EXPECT_EQ(decoded.ciphertext, "00ff");
    EXPECT_EQ(decoded.iv, "0102");
    ASSERT_TRUE(decoded.tag.has_value());
    EXPECT_EQ(*decoded.tag, "aabb");
}

TEST(FormatTest, EnvelopeWithoutTag) {
    crypto::EncryptedEnvelope envelope{"00ff", "0102", std::nullopt};
    Bytes encoded = format::EncodeEnvelope(envelope);
    EXPECT_EQ(encoded.size(), 4u + 4 + 4 + 4 + 4);
    EXPECT_FALSE(format::DecodeEnvelope(encoded).tag.has_value());
}

TEST(FormatTest, MalformedEnvelope) {
    EXPECT_THROW(format::DecodeEnvelope(ToBytes("garbage")), DecryptionError);
    EXPECT_THROW(format::DecodeEnvelope(format::PackLengthPrefixed({ToBytes("a"), ToBytes("b")})),
                 DecryptionError);
}

TEST(FormatTest, BlobSetRoundTrip) {
    BlobSet blobs;
    blobs["a.txt"] = ToBytes("hello");
    blobs["dir/b.bin"] = Bytes{0x00, 0x01};
    blobs["empty"] = {};
    Bytes encoded = format::EncodeBlobSet(blobs);
    EXPECT_EQ(std::string(encoded.begin(), encoded.begin() + 4), "VBS1");
    EXPECT_EQ(format::DecodeBlobSet(encoded), blobs);
}

TEST(FormatTest, EmptyBlobSet) {
    Bytes encoded = format::EncodeBlobSet({});
    EXPECT_EQ(encoded, ToBytes("VBS1"));
    EXPECT_TRUE(format::DecodeBlobSet(encoded).empty());
}

TEST(FormatTest, BlobSetEncodingIsDeterministic) {
    BlobSet first;
    first["z"] = ToBytes("1");
    first["a"] = ToBytes("2");
    BlobSet second;
    second["a"] = ToBytes("2");
    second["z"] = ToBytes("1");
    EXPECT_EQ(format::EncodeBlobSet(first), format::EncodeBlobSet(second));
}

TEST(FormatTest, MalformedBlobSet) {
    EXPECT_THROW(format::DecodeBlobSet(ToBytes("NOPE")), DecryptionError);

    Bytes dangling = ToBytes("VBS1");
    Bytes part = format::PackLengthPrefixed({ToBytes("only-a-path")});
    dangling.insert(dangling.end(), part.begin(), part.end());
    EXPECT_THROW(format::DecodeBlobSet(dangling), DecryptionError);

    Bytes duplicate = ToBytes("VBS1");
    Bytes pairs = format::PackLengthPrefixed({ToBytes("x"), ToBytes("1"), ToBytes("x"), ToBytes("2")});
    duplicate.insert(duplicate.end(), pairs.begin(), pairs.end());
    EXPECT_THROW(format::DecodeBlobSet(duplicate), DecryptionError);
}
