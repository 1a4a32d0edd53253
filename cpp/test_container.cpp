#include <gtest/gtest.h>

#include "valkyrie/container.hpp"
#include "valkyrie/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace valkyrie;
using container::ArchiveHeader;

namespace {

ArchiveHeader SampleHeader() {
    ArchiveHeader header;
    header.name = "assets";
    header.description = "Encrypted data package";
    header.payload_size = 0x01020304;
    header.author = "Valky Fischer";
    header.copyright = std::string(constants::kDefaultCopyright);
    header.timestamp = 1700000000;
    header.encryption = "AES-GCM";
    header.key_length = 32;
    header.version = 2;
    header.compression = "zstd";
    return header;
}

std::uint32_t ReadU32LE(const container::HeaderBytes& bytes, std::size_t offset) {
    return static_cast<std::uint32_t>(bytes[offset]) | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(bytes[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
}

}  // namespace

TEST(ContainerTest, HeaderIs105Bytes) {
    EXPECT_EQ(container::EncodeHeader(SampleHeader()).size(), 105u);
}

TEST(ContainerTest, RoundTrips) {
    ArchiveHeader header = SampleHeader();
    container::HeaderBytes bytes = container::EncodeHeader(header);
    EXPECT_EQ(container::DecodeHeader(std::vector<std::uint8_t>(bytes.begin(), bytes.end())), header);
}

TEST(ContainerTest, FieldOffsetsMatchNativeLayout) {
    container::HeaderBytes bytes = container::EncodeHeader(SampleHeader());
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(bytes.data()), 6), "assets");
    EXPECT_EQ(bytes[16], 'E');
    EXPECT_EQ(bytes[38], 0);
    EXPECT_EQ(bytes[39], 0);
    EXPECT_EQ(ReadU32LE(bytes, 40), 0x01020304u);
    EXPECT_EQ(bytes[40], 0x04);
    EXPECT_EQ(bytes[44], 'V');
    EXPECT_EQ(bytes[60], 'V');
    EXPECT_EQ(bytes[77], 0);
    EXPECT_EQ(bytes[78], 0);
    EXPECT_EQ(bytes[79], 0);
    EXPECT_EQ(ReadU32LE(bytes, 80), 1700000000u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(bytes.data() + 84), 7), "AES-GCM");
    EXPECT_EQ(bytes[91], 0);
    EXPECT_EQ(ReadU32LE(bytes, 92), 32u);
    EXPECT_EQ(ReadU32LE(bytes, 96), 2u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(bytes.data() + 100), 4), "zstd");
    EXPECT_EQ(bytes[104], 0);
}

TEST(ContainerTest, FieldAtExactWidthRoundTrips) {
    ArchiveHeader header = SampleHeader();
    header.name = std::string(16, 'n');
    header.description = std::string(22, 'd');
    header.author = std::string(16, 'a');
    header.copyright = std::string(17, 'c');
    header.compression = "bzip2";
    container::HeaderBytes bytes = container::EncodeHeader(header);
    EXPECT_EQ(container::DecodeHeader(bytes.data(), bytes.size()), header);
}

TEST(ContainerTest, FieldTooLongIsRejected) {
    ArchiveHeader header = SampleHeader();
    header.name = std::string(17, 'n');
    try {
        container::EncodeHeader(header);
        FAIL() << "expected HeaderFieldTooLong";
    } catch (const HeaderFieldTooLong& exc) {
        EXPECT_EQ(exc.field(), "name");
        EXPECT_EQ(exc.kind(), ErrorKind::HeaderFieldTooLong);
    }

    header = SampleHeader();
    header.encryption = "AES-GCM2";
    EXPECT_THROW(container::EncodeHeader(header), HeaderFieldTooLong);

    header = SampleHeader();
    header.compression = "brotli";
    EXPECT_THROW(container::EncodeHeader(header), HeaderFieldTooLong);
}

TEST(ContainerTest, WidthCountsUtf8Bytes) {
    ArchiveHeader header = SampleHeader();
    // Six copies of a three-byte code point: six characters, eighteen bytes.
    std::string wide;
    for (int i = 0; i < 6; ++i) {
        wide += "\xE2\x93\x92";
    }
    header.copyright = wide;
    EXPECT_THROW(container::EncodeHeader(header), HeaderFieldTooLong);
}

TEST(ContainerTest, ShortInputIsIoError) {
    std::vector<std::uint8_t> short_header(104, 0);
    EXPECT_THROW(container::DecodeHeader(short_header), ArchiveIoError);
}

TEST(ContainerTest, ProbeReadsPrefixOnly) {
    auto path = std::filesystem::temp_directory_path() / "valkyrie_container_probe.vpk";
    container::HeaderBytes bytes = container::EncodeHeader(SampleHeader());
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out << "trailing payload that is never parsed";
    }
    EXPECT_EQ(container::Probe(path), SampleHeader());
    std::filesystem::remove(path);
}

TEST(ContainerTest, ProbeFailures) {
    auto dir = std::filesystem::temp_directory_path();
    EXPECT_THROW(container::Probe(dir / "valkyrie_missing_archive.vpk"), ArchiveIoError);

    auto path = dir / "valkyrie_short_archive.vpk";
    {
        std::ofstream out(path, std::ios::binary);
        out << "too short";
    }
    EXPECT_THROW(container::Probe(path), ArchiveIoError);
    std::filesystem::remove(path);
}
