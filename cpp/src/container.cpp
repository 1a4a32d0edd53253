#include "valkyrie/container.hpp"

#include "valkyrie/errors.hpp"

#include <algorithm>
#include <fstream>

namespace valkyrie::container {

namespace {

void WriteU32LE(HeaderBytes& out, std::size_t offset, std::uint32_t value) {
    out[offset] = static_cast<std::uint8_t>(value & 0xFF);
    out[offset + 1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[offset + 2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[offset + 3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

std::uint32_t ReadU32LE(const std::uint8_t* data, std::size_t offset) {
    return static_cast<std::uint32_t>(data[offset])
           | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

void WriteField(HeaderBytes& out,
                std::size_t offset,
                std::size_t width,
                const std::string& value,
                const char* field) {
    if (value.size() > width) {
        throw HeaderFieldTooLong(field, width, value.size());
    }
    std::copy(value.begin(), value.end(), out.begin() + offset);
}

std::string ReadField(const std::uint8_t* data, std::size_t offset, std::size_t width) {
    std::size_t len = width;
    while (len > 0 && data[offset + len - 1] == 0) {
        --len;
    }
    return std::string(reinterpret_cast<const char*>(data + offset), len);
}

}  // namespace

bool ArchiveHeader::operator==(const ArchiveHeader& other) const {
    return name == other.name && description == other.description && payload_size == other.payload_size
           && author == other.author && copyright == other.copyright && timestamp == other.timestamp
           && encryption == other.encryption && key_length == other.key_length && version == other.version
           && compression == other.compression;
}

HeaderBytes EncodeHeader(const ArchiveHeader& header) {
    using namespace constants;
    HeaderBytes out{};
    WriteField(out, kNameOffset, kNameWidth, header.name, "name");
    WriteField(out, kDescriptionOffset, kDescriptionWidth, header.description, "description");
    WriteU32LE(out, kPayloadSizeOffset, header.payload_size);
    WriteField(out, kAuthorOffset, kAuthorWidth, header.author, "author");
    WriteField(out, kCopyrightOffset, kCopyrightWidth, header.copyright, "copyright");
    WriteU32LE(out, kTimestampOffset, header.timestamp);
    WriteField(out, kEncryptionOffset, kEncryptionWidth, header.encryption, "encryption");
    WriteU32LE(out, kKeyLengthOffset, header.key_length);
    WriteU32LE(out, kVersionOffset, header.version);
    WriteField(out, kCompressionOffset, kCompressionWidth, header.compression, "compression");
    return out;
}

ArchiveHeader DecodeHeader(const std::uint8_t* data, std::size_t size) {
    using namespace constants;
    if (data == nullptr || size < kHeaderSize) {
        throw ArchiveIoError("Archive header truncated",
                             "expected " + std::to_string(kHeaderSize) + " bytes, got " + std::to_string(size));
    }
    ArchiveHeader header;
    header.name = ReadField(data, kNameOffset, kNameWidth);
    header.description = ReadField(data, kDescriptionOffset, kDescriptionWidth);
    header.payload_size = ReadU32LE(data, kPayloadSizeOffset);
    header.author = ReadField(data, kAuthorOffset, kAuthorWidth);
    header.copyright = ReadField(data, kCopyrightOffset, kCopyrightWidth);
    header.timestamp = ReadU32LE(data, kTimestampOffset);
    header.encryption = ReadField(data, kEncryptionOffset, kEncryptionWidth);
    header.key_length = ReadU32LE(data, kKeyLengthOffset);
    header.version = ReadU32LE(data, kVersionOffset);
    header.compression = ReadField(data, kCompressionOffset, kCompressionWidth);
    return header;
}

ArchiveHeader DecodeHeader(const std::vector<std::uint8_t>& data) {
    return DecodeHeader(data.data(), data.size());
}

ArchiveHeader Probe(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ArchiveIoError("Failed to open archive", path.string());
    }
    HeaderBytes buffer{};
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    std::size_t got = static_cast<std::size_t>(input.gcount());
    if (got < buffer.size()) {
        throw ArchiveIoError("Archive header truncated",
                             path.string() + ": " + std::to_string(got) + " of "
                                 + std::to_string(constants::kHeaderSize) + " bytes");
    }
    return DecodeHeader(buffer.data(), buffer.size());
}

}  // namespace valkyrie::container
