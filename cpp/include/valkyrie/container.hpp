#pragma once

#include "valkyrie/constants.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace valkyrie::container {

using HeaderBytes = std::array<std::uint8_t, constants::kHeaderSize>;

struct ArchiveHeader {
    std::string name;
    std::string description;
    std::uint32_t payload_size = 0;
    std::string author;
    std::string copyright;
    std::uint32_t timestamp = 0;
    std::string encryption;
    std::uint32_t key_length = 0;
    std::uint32_t version = constants::kFormatVersion;
    std::string compression;

    bool operator==(const ArchiveHeader& other) const;
    bool operator!=(const ArchiveHeader& other) const { return !(*this == other); }
};

// Throws HeaderFieldTooLong when a string field exceeds its byte width.
HeaderBytes EncodeHeader(const ArchiveHeader& header);

// Reads the first kHeaderSize bytes; trailing zero padding is stripped per field.
ArchiveHeader DecodeHeader(const std::vector<std::uint8_t>& data);
ArchiveHeader DecodeHeader(const std::uint8_t* data, std::size_t size);

// Reads only the header prefix of an archive file.
ArchiveHeader Probe(const std::filesystem::path& path);

}  // namespace valkyrie::container
