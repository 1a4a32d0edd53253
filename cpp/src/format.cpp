#include "valkyrie/format.hpp"

#include "valkyrie/constants.hpp"
#include "valkyrie/errors.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace valkyrie::format {

namespace {

std::uint32_t ReadU32BE(const Bytes& data, std::size_t offset) {
    if (offset + 4 > data.size()) {
        throw std::runtime_error("Malformed length-prefixed blob (missing length)");
    }
    return (static_cast<std::uint32_t>(data[offset]) << 24)
           | (static_cast<std::uint32_t>(data[offset + 1]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 8)
           | static_cast<std::uint32_t>(data[offset + 3]);
}

Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::string ToString(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

}  // namespace

Bytes PackLengthPrefixed(const std::vector<Bytes>& parts) {
    std::size_t total = 4 * parts.size();
    for (const auto& part : parts) {
        if (part.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw std::length_error("Length-prefixed part exceeds 4 GiB");
        }
        total += part.size();
    }
    Bytes out(total);
    std::size_t offset = 0;
    for (const auto& part : parts) {
        std::uint32_t len = static_cast<std::uint32_t>(part.size());
        out[offset] = static_cast<std::uint8_t>((len >> 24) & 0xFF);
        out[offset + 1] = static_cast<std::uint8_t>((len >> 16) & 0xFF);
        out[offset + 2] = static_cast<std::uint8_t>((len >> 8) & 0xFF);
        out[offset + 3] = static_cast<std::uint8_t>(len & 0xFF);
        offset += 4;
        if (!part.empty()) {
            std::copy(part.begin(), part.end(), out.begin() + offset);
            offset += part.size();
        }
    }
    return out;
}

std::vector<Bytes> UnpackLengthPrefixed(const Bytes& data, std::size_t count) {
    std::vector<Bytes> parts = UnpackAllLengthPrefixed(data);
    if (parts.size() != count) {
        throw std::runtime_error("Malformed length-prefixed blob (expected " + std::to_string(count)
                                 + " parts, found " + std::to_string(parts.size()) + ")");
    }
    return parts;
}

std::vector<Bytes> UnpackAllLengthPrefixed(const Bytes& data, std::size_t offset) {
    std::vector<Bytes> parts;
    while (offset < data.size()) {
        std::uint32_t len = ReadU32BE(data, offset);
        offset += 4;
        if (len > data.size() - offset) {
            throw std::runtime_error("Malformed length-prefixed blob (truncated part)");
        }
        parts.emplace_back(data.begin() + offset, data.begin() + offset + len);
        offset += len;
    }
    return parts;
}

Bytes EncodeEnvelope(const crypto::EncryptedEnvelope& envelope) {
    return PackLengthPrefixed({ToBytes(envelope.ciphertext),
                               ToBytes(envelope.iv),
                               ToBytes(envelope.tag.value_or(std::string()))});
}

crypto::EncryptedEnvelope DecodeEnvelope(const Bytes& data) {
    std::vector<Bytes> parts;
    try {
        parts = UnpackLengthPrefixed(data, 3);
    } catch (const std::exception& exc) {
        throw DecryptionError("Malformed encrypted envelope", exc.what());
    }
    crypto::EncryptedEnvelope envelope;
    envelope.ciphertext = ToString(parts[0]);
    envelope.iv = ToString(parts[1]);
    if (!parts[2].empty()) {
        envelope.tag = ToString(parts[2]);
    }
    return envelope;
}

Bytes EncodeBlobSet(const BlobSet& blobs) {
    std::vector<Bytes> parts;
    parts.reserve(blobs.size() * 2);
    for (const auto& [path, content] : blobs) {
        parts.push_back(ToBytes(path));
        parts.push_back(content);
    }
    Bytes packed = PackLengthPrefixed(parts);
    Bytes out(constants::kBlobSetMagic.begin(), constants::kBlobSetMagic.end());
    out.insert(out.end(), packed.begin(), packed.end());
    return out;
}

BlobSet DecodeBlobSet(const Bytes& data) {
    const std::size_t magic_len = constants::kBlobSetMagic.size();
    if (data.size() < magic_len
        || !std::equal(constants::kBlobSetMagic.begin(), constants::kBlobSetMagic.end(), data.begin())) {
        throw DecryptionError("Payload is not a blob set", "bad magic");
    }
    std::vector<Bytes> parts;
    try {
        parts = UnpackAllLengthPrefixed(data, magic_len);
    } catch (const std::exception& exc) {
        throw DecryptionError("Malformed blob set", exc.what());
    }
    if (parts.size() % 2 != 0) {
        throw DecryptionError("Malformed blob set", "dangling path without content");
    }
    BlobSet blobs;
    for (std::size_t i = 0; i < parts.size(); i += 2) {
        std::string path = ToString(parts[i]);
        if (!blobs.emplace(std::move(path), std::move(parts[i + 1])).second) {
            throw DecryptionError("Malformed blob set", "duplicate path " + ToString(parts[i]));
        }
    }
    return blobs;
}

}  // namespace valkyrie::format
