#pragma once

#include "valkyrie/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace valkyrie {

// Relative path (generic '/' separators) to file contents.
using BlobSet = std::map<std::string, Bytes>;

}  // namespace valkyrie

namespace valkyrie::format {

// u32 big-endian length followed by the bytes, once per part.
Bytes PackLengthPrefixed(const std::vector<Bytes>& parts);
std::vector<Bytes> UnpackLengthPrefixed(const Bytes& data, std::size_t count);
std::vector<Bytes> UnpackAllLengthPrefixed(const Bytes& data, std::size_t offset = 0);

// ciphertext hex, iv hex, tag hex (empty when absent).
Bytes EncodeEnvelope(const crypto::EncryptedEnvelope& envelope);
crypto::EncryptedEnvelope DecodeEnvelope(const Bytes& data);

// "VBS1" followed by path/content pairs in key order.
Bytes EncodeBlobSet(const BlobSet& blobs);
BlobSet DecodeBlobSet(const Bytes& data);

}  // namespace valkyrie::format
