#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace valkyrie::constants {

inline constexpr std::size_t kKeyLength = 32;
inline constexpr std::uint32_t kArgon2TimeCost = 2;
inline constexpr std::uint32_t kArgon2MemoryCost = 100u * 100u;  // KiB
inline constexpr std::uint32_t kArgon2Parallelism = 8;
inline constexpr std::size_t kArgon2MinSaltLen = 8;

inline constexpr std::size_t kGcmNonceLen = 12;
inline constexpr std::size_t kGcmTagLen = 16;
inline constexpr std::size_t kCtrNonceLen = 8;
inline constexpr std::size_t kAesBlockLen = 16;

// Fixed-width header record: 16s 22s I 16s 17s I 7s I I 5s, native alignment.
inline constexpr std::size_t kNameWidth = 16;
inline constexpr std::size_t kDescriptionWidth = 22;
inline constexpr std::size_t kAuthorWidth = 16;
inline constexpr std::size_t kCopyrightWidth = 17;
inline constexpr std::size_t kEncryptionWidth = 7;
inline constexpr std::size_t kCompressionWidth = 5;

inline constexpr std::size_t kNameOffset = 0;
inline constexpr std::size_t kDescriptionOffset = 16;
inline constexpr std::size_t kPayloadSizeOffset = 40;
inline constexpr std::size_t kAuthorOffset = 44;
inline constexpr std::size_t kCopyrightOffset = 60;
inline constexpr std::size_t kTimestampOffset = 80;
inline constexpr std::size_t kEncryptionOffset = 84;
inline constexpr std::size_t kKeyLengthOffset = 92;
inline constexpr std::size_t kVersionOffset = 96;
inline constexpr std::size_t kCompressionOffset = 100;
inline constexpr std::size_t kHeaderSize = 105;

static_assert(kCompressionOffset + kCompressionWidth == kHeaderSize, "Header layout mismatch");

inline constexpr std::uint32_t kFormatVersion = 2;
inline constexpr std::string_view kArchiveExt = ".vpk";
inline constexpr std::string_view kDefaultArchiveName = "ValkyrieUtils";
inline constexpr std::string_view kDefaultDescription = "Encrypted data package";
inline constexpr std::string_view kDefaultAuthor = "Valky Fischer";
inline constexpr std::string_view kDefaultCopyright = "Valky \xE2\x93\x92 2023";
inline constexpr std::string_view kBlobSetMagic = "VBS1";
inline constexpr std::string_view kTempSuffix = ".tmp";

}  // namespace valkyrie::constants
