#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace valkyrie::compressor {

using Bytes = std::vector<std::uint8_t>;

enum class Codec {
    Gzip,
    Bzip2,
    Lzma,
    Lz4,
    Zstd,
    None
};

inline constexpr std::array<Codec, 6> kAllCodecs = {
    Codec::Gzip, Codec::Bzip2, Codec::Lzma, Codec::Lz4, Codec::Zstd, Codec::None
};

// Names are stored in the archive header and never exceed five bytes.
const char* CodecName(Codec codec);
std::optional<Codec> TryCodecFromName(std::string_view name);
Codec CodecFromName(std::string_view name);

// False when the codec's library was not found at build time.
bool IsAvailable(Codec codec);

Bytes Compress(const Bytes& data, Codec codec);
Bytes Decompress(const Bytes& data, Codec codec);

// Name-keyed entry points; unknown names raise UnsupportedCodec.
Bytes Compress(const Bytes& data, std::string_view codec_name);
Bytes Decompress(const Bytes& data, std::string_view codec_name);

}  // namespace valkyrie::compressor
