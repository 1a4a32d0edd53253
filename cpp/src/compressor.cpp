#include "valkyrie/compressor.hpp"

#include "valkyrie/errors.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include <zlib.h>

#ifndef VALKYRIE_HAS_BZIP2
#define VALKYRIE_HAS_BZIP2 0
#endif
#ifndef VALKYRIE_HAS_LZMA
#define VALKYRIE_HAS_LZMA 0
#endif
#ifndef VALKYRIE_HAS_LZ4
#define VALKYRIE_HAS_LZ4 0
#endif
#ifndef VALKYRIE_HAS_ZSTD
#define VALKYRIE_HAS_ZSTD 0
#endif

#if VALKYRIE_HAS_BZIP2
#include <bzlib.h>
#endif

#if VALKYRIE_HAS_LZMA
#include <lzma.h>
#endif

#if VALKYRIE_HAS_LZ4
#include <lz4frame.h>
#endif

#if VALKYRIE_HAS_ZSTD
#include <zstd.h>
#endif

namespace valkyrie::compressor {

namespace {

constexpr std::size_t kChunkSize = 1 << 16;
constexpr int kGzipLevel = 9;
constexpr int kBzip2BlockSize = 9;
constexpr std::uint32_t kXzPreset = 6;
constexpr int kZstdLevel = 3;
constexpr int kGzipWindowBits = 15 + 16;  // gzip wrapper
constexpr int kGunzipWindowBits = 15 + 32;  // zlib or gzip, auto-detected

void EnsureFits(const Bytes& data) {
    if (data.size() > std::numeric_limits<unsigned int>::max()) {
        throw std::runtime_error("Buffer too large for a single-shot codec call");
    }
}

Bytes CompressGzip(const Bytes& input) {
    EnsureFits(input);
    z_stream strm{};
    if (deflateInit2(&strm, kGzipLevel, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip encoder");
    }
    Bytes out;
    std::array<std::uint8_t, kChunkSize> out_buf{};
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    int ret = Z_OK;
    do {
        strm.next_out = out_buf.data();
        strm.avail_out = static_cast<uInt>(out_buf.size());
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            throw std::runtime_error("Gzip compression failed");
        }
        out.insert(out.end(), out_buf.data(), out_buf.data() + (out_buf.size() - strm.avail_out));
    } while (ret != Z_STREAM_END);
    deflateEnd(&strm);
    return out;
}

Bytes DecompressGzip(const Bytes& input) {
    EnsureFits(input);
    z_stream strm{};
    if (inflateInit2(&strm, kGunzipWindowBits) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip decoder");
    }
    Bytes out;
    std::array<std::uint8_t, kChunkSize> out_buf{};
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    while (true) {
        strm.next_out = out_buf.data();
        strm.avail_out = static_cast<uInt>(out_buf.size());
        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string reason = strm.msg ? strm.msg : "truncated or corrupt stream";
            inflateEnd(&strm);
            throw std::runtime_error("Gzip decompression failed: " + reason);
        }
        out.insert(out.end(), out_buf.data(), out_buf.data() + (out_buf.size() - strm.avail_out));
        if (ret == Z_STREAM_END) {
            if (strm.avail_in == 0) {
                break;
            }
            // Concatenated gzip members decode as one stream.
            inflateReset(&strm);
            continue;
        }
        if (strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            throw std::runtime_error("Gzip decompression failed: truncated stream");
        }
    }
    inflateEnd(&strm);
    return out;
}

#if VALKYRIE_HAS_BZIP2
Bytes CompressBzip2(const Bytes& input) {
    EnsureFits(input);
    bz_stream strm{};
    if (BZ2_bzCompressInit(&strm, kBzip2BlockSize, 0, 0) != BZ_OK) {
        throw std::runtime_error("Failed to initialize bzip2 encoder");
    }
    Bytes out;
    std::array<char, kChunkSize> out_buf{};
    strm.next_in = const_cast<char*>(reinterpret_cast<const char*>(input.data()));
    strm.avail_in = static_cast<unsigned int>(input.size());
    int ret = BZ_FINISH_OK;
    do {
        strm.next_out = out_buf.data();
        strm.avail_out = static_cast<unsigned int>(out_buf.size());
        ret = BZ2_bzCompress(&strm, BZ_FINISH);
        if (ret != BZ_FINISH_OK && ret != BZ_STREAM_END) {
            BZ2_bzCompressEnd(&strm);
            throw std::runtime_error("Bzip2 compression failed");
        }
        std::size_t produced = out_buf.size() - strm.avail_out;
        out.insert(out.end(), reinterpret_cast<std::uint8_t*>(out_buf.data()),
                   reinterpret_cast<std::uint8_t*>(out_buf.data()) + produced);
    } while (ret != BZ_STREAM_END);
    BZ2_bzCompressEnd(&strm);
    return out;
}

Bytes DecompressBzip2(const Bytes& input) {
    EnsureFits(input);
    bz_stream strm{};
    if (BZ2_bzDecompressInit(&strm, 0, 0) != BZ_OK) {
        throw std::runtime_error("Failed to initialize bzip2 decoder");
    }
    Bytes out;
    std::array<char, kChunkSize> out_buf{};
    strm.next_in = const_cast<char*>(reinterpret_cast<const char*>(input.data()));
    strm.avail_in = static_cast<unsigned int>(input.size());
    while (true) {
        strm.next_out = out_buf.data();
        strm.avail_out = static_cast<unsigned int>(out_buf.size());
        int ret = BZ2_bzDecompress(&strm);
        if (ret != BZ_OK && ret != BZ_STREAM_END) {
            BZ2_bzDecompressEnd(&strm);
            throw std::runtime_error("Bzip2 decompression failed: corrupt stream");
        }
        std::size_t produced = out_buf.size() - strm.avail_out;
        out.insert(out.end(), reinterpret_cast<std::uint8_t*>(out_buf.data()),
                   reinterpret_cast<std::uint8_t*>(out_buf.data()) + produced);
        if (ret == BZ_STREAM_END) {
            break;
        }
        if (strm.avail_in == 0 && produced == 0) {
            BZ2_bzDecompressEnd(&strm);
            throw std::runtime_error("Bzip2 decompression failed: truncated stream");
        }
    }
    BZ2_bzDecompressEnd(&strm);
    return out;
}
#endif

#if VALKYRIE_HAS_LZMA
Bytes RunLzma(lzma_stream& strm, const Bytes& input, const char* what) {
    Bytes out;
    std::array<std::uint8_t, kChunkSize> out_buf{};
    strm.next_in = input.data();
    strm.avail_in = input.size();
    while (true) {
        strm.next_out = out_buf.data();
        strm.avail_out = out_buf.size();
        lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
            lzma_end(&strm);
            throw std::runtime_error(std::string(what) + " failed (lzma error " + std::to_string(ret) + ")");
        }
        out.insert(out.end(), out_buf.data(), out_buf.data() + (out_buf.size() - strm.avail_out));
        if (ret == LZMA_STREAM_END) {
            break;
        }
    }
    lzma_end(&strm);
    return out;
}

Bytes CompressXz(const Bytes& input) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_easy_encoder(&strm, kXzPreset, LZMA_CHECK_CRC64) != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz encoder");
    }
    return RunLzma(strm, input, "XZ compression");
}

Bytes DecompressXz(const Bytes& input) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz decoder");
    }
    return RunLzma(strm, input, "XZ decompression");
}
#endif

#if VALKYRIE_HAS_LZ4
struct Lz4DctxDeleter {
    void operator()(LZ4F_dctx* ctx) const noexcept {
        if (ctx) LZ4F_freeDecompressionContext(ctx);
    }
};

Bytes CompressLz4(const Bytes& input) {
    Bytes out(LZ4F_compressFrameBound(input.size(), nullptr));
    std::size_t written = LZ4F_compressFrame(out.data(), out.size(), input.data(), input.size(), nullptr);
    if (LZ4F_isError(written)) {
        throw std::runtime_error(std::string("LZ4 compression failed: ") + LZ4F_getErrorName(written));
    }
    out.resize(written);
    return out;
}

Bytes DecompressLz4(const Bytes& input) {
    LZ4F_dctx* raw = nullptr;
    std::size_t rc = LZ4F_createDecompressionContext(&raw, LZ4F_VERSION);
    if (LZ4F_isError(rc)) {
        throw std::runtime_error("Failed to initialize lz4 decoder");
    }
    std::unique_ptr<LZ4F_dctx, Lz4DctxDeleter> dctx(raw);
    Bytes out;
    std::array<std::uint8_t, kChunkSize> out_buf{};
    const std::uint8_t* src = input.data();
    std::size_t remaining = input.size();
    std::size_t hint = 1;
    while (remaining > 0 && hint != 0) {
        std::size_t out_size = out_buf.size();
        std::size_t in_size = remaining;
        hint = LZ4F_decompress(dctx.get(), out_buf.data(), &out_size, src, &in_size, nullptr);
        if (LZ4F_isError(hint)) {
            throw std::runtime_error(std::string("LZ4 decompression failed: ") + LZ4F_getErrorName(hint));
        }
        out.insert(out.end(), out_buf.data(), out_buf.data() + out_size);
        src += in_size;
        remaining -= in_size;
        if (in_size == 0 && out_size == 0) {
            break;
        }
    }
    // Drain output still buffered inside the context.
    while (hint != 0) {
        std::size_t out_size = out_buf.size();
        std::size_t in_size = 0;
        hint = LZ4F_decompress(dctx.get(), out_buf.data(), &out_size, src, &in_size, nullptr);
        if (LZ4F_isError(hint)) {
            throw std::runtime_error(std::string("LZ4 decompression failed: ") + LZ4F_getErrorName(hint));
        }
        if (out_size == 0) {
            break;
        }
        out.insert(out.end(), out_buf.data(), out_buf.data() + out_size);
    }
    if (hint != 0) {
        throw std::runtime_error("LZ4 decompression failed: truncated frame");
    }
    return out;
}
#endif

#if VALKYRIE_HAS_ZSTD
struct ZstdDctxDeleter {
    void operator()(ZSTD_DCtx* ctx) const noexcept {
        if (ctx) ZSTD_freeDCtx(ctx);
    }
};

Bytes CompressZstd(const Bytes& input) {
    Bytes out(ZSTD_compressBound(input.size()));
    std::size_t written = ZSTD_compress(out.data(), out.size(), input.data(), input.size(), kZstdLevel);
    if (ZSTD_isError(written)) {
        throw std::runtime_error(std::string("ZSTD compression failed: ") + ZSTD_getErrorName(written));
    }
    out.resize(written);
    return out;
}

Bytes DecompressZstd(const Bytes& input) {
    std::unique_ptr<ZSTD_DCtx, ZstdDctxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) {
        throw std::runtime_error("Failed to initialize zstd decoder");
    }
    Bytes out;
    std::array<std::uint8_t, kChunkSize> out_buf{};
    ZSTD_inBuffer in{input.data(), input.size(), 0};
    std::size_t ret = 1;
    while (in.pos < in.size || ret != 0) {
        ZSTD_outBuffer output{out_buf.data(), out_buf.size(), 0};
        std::size_t before = in.pos;
        ret = ZSTD_decompressStream(dctx.get(), &output, &in);
        if (ZSTD_isError(ret)) {
            throw std::runtime_error(std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(ret));
        }
        out.insert(out.end(), out_buf.data(), out_buf.data() + output.pos);
        if (ret != 0 && in.pos == before && output.pos == 0) {
            throw std::runtime_error("ZSTD decompression failed: truncated frame");
        }
    }
    return out;
}
#endif

}  // namespace

const char* CodecName(Codec codec) {
    switch (codec) {
        case Codec::Gzip:
            return "gzip";
        case Codec::Bzip2:
            return "bzip2";
        case Codec::Lzma:
            return "lzma";
        case Codec::Lz4:
            return "lz4";
        case Codec::Zstd:
            return "zstd";
        case Codec::None:
            return "none";
    }
    return "";
}

std::optional<Codec> TryCodecFromName(std::string_view name) {
    for (Codec codec : kAllCodecs) {
        if (name == CodecName(codec)) {
            return codec;
        }
    }
    return std::nullopt;
}

Codec CodecFromName(std::string_view name) {
    auto codec = TryCodecFromName(name);
    if (!codec) {
        throw UnsupportedCodec(std::string(name));
    }
    return *codec;
}

bool IsAvailable(Codec codec) {
    switch (codec) {
        case Codec::Gzip:
        case Codec::None:
            return true;
        case Codec::Bzip2:
            return VALKYRIE_HAS_BZIP2 != 0;
        case Codec::Lzma:
            return VALKYRIE_HAS_LZMA != 0;
        case Codec::Lz4:
            return VALKYRIE_HAS_LZ4 != 0;
        case Codec::Zstd:
            return VALKYRIE_HAS_ZSTD != 0;
    }
    return false;
}

Bytes Compress(const Bytes& data, Codec codec) {
    if (!IsAvailable(codec)) {
        throw UnsupportedCodec(CodecName(codec), "library not available in this build");
    }
    try {
        switch (codec) {
            case Codec::Gzip:
                return CompressGzip(data);
            case Codec::Bzip2:
#if VALKYRIE_HAS_BZIP2
                return CompressBzip2(data);
#else
                break;
#endif
            case Codec::Lzma:
#if VALKYRIE_HAS_LZMA
                return CompressXz(data);
#else
                break;
#endif
            case Codec::Lz4:
#if VALKYRIE_HAS_LZ4
                return CompressLz4(data);
#else
                break;
#endif
            case Codec::Zstd:
#if VALKYRIE_HAS_ZSTD
                return CompressZstd(data);
#else
                break;
#endif
            case Codec::None:
                return data;
        }
    } catch (const std::exception& exc) {
        throw CompressionError(std::string(CodecName(codec)) + " compression failed", exc.what());
    }
    throw UnsupportedCodec(CodecName(codec));
}

Bytes Decompress(const Bytes& data, Codec codec) {
    if (!IsAvailable(codec)) {
        throw UnsupportedCodec(CodecName(codec), "library not available in this build");
    }
    try {
        switch (codec) {
            case Codec::Gzip:
                return DecompressGzip(data);
            case Codec::Bzip2:
#if VALKYRIE_HAS_BZIP2
                return DecompressBzip2(data);
#else
                break;
#endif
            case Codec::Lzma:
#if VALKYRIE_HAS_LZMA
                return DecompressXz(data);
#else
                break;
#endif
            case Codec::Lz4:
#if VALKYRIE_HAS_LZ4
                return DecompressLz4(data);
#else
                break;
#endif
            case Codec::Zstd:
#if VALKYRIE_HAS_ZSTD
                return DecompressZstd(data);
#else
                break;
#endif
            case Codec::None:
                return data;
        }
    } catch (const std::exception& exc) {
        throw CompressionError(std::string(CodecName(codec)) + " decompression failed", exc.what());
    }
    throw UnsupportedCodec(CodecName(codec));
}

Bytes Compress(const Bytes& data, std::string_view codec_name) {
    return Compress(data, CodecFromName(codec_name));
}

Bytes Decompress(const Bytes& data, std::string_view codec_name) {
    return Decompress(data, CodecFromName(codec_name));
}

}  // namespace valkyrie::compressor
