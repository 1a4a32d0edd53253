#include "valkyrie/package.hpp"

#include "valkyrie/config.hpp"
#include "valkyrie/env.hpp"
#include "valkyrie/errors.hpp"
#include "valkyrie/tools.hpp"

#include <ctime>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <system_error>
#include <utility>

namespace valkyrie::package {

namespace {

crypto::EncryptionMode ParseMode(const std::string& name, const std::string& origin) {
    auto mode = crypto::TryModeFromName(name);
    if (!mode) {
        throw ConfigError("Unknown encryption mode '" + name + "'", origin);
    }
    return *mode;
}

compressor::Codec ParseCodec(const std::string& name, const std::string& origin) {
    auto codec = compressor::TryCodecFromName(name);
    if (!codec) {
        throw ConfigError("Unknown compression codec '" + name + "'", origin);
    }
    return *codec;
}

bool IsSafeEntry(const std::filesystem::path& entry) {
    if (entry.empty() || entry.has_root_name() || entry.has_root_directory()) {
        return false;
    }
    for (const auto& part : entry) {
        if (part == "..") {
            return false;
        }
    }
    std::filesystem::path leaf = entry.lexically_normal().filename();
    return !leaf.empty() && leaf != ".";
}

// Finds an entry that cannot be written next to the others: a path that is also
// a parent directory of another entry, or one that collides with what already
// exists below dest_dir. Returns an empty string when the set extracts cleanly.
std::string FindExtractConflict(const BlobSet& blobs, const std::filesystem::path& dest_dir) {
    std::set<std::string> files;
    for (const auto& entry : blobs) {
        std::string normal = std::filesystem::path(entry.first).lexically_normal().generic_string();
        if (!files.insert(normal).second) {
            return entry.first + " is listed twice";
        }
    }
    std::error_code ec;
    for (const auto& name : files) {
        std::filesystem::path relative(name);
        for (auto parent = relative.parent_path(); !parent.empty(); parent = parent.parent_path()) {
            if (files.count(parent.generic_string()) != 0) {
                return parent.generic_string() + " is both a file and a directory";
            }
            auto status = std::filesystem::symlink_status(dest_dir / parent, ec);
            if (std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
                return (dest_dir / parent).string() + " exists and is not a directory";
            }
        }
        if (std::filesystem::is_directory(std::filesystem::symlink_status(dest_dir / relative, ec))) {
            return (dest_dir / relative).string() + " exists and is a directory";
        }
    }
    return {};
}

bool SamePath(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    auto lhs = std::filesystem::weakly_canonical(a, ec);
    if (ec) return false;
    auto rhs = std::filesystem::weakly_canonical(b, ec);
    if (ec) return false;
    return lhs == rhs;
}

}  // namespace

PackageOptions PackageOptions::FromEnvironment() {
    PackageOptions options;
    std::string encryption = env::Get("VALKYRIE_ENCRYPTION");
    if (!encryption.empty()) {
        options.encryption = ParseMode(encryption, "VALKYRIE_ENCRYPTION");
    }
    std::string compression = env::Get("VALKYRIE_COMPRESSION");
    if (!compression.empty()) {
        options.compression = ParseCodec(compression, "VALKYRIE_COMPRESSION");
    }
    std::string author = env::Get("VALKYRIE_AUTHOR");
    if (!author.empty()) {
        options.author = author;
    }
    return options;
}

PackageOptions PackageOptions::FromConfig(const config::IniConfig& ini, const std::string& section) {
    return FromConfig(ini, section, PackageOptions());
}

PackageOptions PackageOptions::FromConfig(const config::IniConfig& ini,
                                          const std::string& section,
                                          PackageOptions base) {
    if (!ini.HasSection(section)) {
        return base;
    }
    const std::string origin = "[" + section + "]";
    if (auto value = ini.Find(section, "encryption")) {
        base.encryption = ParseMode(*value, origin);
    }
    if (auto value = ini.Find(section, "compression")) {
        base.compression = ParseCodec(*value, origin);
    }
    base.author = ini.GetString(section, "author", base.author);
    base.copyright = ini.GetString(section, "copyright", base.copyright);
    base.description = ini.GetString(section, "description", base.description);
    return base;
}

const char* StageName(Stage stage) {
    switch (stage) {
        case Stage::Idle:
            return "idle";
        case Stage::Validating:
            return "validating";
        case Stage::Compressing:
            return "compressing";
        case Stage::Decompressing:
            return "decompressing";
        case Stage::Encrypting:
            return "encrypting";
        case Stage::Decrypting:
            return "decrypting";
        case Stage::Done:
            return "done";
    }
    return "";
}

BlobSet CollectFiles(const std::vector<std::filesystem::path>& files) {
    BlobSet patch;
    std::map<std::string, std::filesystem::path> origin;
    for (const auto& file : files) {
        std::string key = file.filename().generic_string();
        auto [it, inserted] = origin.emplace(key, file);
        if (!inserted) {
            throw ArchiveIoError("Duplicate entry name " + key, it->second.string() + " and " + file.string());
        }
        patch[key] = tools::ReadFileBytes(file);
    }
    return patch;
}

Package::Package(KeyMaterial key, PackageOptions options, log::Logger* logger)
    : key_(std::move(key)), options_(std::move(options)), logger_(logger) {}

log::Logger& Package::logger() {
    return logger_ ? *logger_ : null_logger_;
}

void Package::SetStage(Stage stage) {
    stage_ = stage;
    logger().Debug(std::string("stage: ") + StageName(stage));
}

std::filesystem::path Package::DefaultArchivePath(const std::filesystem::path& directory) {
    std::filesystem::path normal = directory.lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    std::string name = normal.filename().string();
    if (name.empty() || name == "." || name == "..") {
        name = std::string(constants::kDefaultArchiveName);
    }
    return directory / (name + std::string(constants::kArchiveExt));
}

std::string Package::ArchiveName(const std::filesystem::path& archive_path) {
    std::string name = archive_path.filename().string();
    const std::string ext(constants::kArchiveExt);
    if (name.size() >= ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
        name.erase(name.size() - ext.size());
    }
    return name;
}

BlobSet Package::ReadDirectory(const std::filesystem::path& directory, const std::filesystem::path& skip) {
    std::filesystem::path temp = skip;
    temp += std::string(constants::kTempSuffix);
    std::filesystem::path base = std::filesystem::absolute(directory);
    BlobSet blobs;
    for (const auto& file : tools::ListFiles(directory)) {
        if (SamePath(file, skip) || SamePath(file, temp)) {
            continue;
        }
        std::string key = file.lexically_relative(base).generic_string();
        try {
            blobs[key] = tools::ReadFileBytes(file);
        } catch (const Error& exc) {
            throw DirectoryReadError("Failed to read " + file.string(), exc.what());
        }
    }
    logger().Info("Collected " + std::to_string(blobs.size()) + " file(s) from " + directory.string());
    return blobs;
}

std::filesystem::path Package::Create(const std::filesystem::path& directory,
                                      const std::filesystem::path& archive_path) {
    std::filesystem::path target = archive_path.empty() ? DefaultArchivePath(directory) : archive_path;
    BlobSet blobs;
    try {
        blobs = ReadDirectory(directory, target);
    } catch (const Error& exc) {
        logger().Error(std::string("Failed to read directory: ") + exc.what());
        stage_ = Stage::Idle;
        throw;
    }
    return Save(blobs, target);
}

std::filesystem::path Package::Save(const BlobSet& blobs, const std::filesystem::path& archive_path) {
    try {
        SetStage(Stage::Validating);
        if (archive_path.empty()) {
            throw ArchiveIoError("Archive path is empty");
        }
        Bytes plaintext = format::EncodeBlobSet(blobs);

        SetStage(Stage::Encrypting);
        crypto::EncryptedEnvelope envelope = crypto::Encrypt(key_, plaintext, options_.encryption);
        Bytes envelope_bytes = format::EncodeEnvelope(envelope);

        SetStage(Stage::Compressing);
        Bytes compressed = compressor::Compress(envelope_bytes, options_.compression);
        if (compressed.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw ArchiveIoError("Payload exceeds the 4 GiB header limit");
        }

        container::ArchiveHeader header;
        header.name = ArchiveName(archive_path);
        header.description = options_.description;
        header.payload_size = static_cast<std::uint32_t>(compressed.size());
        header.author = options_.author;
        header.copyright = options_.copyright;
        header.timestamp = static_cast<std::uint32_t>(std::time(nullptr));
        header.encryption = crypto::ModeName(options_.encryption);
        header.key_length = static_cast<std::uint32_t>(key_.size());
        header.version = options_.version;
        header.compression = compressor::CodecName(options_.compression);
        container::HeaderBytes header_bytes = container::EncodeHeader(header);

        Bytes file(header_bytes.begin(), header_bytes.end());
        file.insert(file.end(), compressed.begin(), compressed.end());
        tools::WriteFileAtomic(archive_path, file);

        logger().Info("Saved " + std::to_string(blobs.size()) + " entries to " + archive_path.string() + " ("
                      + tools::FormatSize(file.size()) + ")");
        SetStage(Stage::Done);
        return archive_path;
    } catch (const Error& exc) {
        logger().Error(std::string("Failed to save archive: ") + exc.what());
        stage_ = Stage::Idle;
        throw;
    }
}

container::ArchiveHeader Package::Check(const std::filesystem::path& archive_path) {
    container::ArchiveHeader header = container::Probe(archive_path);
    const std::string expected_mode = crypto::ModeName(options_.encryption);
    if (header.encryption != expected_mode) {
        logger().Error("Archive " + archive_path.string() + " is encrypted with " + header.encryption);
        throw EncryptionMismatch(expected_mode, header.encryption);
    }
    if (header.version != options_.version) {
        logger().Warning("Archive " + header.name + " has format version " + std::to_string(header.version)
                         + ", expected " + std::to_string(options_.version));
    }
    const std::string expected_codec = compressor::CodecName(options_.compression);
    if (header.compression != expected_codec) {
        logger().Error("Archive " + archive_path.string() + " is compressed with " + header.compression);
        throw CompressionMismatch(expected_codec, header.compression);
    }
    return header;
}

BlobSet Package::Read(const std::filesystem::path& archive_path) {
    try {
        SetStage(Stage::Validating);
        container::ArchiveHeader header = Check(archive_path);

        std::error_code ec;
        std::uintmax_t file_size = std::filesystem::file_size(archive_path, ec);
        if (ec) {
            throw ArchiveIoError("Failed to stat archive", ec.message());
        }
        std::uintmax_t available = file_size - constants::kHeaderSize;
        if (available < header.payload_size) {
            throw ArchiveIoError("Archive payload truncated",
                                 archive_path.string() + ": " + std::to_string(available) + " of "
                                     + std::to_string(header.payload_size) + " bytes");
        }
        std::ifstream input(archive_path, std::ios::binary);
        if (!input) {
            throw ArchiveIoError("Failed to open archive", archive_path.string());
        }
        input.seekg(static_cast<std::streamoff>(constants::kHeaderSize), std::ios::beg);
        Bytes payload(header.payload_size);
        if (!payload.empty()) {
            input.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
            if (!input) {
                throw ArchiveIoError("Failed to read archive payload", archive_path.string());
            }
        }

        SetStage(Stage::Decompressing);
        Bytes envelope_bytes = compressor::Decompress(payload, options_.compression);

        SetStage(Stage::Decrypting);
        crypto::EncryptedEnvelope envelope = format::DecodeEnvelope(envelope_bytes);
        Bytes plaintext = crypto::Decrypt(key_, envelope, options_.encryption);
        BlobSet blobs = format::DecodeBlobSet(plaintext);

        logger().Info("Read " + std::to_string(blobs.size()) + " entries from " + archive_path.string());
        SetStage(Stage::Done);
        return blobs;
    } catch (const Error& exc) {
        logger().Error(std::string("Failed to read archive: ") + exc.what());
        stage_ = Stage::Idle;
        throw;
    }
}

std::filesystem::path Package::Update(const BlobSet& patch, const std::filesystem::path& archive_path) {
    BlobSet blobs = Read(archive_path);
    for (const auto& [path, content] : patch) {
        blobs.insert_or_assign(path, content);
    }
    return Save(blobs, archive_path);
}

container::ArchiveHeader Package::Info(const std::filesystem::path& archive_path) const {
    return container::Probe(archive_path);
}

std::vector<std::filesystem::path> Package::Extract(const std::filesystem::path& archive_path,
                                                    const std::filesystem::path& dest_dir) {
    BlobSet blobs = Read(archive_path);
    for (const auto& entry : blobs) {
        if (!IsSafeEntry(std::filesystem::path(entry.first))) {
            logger().Error("Refusing to extract unsafe entry " + entry.first);
            throw ArchiveIoError("Unsafe entry path in archive", entry.first);
        }
    }
    std::string conflict = FindExtractConflict(blobs, dest_dir);
    if (!conflict.empty()) {
        logger().Error("Refusing to extract " + archive_path.string() + ": " + conflict);
        throw ArchiveIoError("Conflicting entry paths in archive", conflict);
    }
    std::vector<std::filesystem::path> written;
    written.reserve(blobs.size());
    for (const auto& [name, content] : blobs) {
        std::filesystem::path target = dest_dir / std::filesystem::path(name);
        tools::WriteFileAtomic(target, content);
        logger().Debug("extracted " + target.string());
        written.push_back(std::move(target));
    }
    return written;
}

}  // namespace valkyrie::package
