#pragma once

#include "valkyrie/compressor.hpp"
#include "valkyrie/constants.hpp"
#include "valkyrie/container.hpp"
#include "valkyrie/crypto.hpp"
#include "valkyrie/format.hpp"
#include "valkyrie/kdf.hpp"
#include "valkyrie/log.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace valkyrie::config {
class IniConfig;
}

namespace valkyrie::package {

struct PackageOptions {
    crypto::EncryptionMode encryption = crypto::EncryptionMode::Gcm;
    compressor::Codec compression = compressor::Codec::Zstd;
    std::string author = std::string(constants::kDefaultAuthor);
    std::string copyright = std::string(constants::kDefaultCopyright);
    std::string description = std::string(constants::kDefaultDescription);
    std::uint32_t version = constants::kFormatVersion;

    // Defaults overridden by VALKYRIE_ENCRYPTION, VALKYRIE_COMPRESSION and VALKYRIE_AUTHOR.
    static PackageOptions FromEnvironment();

    // Applies encryption, compression, author, copyright and description keys
    // of the given section on top of base. A missing section leaves base unchanged.
    static PackageOptions FromConfig(const config::IniConfig& ini, const std::string& section = "package");
    static PackageOptions FromConfig(const config::IniConfig& ini,
                                     const std::string& section,
                                     PackageOptions base);
};

enum class Stage {
    Idle,
    Validating,
    Compressing,
    Decompressing,
    Encrypting,
    Decrypting,
    Done
};

const char* StageName(Stage stage);

// Reads loose files into a patch keyed by file name. Two inputs sharing a
// file name raise ArchiveIoError instead of replacing one another.
BlobSet CollectFiles(const std::vector<std::filesystem::path>& files);

// Seals a BlobSet into a .vpk archive and opens it again. Every operation runs
// to completion or throws exactly one valkyrie::Error; archives are written
// through a temporary sibling file so a failed save never leaves a partial file.
class Package {
public:
    explicit Package(KeyMaterial key, PackageOptions options = {}, log::Logger* logger = nullptr);

    const PackageOptions& options() const { return options_; }
    Stage stage() const { return stage_; }
    std::size_t key_length() const { return key_.size(); }

    // Packs every file below directory. An empty archive_path selects DefaultArchivePath(directory).
    std::filesystem::path Create(const std::filesystem::path& directory,
                                 const std::filesystem::path& archive_path = {});
    std::filesystem::path Save(const BlobSet& blobs, const std::filesystem::path& archive_path);
    BlobSet Read(const std::filesystem::path& archive_path);
    // Read, merge (patch wins, nothing removed), save to the same path.
    std::filesystem::path Update(const BlobSet& patch, const std::filesystem::path& archive_path);
    container::ArchiveHeader Info(const std::filesystem::path& archive_path) const;
    // Throws EncryptionMismatch or CompressionMismatch; a version difference is only logged.
    container::ArchiveHeader Check(const std::filesystem::path& archive_path);
    // Writes each entry below dest_dir. Entries with absolute paths or "..", and sets where
    // one entry is a parent directory of another, are rejected before anything is written.
    std::vector<std::filesystem::path> Extract(const std::filesystem::path& archive_path,
                                               const std::filesystem::path& dest_dir);

    static std::filesystem::path DefaultArchivePath(const std::filesystem::path& directory);
    static std::string ArchiveName(const std::filesystem::path& archive_path);

private:
    log::Logger& logger();
    void SetStage(Stage stage);
    BlobSet ReadDirectory(const std::filesystem::path& directory, const std::filesystem::path& skip);

    KeyMaterial key_;
    PackageOptions options_;
    log::Logger* logger_;
    log::NullLogger null_logger_;
    Stage stage_ = Stage::Idle;
};

}  // namespace valkyrie::package
