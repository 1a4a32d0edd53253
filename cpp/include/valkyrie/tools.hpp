#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace valkyrie::tools {

using Bytes = std::vector<std::uint8_t>;

// Regular files below root, recursively, sorted. Throws DirectoryReadError.
std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& root);

Bytes ReadFileBytes(const std::filesystem::path& path);

// Writes to "<path>.tmp" then renames over path. The temporary file is
// removed on failure. Throws ArchiveIoError.
void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data);

struct CodeOptions {
    bool letters = true;
    bool digits = true;
    bool punctuation = false;
};

// Uniform over the selected alphabet, drawn from the OpenSSL RNG.
std::string GenerateCode(std::size_t length, const CodeOptions& options = {});

// /etc/machine-id, then /var/lib/dbus/machine-id, then the host name.
std::string MachineId();

// Decimal units: 1000 -> "1.00 KB", 500 -> "500.00 B".
std::string FormatSize(std::uint64_t bytes);

// Lowercase hex digest ("md5", "sha1", "sha256", "sha512", ...).
std::string HashHex(const Bytes& data, std::string_view algorithm);
std::string HashHex(std::string_view data, std::string_view algorithm);

}  // namespace valkyrie::tools
