#include "valkyrie/tools.hpp"

#include "valkyrie/constants.hpp"
#include "valkyrie/crypto.hpp"
#include "valkyrie/errors.hpp"
#include "valkyrie/hex.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace valkyrie::tools {

namespace {

constexpr std::string_view kLetters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kDigits = "0123456789";
constexpr std::string_view kPunctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

std::string ReadFirstLine(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return {};
    }
    std::string line;
    std::getline(input, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    return line;
}

}  // namespace

std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw DirectoryReadError("Not a directory: " + root.string(), ec ? ec.message() : std::string());
    }
    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw DirectoryReadError("Failed to list directory: " + root.string(), ec.message());
    }
    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(std::filesystem::absolute(it->path(), type_ec));
        }
        it.increment(ec);
        if (ec) {
            throw DirectoryReadError("Failed to list directory: " + root.string(), ec.message());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

Bytes ReadFileBytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ArchiveIoError("Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw ArchiveIoError("Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);
    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw ArchiveIoError("Failed to read file: " + path.string());
        }
    }
    return data;
}

void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ArchiveIoError("Failed to create directory: " + path.parent_path().string(), ec.message());
        }
    }
    std::filesystem::path temp = path;
    temp += std::string(constants::kTempSuffix);
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw ArchiveIoError("Failed to open file for writing: " + temp.string());
        }
        if (!data.empty()) {
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        output.flush();
        if (!output) {
            output.close();
            std::filesystem::remove(temp, ec);
            throw ArchiveIoError("Failed to write file: " + temp.string());
        }
    }
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(temp, ec);
        throw ArchiveIoError("Failed to move " + temp.string() + " into place", reason);
    }
}

std::string GenerateCode(std::size_t length, const CodeOptions& options) {
    std::string alphabet;
    if (options.letters) alphabet += kLetters;
    if (options.digits) alphabet += kDigits;
    if (options.punctuation) alphabet += kPunctuation;
    if (alphabet.empty()) {
        throw std::invalid_argument("GenerateCode requires at least one character class");
    }
    // Largest multiple of the alphabet size that fits a byte; higher draws are rejected.
    const std::size_t limit = 256 - (256 % alphabet.size());
    std::string code;
    code.reserve(length);
    while (code.size() < length) {
        Bytes pool = crypto::RandomBytes(std::max<std::size_t>(length - code.size(), 16));
        for (std::uint8_t byte : pool) {
            if (byte >= limit) {
                continue;
            }
            code.push_back(alphabet[byte % alphabet.size()]);
            if (code.size() == length) {
                break;
            }
        }
    }
    return code;
}

std::string MachineId() {
    for (const char* candidate : {"/etc/machine-id", "/var/lib/dbus/machine-id"}) {
        std::string id = ReadFirstLine(candidate);
        if (!id.empty()) {
            return id;
        }
    }
    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return host;
    }
    throw std::runtime_error("Unable to determine a machine identifier");
}

std::string FormatSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    std::size_t unit = 0;
    double value = static_cast<double>(bytes);

    while (value >= 1000.0 && unit < 5) {
        value /= 1000.0;
        unit++;
    }

    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << value << " " << units[unit];
    return oss.str();
}

std::string HashHex(const Bytes& data, std::string_view algorithm) {
    return hex::Encode(crypto::Digest(data, algorithm));
}

std::string HashHex(std::string_view data, std::string_view algorithm) {
    return HashHex(Bytes(data.begin(), data.end()), algorithm);
}

}  // namespace valkyrie::tools
