#include "valkyrie/cli_colors.hpp"
#include "valkyrie/valkyrie.hpp"

#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  valkyrie info <archive.vpk>\n";
    std::cout << "  valkyrie create <dir> [-o <archive.vpk>] <key> [options]\n";
    std::cout << "  valkyrie list <archive.vpk> <key> [options]\n";
    std::cout << "  valkyrie extract <archive.vpk> [-o <dir>] <key> [options]\n";
    std::cout << "  valkyrie add <archive.vpk> <file>... <key> [options]\n";
    std::cout << "  valkyrie keygen [--length <n>] [--no-letters] [--no-digits] [--symbols]\n";
    std::cout << "\n";
    std::cout << "Key:      --secret <s> --salt <s> | --machine\n";
    std::cout << "Options:  [--encryption AES-GCM|AES-CTR|AES-CBC] [--compression gzip|bzip2|lzma|lz4|zstd|none]\n";
    std::cout << "          [--config <file.ini>] [--verbose] [--no-color]\n";
}

struct Args {
    std::vector<std::string> positional;
    std::string output;
    std::optional<std::string> secret;
    std::optional<std::string> salt;
    bool machine = false;
    std::string encryption;
    std::string compression;
    std::string config;
    bool verbose = false;
    bool no_color = false;
    std::size_t length = 32;
    valkyrie::tools::CodeOptions code;
};

Args ParseArgs(int argc, char** argv, int start_index) {
    Args args;
    auto value = [&](int& idx, const char* what) -> std::string {
        if (idx + 1 >= argc) {
            throw std::runtime_error(std::string("Missing ") + what);
        }
        idx += 2;
        return argv[idx - 1];
    };
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-o" || flag == "--out") {
            args.output = value(idx, "output path");
        } else if (flag == "--secret") {
            args.secret = value(idx, "secret");
        } else if (flag == "--salt") {
            args.salt = value(idx, "salt");
        } else if (flag == "--machine") {
            args.machine = true;
            idx += 1;
        } else if (flag == "--encryption") {
            args.encryption = value(idx, "encryption mode");
        } else if (flag == "--compression") {
            args.compression = value(idx, "compression codec");
        } else if (flag == "--config") {
            args.config = value(idx, "config path");
        } else if (flag == "--verbose" || flag == "-v") {
            args.verbose = true;
            idx += 1;
        } else if (flag == "--no-color") {
            args.no_color = true;
            idx += 1;
        } else if (flag == "--length") {
            args.length = static_cast<std::size_t>(std::stoul(value(idx, "code length")));
        } else if (flag == "--no-letters") {
            args.code.letters = false;
            idx += 1;
        } else if (flag == "--no-digits") {
            args.code.digits = false;
            idx += 1;
        } else if (flag == "--symbols") {
            args.code.punctuation = true;
            idx += 1;
        } else if (flag.size() > 1 && flag[0] == '-') {
            throw std::runtime_error("Unknown flag: " + flag);
        } else {
            args.positional.push_back(flag);
            idx += 1;
        }
    }
    return args;
}

valkyrie::log::Level SelectLevel(const Args& args) {
    if (args.verbose) {
        return valkyrie::log::Level::Debug;
    }
    std::string name = valkyrie::env::Get("VALKYRIE_LOG_LEVEL");
    if (!name.empty()) {
        if (auto level = valkyrie::log::TryLevelFromName(name)) {
            return *level;
        }
    }
    return valkyrie::log::Level::Warning;
}

valkyrie::package::PackageOptions BuildOptions(const Args& args) {
    using valkyrie::package::PackageOptions;
    PackageOptions options = PackageOptions::FromEnvironment();
    if (!args.config.empty()) {
        options = PackageOptions::FromConfig(valkyrie::config::IniConfig::Load(args.config), "package", options);
    }
    if (!args.encryption.empty()) {
        options.encryption = valkyrie::crypto::ModeFromName(args.encryption);
    }
    if (!args.compression.empty()) {
        options.compression = valkyrie::compressor::CodecFromName(args.compression);
    }
    return options;
}

valkyrie::KeyMaterial BuildKey(const Args& args) {
    valkyrie::kdf::KdfParams params = valkyrie::kdf::KdfParams::FromEnvironment();
    if (args.machine) {
        return valkyrie::kdf::DeriveMachineKey(valkyrie::tools::MachineId(), params);
    }
    if (!args.secret || !args.salt) {
        throw std::runtime_error("A key is required: pass --secret and --salt, or --machine");
    }
    return valkyrie::kdf::DeriveKey(*args.secret, *args.salt, params);
}

const std::string& Positional(const Args& args, std::size_t index, const char* what) {
    if (index >= args.positional.size()) {
        throw std::runtime_error(std::string("Missing ") + what);
    }
    return args.positional[index];
}

void PrintHeader(const std::filesystem::path& path, const valkyrie::container::ArchiveHeader& header) {
    namespace cli = valkyrie::cli;
    std::time_t stamp = static_cast<std::time_t>(header.timestamp);
    char when[32] = {};
    std::strftime(when, sizeof(when), "%Y-%m-%d %H:%M:%S", std::gmtime(&stamp));
    std::cout << cli::Cyan("archive: ") << path.string() << "\n";
    std::cout << "name: " << header.name << "\n";
    std::cout << "description: " << header.description << "\n";
    std::cout << "payload_size: " << header.payload_size << " bytes ("
              << valkyrie::tools::FormatSize(header.payload_size) << ")\n";
    std::cout << "author: " << header.author << "\n";
    std::cout << "copyright: " << header.copyright << "\n";
    std::cout << "timestamp: " << header.timestamp << " (" << when << " UTC)\n";
    std::cout << "encryption: " << header.encryption << "\n";
    std::cout << "key_length: " << header.key_length << "\n";
    std::cout << "version: " << header.version << "\n";
    std::cout << "compression: " << header.compression << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return 0;
    }
    namespace cli = valkyrie::cli;
    try {
        Args args = ParseArgs(argc, argv, 2);
        if (args.no_color || valkyrie::env::IsEnabled("NO_COLOR")) {
            cli::SetColorsEnabled(false);
        }
        valkyrie::log::ConsoleLogger logger("valkyrie", SelectLevel(args));

        if (command == "keygen") {
            std::cout << valkyrie::tools::GenerateCode(args.length, args.code) << "\n";
            return 0;
        }
        if (command == "info") {
            std::filesystem::path archive = Positional(args, 0, "archive path");
            PrintHeader(archive, valkyrie::container::Probe(archive));
            return 0;
        }
        if (command != "create" && command != "list" && command != "extract" && command != "add") {
            PrintUsage();
            return 2;
        }

        valkyrie::package::Package package(BuildKey(args), BuildOptions(args), &logger);
        if (command == "create") {
            std::filesystem::path dir = Positional(args, 0, "directory");
            auto archive = package.Create(dir, args.output);
            std::cout << cli::Green("created ") << archive.string() << "\n";
            return 0;
        }
        std::filesystem::path archive = Positional(args, 0, "archive path");
        if (command == "list") {
            valkyrie::BlobSet blobs = package.Read(archive);
            for (const auto& [name, content] : blobs) {
                std::cout << name << "  " << valkyrie::tools::FormatSize(content.size()) << "\n";
            }
            return 0;
        }
        if (command == "extract") {
            std::filesystem::path dest = args.output;
            if (dest.empty()) {
                dest = archive.parent_path() / valkyrie::package::Package::ArchiveName(archive);
            }
            for (const auto& path : package.Extract(archive, dest)) {
                std::cout << path.string() << "\n";
            }
            return 0;
        }
        // add
        if (args.positional.size() < 2) {
            throw std::runtime_error("Missing files to add");
        }
        std::vector<std::filesystem::path> files(args.positional.begin() + 1, args.positional.end());
        valkyrie::BlobSet patch = valkyrie::package::CollectFiles(files);
        package.Update(patch, archive);
        std::cout << cli::Green("updated ") << archive.string() << " (+" << patch.size() << " entries)\n";
        return 0;
    } catch (const valkyrie::Error& exc) {
        std::cerr << cli::Colorize("Error", cli::color::BOLD_RED, std::cerr) << " [" << valkyrie::ErrorKindName(exc.kind())
                  << "]: " << exc.what() << "\n";
        return 1;
    } catch (const std::exception& exc) {
        std::cerr << cli::Colorize("Error", cli::color::BOLD_RED, std::cerr) << ": " << exc.what() << "\n";
        return 1;
    }
}
