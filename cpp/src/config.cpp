#include "valkyrie/config.hpp"

#include "valkyrie/errors.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace valkyrie::config {

namespace {

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string ToLower(std::string text) {
    for (char& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

std::string Where(const std::string& section, const std::string& key) {
    return "[" + section + "] " + key;
}

}  // namespace

IniConfig IniConfig::Load(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("Failed to open config file", path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Parse(buffer.str(), path.string());
}

IniConfig IniConfig::Parse(const std::string& text, const std::string& origin) {
    IniConfig config;
    std::istringstream stream(text);
    std::string raw;
    std::string current;
    bool in_section = false;
    std::size_t line_no = 0;
    while (std::getline(stream, raw)) {
        ++line_no;
        std::string line = Trim(raw);
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }
        std::string at = origin + ":" + std::to_string(line_no);
        if (line.front() == '[') {
            if (line.back() != ']') {
                throw ConfigError("Malformed section header", at);
            }
            current = Trim(line.substr(1, line.size() - 2));
            if (current.empty()) {
                throw ConfigError("Empty section name", at);
            }
            if (config.sections_.count(current) != 0) {
                throw ConfigError("Duplicate section '" + current + "'", at);
            }
            config.sections_[current];
            config.order_.push_back(current);
            in_section = true;
            continue;
        }
        std::size_t sep = line.find_first_of("=:");
        if (sep == std::string::npos) {
            throw ConfigError("Expected key=value", at);
        }
        if (!in_section) {
            throw ConfigError("Key outside of any section", at);
        }
        std::string key = ToLower(Trim(line.substr(0, sep)));
        if (key.empty()) {
            throw ConfigError("Empty key", at);
        }
        auto& section = config.sections_[current];
        if (!section.emplace(key, Trim(line.substr(sep + 1))).second) {
            throw ConfigError("Duplicate key '" + key + "' in section '" + current + "'", at);
        }
    }
    return config;
}

bool IniConfig::HasSection(const std::string& section) const {
    return sections_.count(section) != 0;
}

bool IniConfig::Has(const std::string& section, const std::string& key) const {
    return Find(section, key).has_value();
}

std::vector<std::string> IniConfig::Sections() const {
    return order_;
}

const IniConfig::Section& IniConfig::GetSection(const std::string& section) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) {
        throw ConfigError("No such section", section);
    }
    return it->second;
}

std::optional<std::string> IniConfig::Find(const std::string& section, const std::string& key) const {
    auto sit = sections_.find(section);
    if (sit == sections_.end()) {
        return std::nullopt;
    }
    auto kit = sit->second.find(ToLower(key));
    if (kit == sit->second.end()) {
        return std::nullopt;
    }
    return kit->second;
}

std::string IniConfig::GetString(const std::string& section, const std::string& key, const std::string& fallback) const {
    return Find(section, key).value_or(fallback);
}

std::int64_t IniConfig::GetInt(const std::string& section, const std::string& key, std::int64_t fallback) const {
    auto value = Find(section, key);
    if (!value) {
        return fallback;
    }
    try {
        std::size_t used = 0;
        long long parsed = std::stoll(*value, &used, 10);
        if (used != value->size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::exception& exc) {
        throw ConfigError("Not an integer: " + Where(section, key) + " = '" + *value + "'", exc.what());
    }
}

double IniConfig::GetFloat(const std::string& section, const std::string& key, double fallback) const {
    auto value = Find(section, key);
    if (!value) {
        return fallback;
    }
    try {
        std::size_t used = 0;
        double parsed = std::stod(*value, &used);
        if (used != value->size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception& exc) {
        throw ConfigError("Not a number: " + Where(section, key) + " = '" + *value + "'", exc.what());
    }
}

bool IniConfig::GetBool(const std::string& section, const std::string& key, bool fallback) const {
    auto value = Find(section, key);
    if (!value) {
        return fallback;
    }
    std::string lower = ToLower(*value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    throw ConfigError("Not a boolean: " + Where(section, key) + " = '" + *value + "'");
}

}  // namespace valkyrie::config
