#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace valkyrie::config {

// INI reader: [section] headers, key=value or key: value pairs, ';' and '#'
// comment lines. Keys are case-insensitive, section names are not.
// Malformed input and failed conversions raise ConfigError.
class IniConfig {
public:
    using Section = std::map<std::string, std::string>;

    IniConfig() = default;

    static IniConfig Load(const std::filesystem::path& path);
    static IniConfig Parse(const std::string& text, const std::string& origin = "<string>");

    bool HasSection(const std::string& section) const;
    bool Has(const std::string& section, const std::string& key) const;
    std::vector<std::string> Sections() const;
    const Section& GetSection(const std::string& section) const;

    std::optional<std::string> Find(const std::string& section, const std::string& key) const;
    std::string GetString(const std::string& section, const std::string& key, const std::string& fallback = {}) const;
    std::int64_t GetInt(const std::string& section, const std::string& key, std::int64_t fallback = 0) const;
    double GetFloat(const std::string& section, const std::string& key, double fallback = 0.0) const;
    // true/yes/on/1 and false/no/off/0, any case.
    bool GetBool(const std::string& section, const std::string& key, bool fallback = false) const;

private:
    std::map<std::string, Section> sections_;
    std::vector<std::string> order_;
};

}  // namespace valkyrie::config
