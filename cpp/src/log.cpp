#include "valkyrie/log.hpp"

#include "valkyrie/cli_colors.hpp"
#include "valkyrie/errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace valkyrie::log {

namespace {

const char* LevelColor(Level level) {
    switch (level) {
        case Level::Debug:
            return cli::color::BRIGHT_BLACK;
        case Level::Info:
            return cli::color::GREEN;
        case Level::Warning:
            return cli::color::YELLOW;
        case Level::Error:
            return cli::color::BOLD_RED;
    }
    return cli::color::RESET;
}

std::string FormatLine(Level level, const std::string& name, const std::string& message) {
    std::string tag = LevelName(level);
    for (char& ch : tag) {
        if (ch >= 'a' && ch <= 'z') {
            ch = static_cast<char>(ch - 'a' + 'A');
        }
    }
    std::ostringstream oss;
    oss << std::left << std::setw(7) << tag << " | " << name << " | " << message;
    return oss.str();
}

}  // namespace

const char* LevelName(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "";
}

std::optional<Level> TryLevelFromName(std::string_view name) {
    for (Level level : {Level::Debug, Level::Info, Level::Warning, Level::Error}) {
        if (name == LevelName(level)) {
            return level;
        }
    }
    return std::nullopt;
}

ConsoleLogger::ConsoleLogger(std::string name,
                             Level level,
                             std::ostream& out,
                             const std::filesystem::path& log_file)
    : Logger(level), name_(std::move(name)), out_(out) {
    if (!log_file.empty()) {
        if (log_file.has_parent_path()) {
            std::filesystem::create_directories(log_file.parent_path());
        }
        file_.open(log_file, std::ios::app);
        if (!file_) {
            throw ConfigError("Failed to open log file", log_file.string());
        }
    }
}

ConsoleLogger::ConsoleLogger(std::string name, Level level)
    : ConsoleLogger(std::move(name), level, std::cerr) {}

void ConsoleLogger::Write(Level level, const std::string& message) {
    std::string line = FormatLine(level, name_, message);
    out_ << cli::Colorize(line, LevelColor(level), out_) << '\n';
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
}

}  // namespace valkyrie::log
