#pragma once

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace valkyrie::log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

const char* LevelName(Level level);
std::optional<Level> TryLevelFromName(std::string_view name);

class Logger {
public:
    explicit Logger(Level level = Level::Info) : level_(level) {}
    virtual ~Logger() = default;

    Level level() const { return level_; }
    void set_level(Level level) { level_ = level; }
    bool Enabled(Level level) const { return level >= level_; }

    void Debug(const std::string& message) { Log(Level::Debug, message); }
    void Info(const std::string& message) { Log(Level::Info, message); }
    void Warning(const std::string& message) { Log(Level::Warning, message); }
    void Error(const std::string& message) { Log(Level::Error, message); }

    void Log(Level level, const std::string& message) {
        if (Enabled(level)) {
            Write(level, message);
        }
    }

protected:
    virtual void Write(Level level, const std::string& message) = 0;

private:
    Level level_;
};

class NullLogger final : public Logger {
public:
    NullLogger() : Logger(Level::Error) {}

protected:
    void Write(Level, const std::string&) override {}
};

// "LEVEL   | name | message" lines. Colored when the stream is a terminal;
// mirrored without color to log_file when one is given.
class ConsoleLogger final : public Logger {
public:
    ConsoleLogger(std::string name,
                  Level level,
                  std::ostream& out,
                  const std::filesystem::path& log_file = {});
    ConsoleLogger(std::string name, Level level = Level::Info);

    const std::string& name() const { return name_; }

protected:
    void Write(Level level, const std::string& message) override;

private:
    std::string name_;
    std::ostream& out_;
    std::ofstream file_;
};

}  // namespace valkyrie::log
