#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace valkyrie::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// Auto-detected from the stream on first use unless SetColorsEnabled was called.
bool ColorsEnabled(std::ostream& os = std::cout);

// --no-color
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text) { return Colorize(text, color::RED); }
inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Yellow(const std::string& text) { return Colorize(text, color::YELLOW); }
inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }

inline std::string BoldRed(const std::string& text) { return Colorize(text, color::BOLD_RED); }
inline std::string BoldGreen(const std::string& text) { return Colorize(text, color::BOLD_GREEN); }

}  // namespace valkyrie::cli
