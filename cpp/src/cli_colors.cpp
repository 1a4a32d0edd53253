#include "valkyrie/cli_colors.hpp"

#include <cstdio>

#include <unistd.h>

namespace valkyrie::cli {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_checked = false;
}

bool ColorsEnabled(std::ostream& os) {
    if (!g_colors_checked) {
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr || &os == &std::clog) {
            is_tty = isatty(fileno(stderr)) != 0;
        }
        g_colors_enabled = is_tty;
        g_colors_checked = true;
    }
    return g_colors_enabled;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_checked = true;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace valkyrie::cli
