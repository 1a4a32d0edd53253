#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace valkyrie::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::uint32_t GetUint(std::string_view name, std::uint32_t fallback);

}  // namespace valkyrie::env
