#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace valkyrie::hex {

std::string Encode(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> Decode(const std::string& input, bool* ok = nullptr);
bool IsHex(const std::string& input);

}  // namespace valkyrie::hex
