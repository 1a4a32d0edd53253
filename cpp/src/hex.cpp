#include "valkyrie/hex.hpp"

#include <array>

namespace valkyrie::hex {

namespace {

constexpr char kEncTable[] = "0123456789abcdef";

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 16; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    for (std::size_t i = 10; i < 16; ++i) {
        table[static_cast<std::uint8_t>('A' + (i - 10))] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kEncTable[byte >> 4]);
        out.push_back(kEncTable[byte & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> Decode(const std::string& input, bool* ok) {
    bool success = input.size() % 2 == 0;
    std::vector<std::uint8_t> out;
    if (success) {
        out.reserve(input.size() / 2);
        for (std::size_t i = 0; i < input.size(); i += 2) {
            std::uint8_t hi = kDecTable[static_cast<unsigned char>(input[i])];
            std::uint8_t lo = kDecTable[static_cast<unsigned char>(input[i + 1])];
            if (hi == 0xFF || lo == 0xFF) {
                success = false;
                break;
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

bool IsHex(const std::string& input) {
    if (input.size() % 2 != 0) {
        return false;
    }
    for (unsigned char c : input) {
        if (kDecTable[c] == 0xFF) {
            return false;
        }
    }
    return true;
}

}  // namespace valkyrie::hex
