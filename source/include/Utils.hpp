#pragma once

#include <fstream>
#include <string>
#include <string_view>
#include <sstream>
#include <array>
#include <vector>
#include <span>
#include <optional>
#include <cstdint>
#include <iomanip>

using PeerId = std::array<uint8_t, 20>;

std::string read_from_file(const std::string&);
void write_to_file(const std::string& path, std::string_view data);

// "-MS0001-" followed by 12 random digits
PeerId generate_peer_id();

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);
std::string percent_decode(std::string_view in);

inline std::string to_hex(std::span<const uint8_t> bytes) {
    std::ostringstream oss;
    for (const auto& ch: bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(ch);
    }
    return oss.str();
}

inline std::string_view as_string_view(std::span<const uint8_t> bytes) {
    return { reinterpret_cast<const char*>(bytes.data()), bytes.size() };
}

inline std::span<const uint8_t> as_bytes(std::string_view s) {
    return { reinterpret_cast<const uint8_t*>(s.data()), s.size() };
}
