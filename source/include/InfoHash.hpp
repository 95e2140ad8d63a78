#pragma once

#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include <iosfwd>

// SHA1 of the bencoded info dictionary. Used both to key a peer connection and
// to verify metadata received from a peer.
class InfoHash {
public:
    static constexpr size_t size = 20;

    InfoHash() = default;
    explicit InfoHash(const std::array<uint8_t, size>& bytes) : bytes_(bytes) {}

    static InfoHash from_bencoded_info_dict(std::string_view info_dict);

    // 40 hex digits or 32 base32 characters, as found in magnet links
    static std::optional<InfoHash> parse(std::string_view text);

    const std::array<uint8_t, size>& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }

    std::string to_hex() const;

    bool operator==(const InfoHash&) const = default;

private:
    std::array<uint8_t, size> bytes_{};
};

std::ostream& operator<<(std::ostream& os, const InfoHash& hash);
