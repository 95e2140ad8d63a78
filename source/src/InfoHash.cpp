#include <InfoHash.hpp>
#include <Utils.hpp>

#include <openssl/sha.h>

#include <algorithm>
#include <ostream>

InfoHash InfoHash::from_bencoded_info_dict(std::string_view info_dict) {
    std::array<uint8_t, size> digest{};
    SHA1(reinterpret_cast<const unsigned char*>(info_dict.data()), info_dict.size(), digest.data());
    return InfoHash(digest);
}

std::optional<InfoHash> InfoHash::parse(std::string_view text) {
    std::array<uint8_t, size> bytes{};

    if (text.size() == size * 2) {
        auto decoded = from_hex(text);
        if (!decoded) return std::nullopt;
        std::copy(decoded->begin(), decoded->end(), bytes.begin());
        return InfoHash(bytes);
    }

    if (text.size() == 32) {
        // RFC 4648 base32, 5 bits per character, 160 bits total
        uint64_t buffer = 0;
        int bits = 0;
        size_t out = 0;
        for (char c : text) {
            int v;
            if (c >= 'A' && c <= 'Z') v = c - 'A';
            else if (c >= 'a' && c <= 'z') v = c - 'a';
            else if (c >= '2' && c <= '7') v = c - '2' + 26;
            else return std::nullopt;

            buffer = (buffer << 5) | static_cast<uint64_t>(v);
            bits += 5;
            if (bits >= 8) {
                bits -= 8;
                bytes[out++] = static_cast<uint8_t>((buffer >> bits) & 0xFF);
            }
        }
        return InfoHash(bytes);
    }

    return std::nullopt;
}

std::string InfoHash::to_hex() const {
    return ::to_hex(bytes_);
}

std::ostream& operator<<(std::ostream& os, const InfoHash& hash) {
    return os << hash.to_hex();
}
