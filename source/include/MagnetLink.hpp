#pragma once

#include <string>
#include <vector>
#include <optional>

#include <InfoHash.hpp>

// magnet:?xt=urn:btih:<hash>&dn=<name>&tr=<tracker>&x.pe=<host:port>
struct MagnetLink {
    InfoHash info_hash;
    std::optional<std::string> name;
    std::vector<std::string> trackers;
    std::vector<std::string> peers;

    // throws std::invalid_argument
    static MagnetLink parse(const std::string& uri);
};
