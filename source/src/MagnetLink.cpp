#include <MagnetLink.hpp>
#include <Utils.hpp>

#include <stdexcept>

MagnetLink MagnetLink::parse(const std::string& uri) {
    const std::string scheme = "magnet:?";
    if (uri.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("Not a magnet link: " + uri);
    }

    MagnetLink link;
    bool have_hash = false;

    std::string_view rest(uri);
    rest.remove_prefix(scheme.size());

    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto param = rest.substr(0, amp);
        rest = (amp == std::string_view::npos) ? std::string_view{} : rest.substr(amp + 1);

        auto eq = param.find('=');
        if (eq == std::string_view::npos) continue;

        auto key = param.substr(0, eq);
        auto value = percent_decode(param.substr(eq + 1));

        if (key == "xt") {
            const std::string urn = "urn:btih:";
            if (value.rfind(urn, 0) != 0) continue;         // some other hash scheme

            auto hash = InfoHash::parse(std::string_view(value).substr(urn.size()));
            if (!hash) throw std::invalid_argument("Malformed info hash in magnet link: " + value);
            link.info_hash = *hash;
            have_hash = true;
        }
        else if (key == "dn") link.name = value;
        else if (key == "tr") link.trackers.push_back(value);
        else if (key == "x.pe") link.peers.push_back(value);
    }

    if (!have_hash) {
        throw std::invalid_argument("Magnet link has no urn:btih topic: " + uri);
    }
    return link;
}
