#include <iostream>

#include <Config.hpp>
#include <Errors.hpp>
#include <InfoFetcher.hpp>
#include <Log.hpp>
#include <MagnetLink.hpp>
#include <Metainfo.hpp>
#include <Peer.hpp>
#include <SeedServer.hpp>
#include <Utils.hpp>

namespace {

MagnetLink resolve_target(const std::string& target) {
    if (target.rfind("magnet:", 0) == 0) return MagnetLink::parse(target);

    auto hash = InfoHash::parse(target);
    if (!hash) throw std::invalid_argument("Not a magnet link or info hash: " + target);

    MagnetLink link;
    link.info_hash = *hash;
    return link;
}

std::string default_output(const Info& info) {
    std::string name = info.name;
    for (auto& ch : name) {
        if (ch == '/' || ch == '\\') ch = '_';
    }
    if (name.empty() || name == "." || name == "..") name = "metadata";
    return name + ".torrent";
}

int fetch(const Config& config) {
    auto link = resolve_target(config.target);

    std::vector<std::string> candidates = link.peers;
    candidates.insert(candidates.end(), config.peers.begin(), config.peers.end());
    if (candidates.empty()) {
        throw std::invalid_argument("No peers to ask, pass --peer HOST:PORT or x.pe in the magnet link");
    }

    auto options = config.session_options();

    for (const auto& candidate : candidates) {
        try {
            auto peer = Peer::parse(candidate);
            APP_LOG("asking ", peer.to_string(), " for ", link.info_hash);

            auto info = InfoFetcher(peer.endpoint(), link.info_hash, options).run();

            auto path = config.output.value_or(default_output(info));
            write_to_file(path, make_torrent(info, link.trackers));

            std::cout << "Fetched metadata for " << link.info_hash << " (" << info.name << ", "
                      << info.total_size() << " bytes) from " << peer.to_string() << "\n";
            std::cout << "Written to " << path << "\n";
            return 0;
        } catch (const MetadataError& e) {
            APP_WARN(candidate, ": ", e.what());
        } catch (const TransportError& e) {
            APP_WARN(candidate, ": ", e.what());
        } catch (const std::invalid_argument& e) {
            APP_WARN(candidate, ": ", e.what());
        }
    }

    std::cerr << "No peer could provide the metadata for " << link.info_hash << "\n";
    return 1;
}

int seed(const Config& config) {
    auto metainfo = parse_torrent(read_from_file(config.target));

    if (metainfo.info.info_hash() != metainfo.info_hash) {
        APP_WARN("info dictionary of ", config.target, " is not canonically encoded, peers will see ",
                 metainfo.info.info_hash(), " instead of ", metainfo.info_hash);
    }

    SeedServer server(metainfo.info, config.port, config.session_options());

    server.handle_signals();

    std::cout << "Seeding metadata for " << server.info_hash() << " on port " << server.port()
              << " (Ctrl-C to stop)\n";
    server.run();

    std::cout << "\nShutting down...\n";
    return 0;
}

int infohash(const Config& config) {
    auto metainfo = parse_torrent(read_from_file(config.target));
    std::cout << metainfo.info_hash << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }

    logging::verbose.store(config.verbose);

    try {
        switch (config.command) {
        case Config::Command::Fetch: return fetch(config);
        case Config::Command::Seed: return seed(config);
        case Config::Command::Infohash: return infohash(config);
        case Config::Command::Help:
            std::cout << usage(argv[0]);
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
