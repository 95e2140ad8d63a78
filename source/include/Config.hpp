#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <SessionOptions.hpp>

// command line of the metaswap binary
struct Config {
    enum class Command { Fetch, Seed, Infohash, Help };

    Command command{ Command::Help };

    // magnet link or hex info hash for fetch, .torrent path for seed and infohash
    std::string target;

    std::vector<std::string> peers;           // --peer HOST:PORT, repeatable
    std::optional<std::string> output;        // --output FILE

    uint16_t port{ 31616 };
    std::chrono::milliseconds connect_timeout{ 5000 };
    std::chrono::milliseconds read_timeout{ 10000 };
    bool verbose{ false };

    SessionOptions session_options() const;
};

// throws std::invalid_argument on anything it can't make sense of
Config parse_args(int argc, char* argv[]);

std::string usage(const std::string& program);
