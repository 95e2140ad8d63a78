#include <Config.hpp>

#include <stdexcept>
#include <string_view>

namespace {

int64_t parse_number(std::string_view flag, const std::string& value, int64_t min, int64_t max) {
    int64_t n{};
    try {
        size_t used{};
        n = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(flag) + " expects a number, got: " + value);
    }
    if (n < min || n > max) {
        throw std::invalid_argument(std::string(flag) + " out of range: " + value);
    }
    return n;
}

} // namespace

SessionOptions Config::session_options() const {
    SessionOptions options;
    options.connect_timeout = connect_timeout;
    options.read_timeout = read_timeout;
    return options;
}

Config parse_args(int argc, char* argv[]) {
    Config config;
    if (argc < 2) return config;

    std::string_view command = argv[1];
    if (command == "fetch") config.command = Config::Command::Fetch;
    else if (command == "seed") config.command = Config::Command::Seed;
    else if (command == "infohash") config.command = Config::Command::Infohash;
    else if (command == "help" || command == "-h" || command == "--help") return config;
    else throw std::invalid_argument("Unknown command: " + std::string(command));

    auto next_value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(std::string(flag) + " needs a value");
        return argv[++i];
    };

    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--peer") {
            if (config.command != Config::Command::Fetch) throw std::invalid_argument("--peer only applies to fetch");
            config.peers.push_back(next_value(i, arg));
        }
        else if (arg == "--output" || arg == "-o") {
            if (config.command != Config::Command::Fetch) throw std::invalid_argument("--output only applies to fetch");
            config.output = next_value(i, arg);
        }
        else if (arg == "--port") {
            if (config.command != Config::Command::Seed) throw std::invalid_argument("--port only applies to seed");
            config.port = static_cast<uint16_t>(parse_number(arg, next_value(i, arg), 0, 65535));
        }
        else if (arg == "--connect-timeout") {
            config.connect_timeout = std::chrono::milliseconds(parse_number(arg, next_value(i, arg), 1, INT32_MAX));
        }
        else if (arg == "--timeout") {
            config.read_timeout = std::chrono::milliseconds(parse_number(arg, next_value(i, arg), 1, INT32_MAX));
        }
        else if (arg.starts_with("-")) {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        }
        else if (config.target.empty()) {
            config.target = arg;
        }
        else {
            throw std::invalid_argument("Unexpected argument: " + std::string(arg));
        }
    }

    if (config.target.empty()) {
        throw std::invalid_argument(std::string(command) + " needs a target");
    }
    return config;
}

std::string usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " fetch <magnet-uri | info-hash> [--peer HOST:PORT]... [--output FILE]\n"
           "        [--connect-timeout MS] [--timeout MS] [--verbose]\n"
           "  " + program + " seed <file.torrent> [--port PORT] [--timeout MS] [--verbose]\n"
           "  " + program + " infohash <file.torrent>\n";
}
