#include <Utils.hpp>

#include <random>
#include <stdexcept>

std::string read_from_file(const std::string& path) {
	std::ifstream file(path, std::ios::binary | std::ios::ate);

	if (!file.is_open()) {
		throw std::runtime_error("Could not open file: " + path);
	}

	std::streamsize size = file.tellg();
	file.seekg(0, std::ios::beg);

	std::string data(size, '\0');
	if (!file.read(data.data(), size)) {
		throw std::runtime_error("Could not read file: " + path);
	}

    return data;
}

void write_to_file(const std::string& path, std::string_view data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + path);
    }

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Could not write file: " + path);
    }
}

PeerId generate_peer_id() {
    static thread_local std::mt19937 rng((std::random_device())());
    std::uniform_int_distribution<int> digit('0', '9');

    PeerId id{};
    const std::string_view prefix = "-MS0001-";
    std::copy(prefix.begin(), prefix.end(), id.begin());
    for (size_t i = prefix.size(); i < id.size(); ++i) id[i] = static_cast<uint8_t>(digit(rng));

    return id;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]), lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        }
        else if (in[i] == '%' && i + 2 < in.size()) {
            auto byte = from_hex(in.substr(i + 1, 2));
            if (!byte) throw std::invalid_argument("Bad percent escape in: " + std::string(in));
            out += static_cast<char>((*byte)[0]);
            i += 2;
        }
        else if (in[i] == '%') {
            throw std::invalid_argument("Truncated percent escape in: " + std::string(in));
        }
        else {
            out += in[i];
        }
    }
    return out;
}
