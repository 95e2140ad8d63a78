#include <Peer.hpp>

#include <boost/asio/io_context.hpp>

#include <stdexcept>

Peer Peer::parse(const std::string& host_port) {
    auto colon = host_port.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == host_port.size()) {
        throw std::invalid_argument("Expected HOST:PORT, got: " + host_port);
    }

    std::string host = host_port.substr(0, colon);
    std::string port_str = host_port.substr(colon + 1);

    // bracketed IPv6
    if (host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);

    unsigned long port{};
    try {
        size_t used{};
        port = std::stoul(port_str, &used);
        if (used != port_str.size()) throw std::invalid_argument(port_str);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Bad port in: " + host_port);
    }
    if (port == 0 || port > 65535) throw std::invalid_argument("Bad port in: " + host_port);

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (!ec) return Peer(address, static_cast<uint16_t>(port));

    // not a literal address, resolve it
    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(host, port_str, ec);
    if (ec || results.empty()) {
        throw std::invalid_argument("Could not resolve " + host + ": " + ec.message());
    }
    return Peer(results.begin()->endpoint().address(), static_cast<uint16_t>(port));
}

std::string Peer::to_string() const {
    if (endpoint_.address().is_v6()) return "[" + ip() + "]:" + std::to_string(port());
    return ip() + ":" + std::to_string(port());
}
