#pragma once

#include <cstdint>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

class Peer {
public:
    Peer(const boost::asio::ip::address& address, uint16_t port) : endpoint_(address, port) {}

    // "1.2.3.4:6881", "[::1]:6881" or "host.name:6881"; throws std::invalid_argument
    static Peer parse(const std::string& host_port);

    const boost::asio::ip::tcp::endpoint& endpoint() const { return endpoint_; }

    std::string ip() const { return endpoint_.address().to_string(); }
    auto addr() const { return endpoint_.address(); }
    uint16_t port() const { return endpoint_.port(); }

    std::string to_string() const;

    bool operator==(const Peer& other) const {
        return this->ip() == other.ip() && this->port() == other.port();
    }

private:
    boost::asio::ip::tcp::endpoint endpoint_;
};
