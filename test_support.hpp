#pragma once

#include <utility>

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <string>

#include <Connection.hpp>
#include <Errors.hpp>
#include <ExtensionDispatcher.hpp>
#include <Info.hpp>
#include <PeerStream.hpp>
#include <SessionOptions.hpp>

using namespace std::chrono_literals;

// short deadlines so a broken exchange fails the test instead of hanging it
inline SessionOptions test_options() {
    SessionOptions options;
    options.connect_timeout = 2000ms;
    options.read_timeout = 2000ms;
    return options;
}

// Listens on an ephemeral loopback port. The serving side of a test runs on
// another thread through spawn().
class LoopbackListener {
public:
    LoopbackListener()
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {}

    tcp::endpoint endpoint() const { return acceptor_.local_endpoint(); }

    PeerStream connect() {
        auto options = test_options();
        return PeerStream::connect(endpoint(), options.connect_timeout, options.read_timeout);
    }

    // runs fn on the next accepted stream, in the background
    template <typename Fn>
    auto spawn(Fn fn) {
        return std::async(std::launch::async, [this, fn = std::move(fn)]() mutable {
            return fn(PeerStream::accept(acceptor_, test_options().read_timeout));
        });
    }

private:
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
};

// Reads until the other end closes, so nothing we wrote gets lost to a reset.
inline void drain(Connection& conn) {
    try {
        while (true) conn.recv();
    } catch (const TransportError&) {
    }
}

// A peer driven by callbacks, for playing the other side of an exchange by hand.
class ScriptedPeer : public ExtensionDispatcher {
public:
    std::function<void(std::span<const uint8_t>)> handshake_hook;
    std::function<void(const UtMetadata&, std::span<const uint8_t>)> data_hook;
    std::function<void(const UtMetadata&)> request_hook;

protected:
    void on_handshake(std::span<const uint8_t> payload) override {
        if (handshake_hook) handshake_hook(payload);
    }
    void on_data(const UtMetadata& header, std::span<const uint8_t> payload) override {
        if (data_hook) data_hook(header, payload);
    }
    void on_request(const UtMetadata& header) override {
        if (request_hook) request_hook(header);
    }
};

// info whose canonical encoding fits in one metadata piece
inline Info small_info() {
    Info info;
    info.name = "foo";
    info.piece_length = 9001;
    info.length = 1;
    info.private_flag = 1;
    return info;
}

// info whose canonical encoding needs two metadata pieces
inline Info two_piece_info() {
    Info info;
    info.name = std::string(16384, 'a');
    info.piece_length = 9001;
    info.length = 1;
    info.private_flag = 1;
    return info;
}

// serves exactly one metadata piece of `dict` in answer to `header`
inline void send_piece(Connection& conn, uint8_t peer_id, const std::string& dict, size_t piece) {
    const auto [begin, end] = metadata_piece_range(dict.size(), piece);
    conn.send(Message::new_extended_with_trailer(
        peer_id, UtMetadata::data(piece, dict.size()).to_bencode(),
        as_bytes(dict).subspan(begin, end - begin)));
}
