#pragma once

#include <utility>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <span>
#include <cstdint>

using boost::asio::ip::tcp;

// Blocking TCP stream with deadlines. Every operation is an async asio
// operation driven on the calling thread by run_for(), and cancelled when the
// deadline passes. Each stream owns its io_context so that independent
// sessions can run on independent threads.
class PeerStream {
public:
    static PeerStream connect(const tcp::endpoint& endpoint,
                              std::chrono::milliseconds connect_timeout,
                              std::chrono::milliseconds read_timeout);

    // blocks until the acceptor hands over a connection
    static PeerStream accept(tcp::acceptor& acceptor, std::chrono::milliseconds read_timeout);

    // takes over a socket accepted elsewhere
    static PeerStream adopt(tcp::socket socket, std::chrono::milliseconds read_timeout);

    PeerStream(PeerStream&&) = default;
    PeerStream& operator=(PeerStream&&) = delete;
    ~PeerStream();

    // Throws TimeoutError if nothing arrived before the deadline, TransportError
    // for everything else (a deadline hit mid-read included, the stream is
    // closed then since it can't be resynchronised).
    void read_exact(std::span<uint8_t> buffer);
    void write_all(std::span<const uint8_t> buffer);

    void set_read_timeout(std::chrono::milliseconds timeout) { read_timeout_ = timeout; }
    std::chrono::milliseconds read_timeout() const { return read_timeout_; }

    // Safe to call from another thread: the pending (or next) read or write
    // fails with a TransportError. The stream must not be moved afterwards.
    void interrupt();

    void close();
    bool is_open() const { return socket_.is_open(); }

    tcp::endpoint remote_endpoint() const;

private:
    explicit PeerStream(std::chrono::milliseconds read_timeout);

    void run(std::chrono::milliseconds timeout);

    std::unique_ptr<boost::asio::io_context> io_;
    tcp::socket socket_;
    std::chrono::milliseconds read_timeout_;
};
