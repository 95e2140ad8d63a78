#include <PeerStream.hpp>
#include <Errors.hpp>
#include <Log.hpp>

PeerStream::PeerStream(std::chrono::milliseconds read_timeout)
    : io_(std::make_unique<boost::asio::io_context>()),
      socket_(*io_),
      read_timeout_(read_timeout) {}

PeerStream::~PeerStream() {
    close();
}

PeerStream PeerStream::connect(const tcp::endpoint& endpoint,
                               std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds read_timeout) {
    PeerStream stream(read_timeout);

    boost::system::error_code ec = boost::asio::error::would_block;
    stream.socket_.async_connect(endpoint,
        [&ec](const boost::system::error_code& result) { ec = result; });
    stream.run(connect_timeout);

    if (ec == boost::asio::error::operation_aborted)
        throw TransportError("Connection to " + endpoint.address().to_string() + " timed out");
    if (ec)
        throw TransportError("Could not connect to " + endpoint.address().to_string() + ": " + ec.message());

    CONN_LOG("connected to ", endpoint);
    return stream;
}

PeerStream PeerStream::accept(tcp::acceptor& acceptor, std::chrono::milliseconds read_timeout) {
    PeerStream stream(read_timeout);

    boost::system::error_code ec;
    acceptor.accept(stream.socket_, ec);
    if (ec) throw TransportError("Accept failed: " + ec.message());

    return stream;
}

PeerStream PeerStream::adopt(tcp::socket socket, std::chrono::milliseconds read_timeout) {
    PeerStream stream(read_timeout);

    boost::system::error_code ec;
    auto protocol = socket.local_endpoint(ec).protocol();
    if (ec) throw TransportError("Cannot adopt socket: " + ec.message());

    // move the descriptor over to the stream's own io_context
    auto handle = socket.release(ec);
    if (ec) throw TransportError("Cannot adopt socket: " + ec.message());
    stream.socket_.assign(protocol, handle, ec);
    if (ec) throw TransportError("Cannot adopt socket: " + ec.message());

    return stream;
}

void PeerStream::run(std::chrono::milliseconds timeout) {
    io_->restart();
    io_->run_for(timeout);

    // deadline passed: cancel and let the handler see operation_aborted
    if (!io_->stopped()) {
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        io_->run();
    }
}

void PeerStream::read_exact(std::span<uint8_t> buffer) {
    if (buffer.empty()) return;
    if (!socket_.is_open()) throw TransportError("Read on a closed connection");

    boost::system::error_code ec = boost::asio::error::would_block;
    std::size_t transferred = 0;

    boost::asio::async_read(socket_, boost::asio::buffer(buffer.data(), buffer.size()),
        [&](const boost::system::error_code& result, std::size_t bytes) {
            ec = result;
            transferred = bytes;
        });
    run(read_timeout_);

    if (ec == boost::asio::error::operation_aborted) {
        if (transferred == 0) throw TimeoutError("Read timed out");
        close();
        throw TransportError("Read timed out in the middle of a message");
    }
    if (ec == boost::asio::error::eof) {
        close();
        throw TransportError("Connection closed by peer");
    }
    if (ec) {
        close();
        throw TransportError("Read failed: " + ec.message());
    }
}

void PeerStream::write_all(std::span<const uint8_t> buffer) {
    if (!socket_.is_open()) throw TransportError("Write on a closed connection");

    boost::system::error_code ec = boost::asio::error::would_block;

    boost::asio::async_write(socket_, boost::asio::buffer(buffer.data(), buffer.size()),
        [&ec](const boost::system::error_code& result, std::size_t) { ec = result; });
    run(read_timeout_);

    if (ec) {
        close();
        if (ec == boost::asio::error::operation_aborted) throw TransportError("Write timed out");
        throw TransportError("Write failed: " + ec.message());
    }
}

// The shutdown runs on the thread driving the stream, inside its next run(),
// so it never races a close() there.
void PeerStream::interrupt() {
    boost::asio::post(*io_, [this] {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
    });
}

void PeerStream::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) socket_.close(ec);
}

tcp::endpoint PeerStream::remote_endpoint() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? tcp::endpoint{} : endpoint;
}
