#pragma once

#include <utility>

#include <boost/asio.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <Info.hpp>
#include <InfoSeeder.hpp>
#include <SessionOptions.hpp>

using boost::asio::ip::tcp;

// Accepts peers on a port and serves the metadata of one torrent, one thread
// per connection.
class SeedServer {
public:
    SeedServer(Info info, uint16_t port, SessionOptions options = {});
    ~SeedServer();

    // blocks until stop() is called
    void run();

    // only flips a flag, so it is fine to call from a signal handler
    void stop() { stop_signal_.store(true); }

    // SIGINT and SIGTERM stop this server until it is destroyed
    void handle_signals();

    uint16_t port() const { return acceptor_.local_endpoint().port(); }
    const InfoHash& info_hash() const { return info_hash_; }

    size_t active_sessions();

private:
    class SeedWorker;

    void start_accept();
    void handle_incoming_connection(tcp::socket socket);
    void reap_finished();
    void shutdown();

    static void signal_handler(int);
    static std::atomic<SeedServer*> instance_;

    Info info_;
    InfoHash info_hash_;
    SessionOptions options_;

    boost::asio::io_context io_;
    tcp::acceptor acceptor_;

    std::mutex workers_mutex_;
    std::vector<std::shared_ptr<SeedWorker>> workers_;

    std::atomic<bool> stop_signal_{ false };
};
