#include <SeedServer.hpp>
#include <Errors.hpp>
#include <Log.hpp>

#include <algorithm>
#include <csignal>
#include <sstream>

// One accepted connection and the thread seeding to it.
class SeedServer::SeedWorker {
public:
    SeedWorker(tcp::socket socket, const Info& info, const SessionOptions& options)
        : socket_(std::move(socket)), info_(info), options_(options) {}

    ~SeedWorker() { join(); }

    void start() { thread_ = std::thread(&SeedWorker::serve, this); }

    // ends a running session by shutting its socket down
    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        if (seeder_) seeder_->interrupt();
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    bool finished() const { return finished_.load(); }

private:
    void serve() {
        std::string peer;
        try {
            auto stream = PeerStream::adopt(std::move(socket_), options_.read_timeout);
            std::ostringstream name;
            name << stream.remote_endpoint();
            peer = name.str();

            auto seeder = std::make_unique<InfoSeeder>(std::move(stream), info_, options_);
            InfoSeeder* running = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!stopping_) {
                    seeder_ = std::move(seeder);
                    running = seeder_.get();
                }
            }
            if (running) running->seed();
        } catch (const TransportError& e) {
            SERVER_LOG("session with ", peer, " ended: ", e.what());
        } catch (const MetadataError& e) {
            SERVER_WARN("could not seed to ", peer, ": ", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            seeder_.reset();
        }
        finished_.store(true);
    }

    tcp::socket socket_;
    const Info& info_;
    SessionOptions options_;

    std::thread thread_;
    std::mutex mutex_;
    std::unique_ptr<InfoSeeder> seeder_;
    bool stopping_{ false };
    std::atomic<bool> finished_{ false };
};

SeedServer::SeedServer(Info info, uint16_t port, SessionOptions options)
    : info_(std::move(info)),
      info_hash_(info_.info_hash()),
      options_(options),
      io_(),
      acceptor_(io_, tcp::endpoint(tcp::v4(), port)) {}

// read from the signal handler
static_assert(std::atomic<SeedServer*>::is_always_lock_free);
std::atomic<SeedServer*> SeedServer::instance_{ nullptr };

SeedServer::~SeedServer() {
    SeedServer* self = this;
    instance_.compare_exchange_strong(self, nullptr);
    shutdown();
}

void SeedServer::handle_signals() {
    instance_.store(this);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void SeedServer::signal_handler(int) {
    if (auto* server = instance_.load()) server->stop();
}

void SeedServer::run() {
    SERVER_LOG("seeding ", info_hash_, " on port ", port());
    start_accept();

    // event loop
    while (!stop_signal_.load()) io_.run_one_for(std::chrono::milliseconds(200));

    shutdown();
}

size_t SeedServer::active_sessions() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return std::count_if(workers_.begin(), workers_.end(),
        [](const auto& worker) { return !worker->finished(); });
}

void SeedServer::start_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (!ec) handle_incoming_connection(std::move(socket));
            else SERVER_WARN("accept failed: ", ec.message());
            start_accept();
        });
}

void SeedServer::handle_incoming_connection(tcp::socket socket) {
    reap_finished();

    auto worker = std::make_shared<SeedWorker>(std::move(socket), info_, options_);
    worker->start();

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(std::move(worker));
}

// kick finished sessions off the pool
void SeedServer::reap_finished() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.erase(
        std::remove_if(workers_.begin(), workers_.end(), [](const auto& worker) {
            return worker->finished();
        }),
        workers_.end()
    );
}

void SeedServer::shutdown() {
    boost::system::error_code ec;
    if (acceptor_.is_open()) acceptor_.close(ec);

    std::vector<std::shared_ptr<SeedWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) worker->stop();
    for (auto& worker : workers) worker->join();
}
