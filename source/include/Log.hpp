#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

namespace logging {

inline std::atomic<bool> verbose{ false };

inline std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

template <typename... Args>
void write(std::string_view tag, const Args&... args) {
    std::ostringstream line;
    line << tag << ' ';
    (line << ... << args);
    line << '\n';

    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << line.str();
}

} // namespace logging

// debug output only shows up with --verbose, warnings always do
#define DO_LOG(tag, ...) do { if (logging::verbose.load(std::memory_order_relaxed)) logging::write(tag, __VA_ARGS__); } while (0)
#define DO_WARN(tag, ...) logging::write(tag, __VA_ARGS__)

#define CONN_LOG(...)   DO_LOG("[Conn]", __VA_ARGS__)
#define FETCH_LOG(...)  DO_LOG("[Fetcher]", __VA_ARGS__)
#define SEED_LOG(...)   DO_LOG("[Seeder]", __VA_ARGS__)
#define SERVER_LOG(...) DO_LOG("[Server]", __VA_ARGS__)
#define APP_LOG(...)    DO_LOG("[App]", __VA_ARGS__)

#define SEED_WARN(...)   DO_WARN("[Seeder]", __VA_ARGS__)
#define SERVER_WARN(...) DO_WARN("[Server]", __VA_ARGS__)
#define APP_WARN(...)    DO_WARN("[App]", __VA_ARGS__)
