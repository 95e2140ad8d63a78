#pragma once

#include <chrono>

#include <Utils.hpp>

// per-connection settings for a fetch or seed session
struct SessionOptions {
    std::chrono::milliseconds connect_timeout{ 5000 };
    std::chrono::milliseconds read_timeout{ 10000 };
    PeerId peer_id = generate_peer_id();
};
