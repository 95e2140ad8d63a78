#pragma once

#include <array>
#include <cstdint>

#include <PeerStream.hpp>
#include <InfoHash.hpp>
#include <Message.hpp>
#include <Utils.hpp>

// A peer wire connection bound to one info hash. Construction exchanges the
// BitTorrent handshake; afterwards messages are sent and received one at a
// time, each call blocking until done or until the stream's deadline.
class Connection {
public:
    static constexpr uint32_t max_message_length = 1024 * 1024 + 1;

    // Fails with TransportError on a bad handshake header or an info hash mismatch.
    Connection(PeerStream stream,
               const InfoHash& info_hash,
               const PeerId& peer_id,
               bool advertise_extensions = true);

    // the peer set the BEP 10 bit in its handshake
    bool supports_extension_protocol() const { return supports_extensions_; }

    const PeerId& remote_peer_id() const { return remote_peer_id_; }
    const InfoHash& info_hash() const { return info_hash_; }

    void send(const Message& message);

    // next non keep-alive message
    Message recv();

    void send_extension_handshake(const ExtendedHandshake& handshake);

    // Reads until the peer's extended handshake shows up, skipping anything
    // else it sends first (bitfield, have, ...).
    ExtendedHandshake expect_extended_handshake();

    void set_read_timeout(std::chrono::milliseconds timeout) { stream_.set_read_timeout(timeout); }
    void interrupt() { stream_.interrupt(); }
    tcp::endpoint remote_endpoint() const { return stream_.remote_endpoint(); }

private:
    void do_handshake(bool advertise_extensions);

    PeerStream stream_;
    InfoHash info_hash_;
    PeerId peer_id_;
    PeerId remote_peer_id_{};
    bool supports_extensions_{ false };

    std::array<uint8_t, 68> handshake_buf_; // 68 byte handshake
};
