#pragma once

#include <span>
#include <string>

#include <Connection.hpp>
#include <ExtensionDispatcher.hpp>
#include <Info.hpp>
#include <SessionOptions.hpp>

// Serves an info dictionary we already have to one peer over ut_metadata.
class InfoSeeder : private ExtensionDispatcher {
public:
    // Handshakes on an accepted stream and reads the peer's extended handshake.
    // NegotiationError if the peer can't take metadata from us.
    InfoSeeder(PeerStream stream, const Info& info, const SessionOptions& options = {});

    // Announces the metadata size, then answers requests until the connection
    // goes away. Timeouts and bad messages are logged and skipped; only a dead
    // connection ends the loop, with a TransportError.
    void seed();

    void send_extended_handshake();

    size_t pieces() const { return pieces_; }
    size_t metadata_size() const { return info_dict_.size(); }
    const InfoHash& info_hash() const { return info_hash_; }

    // from another thread, to tear the session down
    void interrupt() { conn_.interrupt(); }

private:
    void on_handshake(std::span<const uint8_t> payload) override;
    void on_data(const UtMetadata& header, std::span<const uint8_t> payload) override;
    void on_request(const UtMetadata& header) override;

    void send_ut_metadata_data(size_t piece);

    std::string info_dict_;
    InfoHash info_hash_;
    Connection conn_;
    uint8_t ut_metadata_message_id_{};
    size_t pieces_{};
};
