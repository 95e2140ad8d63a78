#pragma once

#include <optional>
#include <span>
#include <vector>

#include <Connection.hpp>
#include <ExtensionDispatcher.hpp>
#include <Info.hpp>
#include <InfoHash.hpp>
#include <SessionOptions.hpp>

// Downloads the info dictionary for an info hash from a single peer with
// ut_metadata (BEP 9). Pieces are requested one at a time, in order, and the
// result is only handed out once it hashes to the info hash we asked for.
class InfoFetcher : private ExtensionDispatcher {
public:
    // Connects and negotiates. Throws TransportError if the peer can't be
    // reached or serves another torrent, NegotiationError if it can't serve
    // metadata.
    InfoFetcher(const tcp::endpoint& address, const InfoHash& info_hash, const SessionOptions& options = {});
    InfoFetcher(PeerStream stream, const InfoHash& info_hash, const SessionOptions& options = {});

    // Blocks until the metadata is complete and verified. Any error ends the
    // fetch, there is no partial result.
    Info run();

    size_t metadata_size() const { return metadata_size_; }
    uint8_t ut_metadata_message_id() const { return ut_metadata_message_id_; }

private:
    void on_handshake(std::span<const uint8_t> payload) override;
    void on_data(const UtMetadata& header, std::span<const uint8_t> payload) override;
    void on_request(const UtMetadata& header) override;

    // size and id from the peer's handshake; resets the accumulated bytes
    void negotiate(const ExtendedHandshake& handshake);
    void request_piece(size_t piece);
    void verify_info_dict();

    InfoHash info_hash_;
    Connection conn_;
    uint8_t ut_metadata_message_id_{};
    size_t metadata_size_{};
    std::vector<uint8_t> info_dict_;
    std::optional<Info> info_;
};
