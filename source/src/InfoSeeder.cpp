#include <InfoSeeder.hpp>
#include <Errors.hpp>
#include <Log.hpp>

InfoSeeder::InfoSeeder(PeerStream stream, const Info& info, const SessionOptions& options)
    : info_dict_(info.encode()),
      info_hash_(InfoHash::from_bencoded_info_dict(info_dict_)),
      conn_(std::move(stream), info_hash_, options.peer_id),
      pieces_(metadata_piece_count(info_dict_.size())) {
    if (!conn_.supports_extension_protocol()) {
        throw NegotiationError("Peer does not support the extension protocol");
    }

    auto handshake = conn_.expect_extended_handshake();
    auto id = handshake.ut_metadata_id();
    if (!id) {
        throw NegotiationError("Peer does not support ut_metadata");
    }
    ut_metadata_message_id_ = *id;

    SEED_LOG("peer ", conn_.remote_endpoint(), " wants metadata for ", info_hash_,
             ", ", pieces_, " pieces, ut_metadata id ", static_cast<int>(ut_metadata_message_id_));
}

void InfoSeeder::send_extended_handshake() {
    conn_.send_extension_handshake(ExtendedHandshake::ours(info_dict_.size()));
}

void InfoSeeder::seed() {
    send_extended_handshake();

    // Respond to any serviceable ut_metadata request. One broken message
    // must not end the session.
    while (true) {
        try {
            auto message = conn_.recv();
            handle_message(message);
        } catch (const TimeoutError&) {
            continue;
        } catch (const MetadataError& e) {
            SEED_LOG("ignoring message from ", conn_.remote_endpoint(), ": ", e.what());
        }
    }
}

void InfoSeeder::on_request(const UtMetadata& header) {
    // out of range requests are dropped without a reject
    if (header.piece < 0 || static_cast<uint64_t>(header.piece) >= pieces_) {
        SEED_LOG("ignoring request for piece ", header.piece, " of ", pieces_);
        return;
    }
    send_ut_metadata_data(static_cast<size_t>(header.piece));
}

void InfoSeeder::send_ut_metadata_data(size_t piece) {
    const auto [begin, end] = metadata_piece_range(info_dict_.size(), piece);
    auto bytes = as_bytes(info_dict_).subspan(begin, end - begin);

    SEED_LOG("sending piece ", piece, " (", bytes.size(), " bytes)");
    conn_.send(Message::new_extended_with_trailer(
        ut_metadata_message_id_,
        UtMetadata::data(piece, info_dict_.size()).to_bencode(),
        bytes));
}

void InfoSeeder::on_data(const UtMetadata&, std::span<const uint8_t>) {
    // a pure seeder never takes metadata in
}

void InfoSeeder::on_handshake(std::span<const uint8_t>) {
}
