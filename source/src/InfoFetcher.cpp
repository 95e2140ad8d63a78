#include <InfoFetcher.hpp>
#include <Errors.hpp>
#include <Log.hpp>

InfoFetcher::InfoFetcher(const tcp::endpoint& address, const InfoHash& info_hash, const SessionOptions& options)
    : InfoFetcher(PeerStream::connect(address, options.connect_timeout, options.read_timeout), info_hash, options) {}

InfoFetcher::InfoFetcher(PeerStream stream, const InfoHash& info_hash, const SessionOptions& options)
    : info_hash_(info_hash),
      conn_(std::move(stream), info_hash, options.peer_id) {
    if (!conn_.supports_extension_protocol()) {
        throw NegotiationError("Peer does not support the extension protocol");
    }

    // we know nothing about the metadata yet, so no size in ours
    conn_.send_extension_handshake(ExtendedHandshake::ours());
    negotiate(conn_.expect_extended_handshake());

    FETCH_LOG("peer ", conn_.remote_endpoint(), " has ", metadata_size_, " bytes of metadata for ", info_hash_,
              ", ut_metadata id ", static_cast<int>(ut_metadata_message_id_));
}

Info InfoFetcher::run() {
    conn_.send_extension_handshake(ExtendedHandshake::ours());
    request_piece(0);

    while (true) {
        auto message = conn_.recv();
        handle_message(message);
        if (info_) {
            Info info = std::move(*info_);
            info_.reset();
            return info;
        }
    }
}

void InfoFetcher::negotiate(const ExtendedHandshake& handshake) {
    if (!handshake.metadata_size) {
        throw NegotiationError("Peer did not announce a metadata size");
    }
    auto id = handshake.ut_metadata_id();
    if (!id) {
        throw NegotiationError("Peer does not support ut_metadata");
    }

    metadata_size_ = static_cast<size_t>(*handshake.metadata_size);
    ut_metadata_message_id_ = *id;
    info_dict_.clear();
}

void InfoFetcher::request_piece(size_t piece) {
    FETCH_LOG("requesting piece ", piece, " of ", metadata_piece_count(metadata_size_));
    conn_.send(Message::new_extended(ut_metadata_message_id_, UtMetadata::request(piece).to_bencode()));
}

void InfoFetcher::on_handshake(std::span<const uint8_t> payload) {
    ExtendedHandshake handshake;
    try {
        handshake = ExtendedHandshake::decode(payload);
    } catch (const BencodeError& e) {
        // same outcome as a malformed handshake at connect time
        throw NegotiationError(std::string("Malformed extended handshake: ") + e.what());
    }

    bool had_progress = !info_dict_.empty();
    negotiate(handshake);
    FETCH_LOG("peer renegotiated, metadata size now ", metadata_size_);

    // Whatever was outstanding belonged to the old transfer. With nothing
    // received yet, the request for piece 0 is still the one in flight.
    if (had_progress) request_piece(0);
}

void InfoFetcher::on_data(const UtMetadata& header, std::span<const uint8_t> payload) {
    const size_t piece = info_dict_.size() / UtMetadata::PIECE_LENGTH;
    if (header.piece < 0 || static_cast<uint64_t>(header.piece) != piece) {
        throw ProtocolViolation("Expected metadata piece " + std::to_string(piece) + ", got " + std::to_string(header.piece));
    }

    // The Data payload is a bencoded header followed by the raw piece bytes.
    // Nothing delimits the two, so re-encode the header to find the offset.
    const size_t piece_offset = header.encode().size();
    if (payload.size() < piece_offset) {
        throw ProtocolViolation("Metadata piece " + std::to_string(piece) + " is shorter than its header");
    }
    auto bytes = payload.subspan(piece_offset);
    if (bytes.size() > UtMetadata::PIECE_LENGTH) {
        throw ProtocolViolation("Metadata piece " + std::to_string(piece) + " is " + std::to_string(bytes.size()) + " bytes long");
    }
    info_dict_.insert(info_dict_.end(), bytes.begin(), bytes.end());

    FETCH_LOG("got piece ", piece, ", ", info_dict_.size(), "/", metadata_size_, " bytes");

    if (info_dict_.size() == metadata_size_) {
        verify_info_dict();
    }
    else if (info_dict_.size() < metadata_size_) {
        // only the last piece may be short
        if (bytes.size() != UtMetadata::PIECE_LENGTH) {
            throw ProtocolViolation("Metadata piece " + std::to_string(piece) + " is short but not the last one");
        }
        request_piece(piece + 1);
    }
    else {
        throw ProtocolViolation("Peer sent " + std::to_string(info_dict_.size()) +
                                " bytes of metadata, more than the announced " + std::to_string(metadata_size_));
    }
}

void InfoFetcher::on_request(const UtMetadata&) {
    // we have nothing to serve
}

void InfoFetcher::verify_info_dict() {
    Info info;
    try {
        info = Info::decode(as_string_view(info_dict_));
    } catch (const BencodeError& e) {
        throw IntegrityError(std::string("Metadata is not valid bencode: ") + e.what());
    } catch (const InfoError& e) {
        throw IntegrityError(std::string("Metadata is not an info dictionary: ") + e.what());
    }

    auto hash = info.info_hash();
    if (hash != info_hash_) {
        throw IntegrityError("Metadata hashes to " + hash.to_hex() + ", expected " + info_hash_.to_hex());
    }

    FETCH_LOG("metadata for ", info_hash_, " verified");
    info_.emplace(std::move(info));
}
