#include <Connection.hpp>
#include <Errors.hpp>
#include <Log.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>

Connection::Connection(PeerStream stream,
                       const InfoHash& info_hash,
                       const PeerId& peer_id,
                       bool advertise_extensions)
    : stream_(std::move(stream)),
      info_hash_(info_hash),
      peer_id_(peer_id) {
    do_handshake(advertise_extensions);
}

// Both ends write first and read second. 68 bytes always fit in the socket
// buffers so this can't deadlock.
void Connection::do_handshake(bool advertise_extensions) {
    // Construct handshake message
    handshake_buf_[0] = 19;                                     // pstrlen
    std::memcpy(&handshake_buf_[1], "BitTorrent protocol", 19); // pstr
    std::memset(&handshake_buf_[20], 0, 8);                     // reserved
    if (advertise_extensions) handshake_buf_[25] |= 0x10;       // BEP 10
    std::memcpy(&handshake_buf_[28], info_hash_.data(), 20);    // info_hash
    std::memcpy(&handshake_buf_[48], peer_id_.data(), 20);      // peer_id

    stream_.write_all(handshake_buf_);
    stream_.read_exact(handshake_buf_);

    if (handshake_buf_[0] != 19 || std::memcmp(&handshake_buf_[1], "BitTorrent protocol", 19) != 0) {
        throw TransportError("Bad handshake header from peer");
    }

    // Verify info_hash
    if (std::memcmp(&handshake_buf_[28], info_hash_.data(), 20) != 0) {
        throw TransportError("Peer answered the handshake with a different info hash");
    }

    supports_extensions_ = (handshake_buf_[25] & 0x10) != 0;
    std::memcpy(remote_peer_id_.data(), &handshake_buf_[48], 20);

    CONN_LOG("handshake with ", stream_.remote_endpoint(), " for ", info_hash_,
             supports_extensions_ ? " (extensions)" : "");
}

void Connection::send(const Message& message) {
    stream_.write_all(message.serialize());
}

Message Connection::recv() {
    while (true) {
        std::array<uint8_t, 4> length_buf;
        stream_.read_exact(length_buf);

        uint32_t len;
        std::memcpy(&len, length_buf.data(), 4);
        len = boost::endian::big_to_native(len);

        if (len == 0) {
            // Keep-alive
            continue;
        }

        // the deadline now covers a partially read frame, so from here on any
        // failure leaves the stream unusable
        if (len > max_message_length) {
            stream_.close();
            throw TransportError("Peer sent an oversized message (" + std::to_string(len) + " bytes)");
        }

        std::vector<uint8_t> body(len);
        try {
            stream_.read_exact(body);
        } catch (const TimeoutError&) {
            stream_.close();
            throw TransportError("Read timed out in the middle of a message");
        }

        auto flavour = static_cast<Flavour>(body[0]);
        body.erase(body.begin());
        return Message(flavour, std::move(body));
    }
}

void Connection::send_extension_handshake(const ExtendedHandshake& handshake) {
    send(Message::new_extended_handshake(handshake));
}

ExtendedHandshake Connection::expect_extended_handshake() {
    while (true) {
        auto message = recv();
        if (message.flavour != Flavour::Extended) {
            CONN_LOG("skipping message ", static_cast<int>(message.flavour), " while waiting for extended handshake");
            continue;
        }

        auto [id, payload] = message.parse_extended_payload();
        if (id != static_cast<uint8_t>(ExtensionId::Handshake)) continue;

        try {
            return ExtendedHandshake::decode(payload);
        } catch (const BencodeError& e) {
            throw NegotiationError(std::string("Malformed extended handshake: ") + e.what());
        }
    }
}
