#include <Errors.hpp>
#include <ExtensionDispatcher.hpp>
#include <Message.hpp>
#include <Utils.hpp>
#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace {

// remembers every hook call, in order
class RecordingDispatcher : public ExtensionDispatcher {
public:
    std::vector<std::string> calls;
    std::vector<UtMetadata> headers;
    size_t last_payload_size{};

protected:
    void on_handshake(std::span<const uint8_t> payload) override {
        calls.push_back("handshake");
        last_payload_size = payload.size();
    }
    void on_data(const UtMetadata& header, std::span<const uint8_t> payload) override {
        calls.push_back("data");
        headers.push_back(header);
        last_payload_size = payload.size();
    }
    void on_request(const UtMetadata& header) override {
        calls.push_back("request");
        headers.push_back(header);
    }
};

Message raw_extended(uint8_t id, std::string_view body) {
    std::vector<uint8_t> payload{ id };
    payload.insert(payload.end(), body.begin(), body.end());
    return Message(Flavour::Extended, std::move(payload));
}

} // namespace

TEST(Metadata, piece_count) {
    const size_t P = UtMetadata::PIECE_LENGTH;
    ASSERT_EQ(P, 16384);

    ASSERT_EQ(metadata_piece_count(0), 0);
    ASSERT_EQ(metadata_piece_count(1), 1);
    ASSERT_EQ(metadata_piece_count(P - 1), 1);
    ASSERT_EQ(metadata_piece_count(P), 1);
    ASSERT_EQ(metadata_piece_count(P + 1), 2);
    ASSERT_EQ(metadata_piece_count(3 * P), 3);
}

TEST(Metadata, last_piece_length) {
    const size_t P = UtMetadata::PIECE_LENGTH;
    for (size_t length : { size_t{ 1 }, size_t{ 45 }, P - 1, P, P + 1, 2 * P - 1, 2 * P, 5 * P + 7 }) {
        auto count = metadata_piece_count(length);
        auto [begin, end] = metadata_piece_range(length, count - 1);
        auto last = end - begin;

        ASSERT_GT(last, 0) << length;
        ASSERT_LE(last, P) << length;
        ASSERT_EQ(last, length - (count - 1) * P) << length;

        // every earlier piece is full
        for (size_t piece = 0; piece + 1 < count; ++piece) {
            auto [b, e] = metadata_piece_range(length, piece);
            ASSERT_EQ(b, piece * P);
            ASSERT_EQ(e - b, P);
        }
    }
}

TEST(UtMetadata, header_offset) {
    // nothing delimits a Data header from the piece bytes after it, the
    // boundary is the length of the re-encoded header
    auto header = UtMetadata::data(0, 31235);
    auto encoded = header.encode();
    ASSERT_EQ(encoded, "d8:msg_typei1e5:piecei0e10:total_sizei31235ee");
    ASSERT_EQ(encoded.size(), 45);

    std::string payload = encoded + "d4:name3:foo";
    auto decoded = UtMetadata::decode(as_bytes(payload));
    ASSERT_EQ(decoded, header);
    ASSERT_EQ(decoded.encode().size(), 45);
    ASSERT_EQ(payload.substr(decoded.encode().size()), "d4:name3:foo");
}

TEST(UtMetadata, encode) {
    ASSERT_EQ(UtMetadata::request(3).encode(), "d8:msg_typei0e5:piecei3ee");
    ASSERT_EQ(UtMetadata::reject(0).encode(), "d8:msg_typei2e5:piecei0ee");
    ASSERT_EQ(UtMetadata::request(3).type(), UtMetadata::MsgType::Request);
    ASSERT_EQ(UtMetadata::data(1, 2).type(), UtMetadata::MsgType::Data);
}

TEST(UtMetadata, decode_invalid) {
    ASSERT_THROW(UtMetadata::decode(as_bytes("d5:piecei0ee")), BencodeError);
    ASSERT_THROW(UtMetadata::decode(as_bytes("d8:msg_typei0ee")), BencodeError);
    ASSERT_THROW(UtMetadata::decode(as_bytes("li0ee")), BencodeError);
    ASSERT_THROW(UtMetadata::decode(as_bytes("garbage")), BencodeError);
}

TEST(ExtendedHandshake, ours) {
    auto handshake = ExtendedHandshake::ours(31235);
    auto encoded = bencode(handshake.to_bencode());
    ASSERT_EQ(encoded, "d1:md11:ut_metadatai1ee13:metadata_sizei31235e1:v12:metaswap 0.1e");

    auto without_size = bencode(ExtendedHandshake::ours().to_bencode());
    ASSERT_EQ(without_size, "d1:md11:ut_metadatai1ee1:v12:metaswap 0.1e");
}

TEST(ExtendedHandshake, decode) {
    auto handshake = ExtendedHandshake::decode(
        as_bytes("d1:md11:ut_metadatai3e6:ut_pexi1ee13:metadata_sizei31235e1:v4:peere"));
    ASSERT_EQ(handshake.metadata_size, 31235);
    ASSERT_EQ(handshake.ut_metadata_id(), 3);
    ASSERT_EQ(handshake.message_ids.size(), 2);
    ASSERT_EQ(handshake.client, "peer");

    // id 0 switches the extension off
    auto disabled = ExtendedHandshake::decode(as_bytes("d1:md11:ut_metadatai0eee"));
    ASSERT_FALSE(disabled.ut_metadata_id());
    ASSERT_FALSE(disabled.metadata_size);

    auto negative = ExtendedHandshake::decode(as_bytes("d1:mde13:metadata_sizei-5ee"));
    ASSERT_FALSE(negative.metadata_size);
    ASSERT_FALSE(negative.ut_metadata_id());

    ASSERT_THROW(ExtendedHandshake::decode(as_bytes("i1e")), BencodeError);
    ASSERT_THROW(ExtendedHandshake::decode(as_bytes("d1:m")), BencodeError);
}

TEST(Message, serialize) {
    auto message = Message::new_extended(1, UtMetadata::request(0).to_bencode());
    auto bytes = message.serialize();

    const std::string body = "d8:msg_typei0e5:piecei0ee";
    ASSERT_EQ(bytes.size(), 4 + 1 + 1 + body.size());
    ASSERT_EQ(bytes[0], 0);
    ASSERT_EQ(bytes[1], 0);
    ASSERT_EQ(bytes[2], 0);
    ASSERT_EQ(bytes[3], 2 + body.size());
    ASSERT_EQ(bytes[4], 20);
    ASSERT_EQ(bytes[5], 1);
    ASSERT_EQ(as_string_view(bytes).substr(6), body);
}

TEST(Message, extended_payload) {
    std::string trailer = "RAW";
    auto message = Message::new_extended_with_trailer(7, UtMetadata::data(0, 3).to_bencode(), as_bytes(trailer));
    auto [id, payload] = message.parse_extended_payload();
    ASSERT_EQ(id, 7);
    ASSERT_EQ(as_string_view(payload), UtMetadata::data(0, 3).encode() + trailer);

    const Message empty(Flavour::Extended);
    ASSERT_THROW(empty.parse_extended_payload(), ProtocolViolation);

    const Message have(Flavour::Have, { 0, 0, 0, 1 });
    ASSERT_THROW(have.parse_extended_payload(), ProtocolViolation);
}

// the payload span borrows from the message, so only lvalues may hand it out
template <typename M>
concept ExtendedPayloadSource = requires(M&& message) { std::forward<M>(message).parse_extended_payload(); };

static_assert(ExtendedPayloadSource<Message&>);
static_assert(ExtendedPayloadSource<const Message&>);
static_assert(!ExtendedPayloadSource<Message>);
static_assert(!ExtendedPayloadSource<const Message&&>);

TEST(Message, extended_payload_outlives_recv) {
    // what a caller does with a freshly received message: bind it, then look inside
    auto received = Message::new_extended(1, UtMetadata::data(0, 31235).to_bencode());
    auto [id, payload] = received.parse_extended_payload();
    ASSERT_EQ(id, 1);
    ASSERT_EQ(UtMetadata::decode(payload), UtMetadata::data(0, 31235));
    ASSERT_EQ(payload.data(), received.payload.data() + 1);
}

TEST(Dispatcher, routes_extended_messages) {
    RecordingDispatcher dispatcher;

    dispatcher.handle_message(Message::new_extended_handshake(ExtendedHandshake::ours(10)));
    dispatcher.handle_message(Message::new_extended(1, UtMetadata::request(4).to_bencode()));

    std::string trailer(10, 'x');
    dispatcher.handle_message(
        Message::new_extended_with_trailer(1, UtMetadata::data(0, 10).to_bencode(), as_bytes(trailer)));

    ASSERT_EQ(dispatcher.calls, (std::vector<std::string>{ "handshake", "request", "data" }));
    ASSERT_EQ(dispatcher.headers[0], UtMetadata::request(4));
    ASSERT_EQ(dispatcher.headers[1], UtMetadata::data(0, 10));

    // on_data sees the header as well as the piece bytes
    ASSERT_EQ(dispatcher.last_payload_size, UtMetadata::data(0, 10).encode().size() + trailer.size());
}

TEST(Dispatcher, ignores_everything_else) {
    RecordingDispatcher dispatcher;

    dispatcher.handle_message(Message(Flavour::Unchoke));
    dispatcher.handle_message(Message(Flavour::Have, { 0, 0, 0, 1 }));
    dispatcher.handle_message(Message(Flavour::Bitfield, { 0xff }));
    dispatcher.handle_message(Message::new_extended(1, UtMetadata::reject(0).to_bencode()));
    dispatcher.handle_message(raw_extended(1, "d8:msg_typei9e5:piecei0ee"));

    // some other extension, not even bencode
    dispatcher.handle_message(raw_extended(2, "not bencode"));

    ASSERT_TRUE(dispatcher.calls.empty());
}

TEST(Dispatcher, malformed_payload) {
    RecordingDispatcher dispatcher;

    ASSERT_THROW(dispatcher.handle_message(raw_extended(1, "garbage")), ProtocolViolation);
    ASSERT_THROW(dispatcher.handle_message(raw_extended(1, "d5:piecei0ee")), ProtocolViolation);
    ASSERT_THROW(dispatcher.handle_message(Message(Flavour::Extended)), ProtocolViolation);
    ASSERT_TRUE(dispatcher.calls.empty());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
