#include <Message.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstring>

ExtendedHandshake ExtendedHandshake::ours(std::optional<uint64_t> metadata_size) {
    ExtendedHandshake handshake;
    handshake.metadata_size = metadata_size;
    handshake.message_ids[UtMetadata::NAME] = static_cast<uint8_t>(ExtensionId::UtMetadata);
    handshake.client = "metaswap 0.1";
    return handshake;
}

ExtendedHandshake ExtendedHandshake::decode(std::span<const uint8_t> payload) {
    BEncodeParser parser(as_string_view(payload));
    auto value = parser.parse();
    if (!value.is_dict()) throw BencodeError("Extended handshake is not a dictionary");
    const auto& dict = value.as_dict();

    ExtendedHandshake handshake;

    // extension name -> id, anything that isn't a one byte id is skipped
    if (auto m = value.find("m"); m && m->is_dict()) {
        for (const auto& [name, id] : m->as_dict()) {
            if (id.is_int() && id.as_int() >= 0 && id.as_int() <= 255)
                handshake.message_ids[name] = static_cast<uint8_t>(id.as_int());
        }
    }

    if (auto size = dict_int(dict, "metadata_size"); size && *size >= 0)
        handshake.metadata_size = static_cast<uint64_t>(*size);

    handshake.client = dict_string(dict, "v");

    return handshake;
}

BEncodeValue ExtendedHandshake::to_bencode() const {
    BEncodeValue::Dict m;
    for (const auto& [name, id] : message_ids) m.insert_or_assign(name, id);

    BEncodeValue::Dict dict;
    dict.insert_or_assign("m", std::move(m));
    if (metadata_size) dict.insert_or_assign("metadata_size", *metadata_size);
    if (client) dict.insert_or_assign("v", *client);
    return dict;
}

std::optional<uint8_t> ExtendedHandshake::ut_metadata_id() const {
    auto it = message_ids.find(UtMetadata::NAME);
    if (it == message_ids.end() || it->second == 0) return std::nullopt;
    return it->second;
}

UtMetadata UtMetadata::request(size_t piece) {
    return { static_cast<int64_t>(MsgType::Request), static_cast<int64_t>(piece), std::nullopt };
}

UtMetadata UtMetadata::data(size_t piece, size_t total_size) {
    return { static_cast<int64_t>(MsgType::Data), static_cast<int64_t>(piece), static_cast<int64_t>(total_size) };
}

UtMetadata UtMetadata::reject(size_t piece) {
    return { static_cast<int64_t>(MsgType::Reject), static_cast<int64_t>(piece), std::nullopt };
}

UtMetadata UtMetadata::decode(std::span<const uint8_t> payload) {
    BEncodeParser parser(as_string_view(payload));
    auto value = parser.parse();
    if (!value.is_dict()) throw BencodeError("ut_metadata message is not a dictionary");
    const auto& dict = value.as_dict();

    auto msg_type = dict_int(dict, "msg_type");
    auto piece = dict_int(dict, "piece");
    if (!msg_type) throw BencodeError("ut_metadata message without msg_type");
    if (!piece) throw BencodeError("ut_metadata message without piece");

    return { *msg_type, *piece, dict_int(dict, "total_size") };
}

BEncodeValue UtMetadata::to_bencode() const {
    BEncodeValue::Dict dict;
    dict.insert_or_assign("msg_type", msg_type);
    dict.insert_or_assign("piece", piece);
    if (total_size) dict.insert_or_assign("total_size", *total_size);
    return dict;
}

size_t metadata_piece_count(size_t total_size) {
    return (total_size + UtMetadata::PIECE_LENGTH - 1) / UtMetadata::PIECE_LENGTH;
}

std::pair<size_t, size_t> metadata_piece_range(size_t total_size, size_t piece) {
    size_t begin = piece * UtMetadata::PIECE_LENGTH;
    size_t end = std::min(begin + UtMetadata::PIECE_LENGTH, total_size);
    return { begin, end };
}

Message Message::new_extended(uint8_t extension_id, const BEncodeValue& body) {
    return new_extended_with_trailer(extension_id, body, {});
}

Message Message::new_extended_with_trailer(uint8_t extension_id, const BEncodeValue& body,
                                           std::span<const uint8_t> trailer) {
    auto encoded = bencode(body);

    std::vector<uint8_t> payload;
    payload.reserve(1 + encoded.size() + trailer.size());
    payload.push_back(extension_id);
    payload.insert(payload.end(), encoded.begin(), encoded.end());
    payload.insert(payload.end(), trailer.begin(), trailer.end());

    return Message(Flavour::Extended, std::move(payload));
}

std::vector<uint8_t> Message::serialize() const {
    uint32_t msg_len = boost::endian::native_to_big(static_cast<uint32_t>(1 + payload.size()));

    std::vector<uint8_t> buffer;
    buffer.reserve(5 + payload.size());

    buffer.insert(buffer.end(), reinterpret_cast<uint8_t*>(&msg_len), reinterpret_cast<uint8_t*>(&msg_len) + 4);
    buffer.push_back(static_cast<uint8_t>(flavour));
    buffer.insert(buffer.end(), payload.begin(), payload.end());

    return buffer;
}

std::pair<uint8_t, std::span<const uint8_t>> Message::parse_extended_payload() const& {
    if (flavour != Flavour::Extended) throw ProtocolViolation("Not an extended message");
    if (payload.empty()) throw ProtocolViolation("Extended message without extension id");

    return { payload[0], std::span<const uint8_t>(payload).subspan(1) };
}
