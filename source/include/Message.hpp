#pragma once

#include <map>
#include <span>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdint>

#include <Bencode.hpp>

// peer wire message ids (BEP 3), plus the extension protocol (BEP 10)
enum class Flavour : uint8_t {
    Choke = 0,
    Unchoke = 1,
    Interested = 2,
    NotInterested = 3,
    Have = 4,
    Bitfield = 5,
    Request = 6,
    Piece = 7,
    Cancel = 8,
    Port = 9,
    Extended = 20,
};

// Extension ids we announce in our own handshake. A peer addresses its
// extension messages to us with these.
enum class ExtensionId : uint8_t {
    Handshake = 0,
    UtMetadata = 1,
};

struct ExtendedHandshake {
    std::optional<uint64_t> metadata_size;
    std::map<std::string, uint8_t> message_ids;     // "m": extension name -> sender's local id
    std::optional<std::string> client;              // "v"

    // What we send: ut_metadata under our local id, size only when we have the metadata.
    static ExtendedHandshake ours(std::optional<uint64_t> metadata_size = std::nullopt);

    static ExtendedHandshake decode(std::span<const uint8_t> payload);

    BEncodeValue to_bencode() const;

    // id 0 disables an extension, so it counts as absent
    std::optional<uint8_t> ut_metadata_id() const;
};

// BEP 9 message header
struct UtMetadata {
    static constexpr const char* NAME = "ut_metadata";
    static constexpr size_t PIECE_LENGTH = 16384;

    enum class MsgType : int64_t { Request = 0, Data = 1, Reject = 2 };

    int64_t msg_type{};
    int64_t piece{};
    std::optional<int64_t> total_size;          // Data only

    static UtMetadata request(size_t piece);
    static UtMetadata data(size_t piece, size_t total_size);
    static UtMetadata reject(size_t piece);

    // Reads the leading dictionary only. For Data the piece bytes follow it.
    static UtMetadata decode(std::span<const uint8_t> payload);

    BEncodeValue to_bencode() const;
    std::string encode() const { return bencode(to_bencode()); }

    MsgType type() const { return static_cast<MsgType>(msg_type); }

    bool operator==(const UtMetadata&) const = default;
};

// ceil(total_size / PIECE_LENGTH)
size_t metadata_piece_count(size_t total_size);

// [begin, end) of piece `piece` within a dictionary of total_size bytes
std::pair<size_t, size_t> metadata_piece_range(size_t total_size, size_t piece);

class Message {
public:
    Message(Flavour flavour, std::vector<uint8_t> payload = {})
        : flavour(flavour), payload(std::move(payload)) {}

    static Message new_extended(uint8_t extension_id, const BEncodeValue& body);

    // bencoded body immediately followed by raw bytes, nothing marks the boundary
    static Message new_extended_with_trailer(uint8_t extension_id, const BEncodeValue& body,
                                             std::span<const uint8_t> trailer);

    static Message new_extended_handshake(const ExtendedHandshake& handshake) {
        return new_extended(static_cast<uint8_t>(ExtensionId::Handshake), handshake.to_bencode());
    }

    // length prefix, id, payload
    std::vector<uint8_t> serialize() const;

    // (extension id, extension payload); throws ProtocolViolation. The span
    // points into this message, so temporaries are refused.
    std::pair<uint8_t, std::span<const uint8_t>> parse_extended_payload() const&;
    std::pair<uint8_t, std::span<const uint8_t>> parse_extended_payload() const&& = delete;

    Flavour flavour;
    std::vector<uint8_t> payload;
};
