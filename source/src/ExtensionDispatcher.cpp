#include <ExtensionDispatcher.hpp>
#include <Errors.hpp>

void ExtensionDispatcher::handle_message(const Message& message) {
    switch (message.flavour) {
        case Flavour::Extended: handle_extended(message); break;
        default: break;                                             // not ours to handle
    }
}

void ExtensionDispatcher::handle_extended(const Message& message) {
    auto [id, payload] = message.parse_extended_payload();

    switch (static_cast<ExtensionId>(id)) {
        case ExtensionId::Handshake: on_handshake(payload); break;
        case ExtensionId::UtMetadata: handle_ut_metadata(payload); break;
        default: break;                                             // extension we never announced
    }
}

void ExtensionDispatcher::handle_ut_metadata(std::span<const uint8_t> payload) {
    UtMetadata header;
    try {
        header = UtMetadata::decode(payload);
    } catch (const BencodeError& e) {
        throw ProtocolViolation(std::string("Malformed ut_metadata message: ") + e.what());
    }

    switch (header.type()) {
        case UtMetadata::MsgType::Data: on_data(header, payload); break;
        case UtMetadata::MsgType::Request: on_request(header); break;
        default: break;                                             // reject, or unknown
    }
}
