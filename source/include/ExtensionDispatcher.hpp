#pragma once

#include <span>
#include <cstdint>

#include <Message.hpp>

// Routes inbound messages for both ends of a metadata exchange. Only extended
// messages matter: the handshake goes to on_handshake, ut_metadata requests and
// data go to on_request / on_data. Everything else is dropped.
class ExtensionDispatcher {
public:
    virtual ~ExtensionDispatcher() = default;

    // Hook exceptions propagate. Undecodable payloads throw ProtocolViolation.
    void handle_message(const Message& message);

protected:
    virtual void on_handshake(std::span<const uint8_t> payload) = 0;

    // payload is the whole extension payload: the header and the piece bytes after it
    virtual void on_data(const UtMetadata& header, std::span<const uint8_t> payload) = 0;

    virtual void on_request(const UtMetadata& header) = 0;

private:
    void handle_extended(const Message& message);
    void handle_ut_metadata(std::span<const uint8_t> payload);
};
