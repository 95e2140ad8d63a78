#pragma once

#include <stdexcept>
#include <string>

// Failures of the metadata exchange itself. Everything derived from here is
// fatal for a fetch and swallowed by a seeding loop.
class MetadataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// extension protocol unsupported, metadata size unknown, no ut_metadata id
class NegotiationError : public MetadataError {
public:
    using MetadataError::MetadataError;
};

// wrong piece index, oversized piece, declared size exceeded, malformed payload
class ProtocolViolation : public MetadataError {
public:
    using MetadataError::MetadataError;
};

// reassembled dictionary does not decode or does not hash to the target
class IntegrityError : public MetadataError {
public:
    using MetadataError::MetadataError;
};

// connect, handshake and socket level failures
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A read deadline expired before any byte of the next frame arrived, so the
// stream is still in sync and the caller may keep reading.
class TimeoutError : public TransportError {
public:
    using TransportError::TransportError;
};
