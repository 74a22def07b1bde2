#ifndef RDX_ERRORS_HPP
#define RDX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rdx {

/**
 * @brief Base class for wire level failures.
 *
 * Anything derived from ProtocolError means the byte stream can no longer
 * be trusted; the connection owner must close the connection.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed frame header, magic byte mismatch or oversized frame.
class FormatError : public ProtocolError {
public:
    explicit FormatError(const std::string& what) : ProtocolError(what) {}
};

/// Payload could not be decompressed (corrupt data, missing back-end, size cap).
class CompressionError : public ProtocolError {
public:
    explicit CompressionError(const std::string& what) : ProtocolError(what) {}
};

/// Payload failed decryption or authentication of the cipher tag.
class CipherError : public ProtocolError {
public:
    explicit CipherError(const std::string& what) : ProtocolError(what) {}
};

/// None of the requested digests can be satisfied by the authenticator.
class UnsupportedDigestError : public std::runtime_error {
public:
    explicit UnsupportedDigestError(const std::string& what) : std::runtime_error(what) {}
};

/// The peer refused our credentials.
class AuthenticationFailure : public std::runtime_error {
public:
    explicit AuthenticationFailure(const std::string& what) : std::runtime_error(what) {}
};

/// Invalid setting override. Internal: resolved to a default, never escapes.
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& what) : std::runtime_error(what) {}
};

/// Socket level failure (connect, bind, send, receive).
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rdx

#endif // RDX_ERRORS_HPP
