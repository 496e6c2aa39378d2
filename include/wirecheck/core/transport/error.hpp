#pragma once

#include <cstdint>
#include <string_view>

namespace wirecheck::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (libcurl, gRPC status, etc.).

A response with a non-2xx status is NOT a transport error: the call succeeded
and it is up to the assertion evaluator to judge the status.

It is intentionally:
- small
- stable
- policy-free

The retry policy decides whether a given classification is worth retrying.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // No complete response within the unit timeout
    ConnectionFailed, // DNS, refused connection, TLS handshake, routing
    ConnectionReset,  // Connection dropped while the request was in flight

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Malformed response, invalid framing, gRPC status mapping failure

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidRequest,   // Request could not be built (bad URL, unsupported method)
    Cancelled,        // Aborted by a local cancellation decision

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure  // Unclassified failure (including exceptions escaping send)
};


/// Optional helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::ConnectionReset:   return "ConnectionReset";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::InvalidRequest:    return "InvalidRequest";
    case Error::Cancelled:         return "Cancelled";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace wirecheck::core
