#pragma once

#include <string>
#include <chrono>
#include <concepts>

#include "wirecheck/core/transport/error.hpp"
#include "wirecheck/core/model/request.hpp"

namespace wirecheck::core::transport {

// -----------------------------------------------------------------------------
// Reply
// -----------------------------------------------------------------------------
//
// Result of one transport call. When error == Error::None, `response` holds
// the received response (whatever its status code); otherwise `detail`
// carries a human-readable description of the failure.
// -----------------------------------------------------------------------------
struct Reply {
    Error error{Error::None};
    Response response;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return error == Error::None; }
};

// -----------------------------------------------------------------------------
// TransportConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the execution engine.
//
// The transport implementation:
//
//   • Performs one blocking request/response exchange per send()
//   • Honours the supplied timeout (the engine re-checks the elapsed time)
//   • Must be safe for concurrent send() calls from several workers
//   • Owns connection pooling, TLS and protocol details
//
// -----------------------------------------------------------------------------

template<class T>
concept TransportConcept =
    requires(T t, const Request& request, std::chrono::milliseconds timeout)
{
    { t.send(request, timeout) } -> std::same_as<Reply>;
};

} // namespace wirecheck::core::transport
