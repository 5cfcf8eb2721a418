#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy and Result alias shared by every relaygate component.
 * @details No exceptions cross the public API; fallible calls return Result<T>.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "relaygate/compat/expected.hpp"  // relaygate_detail::expected / unexpected

namespace relaygate {

/// Failure classes surfaced by resolution, relay creation and authorization.
enum class Errc : std::uint8_t {
    UnknownNode,              ///< Node alias not present in the lookup.
    UnknownProject,           ///< Project alias absent even after a refresh.
    InvalidSegment,           ///< Segment value does not match its protocol code.
    InvalidAddress,           ///< Textual address or locality check rejected.
    RemoteRefreshFailed,      ///< Project directory could not repopulate the cache.
    TransportUnavailable,     ///< Relay-creation request could not be delivered.
    AuthorizationCheckFailed, ///< A policy could not reach a verdict.
    InvalidConfig             ///< Configuration document unreadable or malformed.
};

/// Stable lower_snake label for logs.
std::string_view to_string(Errc c) noexcept;

/// Error value carried by Result<T>. Equality compares code and message.
struct Error final {
    Errc        code{Errc::InvalidAddress};
    std::string message;

    bool operator==(const Error&) const = default;
};

template <class T>
using Result = relaygate_detail::expected<T, Error>;

/// Build the unexpected branch of a Result.
inline relaygate_detail::unexpected<Error> make_error(Errc code, std::string message) {
    return relaygate_detail::unexpected<Error>(Error{code, std::move(message)});
}

/// Re-wrap an existing error (propagation without loss of identity).
inline relaygate_detail::unexpected<Error> forward_error(Error e) {
    return relaygate_detail::unexpected<Error>(std::move(e));
}

} // namespace relaygate
