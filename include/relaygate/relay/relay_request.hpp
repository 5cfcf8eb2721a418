#pragma once
/**
 * @file relay_request.hpp
 * @brief Relay-creation request model and its naming rule.
 *
 * A relay registered on a node the caller itself hosts is named
 * "forward_to_<base>"; a relay on a remote node keeps <base> unmodified.
 * The hosting node relies on that convention to keep generated names apart
 * from inbound relay names.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/route/route_resolver.hpp"

namespace relaygate::relay {

/**
 * @enum CredentialExchangeMode
 * @brief How identity credentials are exchanged when the relay's channel is set up.
 */
enum class CredentialExchangeMode : uint8_t {
    None,    ///< No credentials presented
    Oneway,  ///< Single round-trip, initiator presents
    Mutual   ///< Both sides present
};

std::string_view to_string(CredentialExchangeMode m) noexcept;

/** @struct RelayRequest
 *  @brief Body of the POST sent to the relay-management endpoint.
 */
struct RelayRequest {
    addr::MultiAddr            route;          ///< Fully resolved route to the hosting node
    std::optional<std::string> alias;          ///< Registered relay name
    bool                       at_local_node{false};
    relaygate::route::IdentityMap identities;  ///< Required identity per project sub-route
    CredentialExchangeMode     mode{CredentialExchangeMode::Oneway};
};

/** @struct RelayInfo
 *  @brief Hosting node's answer.
 */
struct RelayInfo {
    std::string remote_address;

    bool operator==(const RelayInfo&) const = default;
};

/// Hex token of RELAY_NAME_RANDOM_BYTES random bytes.
std::string random_relay_name();

/**
 * @brief Assemble a relay-creation request. Performs no I/O.
 * @param resolved_route Output of RouteResolver.
 * @param explicit_name Base name, used verbatim when present (even if empty); a random token is used when absent.
 * @param is_local_target Locality of the *unresolved* address (addr::is_local_node).
 * @param identities Identity entries produced by resolution.
 * @param mode Passed through unchanged.
 */
RelayRequest build_relay_request(addr::MultiAddr resolved_route,
                                 std::optional<std::string> explicit_name,
                                 bool is_local_target,
                                 route::IdentityMap identities,
                                 CredentialExchangeMode mode);

/// "/service/<remote_address>"
std::string service_address(const RelayInfo& info);

} // namespace relaygate::relay
