#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for relay creation and resolution.
 * @details Relay naming and the endpoint path are part of the protocol with the
 *          relay-hosting node; change them only together with that node.
 */

#include <cstddef>
#include <string_view>

namespace relaygate::config::constants {

// =====================
// Relay management protocol
// =====================
/// Path on the hosting node that accepts relay-creation requests (POST).
inline constexpr std::string_view RELAY_ENDPOINT_PATH = "/node/forwarder";
/// Prefix for relays registered on a local node; inbound relays own the bare names.
inline constexpr std::string_view LOCAL_RELAY_PREFIX  = "forward_to_";
/// Random bytes in a generated relay name (hex-encoded → 8 chars).
inline constexpr std::size_t      RELAY_NAME_RANDOM_BYTES = 4;

// =====================
// Output
// =====================
/// Rendered prefix of a created relay's service address.
inline constexpr std::string_view SERVICE_ADDRESS_PREFIX = "/service/";

// =====================
// Local node recognition
// =====================
inline constexpr std::string_view LOCALHOST_NAME = "localhost";
inline constexpr unsigned char    IP4_LOOPBACK_FIRST_OCTET = 127;

} // namespace relaygate::config::constants
