#pragma once
/**
 * @file local_message.hpp
 * @brief Message envelope as seen by the delivery path and by policies.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace relaygate::access {

/// Ordered list of worker addresses.
using WorkerRoute = std::vector<std::string>;

/**
 * @brief Envelope handed to AccessControl before delivery.
 *
 * Policies receive it by const reference and never modify it.
 */
struct LocalMessage final {
    WorkerRoute               onward_route;  ///< Hops still to traverse; front is the recipient
    WorkerRoute               return_route;  ///< Hops traversed so far; front is the latest sender
    std::vector<std::uint8_t> payload;

    bool operator==(const LocalMessage&) const = default;
};

} // namespace relaygate::access
