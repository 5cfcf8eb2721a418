/**
 * @file relay_request.cpp
 * @brief Relay naming and request assembly.
 */
#include "relaygate/relay/relay_request.hpp"
#include "relaygate/config/constants.hpp"

#include <random>

namespace relaygate::relay {

using namespace relaygate::config::constants;

std::string_view to_string(CredentialExchangeMode m) noexcept {
    switch (m) {
        case CredentialExchangeMode::None:   return "none";
        case CredentialExchangeMode::Oneway: return "oneway";
        case CredentialExchangeMode::Mutual: return "mutual";
    }
    return "unknown";
}

std::string random_relay_name() {
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::string out;
    out.reserve(RELAY_NAME_RANDOM_BYTES * 2);
    for (std::size_t i = 0; i < RELAY_NAME_RANDOM_BYTES; ++i) {
        const auto b = static_cast<unsigned>(byte(rng));
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

RelayRequest build_relay_request(addr::MultiAddr resolved_route,
                                 std::optional<std::string> explicit_name,
                                 bool is_local_target,
                                 route::IdentityMap identities,
                                 CredentialExchangeMode mode) {
    std::string base = explicit_name ? std::move(*explicit_name) : random_relay_name();

    RelayRequest req;
    req.route = std::move(resolved_route);
    req.alias = is_local_target ? std::string(LOCAL_RELAY_PREFIX) + base : std::move(base);
    req.at_local_node = is_local_target;
    req.identities = std::move(identities);
    req.mode = mode;
    return req;
}

std::string service_address(const RelayInfo& info) {
    return std::string(SERVICE_ADDRESS_PREFIX) + info.remote_address;
}

} // namespace relaygate::relay
