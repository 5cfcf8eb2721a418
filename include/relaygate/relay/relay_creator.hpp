#pragma once
/**
 * @file relay_creator.hpp
 * @brief End-to-end relay creation: locality → resolution → request → transport.
 */

#include <optional>
#include <string>
#include <string_view>

#include "relaygate/addr/lookup.hpp"
#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/core/error.hpp"
#include "relaygate/obs/observability.hpp"
#include "relaygate/relay/relay_request.hpp"

namespace relaygate::relay {

/**
 * @class RelayTransport
 * @brief Request/response channel to a node's management API.
 *
 * Implementations own connection handling and any retry policy; they report
 * an unreachable node as TransportUnavailable.
 */
class RelayTransport {
public:
    virtual ~RelayTransport() = default;

    /// POST req to path on api_node and decode the RelayInfo answer.
    virtual Result<RelayInfo> post(std::string_view api_node,
                                   std::string_view path,
                                   const RelayRequest& req) = 0;
};

/** @struct CreateRelayOptions
 *  @brief Inputs of one relay-creation call.
 */
struct CreateRelayOptions {
    std::optional<std::string> name;             ///< Base relay name (random when absent)
    std::string                to;               ///< Node receiving the request ("/node/n1" or "n1")
    addr::MultiAddr            at;               ///< Unresolved route to the hosting node
    addr::MultiAddr            authority_route;  ///< Where to refresh projects from
    CredentialExchangeMode     mode{CredentialExchangeMode::Oneway};
};

/** @class RelayCreator
 *  @brief Drives one relay creation; holds no per-call state.
 */
class RelayCreator {
public:
    RelayCreator(addr::AddressLookup& lookup, RelayTransport& transport,
                 obs::Observer* observer = nullptr) noexcept
        : lookup_(lookup), transport_(transport), observer_(observer) {}

    /// Build the request without sending it (locality check + resolution).
    Result<RelayRequest> prepare(const CreateRelayOptions& opts) const;

    /**
     * @brief Create the relay.
     * @return RelayInfo of the created relay, or the first error of any stage.
     */
    Result<RelayInfo> create(const CreateRelayOptions& opts) const;

private:
    addr::AddressLookup& lookup_;
    RelayTransport&      transport_;
    obs::Observer*       observer_{nullptr};
};

} // namespace relaygate::relay
