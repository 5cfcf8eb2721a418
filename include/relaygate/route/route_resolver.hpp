#pragma once
/**
 * @file route_resolver.hpp
 * @brief Turns a multi-protocol address into a concrete route plus identity requirements.
 */

#include <string>
#include <utility>
#include <vector>

#include "relaygate/addr/lookup.hpp"
#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/core/error.hpp"
#include "relaygate/obs/observability.hpp"

namespace relaygate::route {

/** @struct IdentityEntry
 *  @brief A sub-route and the identity messages on it must present.
 */
struct IdentityEntry {
    addr::MultiAddr route;        ///< Project route as spliced into the output
    std::string     identity_id;  ///< Required identity identifier

    bool operator==(const IdentityEntry&) const = default;
};

/// One entry per project segment resolved; insertion order carries no meaning.
using IdentityMap = std::vector<IdentityEntry>;

/** @struct Resolution
 *  @brief Output of resolve(): no node/project segments remain in route.
 */
struct Resolution {
    addr::MultiAddr route;
    IdentityMap     identities;
};

/** @struct RefreshContext
 *  @brief Who asks the authority, and how to reach it, when a project is missing.
 */
struct RefreshContext {
    std::string     acting_node;
    addr::MultiAddr authority_route;
};

/** @class RouteResolver
 *  @brief Stateless resolver over an injected AddressLookup.
 *
 *  Concurrent resolve() calls are independent. Two calls missing the same
 *  project may both refresh; the lookup is expected to tolerate that.
 */
class RouteResolver {
public:
    explicit RouteResolver(addr::AddressLookup& lookup, obs::Observer* observer = nullptr) noexcept
        : lookup_(lookup), observer_(observer) {}

    /**
     * @brief Resolve every segment of address in order.
     * @param address Unresolved address; the empty address resolves to the empty route.
     * @param refresh Used only when a project alias misses the cache.
     * @return Resolution, or UnknownNode / UnknownProject / InvalidSegment /
     *         RemoteRefreshFailed. Nothing partial is ever returned.
     */
    Result<Resolution> resolve(const addr::MultiAddr& address, const RefreshContext& refresh) const;

private:
    Result<void> append_node(const addr::Segment& seg, addr::MultiAddr& out) const;
    Result<void> append_project(const addr::Segment& seg, const RefreshContext& refresh,
                                addr::MultiAddr& out, IdentityMap& ids) const;

    addr::AddressLookup& lookup_;
    obs::Observer*       observer_{nullptr};
};

} // namespace relaygate::route
