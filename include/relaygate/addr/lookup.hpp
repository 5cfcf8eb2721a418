/**
 * @file lookup.hpp
 * @brief Records and interfaces through which aliases become network routes.
 *
 * Node aliases resolve to an internet address; project aliases resolve to a
 * stored route plus the identity required on that route. The project
 * directory (a remote authority) repopulates project records on demand.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/core/error.hpp"

namespace relaygate::addr {

// Host alternatives of a NodeRecord. Declared at namespace scope so the
// variant below sees complete types and NodeRecord stays default-constructible.
struct NodeDns { std::string host; std::uint16_t port{0}; bool operator==(const NodeDns&) const = default; };
struct NodeV4  { Ip4Octets ip{};   std::uint16_t port{0}; bool operator==(const NodeV4&) const = default; };
struct NodeV6  { Ip6Octets ip{};   std::uint16_t port{0}; bool operator==(const NodeV6&) const = default; };

/**
 * @brief Endpoint for a local node alias.
 *
 * The host encoding is chosen by the alternative held, never guessed from the
 * content: a Dns host is always emitted as /dnsaddr even if it looks like an IP.
 */
struct NodeRecord final {
    using Dns = NodeDns;
    using V4  = NodeV4;
    using V6  = NodeV6;

    std::variant<Dns, V4, V6> addr;

    std::uint16_t port() const noexcept {
        return std::visit([](const auto& a) { return a.port; }, addr);
    }

    bool operator==(const NodeRecord&) const = default;
};

/// Route to a project's entry node plus the identity required on that route.
struct ProjectRecord final {
    MultiAddr   node_route;
    std::string identity_id;

    bool operator==(const ProjectRecord&) const = default;
};

using NodeMap    = std::unordered_map<std::string, NodeRecord>;
using ProjectMap = std::unordered_map<std::string, ProjectRecord>;

/**
 * @brief Lookup capability consumed by the route resolver.
 *
 * Implementations must be safe for concurrent use. refresh_projects() may
 * suspend on a remote call; it must not hold a lock over the records while
 * doing so.
 */
class AddressLookup {
public:
    virtual ~AddressLookup() = default;

    virtual std::optional<NodeRecord>    get_node(std::string_view alias) const = 0;
    virtual std::optional<ProjectRecord> get_project(std::string_view alias) const = 0;

    /// Repopulate project records on behalf of acting_node from the authority.
    virtual Result<void> refresh_projects(std::string_view acting_node,
                                          const MultiAddr& route_to_authority) = 0;
};

/**
 * @brief Remote authority that knows every project visible to a node.
 */
class ProjectDirectory {
public:
    virtual ~ProjectDirectory() = default;

    /// Fetch the project records visible to acting_node.
    virtual Result<ProjectMap> list_projects(std::string_view acting_node,
                                             const MultiAddr& route_to_authority) = 0;
};

} // namespace relaygate::addr
