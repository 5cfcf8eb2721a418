#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: persisted node/project records → LookupCache.
 * @details JSON layout:
 *   {
 *     "nodes":    { "<alias>": { "ip4"|"ip6"|"dns": "<host>", "port": <u16> } },
 *     "projects": { "<alias>": { "route": "<multiaddr>", "identity": "<id>" } },
 *     "authority": "<multiaddr>",
 *     "default_node": "<alias>"
 *   }
 */

#include <string>
#include <string_view>

#include "relaygate/addr/lookup.hpp"
#include "relaygate/addr/lookup_cache.hpp"
#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/core/error.hpp"

namespace relaygate::config {

    /** @struct NodeConfig
     *  @brief Everything a process needs to resolve addresses at start.
     */
    struct NodeConfig {
        addr::NodeMap    nodes;            ///< Local node aliases
        addr::ProjectMap projects;         ///< Last known project records
        addr::MultiAddr  authority_route;  ///< Project directory location (may be empty)
        std::string      default_node;     ///< Node that issues requests when none is named
    };

    /** @class Loader
     *  @brief Source of node configuration.
     */
    class Loader {
    public:
        /**
         * @brief Read and parse a configuration file.
         * @return NodeConfig, or InvalidConfig naming the offending entry.
         */
        static Result<NodeConfig> load_from_file(const std::string& path);

        /// Parse a configuration document held in memory.
        static Result<NodeConfig> load_from_string(std::string_view text);

        /// Populate cache with every node and project of cfg in one publication.
        /// On error the cache is left untouched.
        static Result<void> apply(const NodeConfig& cfg, addr::LookupCache& cache);
    };

} // namespace relaygate::config
