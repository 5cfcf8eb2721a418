// apps/route_tool/src/main.cpp
// relaygate — route_tool
// Purpose: resolve an address against a node configuration and show the relay
// request a creation call would send. Does not contact any node.
//
// Usage:
//   ./route_tool <config.json> <address> [relay-name]
//
// Notes:
// - Projects missing from the configuration cannot be refreshed here (no
//   directory is attached), so they fail with remote_refresh_failed.

#include <iostream>
#include <optional>
#include <string>

#include "relaygate/addr/lookup_cache.hpp"
#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/config/config_loader.hpp"
#include "relaygate/obs/observability.hpp"
#include "relaygate/relay/relay_request.hpp"
#include "relaygate/route/route_resolver.hpp"
#include "relaygate/version.hpp"

using namespace relaygate;

static int fail(const Error& e) {
    std::cerr << "error: " << to_string(e.code) << ": " << e.message << std::endl;
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.json> <address> [relay-name]" << std::endl;
        return 2;
    }
    const std::string cfg_path = argv[1];
    const std::string address  = argv[2];
    std::optional<std::string> name;
    if (argc > 3) name = argv[3];

    std::cout << "relaygate route_tool " << version_string
              << " (expected: " << relaygate_detail::expected_backend << ")" << std::endl;

    auto cfg = config::Loader::load_from_file(cfg_path);
    if (!cfg) return fail(cfg.error());

    auto* observer = obs::make_simple_observer();
    addr::LookupCache cache(nullptr, observer);
    if (auto applied = config::Loader::apply(*cfg, cache); !applied) return fail(applied.error());

    auto ma = addr::MultiAddr::parse(address);
    if (!ma) return fail(ma.error());

    auto local = addr::is_local_node(*ma);
    if (!local) return fail(local.error());

    route::RouteResolver resolver(cache, observer);
    auto res = resolver.resolve(*ma, route::RefreshContext{cfg->default_node, cfg->authority_route});
    if (!res) return fail(res.error());

    const auto req = relay::build_relay_request(res->route, name, *local, res->identities,
                                                relay::CredentialExchangeMode::Oneway);

    std::cout << "route:    " << res->route.to_string() << std::endl;
    for (const auto& id : res->identities)
        std::cout << "identity: " << id.route.to_string() << " -> " << id.identity_id << std::endl;
    std::cout << "local:    " << (req.at_local_node ? "yes" : "no") << std::endl;
    std::cout << "alias:    " << req.alias.value_or("") << std::endl;
    std::cout << "mode:     " << relay::to_string(req.mode) << std::endl;
    return 0;
}
