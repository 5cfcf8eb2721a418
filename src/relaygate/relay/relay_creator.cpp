#include "relaygate/relay/relay_creator.hpp"
#include "relaygate/config/constants.hpp"
#include "relaygate/route/route_resolver.hpp"

namespace relaygate::relay {

Result<RelayRequest> RelayCreator::prepare(const CreateRelayOptions& opts) const {
    const std::string api_node = addr::final_element(opts.to);

    // Locality is a property of the address as written, before resolution.
    auto local = addr::is_local_node(opts.at);
    if (!local) {
        return make_error(local.error().code,
                          "argument 'at' is not valid: " + local.error().message);
    }

    route::RouteResolver resolver(lookup_, observer_);
    auto resolved = resolver.resolve(opts.at, route::RefreshContext{api_node, opts.authority_route});
    if (!resolved) return forward_error(std::move(resolved.error()));

    return build_relay_request(std::move(resolved->route), opts.name, *local,
                               std::move(resolved->identities), opts.mode);
}

Result<RelayInfo> RelayCreator::create(const CreateRelayOptions& opts) const {
    auto req = prepare(opts);
    if (!req) return forward_error(std::move(req.error()));

    const std::string api_node = addr::final_element(opts.to);
    obs::emit(observer_, obs::EventKind::RelayRequested, req->alias.value_or(""),
              api_node + " " + req->route.to_string());

    auto info = transport_.post(api_node, config::constants::RELAY_ENDPOINT_PATH, *req);
    if (!info) {
        obs::emit(observer_, obs::EventKind::Failure, req->alias.value_or(""),
                  std::string(to_string(info.error().code)));
        return forward_error(std::move(info.error()));
    }

    obs::emit(observer_, obs::EventKind::RelayCreated, req->alias.value_or(""), service_address(*info));
    return info;
}

} // namespace relaygate::relay
