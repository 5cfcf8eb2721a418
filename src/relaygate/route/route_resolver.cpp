/**
 * @file route_resolver.cpp
 * @brief Segment-by-segment resolution with a single refresh per missing project.
 */
#include "relaygate/route/route_resolver.hpp"

#include <type_traits>

namespace relaygate::route {

using addr::MultiAddr;
using addr::NodeRecord;
using addr::Proto;
using addr::Segment;

Result<void> RouteResolver::append_node(const Segment& seg, MultiAddr& out) const {
    auto alias = seg.as_name();
    if (!alias) return forward_error(std::move(alias.error()));

    const auto rec = lookup_.get_node(*alias);
    if (!rec) return make_error(Errc::UnknownNode, "unknown node " + std::string(*alias));

    // Host encoding follows the record's tag, then the port.
    std::visit([&](const auto& a) {
        using A = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<A, NodeRecord::Dns>)     out.push_back(Segment::dns(a.host));
        else if constexpr (std::is_same_v<A, NodeRecord::V4>) out.push_back(Segment::ip4(a.ip));
        else                                                  out.push_back(Segment::ip6(a.ip));
    }, rec->addr);
    out.push_back(Segment::tcp(rec->port()));
    return {};
}

Result<void> RouteResolver::append_project(const Segment& seg, const RefreshContext& refresh,
                                           MultiAddr& out, IdentityMap& ids) const {
    auto alias = seg.as_name();
    if (!alias) return forward_error(std::move(alias.error()));

    auto rec = lookup_.get_project(*alias);
    if (!rec) {
        // One refresh, one retry. No loop.
        auto refreshed = lookup_.refresh_projects(refresh.acting_node, refresh.authority_route);
        if (!refreshed) return forward_error(std::move(refreshed.error()));
        rec = lookup_.get_project(*alias);
    }
    if (!rec) return make_error(Errc::UnknownProject, "unknown project name " + std::string(*alias));

    out.extend(rec->node_route);
    ids.push_back(IdentityEntry{rec->node_route, rec->identity_id});
    return {};
}

Result<Resolution> RouteResolver::resolve(const MultiAddr& address, const RefreshContext& refresh) const {
    Resolution res;
    for (const auto& seg : address) {
        Result<void> step{};
        switch (seg.code()) {
            case Proto::Node:
                step = append_node(seg, res.route);
                break;
            case Proto::Project:
                step = append_project(seg, refresh, res.route, res.identities);
                break;
            default:
                res.route.push_back(seg); // pass-through, unchanged
                break;
        }
        if (!step) {
            obs::emit(observer_, obs::EventKind::Failure, address.to_string(),
                      std::string(to_string(step.error().code)));
            return forward_error(std::move(step.error()));
        }
    }

    obs::emit(observer_, obs::EventKind::RouteResolved, address.to_string(), res.route.to_string());
    return res;
}

} // namespace relaygate::route
