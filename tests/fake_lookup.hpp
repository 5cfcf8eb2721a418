/**
 * @file fake_lookup.hpp
 * @brief In-memory AddressLookup for resolver and relay tests.
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "relaygate/addr/lookup.hpp"

namespace relaygate::testing {

/// Projects in `after_refresh` become visible only once refresh_projects() runs.
class FakeLookup final : public addr::AddressLookup {
public:
    std::map<std::string, addr::NodeRecord, std::less<>>    nodes;
    std::map<std::string, addr::ProjectRecord, std::less<>> projects;
    std::map<std::string, addr::ProjectRecord, std::less<>> after_refresh;
    std::optional<Error> refresh_error;

    std::optional<addr::NodeRecord> get_node(std::string_view alias) const override {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = nodes.find(alias);
        if (it == nodes.end()) return std::nullopt;
        return it->second;
    }

    std::optional<addr::ProjectRecord> get_project(std::string_view alias) const override {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = projects.find(alias);
        if (it == projects.end()) return std::nullopt;
        return it->second;
    }

    Result<void> refresh_projects(std::string_view acting_node,
                                  const addr::MultiAddr& route_to_authority) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++refreshes;
        last_acting_node = std::string(acting_node);
        last_authority = route_to_authority;
        if (refresh_error) return forward_error(*refresh_error);
        for (const auto& [alias, rec] : after_refresh) projects.insert_or_assign(alias, rec);
        return {};
    }

    int refreshes{0};
    std::string last_acting_node;
    addr::MultiAddr last_authority;

private:
    mutable std::mutex mu_;
};

} // namespace relaygate::testing
