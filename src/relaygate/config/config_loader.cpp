/**
* @file config_loader.cpp
 * @brief JSON loader for node and project records (nlohmann::json).
 */
#include "relaygate/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <arpa/inet.h>

#include <nlohmann/json.hpp>

namespace relaygate::config {
    using nlohmann::json;
    using namespace relaygate::addr;

    static relaygate_detail::unexpected<Error> bad(const std::string& what) {
        return make_error(Errc::InvalidConfig, what);
    }

    static Result<NodeRecord> parse_node(const std::string& alias, const json& j) {
        if (!j.is_object()) return bad("node '" + alias + "' must be an object");

        const auto port_it = j.find("port");
        if (port_it == j.end() || !port_it->is_number_unsigned() ||
            port_it->get<std::uint64_t>() > std::numeric_limits<std::uint16_t>::max())
            return bad("node '" + alias + "' needs a port in 0..65535");
        const auto port = static_cast<std::uint16_t>(port_it->get<std::uint64_t>());

        const int hosts = int(j.contains("dns")) + int(j.contains("ip4")) + int(j.contains("ip6"));
        if (hosts != 1) return bad("node '" + alias + "' needs exactly one of dns/ip4/ip6");

        if (auto it = j.find("dns"); it != j.end()) {
            if (!it->is_string() || it->get<std::string>().empty())
                return bad("node '" + alias + "' has an empty dns host");
            return NodeRecord{NodeRecord::Dns{it->get<std::string>(), port}};
        }
        if (auto it = j.find("ip4"); it != j.end()) {
            Ip4Octets ip{};
            if (!it->is_string() || ::inet_pton(AF_INET, it->get<std::string>().c_str(), ip.data()) != 1)
                return bad("node '" + alias + "' has an invalid ip4 address");
            return NodeRecord{NodeRecord::V4{ip, port}};
        }
        const auto& v6 = j.at("ip6");
        Ip6Octets ip{};
        if (!v6.is_string() || ::inet_pton(AF_INET6, v6.get<std::string>().c_str(), ip.data()) != 1)
            return bad("node '" + alias + "' has an invalid ip6 address");
        return NodeRecord{NodeRecord::V6{ip, port}};
    }

    static Result<ProjectRecord> parse_project(const std::string& alias, const json& j) {
        if (!j.is_object()) return bad("project '" + alias + "' must be an object");
        const auto route = j.find("route");
        const auto ident = j.find("identity");
        if (route == j.end() || !route->is_string())
            return bad("project '" + alias + "' needs a route");
        if (ident == j.end() || !ident->is_string() || ident->get<std::string>().empty())
            return bad("project '" + alias + "' needs an identity");

        auto ma = MultiAddr::parse(route->get<std::string>());
        if (!ma) return bad("project '" + alias + "': " + ma.error().message);
        ProjectRecord rec{std::move(*ma), ident->get<std::string>()};
        if (!LookupCache::validate_project(rec))
            return bad("project '" + alias + "' route must be concrete (no node or project segments)");
        return rec;
    }

    Result<NodeConfig> Loader::load_from_string(std::string_view text) {
        const json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) return bad("configuration is not valid JSON");
        if (!doc.is_object())   return bad("configuration root must be an object");

        NodeConfig cfg;

        if (auto it = doc.find("nodes"); it != doc.end()) {
            if (!it->is_object()) return bad("'nodes' must be an object");
            for (const auto& item : it->items()) {
                const std::string& alias = item.key();
                const json& body = item.value();
                if (!LookupCache::validate_alias(alias)) return bad("invalid node alias '" + alias + "'");
                auto rec = parse_node(alias, body);
                if (!rec) return relaygate::forward_error(std::move(rec.error()));
                cfg.nodes.emplace(alias, std::move(*rec));
            }
        }

        if (auto it = doc.find("projects"); it != doc.end()) {
            if (!it->is_object()) return bad("'projects' must be an object");
            for (const auto& item : it->items()) {
                const std::string& alias = item.key();
                const json& body = item.value();
                if (!LookupCache::validate_alias(alias)) return bad("invalid project alias '" + alias + "'");
                auto rec = parse_project(alias, body);
                if (!rec) return relaygate::forward_error(std::move(rec.error()));
                cfg.projects.emplace(alias, std::move(*rec));
            }
        }

        if (auto it = doc.find("authority"); it != doc.end()) {
            if (!it->is_string()) return bad("'authority' must be a string");
            auto ma = MultiAddr::parse(it->get<std::string>());
            if (!ma) return bad("authority: " + ma.error().message);
            cfg.authority_route = std::move(*ma);
        }

        if (auto it = doc.find("default_node"); it != doc.end()) {
            if (!it->is_string()) return bad("'default_node' must be a string");
            cfg.default_node = it->get<std::string>();
            if (!cfg.nodes.count(cfg.default_node))
                return bad("default_node '" + cfg.default_node + "' is not a configured node");
        }

        return cfg;
    }

    Result<NodeConfig> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return bad("cannot open " + path);
        std::ostringstream buf;
        buf << in.rdbuf();
        return load_from_string(buf.str());
    }

    Result<void> Loader::apply(const NodeConfig& cfg, LookupCache& cache) {
        // Name the first offending entry; nothing is published unless all pass.
        for (const auto& [alias, rec] : cfg.nodes) {
            if (!LookupCache::validate_alias(alias) || !LookupCache::validate_node(rec))
                return bad("node '" + alias + "' rejected by cache");
        }
        for (const auto& [alias, rec] : cfg.projects) {
            if (!LookupCache::validate_alias(alias) || !LookupCache::validate_project(rec))
                return bad("project '" + alias + "' rejected by cache");
        }
        switch (cache.load(cfg.nodes, cfg.projects)) {
            case CacheErr::Ok:       return {};
            case CacheErr::Capacity: return bad("configuration exceeds cache capacity");
            case CacheErr::Invalid:  break;
        }
        return bad("configuration rejected by cache");
    }

} // namespace relaygate::config
