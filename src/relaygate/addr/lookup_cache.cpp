// LookupCache — RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: copy current tables, mutate, atomic_store (RELEASE).
// The shared_ptr reference count provides the grace period: a resolver holding
// an old snapshot keeps it alive until it drops its ref.
// refresh_projects() fetches from the directory first and only then enters the
// writer section, so a slow authority never stalls other writers or readers.

#include "relaygate/addr/lookup_cache.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <string_view>

namespace relaygate::addr {

LookupCache::LookupCache(std::shared_ptr<ProjectDirectory> directory, obs::Observer* observer)
    : directory_(std::move(directory)), observer_(observer) {}

//------------------------------- Validation -----------------------------------

bool LookupCache::validate_alias(std::string_view alias) noexcept {
    if (alias.empty() || alias.size() > Limits::MaxAliasLen) return false;
    // Allow [A-Za-z0-9_.-]
    for (char c : alias) {
        const bool ok = (c == '_' || c == '-' || c == '.' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool LookupCache::validate_node(const NodeRecord& n) noexcept {
    const auto* dns = std::get_if<NodeRecord::Dns>(&n.addr);
    return !(dns && dns->host.empty());
}

bool LookupCache::validate_project(const ProjectRecord& p) noexcept {
    if (p.identity_id.empty() || p.identity_id.size() > Limits::MaxIdentityLen) return false;
    // A project route is a concrete route: no aliases left to resolve.
    for (const auto& seg : p.node_route) {
        if (seg.code() == Proto::Node || seg.code() == Proto::Project) return false;
        if (!seg.well_formed()) return false;
    }
    return true;
}

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const LookupCache::Tables> LookupCache::snapshot() const noexcept {
    // RCU read: acquire pairs with the RELEASE in publish().
    return std::atomic_load_explicit(&tables_, std::memory_order_acquire);
}

std::optional<NodeRecord> LookupCache::get_node(std::string_view alias) const {
    auto snap = snapshot();
    auto it = snap->nodes.find(std::string(alias));
    if (it == snap->nodes.end()) return std::nullopt;
    return it->second; // copy
}

std::optional<ProjectRecord> LookupCache::get_project(std::string_view alias) const {
    auto snap = snapshot();
    auto it = snap->projects.find(std::string(alias));
    if (it == snap->projects.end()) return std::nullopt;
    return it->second; // copy
}

//------------------------------- Mutations ------------------------------------

void LookupCache::publish(std::shared_ptr<Tables> next) {
    std::shared_ptr<const Tables> cnext = std::move(next); // convert Tables -> const Tables
    std::atomic_store_explicit(&tables_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

CacheErr LookupCache::upsert_node(std::string_view alias, NodeRecord record) {
    if (!validate_alias(alias) || !validate_node(record)) return CacheErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->nodes.size() >= Limits::MaxNodes && !snap->nodes.count(std::string(alias)))
        return CacheErr::Capacity;
    auto next = std::make_shared<Tables>(*snap); // copy-on-write
    next->nodes.insert_or_assign(std::string(alias), std::move(record));
    publish(std::move(next));
    return CacheErr::Ok;
}

CacheErr LookupCache::upsert_project(std::string_view alias, ProjectRecord record) {
    if (!validate_alias(alias) || !validate_project(record)) return CacheErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->projects.size() >= Limits::MaxProjects && !snap->projects.count(std::string(alias)))
        return CacheErr::Capacity;
    auto next = std::make_shared<Tables>(*snap);
    next->projects.insert_or_assign(std::string(alias), std::move(record));
    publish(std::move(next));
    return CacheErr::Ok;
}

bool LookupCache::remove_node(std::string_view alias) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap->nodes.count(std::string(alias))) return false;
    auto next = std::make_shared<Tables>(*snap);
    next->nodes.erase(std::string(alias));
    publish(std::move(next));
    return true;
}

bool LookupCache::remove_project(std::string_view alias) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap->projects.count(std::string(alias))) return false;
    auto next = std::make_shared<Tables>(*snap);
    next->projects.erase(std::string(alias));
    publish(std::move(next));
    return true;
}

CacheErr LookupCache::merge_projects(const ProjectMap& projects) {
    // Validate the whole batch before publishing anything.
    for (const auto& [alias, rec] : projects)
        if (!validate_alias(alias) || !validate_project(rec)) return CacheErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto next = std::make_shared<Tables>(*snap);
    for (const auto& [alias, rec] : projects) next->projects.insert_or_assign(alias, rec);
    if (next->projects.size() > Limits::MaxProjects) return CacheErr::Capacity;
    publish(std::move(next));
    return CacheErr::Ok;
}

CacheErr LookupCache::load(const NodeMap& nodes, const ProjectMap& projects) {
    for (const auto& [alias, rec] : nodes)
        if (!validate_alias(alias) || !validate_node(rec)) return CacheErr::Invalid;
    for (const auto& [alias, rec] : projects)
        if (!validate_alias(alias) || !validate_project(rec)) return CacheErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<Tables>(*snapshot());
    for (const auto& [alias, rec] : nodes)    next->nodes.insert_or_assign(alias, rec);
    for (const auto& [alias, rec] : projects) next->projects.insert_or_assign(alias, rec);
    if (next->nodes.size() > Limits::MaxNodes || next->projects.size() > Limits::MaxProjects)
        return CacheErr::Capacity;
    publish(std::move(next));
    return CacheErr::Ok;
}

void LookupCache::attach_directory(std::shared_ptr<ProjectDirectory> directory) {
    std::lock_guard<std::mutex> lk(write_mu_);
    directory_ = std::move(directory);
}

std::shared_ptr<ProjectDirectory> LookupCache::directory() const {
    std::lock_guard<std::mutex> lk(write_mu_);
    return directory_;
}

//------------------------------- Refresh --------------------------------------

Result<void> LookupCache::refresh_projects(std::string_view acting_node,
                                           const MultiAddr& route_to_authority) {
    refreshes_.fetch_add(1, std::memory_order_relaxed);

    auto dir = directory(); // copy the handle; lock released before the remote call
    if (!dir) {
        return make_error(Errc::RemoteRefreshFailed,
                          "no project directory attached for node " + std::string(acting_node));
    }

    auto fetched = dir->list_projects(acting_node, route_to_authority);
    if (!fetched) {
        obs::emit(observer_, obs::EventKind::Failure, std::string(acting_node),
                  std::string(to_string(fetched.error().code)));
        if (fetched.error().code == Errc::RemoteRefreshFailed) return forward_error(std::move(fetched.error()));
        return make_error(Errc::RemoteRefreshFailed,
                          "project refresh failed: " + fetched.error().message);
    }

    if (merge_projects(*fetched) != CacheErr::Ok) {
        return make_error(Errc::RemoteRefreshFailed,
                          "project directory returned invalid records for node " + std::string(acting_node));
    }

    obs::emit(observer_, obs::EventKind::ProjectRefresh, std::string(acting_node),
              std::to_string(fetched->size()) + " projects");
    return {};
}

} // namespace relaygate::addr
