#pragma once
// relaygate — LookupCache
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: resolvers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers copy both tables, mutate, and atomically swap with RELEASE semantics.
//   • Writers are serialized by a mutex held only for copy-and-swap, never across a
//     ProjectDirectory call; readers never block.
//   • Records are published whole: a reader sees the old record or the new one, never a mix.


#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "relaygate/addr/lookup.hpp"
#include "relaygate/obs/observability.hpp"

namespace relaygate::addr {

// -----------------------------------------------------------------------------
// Result codes for cache mutations.
// -----------------------------------------------------------------------------
enum class CacheErr {
    Ok,         ///< Mutation published.
    Invalid,    ///< Alias or record failed validation.
    Capacity    ///< Rejected by configured limits.
};

/// Compile-time capacity and field limits.
struct Limits {
    static constexpr std::size_t MaxNodes       = 1024;
    static constexpr std::size_t MaxProjects    = 1024;
    static constexpr std::size_t MaxAliasLen    = 64;
    static constexpr std::size_t MaxIdentityLen = 256;
};

// -----------------------------------------------------------------------------
// LookupCache class
// -----------------------------------------------------------------------------
///
/// Process-wide node/project cache with lazy project repopulation.
/// Owned explicitly by the caller and handed to resolvers by reference.
///
/// Lifecycle:
///   - populated at start from persisted config (config::Loader::apply)
///   - project table mutated by refresh_projects() from the attached directory
///   - read by RouteResolver through the AddressLookup interface
///
class LookupCache final : public AddressLookup {
public:
    struct Tables {
        NodeMap    nodes;
        ProjectMap projects;
    };

    explicit LookupCache(std::shared_ptr<ProjectDirectory> directory = nullptr,
                         obs::Observer* observer = nullptr);

    // --------------------------- AddressLookup -------------------------------
    std::optional<NodeRecord>    get_node(std::string_view alias) const override;
    std::optional<ProjectRecord> get_project(std::string_view alias) const override;

    /// Calls the directory without holding any lock, then merges the records.
    Result<void> refresh_projects(std::string_view acting_node,
                                  const MultiAddr& route_to_authority) override;

    // --------------------------- RCU Snapshot API ----------------------------
    std::shared_ptr<const Tables> snapshot() const noexcept;

    /// Monotonic version counter. Increments on every published mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    CacheErr upsert_node(std::string_view alias, NodeRecord record);
    CacheErr upsert_project(std::string_view alias, ProjectRecord record);
    bool remove_node(std::string_view alias);
    bool remove_project(std::string_view alias);

    /// Merge a batch of project records (last writer wins per alias).
    CacheErr merge_projects(const ProjectMap& projects);

    /// Merge nodes and projects as one publication; nothing is applied if any
    /// record is rejected.
    CacheErr load(const NodeMap& nodes, const ProjectMap& projects);

    /// Attach or replace the remote authority used by refresh_projects().
    void attach_directory(std::shared_ptr<ProjectDirectory> directory);

    [[nodiscard]] std::size_t refresh_count() const noexcept { return refreshes_.load(std::memory_order_relaxed); }

    static bool validate_alias(std::string_view alias) noexcept;
    static bool validate_node(const NodeRecord& n) noexcept;
    /// Identity present and route concrete: no node or project segments left.
    static bool validate_project(const ProjectRecord& p) noexcept;

private:
    std::shared_ptr<const Tables> tables_{std::make_shared<Tables>()};
    std::shared_ptr<ProjectDirectory> directory_;
    obs::Observer* observer_{nullptr};

    mutable std::mutex write_mu_;   // serializes copy-and-swap; never held across I/O
    std::atomic<uint64_t> version_{0};
    std::atomic<std::size_t> refreshes_{0};

    std::shared_ptr<ProjectDirectory> directory() const;
    void publish(std::shared_ptr<Tables> next);
};

} // namespace relaygate::addr
