/**
 * @file test_resolver.cpp
 * @brief Tests for RouteResolver against an injected lookup.
 *
 * Validates:
 *  - Pass-through of concrete segments, order preserved
 *  - Node expansion (host by record tag, then port)
 *  - Project splicing + identity entries
 *  - Exactly one refresh per missing project, no retry loop
 *  - Error propagation (UnknownNode, UnknownProject, InvalidSegment, RemoteRefreshFailed)
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

#include "fake_lookup.hpp"
#include "relaygate/addr/lookup_cache.hpp"
#include "relaygate/obs/observability.hpp"
#include "relaygate/route/route_resolver.hpp"

using relaygate::Errc;
using relaygate::Error;
using relaygate::Result;
using relaygate::addr::Ip6Octets;
using relaygate::addr::MultiAddr;
using relaygate::addr::NodeRecord;
using relaygate::addr::ProjectRecord;
using relaygate::addr::Proto;
using relaygate::addr::Segment;
using relaygate::route::IdentityEntry;
using relaygate::route::RefreshContext;
using relaygate::route::RouteResolver;
using relaygate::testing::FakeLookup;

static RefreshContext ctx() {
  return RefreshContext{"n1", MultiAddr{Segment::dns("orchestrator.example"), Segment::tcp(443)}};
}

// --------------------------- Pass-through ------------------------------------

/**
 * @test Resolve_Concrete_Address_Unchanged
 * @brief No node/project segments → route equals input, no identities, no refresh.
 */
TEST(RouteResolver, Resolve_Concrete_Address_Unchanged) {
  FakeLookup lookup;
  RouteResolver r(lookup);

  const MultiAddr in{Segment::dns("relay.example"), Segment::tcp(4000), Segment::service("api"),
                     Segment::secure("sc")};
  auto res = r.resolve(in, ctx());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->route, in);
  EXPECT_TRUE(res->identities.empty());
  EXPECT_EQ(lookup.refreshes, 0);
}

TEST(RouteResolver, Resolve_Empty_Is_Self) {
  FakeLookup lookup;
  RouteResolver r(lookup);
  auto res = r.resolve(MultiAddr{}, ctx());
  ASSERT_TRUE(res);
  EXPECT_TRUE(res->route.empty());
  EXPECT_TRUE(res->identities.empty());
}

// --------------------------- Nodes -------------------------------------------

static_assert(std::is_default_constructible_v<NodeRecord>);

/**
 * @test Node records can be stored through map subscripting and keep the
 *       alternative they were assigned.
 */
TEST(RouteResolver, Node_Record_Assignable_Through_Subscript) {
  FakeLookup lookup;
  lookup.nodes["a"] = NodeRecord{NodeRecord::V4{{10, 0, 0, 1}, 4000}};
  lookup.nodes["a"] = NodeRecord{NodeRecord::Dns{"node-a.example", 4001}};

  const auto rec = lookup.get_node("a");
  ASSERT_TRUE(rec);
  EXPECT_TRUE(std::holds_alternative<NodeRecord::Dns>(rec->addr));
  EXPECT_EQ(rec->port(), 4001);
}

TEST(RouteResolver, Node_Dns_Appends_Host_Then_Port) {
  FakeLookup lookup;
  lookup.nodes["a"] = NodeRecord{NodeRecord::Dns{"node-a.example", 6000}};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::node("a")}, ctx());
  ASSERT_TRUE(res);
  ASSERT_EQ(res->route.size(), 2u);
  EXPECT_EQ(res->route[0], Segment::dns("node-a.example"));
  EXPECT_EQ(res->route[1], Segment::tcp(6000));
}

TEST(RouteResolver, Node_Host_Encoding_Follows_Record_Tag) {
  Ip6Octets v6{};
  v6[15] = 1;
  FakeLookup lookup;
  lookup.nodes["v6"]  = NodeRecord{NodeRecord::V6{v6, 7000}};
  // A DNS record whose host looks like an IP is still emitted as dnsaddr.
  lookup.nodes["dns"] = NodeRecord{NodeRecord::Dns{"10.9.9.9", 7001}};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::node("v6"), Segment::node("dns")}, ctx());
  ASSERT_TRUE(res);
  const MultiAddr expected{Segment::ip6(v6), Segment::tcp(7000),
                           Segment::dns("10.9.9.9"), Segment::tcp(7001)};
  EXPECT_EQ(res->route, expected);
}

TEST(RouteResolver, Unknown_Node_Fails_Without_Refresh) {
  FakeLookup lookup;
  RouteResolver r(lookup);
  auto res = r.resolve(MultiAddr{Segment::node("ghost")}, ctx());
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().code, Errc::UnknownNode);
  EXPECT_EQ(lookup.refreshes, 0);
}

TEST(RouteResolver, Corrupted_Segment_Is_InvalidSegment) {
  FakeLookup lookup;
  RouteResolver r(lookup);
  const MultiAddr in{Segment::tcp(1), Segment(Proto::Project, std::uint16_t{9})};
  auto res = r.resolve(in, ctx());
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().code, Errc::InvalidSegment);
  EXPECT_EQ(lookup.refreshes, 0);
}

// --------------------------- Projects ----------------------------------------

/**
 * @test End_To_End_Node_Then_Project
 * @brief [Node a, Project p] → [Ip4(10.0.0.1), Tcp(4000), Tcp(5000)] + {[Tcp(5000)]: id-p}.
 */
TEST(RouteResolver, End_To_End_Node_Then_Project) {
  FakeLookup lookup;
  lookup.nodes["a"]    = NodeRecord{NodeRecord::V4{{10, 0, 0, 1}, 4000}};
  lookup.projects["p"] = ProjectRecord{MultiAddr{Segment::tcp(5000)}, "id-p"};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::node("a"), Segment::project("p")}, ctx());
  ASSERT_TRUE(res) << res.error().message;

  const MultiAddr expected{Segment::ip4({10, 0, 0, 1}), Segment::tcp(4000), Segment::tcp(5000)};
  EXPECT_EQ(res->route, expected);
  ASSERT_EQ(res->identities.size(), 1u);
  EXPECT_EQ(res->identities[0], (IdentityEntry{MultiAddr{Segment::tcp(5000)}, "id-p"}));
  EXPECT_EQ(lookup.refreshes, 0);
}

TEST(RouteResolver, Project_Route_Spliced_Whole) {
  FakeLookup lookup;
  const MultiAddr proute{Segment::dns("p.cloud.example"), Segment::tcp(4000), Segment::service("api")};
  lookup.projects["p"] = ProjectRecord{proute, "id-p"};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::project("p"), Segment::service("echo")}, ctx());
  ASSERT_TRUE(res);
  MultiAddr expected = proute;
  expected.push_back(Segment::service("echo"));
  EXPECT_EQ(res->route, expected);
}

TEST(RouteResolver, Missing_Project_Found_After_One_Refresh) {
  FakeLookup lookup;
  lookup.after_refresh["p"] = ProjectRecord{MultiAddr{Segment::tcp(5000)}, "id-p"};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::project("p")}, ctx());
  ASSERT_TRUE(res);
  EXPECT_EQ(lookup.refreshes, 1);
  EXPECT_EQ(lookup.last_acting_node, "n1");
  EXPECT_EQ(lookup.last_authority, ctx().authority_route);
  ASSERT_EQ(res->identities.size(), 1u);
  EXPECT_EQ(res->identities[0].identity_id, "id-p");
}

TEST(RouteResolver, Missing_Project_Still_Missing_Fails_After_One_Refresh) {
  FakeLookup lookup;
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::project("nope")}, ctx());
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().code, Errc::UnknownProject);
  EXPECT_EQ(lookup.refreshes, 1);
}

TEST(RouteResolver, Repeated_Project_Gives_Repeated_Entries) {
  FakeLookup lookup;
  lookup.after_refresh["q"] = ProjectRecord{MultiAddr{Segment::tcp(5001)}, "id-q"};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::project("q"), Segment::project("q")}, ctx());
  ASSERT_TRUE(res);
  // The first segment refreshed; the second found the record already cached.
  EXPECT_EQ(lookup.refreshes, 1);
  EXPECT_EQ(res->route, (MultiAddr{Segment::tcp(5001), Segment::tcp(5001)}));
  ASSERT_EQ(res->identities.size(), 2u);
  EXPECT_EQ(res->identities[0], res->identities[1]);
}

TEST(RouteResolver, Refresh_Failure_Propagates_Unchanged) {
  FakeLookup lookup;
  lookup.refresh_error = Error{Errc::RemoteRefreshFailed, "authority unreachable"};
  RouteResolver r(lookup);

  auto res = r.resolve(MultiAddr{Segment::tcp(1), Segment::project("p")}, ctx());
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), *lookup.refresh_error);
  EXPECT_EQ(lookup.refreshes, 1);
}

// --------------------------- With LookupCache ---------------------------------

namespace {
class CountingDirectory final : public relaygate::addr::ProjectDirectory {
public:
  Result<relaygate::addr::ProjectMap> list_projects(std::string_view,
                                                    const MultiAddr&) override {
    ++calls;
    return relaygate::addr::ProjectMap{
      {"p", ProjectRecord{MultiAddr{Segment::tcp(5000)}, "id-p"}}};
  }
  int calls{0};
};
} // namespace

TEST(RouteResolver, Cache_Refresh_Populates_For_Later_Calls) {
  auto dir = std::make_shared<CountingDirectory>();
  relaygate::addr::LookupCache cache(dir);
  RouteResolver r(cache);

  auto first = r.resolve(MultiAddr{Segment::project("p")}, ctx());
  ASSERT_TRUE(first);
  auto second = r.resolve(MultiAddr{Segment::project("p")}, ctx());
  ASSERT_TRUE(second);
  EXPECT_EQ(dir->calls, 1);
  EXPECT_EQ(first->route, second->route);
}

namespace {
/// Holds every caller inside list_projects() until `expected` callers arrived.
class RendezvousDirectory final : public relaygate::addr::ProjectDirectory {
public:
  explicit RendezvousDirectory(int expected) : expected_(expected) {}

  Result<relaygate::addr::ProjectMap> list_projects(std::string_view,
                                                    const MultiAddr&) override {
    calls.fetch_add(1);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (calls.load() < expected_ && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return relaygate::addr::ProjectMap{
      {"p", ProjectRecord{MultiAddr{Segment::dns("p.example"), Segment::tcp(5000)}, "id-p"}}};
  }

  std::atomic<int> calls{0};

private:
  int expected_;
};
} // namespace

/**
 * @test Concurrent resolutions of the same missing project each refresh once
 *       (no deduplication), the directory is entered without a lock held, and
 *       every caller gets the whole record.
 */
TEST(RouteResolver, Concurrent_Misses_Each_Refresh_And_Succeed) {
  constexpr int kThreads = 4;
  auto dir = std::make_shared<RendezvousDirectory>(kThreads);
  relaygate::addr::LookupCache cache(dir);
  RouteResolver r(cache);

  std::atomic<int> ok{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < kThreads; ++i) {
    workers.emplace_back([&] {
      auto res = r.resolve(MultiAddr{Segment::project("p")}, ctx());
      if (res && res->identities.size() == 1 &&
          res->identities[0].identity_id == "id-p" &&
          res->route == MultiAddr{Segment::dns("p.example"), Segment::tcp(5000)})
        ok.fetch_add(1);
    });
  }
  for (auto& t : workers) t.join();

  EXPECT_EQ(ok.load(), kThreads);
  EXPECT_EQ(dir->calls.load(), kThreads);
  EXPECT_EQ(cache.refresh_count(), static_cast<std::size_t>(kThreads));
  EXPECT_EQ(cache.get_project("p")->identity_id, "id-p");
}

// --------------------------- Observability ----------------------------------

TEST(RouteResolver, Observer_Counts_Resolutions_And_Failures) {
  auto* observer = relaygate::obs::make_simple_observer();
  const auto before = observer->snapshot();

  FakeLookup lookup;
  RouteResolver r(lookup, observer);
  ASSERT_TRUE(r.resolve(MultiAddr{Segment::tcp(1)}, ctx()));
  ASSERT_FALSE(r.resolve(MultiAddr{Segment::node("ghost")}, ctx()));

  const auto after = observer->snapshot();
  EXPECT_EQ(after.resolutions, before.resolutions + 1);
  EXPECT_EQ(after.failures, before.failures + 1);
}
