/**
 * @file multiaddr.hpp
 * @brief Multi-protocol address model: typed segments in traversal order.
 *
 * A MultiAddr mixes logical aliases (node, project) with concrete network
 * primitives (dnsaddr, ip4, ip6, tcp) and worker names (service, secure).
 * Textual form: "/node/a/project/p/tcp/4000". Segment order is the order in
 * which a route is traversed and is preserved by every transformation.
 */
#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "relaygate/core/error.hpp"

namespace relaygate::addr {

/**
 * @brief Protocol code of a segment.
 *
 * @note Node and Project are logical and must be resolved before a route can
 *       be used; everything else passes through resolution verbatim.
 */
enum class Proto : std::uint8_t {
    Node,
    Project,
    DnsAddr,
    Ip4,
    Ip6,
    Tcp,
    Service,
    Secure
};

/// Textual tag for a protocol code ("node", "ip4", ...).
std::string_view tag_of(Proto p) noexcept;

/// Reverse of tag_of(); nullopt for unknown tags.
std::optional<Proto> proto_from_tag(std::string_view tag) noexcept;

using Ip4Octets = std::array<std::uint8_t, 4>;
using Ip6Octets = std::array<std::uint8_t, 16>;

/// Dotted / colon notation via inet_ntop.
std::string format_ip4(const Ip4Octets& o);
std::string format_ip6(const Ip6Octets& o);

/**
 * @brief One protocol segment: code + typed value.
 *
 * Factory functions always produce well-formed segments. The raw constructor
 * accepts any pairing so that a segment decoded from elsewhere can carry a
 * mismatched value; the typed accessors then fail with InvalidSegment.
 */
class Segment final {
public:
    using Value = std::variant<std::string, Ip4Octets, Ip6Octets, std::uint16_t>;

    Segment(Proto code, Value value) : code_(code), value_(std::move(value)) {}

    static Segment node(std::string_view alias)    { return {Proto::Node,    std::string(alias)}; }
    static Segment project(std::string_view alias) { return {Proto::Project, std::string(alias)}; }
    static Segment dns(std::string_view host)      { return {Proto::DnsAddr, std::string(host)}; }
    static Segment ip4(Ip4Octets octets)           { return {Proto::Ip4,     octets}; }
    static Segment ip6(Ip6Octets octets)           { return {Proto::Ip6,     octets}; }
    static Segment tcp(std::uint16_t port)         { return {Proto::Tcp,     port}; }
    static Segment service(std::string_view name)  { return {Proto::Service, std::string(name)}; }
    static Segment secure(std::string_view name)   { return {Proto::Secure,  std::string(name)}; }

    Proto code() const noexcept { return code_; }
    const Value& value() const noexcept { return value_; }

    /// True when the value alternative matches what the code requires.
    [[nodiscard]] bool well_formed() const noexcept;

    /// Name-valued segments (node, project, dnsaddr, service, secure).
    [[nodiscard]] Result<std::string_view> as_name() const;
    [[nodiscard]] Result<Ip4Octets>        as_ip4() const;
    [[nodiscard]] Result<Ip6Octets>        as_ip6() const;
    [[nodiscard]] Result<std::uint16_t>    as_port() const;

    /// "/tag/value"
    std::string to_string() const;

    bool operator==(const Segment&) const = default;

private:
    Proto code_;
    Value value_;
};

/**
 * @brief Ordered sequence of segments.
 */
class MultiAddr final {
public:
    using Segments       = std::vector<Segment>;
    using const_iterator = Segments::const_iterator;

    MultiAddr() = default;
    explicit MultiAddr(Segments segs) : segs_(std::move(segs)) {}
    MultiAddr(std::initializer_list<Segment> segs) : segs_(segs) {}

    /**
     * @brief Parse "/tag/value/tag/value...". "" and "/" give the empty address.
     * @return InvalidAddress on unknown tags, missing values or bad literals.
     */
    static Result<MultiAddr> parse(std::string_view text);

    void push_back(Segment s) { segs_.push_back(std::move(s)); }

    /// Append every segment of other, in order.
    void extend(const MultiAddr& other);

    const_iterator begin() const noexcept { return segs_.begin(); }
    const_iterator end() const noexcept { return segs_.end(); }
    std::size_t size() const noexcept { return segs_.size(); }
    bool empty() const noexcept { return segs_.empty(); }
    const Segment& operator[](std::size_t i) const { return segs_[i]; }

    std::string to_string() const;

    bool operator==(const MultiAddr&) const = default;

private:
    Segments segs_;
};

/**
 * @brief Whether an unresolved address targets the issuing process's own node.
 *
 * Judged from the first segment only: node -> local, dnsaddr "localhost" and
 * loopback ip4/ip6 -> local, project -> remote. The empty address is self.
 * Any other leading segment is rejected with InvalidAddress.
 */
Result<bool> is_local_node(const MultiAddr& addr);

/// Last non-empty '/'-separated element ("/node/n1" -> "n1", "n1" -> "n1").
std::string final_element(std::string_view text);

} // namespace relaygate::addr
