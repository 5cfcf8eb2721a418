/**
 * @file multiaddr.cpp
 * @brief Parsing, rendering and typed casts for MultiAddr segments.
 */
#include "relaygate/addr/multiaddr.hpp"
#include "relaygate/config/constants.hpp"

#include <charconv>
#include <type_traits>
#include <arpa/inet.h>

namespace relaygate::addr {

namespace {

struct TagEntry {
    Proto            code;
    std::string_view tag;
};

constexpr std::array<TagEntry, 8> kTags{{
    {Proto::Node,    "node"},
    {Proto::Project, "project"},
    {Proto::DnsAddr, "dnsaddr"},
    {Proto::Ip4,     "ip4"},
    {Proto::Ip6,     "ip6"},
    {Proto::Tcp,     "tcp"},
    {Proto::Service, "service"},
    {Proto::Secure,  "secure"},
}};

bool is_name_proto(Proto p) noexcept {
    return p == Proto::Node || p == Proto::Project || p == Proto::DnsAddr ||
           p == Proto::Service || p == Proto::Secure;
}

std::string invalid_cast(Proto p) {
    return "segment value does not match protocol /" + std::string(tag_of(p));
}

Result<Segment> parse_segment(Proto code, std::string_view value) {
    const std::string v(value);
    switch (code) {
        case Proto::Ip4: {
            Ip4Octets o{};
            if (::inet_pton(AF_INET, v.c_str(), o.data()) != 1)
                return make_error(Errc::InvalidAddress, "invalid ip4 literal '" + v + "'");
            return Segment::ip4(o);
        }
        case Proto::Ip6: {
            Ip6Octets o{};
            if (::inet_pton(AF_INET6, v.c_str(), o.data()) != 1)
                return make_error(Errc::InvalidAddress, "invalid ip6 literal '" + v + "'");
            return Segment::ip6(o);
        }
        case Proto::Tcp: {
            std::uint16_t port{0};
            const auto* first = value.data();
            const auto* last  = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(first, last, port);
            if (ec != std::errc{} || ptr != last)
                return make_error(Errc::InvalidAddress, "invalid tcp port '" + v + "'");
            return Segment::tcp(port);
        }
        default:
            return Segment(code, v);
    }
}

} // namespace

std::string format_ip4(const Ip4Octets& o) {
    char buf[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, o.data(), buf, sizeof(buf));
    return buf;
}

std::string format_ip6(const Ip6Octets& o) {
    char buf[INET6_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET6, o.data(), buf, sizeof(buf));
    return buf;
}

std::string_view tag_of(Proto p) noexcept {
    for (const auto& e : kTags) if (e.code == p) return e.tag;
    return "unknown";
}

std::optional<Proto> proto_from_tag(std::string_view tag) noexcept {
    for (const auto& e : kTags) if (e.tag == tag) return e.code;
    return std::nullopt;
}

//------------------------------- Segment --------------------------------------

bool Segment::well_formed() const noexcept {
    switch (code_) {
        case Proto::Ip4: return std::holds_alternative<Ip4Octets>(value_);
        case Proto::Ip6: return std::holds_alternative<Ip6Octets>(value_);
        case Proto::Tcp: return std::holds_alternative<std::uint16_t>(value_);
        default:
            if (const auto* s = std::get_if<std::string>(&value_)) return !s->empty();
            return false;
    }
}

Result<std::string_view> Segment::as_name() const {
    const auto* s = std::get_if<std::string>(&value_);
    if (!is_name_proto(code_) || !s || s->empty())
        return make_error(Errc::InvalidSegment, invalid_cast(code_));
    return std::string_view(*s);
}

Result<Ip4Octets> Segment::as_ip4() const {
    const auto* o = std::get_if<Ip4Octets>(&value_);
    if (code_ != Proto::Ip4 || !o) return make_error(Errc::InvalidSegment, invalid_cast(code_));
    return *o;
}

Result<Ip6Octets> Segment::as_ip6() const {
    const auto* o = std::get_if<Ip6Octets>(&value_);
    if (code_ != Proto::Ip6 || !o) return make_error(Errc::InvalidSegment, invalid_cast(code_));
    return *o;
}

Result<std::uint16_t> Segment::as_port() const {
    const auto* p = std::get_if<std::uint16_t>(&value_);
    if (code_ != Proto::Tcp || !p) return make_error(Errc::InvalidSegment, invalid_cast(code_));
    return *p;
}

std::string Segment::to_string() const {
    std::string out = "/";
    out.append(tag_of(code_));
    out.push_back('/');
    std::visit([&](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>)        out.append(v);
        else if constexpr (std::is_same_v<V, Ip4Octets>)     out.append(format_ip4(v));
        else if constexpr (std::is_same_v<V, Ip6Octets>)     out.append(format_ip6(v));
        else                                                 out.append(std::to_string(v));
    }, value_);
    return out;
}

//------------------------------- MultiAddr ------------------------------------

Result<MultiAddr> MultiAddr::parse(std::string_view text) {
    MultiAddr out;
    if (text.empty() || text == "/") return out;
    if (text.front() != '/')
        return make_error(Errc::InvalidAddress, "address must start with '/': " + std::string(text));

    // Split into elements; a trailing '/' is tolerated.
    std::vector<std::string_view> parts;
    std::size_t pos = 1;
    while (pos <= text.size()) {
        const auto next = text.find('/', pos);
        const auto stop = (next == std::string_view::npos) ? text.size() : next;
        parts.push_back(text.substr(pos, stop - pos));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    if (!parts.empty() && parts.back().empty()) parts.pop_back();

    for (std::size_t i = 0; i < parts.size(); i += 2) {
        const auto proto = proto_from_tag(parts[i]);
        if (!proto)
            return make_error(Errc::InvalidAddress, "unknown protocol '" + std::string(parts[i]) + "'");
        if (i + 1 >= parts.size() || parts[i + 1].empty())
            return make_error(Errc::InvalidAddress, "missing value for /" + std::string(parts[i]));
        auto seg = parse_segment(*proto, parts[i + 1]);
        if (!seg) return forward_error(std::move(seg.error()));
        out.push_back(std::move(*seg));
    }
    return out;
}

void MultiAddr::extend(const MultiAddr& other) {
    segs_.insert(segs_.end(), other.segs_.begin(), other.segs_.end());
}

std::string MultiAddr::to_string() const {
    if (segs_.empty()) return "/";
    std::string out;
    for (const auto& s : segs_) out.append(s.to_string());
    return out;
}

//------------------------------- Helpers --------------------------------------

Result<bool> is_local_node(const MultiAddr& addr) {
    if (addr.empty()) return true;
    const Segment& first = addr[0];
    switch (first.code()) {
        case Proto::Node:
            return true;
        case Proto::Project:
            return false;
        case Proto::DnsAddr: {
            auto host = first.as_name();
            if (!host) return forward_error(std::move(host.error()));
            return *host == config::constants::LOCALHOST_NAME;
        }
        case Proto::Ip4: {
            auto ip = first.as_ip4();
            if (!ip) return forward_error(std::move(ip.error()));
            return (*ip)[0] == config::constants::IP4_LOOPBACK_FIRST_OCTET;
        }
        case Proto::Ip6: {
            auto ip = first.as_ip6();
            if (!ip) return forward_error(std::move(ip.error()));
            Ip6Octets loopback{};
            loopback[15] = 1;
            return *ip == loopback;
        }
        default:
            return make_error(Errc::InvalidAddress,
                              "address must start with a node, host or project: " + addr.to_string());
    }
}

std::string final_element(std::string_view text) {
    while (!text.empty() && text.back() == '/') text.remove_suffix(1);
    const auto slash = text.rfind('/');
    if (slash == std::string_view::npos) return std::string(text);
    return std::string(text.substr(slash + 1));
}

} // namespace relaygate::addr
