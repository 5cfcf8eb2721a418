/**
 * @file access_control.cpp
 * @brief Combinator evaluation. Children are consulted strictly in order.
 */
#include "relaygate/access/access_control.hpp"

#include <algorithm>

namespace relaygate::access {

Result<bool> All::is_authorized(const LocalMessage& msg) const {
    for (const auto& child : children_) {
        if (!child) return make_error(Errc::AuthorizationCheckFailed, "empty policy slot");
        auto verdict = child->is_authorized(msg);
        if (!verdict) return verdict;        // error: propagate as is
        if (!*verdict) return deny();
    }
    return allow();
}

Result<bool> Any::is_authorized(const LocalMessage& msg) const {
    for (const auto& child : children_) {
        if (!child) return make_error(Errc::AuthorizationCheckFailed, "empty policy slot");
        auto verdict = child->is_authorized(msg);
        if (!verdict) return verdict;        // no earlier child said yes
        if (*verdict) return allow();
    }
    return deny();
}

Result<bool> Predicate::is_authorized(const LocalMessage& msg) const {
    if (!fn_) return make_error(Errc::AuthorizationCheckFailed, "predicate policy has no check");
    return fn_(msg);
}

PolicyPtr make_allow_all() { return std::make_shared<const AllowAll>(); }
PolicyPtr make_deny_all()  { return std::make_shared<const DenyAll>(); }

PolicyPtr make_all(PolicyList children) {
    return std::make_shared<const All>(std::move(children));
}

PolicyPtr make_any(PolicyList children) {
    return std::make_shared<const Any>(std::move(children));
}

PolicyPtr make_predicate(Predicate::Fn fn) {
    return std::make_shared<const Predicate>(std::move(fn));
}

PolicyPtr make_recipient_allowlist(std::vector<std::string> allowed) {
    return make_predicate([allowed = std::move(allowed)](const LocalMessage& msg) -> Result<bool> {
        if (msg.onward_route.empty())
            return make_error(Errc::AuthorizationCheckFailed, "message has no recipient");
        const auto& recipient = msg.onward_route.front();
        return std::find(allowed.begin(), allowed.end(), recipient) != allowed.end();
    });
}

} // namespace relaygate::access
