#pragma once
/**
 * @file access_control.hpp
 * @brief Composable message-flow authorization.
 *
 * Every policy answers is_authorized(msg) with Result<bool>:
 *   - true  → the message may proceed
 *   - false → the message is dropped
 *   - error → the check itself failed; the caller must treat this as a hard
 *             delivery failure, never as an implicit allow or deny.
 *
 * Policy trees are immutable once built and shared through
 * shared_ptr<const AccessControl>, so one tree may be evaluated from many
 * worker threads at once. A policy with internal state (rate limit, cache)
 * synchronizes it itself; combinators never see it.
 */

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "relaygate/access/local_message.hpp"
#include "relaygate/core/error.hpp"

namespace relaygate::access {

/**
 * @class AccessControl
 * @brief Authorization capability consulted once per inbound message.
 *
 * Evaluation is a synchronous call. An implementation may block (for example
 * on a remote attribute or credential lookup); the caller's thread waits and
 * combinators do not evaluate the next child until it returns. Implementations
 * must not hold a lock shared with the delivery path while blocked, and must
 * be safe to call from several threads at once.
 */
class AccessControl {
public:
    virtual ~AccessControl() = default;

    /// Return true if the message is allowed to pass, and false if not.
    virtual Result<bool> is_authorized(const LocalMessage& msg) const = 0;
};

using PolicyPtr  = std::shared_ptr<const AccessControl>;
using PolicyList = std::vector<PolicyPtr>;

/// Verdict helpers.
inline Result<bool> allow() { return true; }
inline Result<bool> deny()  { return false; }

/// Always permits; does not inspect the message.
class AllowAll final : public AccessControl {
public:
    Result<bool> is_authorized(const LocalMessage&) const override { return allow(); }
};

/// Always denies; does not inspect the message.
class DenyAll final : public AccessControl {
public:
    Result<bool> is_authorized(const LocalMessage&) const override { return deny(); }
};

/**
 * @class All
 * @brief Conjunction, evaluated left to right.
 *
 * Stops at the first false or the first error. Empty → true.
 */
class All final : public AccessControl {
public:
    explicit All(PolicyList children) noexcept : children_(std::move(children)) {}

    Result<bool> is_authorized(const LocalMessage& msg) const override;

    const PolicyList& children() const noexcept { return children_; }

private:
    const PolicyList children_;
};

/**
 * @class Any
 * @brief Disjunction, evaluated left to right.
 *
 * Stops at the first true or the first error. Empty → false.
 */
class Any final : public AccessControl {
public:
    explicit Any(PolicyList children) noexcept : children_(std::move(children)) {}

    Result<bool> is_authorized(const LocalMessage& msg) const override;

    const PolicyList& children() const noexcept { return children_; }

private:
    const PolicyList children_;
};

/**
 * @class Predicate
 * @brief User-supplied check. The callable must be safe to call concurrently.
 */
class Predicate final : public AccessControl {
public:
    using Fn = std::function<Result<bool>(const LocalMessage&)>;

    explicit Predicate(Fn fn) : fn_(std::move(fn)) {}

    Result<bool> is_authorized(const LocalMessage& msg) const override;

private:
    const Fn fn_;
};

// --------------------------- Factories --------------------------------------

PolicyPtr make_allow_all();
PolicyPtr make_deny_all();
PolicyPtr make_all(PolicyList children);
PolicyPtr make_any(PolicyList children);
PolicyPtr make_predicate(Predicate::Fn fn);

/// Message is authorized only if its onward route is headed by one of allowed.
PolicyPtr make_recipient_allowlist(std::vector<std::string> allowed);

} // namespace relaygate::access
