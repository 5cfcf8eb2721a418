#include "relaygate/access/delivery_gate.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr

namespace relaygate::access {

DeliveryGate::DeliveryGate(std::string worker, PolicyPtr policy, Handler handler,
                           obs::Observer* observer)
    : worker_(std::move(worker)), policy_(std::move(policy)),
      handler_(std::move(handler)), observer_(observer) {}

PolicyPtr DeliveryGate::policy() const noexcept {
    return std::atomic_load_explicit(&policy_, std::memory_order_acquire);
}

void DeliveryGate::rebind(PolicyPtr policy) noexcept {
    std::atomic_store_explicit(&policy_, std::move(policy), std::memory_order_release);
}

Result<bool> DeliveryGate::deliver(const LocalMessage& msg) {
    const auto p = policy();
    if (!p) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        obs::emit(observer_, obs::EventKind::AuthorizationFailed, worker_, "no policy bound");
        return make_error(Errc::AuthorizationCheckFailed, "no policy bound to worker " + worker_);
    }

    auto verdict = p->is_authorized(msg);
    if (!verdict) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        obs::emit(observer_, obs::EventKind::AuthorizationFailed, worker_,
                  std::string(to_string(verdict.error().code)));
        return verdict;
    }
    if (!*verdict) {
        denied_.fetch_add(1, std::memory_order_relaxed);
        obs::emit(observer_, obs::EventKind::MessageDenied, worker_);
        return false;
    }

    if (handler_) handler_(msg);
    delivered_.fetch_add(1, std::memory_order_relaxed);
    obs::emit(observer_, obs::EventKind::MessageDelivered, worker_);
    return true;
}

DeliveryGate::Stats DeliveryGate::stats() const noexcept {
    return Stats{delivered_.load(std::memory_order_relaxed),
                 denied_.load(std::memory_order_relaxed),
                 failed_.load(std::memory_order_relaxed)};
}

} // namespace relaygate::access
