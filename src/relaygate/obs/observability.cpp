/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "relaygate/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace relaygate::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::RouteResolved:       return "route_resolved";
            case EventKind::ProjectRefresh:      return "project_refresh";
            case EventKind::RelayRequested:      return "relay_requested";
            case EventKind::RelayCreated:        return "relay_created";
            case EventKind::MessageDelivered:    return "message_delivered";
            case EventKind::MessageDenied:       return "message_denied";
            case EventKind::AuthorizationFailed: return "authorization_failed";
            case EventKind::Failure:             return "failure";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const Event& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.kind) {
                case EventKind::RouteResolved:       ctr_.resolutions++; break;
                case EventKind::ProjectRefresh:      ctr_.refreshes++; break;
                case EventKind::RelayRequested:      ctr_.relays_requested++; break;
                case EventKind::RelayCreated:        ctr_.relays_created++; break;
                case EventKind::MessageDelivered:    ctr_.messages_delivered++; break;
                case EventKind::MessageDenied:       ctr_.messages_denied++; break;
                case EventKind::AuthorizationFailed: ctr_.authorization_failures++; break;
                case EventKind::Failure:             ctr_.failures++; break;
            }
            // JSON-ish line
            std::printf(
              R"({"event":"%s","subject":"%s","detail":"%s"})" "\n",
              to_string(e.kind), e.subject.c_str(), e.detail.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace relaygate::obs
