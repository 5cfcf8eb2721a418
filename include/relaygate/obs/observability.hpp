#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: resolution/relay/delivery events + counters.
 * @details Components take an optional Observer*; null means silent.
 */

#include <string>
#include <cstdint>
#include <utility>

namespace relaygate::obs {

    /** @enum EventKind
     *  @brief What happened.
     */
    enum class EventKind : uint8_t {
        RouteResolved,        ///< Address resolved into a concrete route
        ProjectRefresh,       ///< Project cache repopulated from the directory
        RelayRequested,       ///< Relay-creation request handed to the transport
        RelayCreated,         ///< Relay-hosting node answered with a RelayInfo
        MessageDelivered,     ///< Policy allowed a message through
        MessageDenied,        ///< Policy denied a message
        AuthorizationFailed,  ///< Policy evaluation returned an error
        Failure               ///< Any other propagated error
    };

    /// Stable label for logs.
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters, one per event kind.
     */
    struct Counters {
        uint64_t resolutions{0};
        uint64_t refreshes{0};
        uint64_t relays_requested{0};
        uint64_t relays_created{0};
        uint64_t messages_delivered{0};
        uint64_t messages_denied{0};
        uint64_t authorization_failures{0};
        uint64_t failures{0};
    };

    /** @struct Event
     *  @brief Payload describing a single event.
     */
    struct Event {
        EventKind   kind{EventKind::Failure};
        std::string subject;   ///< Address, alias or worker the event concerns
        std::string detail;    ///< Human-readable detail (route, error label, ...)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const Event& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Record through an optional observer.
    inline void emit(Observer* o, EventKind k, std::string subject, std::string detail = {}) {
        if (o) o->record(Event{k, std::move(subject), std::move(detail)});
    }

    // Process-wide printf-backed observer (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace relaygate::obs
