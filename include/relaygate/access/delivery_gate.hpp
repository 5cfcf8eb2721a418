#pragma once
/**
 * @file delivery_gate.hpp
 * @brief Point where a worker's mailbox consults its policy before delivery.
 * @note The bound policy is published with release and snapshotted with acquire;
 *       an evaluation already in flight keeps the policy it started with.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "relaygate/access/access_control.hpp"
#include "relaygate/access/local_message.hpp"
#include "relaygate/core/error.hpp"
#include "relaygate/obs/observability.hpp"

namespace relaygate::access {

/** @class DeliveryGate
 *  @brief Gate in front of one worker. Safe to call deliver() from many threads.
 */
class DeliveryGate {
public:
    /// Receives authorized messages; must tolerate concurrent calls.
    using Handler = std::function<void(const LocalMessage&)>;

    struct Stats {
        uint64_t delivered{0}, denied{0}, failed{0};
    };

    DeliveryGate(std::string worker, PolicyPtr policy, Handler handler,
                 obs::Observer* observer = nullptr);

    /**
     * @brief Evaluate the bound policy and deliver on success.
     * @return true if delivered, false if dropped by the policy, or the
     *         policy's error (message dropped as well).
     */
    Result<bool> deliver(const LocalMessage& msg);

    /// Swap the policy for subsequent deliveries.
    void rebind(PolicyPtr policy) noexcept;

    /// Current policy snapshot.
    PolicyPtr policy() const noexcept;

    [[nodiscard]] Stats stats() const noexcept;

    const std::string& worker() const noexcept { return worker_; }

private:
    const std::string worker_;
    PolicyPtr policy_;
    const Handler handler_;
    obs::Observer* observer_{nullptr};

    std::atomic<uint64_t> delivered_{0}, denied_{0}, failed_{0};
};

} // namespace relaygate::access
