#pragma once

/**
 * @file heartbeat.hpp
 * @brief Liveness monitor for an activated device
 */

#include "kioskagent/events.hpp"
#include "kioskagent/http.hpp"
#include "kioskagent/kioskagent.hpp"
#include "kioskagent/storage.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace kioskagent {

/// Result of a single heartbeat check
enum class HeartbeatOutcome {
    Skipped,         // No api key yet
    Alive,           // 2xx with a message count
    Deleted,         // Deletion signature or 404/410
    AuthFailed,      // 401/403, credentials kept
    TransientError   // Anything else; retried next interval
};

[[nodiscard]] constexpr const char* heartbeat_outcome_to_string(HeartbeatOutcome outcome) noexcept {
    switch (outcome) {
        case HeartbeatOutcome::Skipped:
            return "skipped";
        case HeartbeatOutcome::Alive:
            return "alive";
        case HeartbeatOutcome::Deleted:
            return "deleted";
        case HeartbeatOutcome::AuthFailed:
            return "auth_failed";
        case HeartbeatOutcome::TransientError:
            return "transient_error";
    }
    return "transient_error";
}

/**
 * @brief Periodic heartbeat against the registration backend
 *
 * Tracks the pending-message counter and detects that the device was deleted
 * on the backend. Deletion is recognised from the response body first (an
 * object whose message, innerException, errors and stackTrace are all
 * explicitly null, whatever the status) and only then from status 404/410.
 * On deletion both credential documents are removed, the counter is reset
 * and events::HEARTBEAT_DEVICE_DELETED is emitted.
 */
class HeartbeatMonitor {
  public:
    struct Options {
        std::string base_url;
        double interval = 60.0;  // seconds
        int timeout_seconds = 10;
    };

    HeartbeatMonitor(Options options, CredentialStoreInterface& store, http::ClientFactory client_factory,
                     EventBus& events);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /// Run one check; never throws for backend or network failures
    HeartbeatOutcome check();

    /// Check immediately, then every interval until stop()
    void start();

    void stop();

    [[nodiscard]] bool is_running() const { return running_; }

    [[nodiscard]] int64_t message_count() const;
    [[nodiscard]] std::optional<Timestamp> last_checked_at() const;

  private:
    void handle_deletion(const char* reason);

    Options options_;
    CredentialStoreInterface& store_;
    http::ClientFactory client_factory_;
    EventBus& events_;

    int64_t message_count_ = 0;
    std::optional<Timestamp> last_checked_at_;
    mutable std::mutex mutex_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace kioskagent
