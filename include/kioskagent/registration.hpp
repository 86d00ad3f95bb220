#pragma once

/**
 * @file registration.hpp
 * @brief Device registration state machine
 *
 * Drives the device from Unregistered through the QR claim handshake to
 * Activated:
 *
 *     Unregistered -> QrIssued -> Claimed -> Activated
 *
 * Cancelled is reachable from every state before Activated and leaves the
 * persisted claim in place so that resume() can pick it up again.
 */

#include "kioskagent/events.hpp"
#include "kioskagent/http.hpp"
#include "kioskagent/kioskagent.hpp"
#include "kioskagent/storage.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace kioskagent {

/**
 * @brief Registration state machine
 *
 * Every state change emits events::REGISTRATION_STATE_CHANGED; activation
 * additionally emits events::REGISTRATION_ACTIVATED with the credentials.
 */
class RegistrationMachine {
  public:
    struct Options {
        std::string base_url;
        std::string inventory_base_url;
        int device_type = 11;
        double poll_interval = 10.0;  // seconds
        int timeout_seconds = 30;
    };

    RegistrationMachine(Options options, CredentialStoreInterface& store, http::ClientFactory client_factory,
                        EventBus& events);

    /// Stops polling
    ~RegistrationMachine();

    RegistrationMachine(const RegistrationMachine&) = delete;
    RegistrationMachine& operator=(const RegistrationMachine&) = delete;

    /**
     * @brief Request a new claim
     *
     * Persists the issued identity with status QrIssued and returns the
     * ticket the registration screen renders. On failure the state is left
     * unchanged and the call can be retried.
     */
    Result<ClaimTicket> request_claim();

    /**
     * @brief Poll the backend once for the claim status
     *
     * Successful responses are persisted every time. Activation happens
     * exactly when the response carries an api key and triggers the one-time
     * branch fetch. Non-2xx responses leave the state untouched.
     */
    Result<RegistrationStatus> poll_status();

    /**
     * @brief Restore state from the credential store
     *
     * Activated credentials finish immediately. A stored claim that was not
     * yet activated re-enters polling without a new claim request.
     * Nothing stored returns Unregistered.
     */
    RegistrationStatus resume();

    /// Poll in the background every poll_interval until activated or cancelled
    void start_polling();

    /// Stop polling; persisted state is kept
    void cancel();

    /// Stop polling and forget the in-memory claim (after the device was deleted)
    void reset();

    /// Fetch and persist branch details if not stored yet
    Result<BranchInfo> ensure_branch_info();

    [[nodiscard]] RegistrationStatus state() const;
    [[nodiscard]] std::optional<DeviceCredentials> credentials() const;
    [[nodiscard]] std::optional<ClaimTicket> claim_ticket() const;
    [[nodiscard]] bool is_polling() const { return polling_; }

  private:
    void set_state(RegistrationStatus state);
    void stop_thread();

    Options options_;
    CredentialStoreInterface& store_;
    http::ClientFactory client_factory_;
    EventBus& events_;

    RegistrationStatus state_ = RegistrationStatus::Unregistered;
    std::optional<DeviceCredentials> credentials_;
    std::optional<ClaimTicket> ticket_;
    mutable std::mutex mutex_;

    std::atomic<bool> polling_{false};
    std::thread poll_thread_;
    std::mutex poll_mutex_;
    std::condition_variable poll_cv_;
};

}  // namespace kioskagent
