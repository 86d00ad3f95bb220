#pragma once

/**
 * @file agent.hpp
 * @brief Kiosk agent - main entry point
 *
 * The Agent wires the credential store, registration machine, heartbeat
 * monitor, media cache and content synchronizer together and owns their
 * threads.
 *
 * @code
 * kioskagent::Config config;
 * config.base_url = "https://devices.example.com";
 *
 * kioskagent::Agent agent(config);
 * agent.on(kioskagent::events::REGISTRATION_CLAIM_ISSUED, [](const kioskagent::EventData& data) {
 *     auto ticket = std::any_cast<kioskagent::ClaimTicket>(data);
 *     show_qr(ticket.qr_code_image);
 * });
 * agent.start();
 * @endcode
 */

#include "kioskagent/events.hpp"
#include "kioskagent/http.hpp"
#include "kioskagent/kioskagent.hpp"
#include "kioskagent/storage.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kioskagent {

/**
 * @brief Device lifecycle supervisor
 *
 * start() resumes a stored registration or requests a new claim. Once the
 * device is activated the heartbeat and content synchronization start. When
 * the heartbeat detects that the device was deleted, synchronization is
 * paused, the heartbeat stops and a new claim is requested. All of this runs
 * on the agent's supervisor thread; event handlers are invoked on the thread
 * of the component that emits them.
 */
class Agent {
  public:
    /// Construct with file storage in config.config_dir and cpp-httplib clients
    explicit Agent(Config config);

    /// Construct with injected HTTP clients and credential store
    Agent(Config config, http::ClientFactory client_factory, std::unique_ptr<CredentialStoreInterface> store);

    /// Stops the agent
    ~Agent();

    // Non-copyable
    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Movable
    Agent(Agent&&) noexcept;
    Agent& operator=(Agent&&) noexcept;

    /// Start the supervisor; returns an error for an unusable configuration
    Result<void> start();

    /// Stop every background activity and join its thread
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Handle a real-time update message (JSON text)
    Result<void> on_update_notification(const std::string& message);

    /// Subscribe to an agent event (see the events namespace)
    EventSubscription on(const std::string& event, EventHandler handler);

    [[nodiscard]] RegistrationStatus registration_status() const;
    [[nodiscard]] std::optional<DeviceCredentials> credentials() const;
    [[nodiscard]] Playlist playlist() const;
    [[nodiscard]] std::vector<PlayableItem> playable_items() const;
    [[nodiscard]] int64_t message_count() const;
    [[nodiscard]] const Config& config() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace kioskagent
