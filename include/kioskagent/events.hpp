#pragma once

/**
 * @file events.hpp
 * @brief Event bus connecting the agent's background activities
 *
 * Registration, heartbeat and content synchronization publish state changes
 * here; the agent and the UI collaborators subscribe.
 */

#include <boost/log/trivial.hpp>

#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kioskagent {

/// Payload of an event; the events namespace lists the type per event
using EventData = std::any;

using EventHandler = std::function<void(const EventData&)>;

/// Handle for one listener; the listener stays registered until cancel()
class EventSubscription {
  public:
    EventSubscription() = default;
    explicit EventSubscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Event bus for agent-wide event handling
 *
 * Handlers run synchronously on the emitting thread, in subscription order,
 * outside the bus lock. A listener cancelled while an event is being
 * delivered receives nothing further, including the rest of that delivery.
 * A handler that throws is logged and does not affect other handlers.
 */
class EventBus {
  public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Register handler for event
    EventSubscription on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = next_id_++;
        listeners_.emplace(id, Listener{event, std::make_shared<EventHandler>(std::move(handler))});
        return EventSubscription([this, id]() { drop(id); });
    }

    /// Deliver data to every listener of event
    void emit(const std::string& event, const EventData& data = {}) {
        std::vector<std::pair<uint64_t, std::shared_ptr<EventHandler>>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, listener] : listeners_) {
                if (listener.event == event) {
                    targets.emplace_back(id, listener.handler);
                }
            }
        }

        for (const auto& [id, handler] : targets) {
            if (!is_registered(id)) {
                continue;
            }
            try {
                (*handler)(data);
            } catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "Handler for " << event << " threw: " << e.what();
            }
        }
    }

  private:
    struct Listener {
        std::string event;
        std::shared_ptr<EventHandler> handler;
    };

    bool is_registered(uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.count(id) > 0;
    }

    void drop(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(id);
    }

    // Keyed by subscription id, so iteration follows subscription order
    std::map<uint64_t, Listener> listeners_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
};

// Event names. Payload types are noted per event.
namespace events {
constexpr const char* REGISTRATION_CLAIM_ISSUED = "registration:claim-issued";        // ClaimTicket
constexpr const char* REGISTRATION_STATE_CHANGED = "registration:state-changed";      // RegistrationStatus
constexpr const char* REGISTRATION_ACTIVATED = "registration:activated";              // DeviceCredentials
constexpr const char* REGISTRATION_ERROR = "registration:error";                      // std::string
constexpr const char* HEARTBEAT_MESSAGE_COUNT_CHANGED = "heartbeat:message-count-changed";  // int64_t
constexpr const char* HEARTBEAT_DEVICE_DELETED = "heartbeat:device-deleted";          // none
constexpr const char* HEARTBEAT_AUTH_FAILED = "heartbeat:auth-failed";                // int status
constexpr const char* PLAYLIST_LOADED = "playlist:loaded";                            // Playlist
constexpr const char* PLAYLIST_UPDATED = "playlist:updated";                          // UpdateAction
constexpr const char* PLAYLIST_FETCH_FAILED = "playlist:fetch-failed";                // std::string
constexpr const char* DOWNLOAD_SUCCEEDED = "download:succeeded";                      // PlayableItem
constexpr const char* DOWNLOAD_SKIPPED = "download:skipped";                          // DownloadTask
constexpr const char* SYNC_PAUSED = "sync:paused";
constexpr const char* SYNC_RESUMED = "sync:resumed";
constexpr const char* AGENT_STOPPED = "agent:stopped";
}  // namespace events

}  // namespace kioskagent
