#include "kioskagent/agent.hpp"
#include "kioskagent/config.hpp"
#include "kioskagent/content_sync.hpp"
#include "kioskagent/heartbeat.hpp"
#include "kioskagent/media_cache.hpp"
#include "kioskagent/registration.hpp"

#include <boost/log/trivial.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace kioskagent {

namespace {

constexpr const char* SNAPSHOT_FILE = "playlist_cache.json";

enum class Command { Boot, Claim, StartContent, ReloadPlaylist, HandleDeletion };

constexpr const char* command_to_string(Command command) noexcept {
    switch (command) {
        case Command::Boot:
            return "boot";
        case Command::Claim:
            return "claim";
        case Command::StartContent:
            return "start-content";
        case Command::ReloadPlaylist:
            return "reload-playlist";
        case Command::HandleDeletion:
            return "handle-deletion";
    }
    return "unknown";
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
}

}  // namespace

class Agent::Impl {
  public:
    Impl(Config config, http::ClientFactory client_factory, std::unique_ptr<CredentialStoreInterface> store)
        : config_(std::move(config)),
          client_factory_(std::move(client_factory)),
          store_(std::move(store)),
          cache_(MediaCache::Options{config_.cache_dir, config_.max_cache_bytes, config_.download_timeout_seconds},
                 client_factory_),
          registration_(RegistrationMachine::Options{config_.base_url, config_.inventory_base_url,
                                                     config_.device_type, config_.registration_poll_interval,
                                                     config_.timeout_seconds},
                        *store_, client_factory_, event_bus_),
          heartbeat_(HeartbeatMonitor::Options{config_.base_url, config_.heartbeat_interval,
                                               config_.heartbeat_timeout_seconds},
                     *store_, client_factory_, event_bus_),
          sync_(ContentSynchronizer::Options{config_.base_url, config_.timeout_seconds,
                                             config_.max_download_attempts, config_.download_backoff_ms,
                                             config_.max_concurrent_downloads,
                                             std::filesystem::path(config_.cache_dir) / SNAPSHOT_FILE,
                                             config_.default_image_duration},
                *store_, cache_, client_factory_, event_bus_) {}

    ~Impl() { stop(); }

    Result<void> start() {
        if (running_) {
            return Result<void>::ok();
        }

        auto valid = config::validate(config_);
        if (valid.is_error()) {
            BOOST_LOG_TRIVIAL(error) << "Invalid configuration: " << valid.error_message();
            return valid;
        }

        subscriptions_.push_back(event_bus_.on(events::REGISTRATION_ACTIVATED, [this](const EventData&) {
            schedule(Command::StartContent);
        }));
        subscriptions_.push_back(event_bus_.on(events::HEARTBEAT_DEVICE_DELETED, [this](const EventData&) {
            schedule(Command::HandleDeletion);
        }));

        {
            std::lock_guard<std::mutex> lock(command_mutex_);
            stopping_ = false;
        }
        running_ = true;
        supervisor_ = std::thread([this]() { supervise(); });

        BOOST_LOG_TRIVIAL(info) << "Kiosk agent " << VERSION << " starting (backend " << config_.base_url << ")";
        schedule(Command::Boot);
        return Result<void>::ok();
    }

    void stop() {
        if (!running_) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(command_mutex_);
            stopping_ = true;
            commands_.clear();
        }
        command_cv_.notify_all();
        if (supervisor_.joinable()) {
            supervisor_.join();
        }

        for (auto& subscription : subscriptions_) {
            subscription.cancel();
        }
        subscriptions_.clear();

        registration_.cancel();
        heartbeat_.stop();
        sync_.stop();
        running_ = false;

        BOOST_LOG_TRIVIAL(info) << "Kiosk agent stopped";
        event_bus_.emit(events::AGENT_STOPPED);
    }

    bool is_running() const { return running_; }

    Result<void> on_update_notification(const std::string& message) {
        auto credentials = store_->get_credentials();
        if (!credentials || !credentials->is_activated()) {
            BOOST_LOG_TRIVIAL(debug) << "Ignoring update notification before activation";
            return Result<void>::error(ErrorCode::NotActivated, "Device is not activated");
        }
        if (sync_.is_paused()) {
            return Result<void>::error(ErrorCode::NotActivated, "Content synchronization is paused");
        }
        return sync_.apply_notification(message);
    }

    EventSubscription on(const std::string& event, EventHandler handler) {
        return event_bus_.on(event, std::move(handler));
    }

    RegistrationStatus registration_status() const { return registration_.state(); }
    std::optional<DeviceCredentials> credentials() const { return store_->get_credentials(); }
    Playlist playlist() const { return sync_.playlist(); }
    std::vector<PlayableItem> playable_items() const { return sync_.playable_items(); }
    int64_t message_count() const { return heartbeat_.message_count(); }
    const Config& config() const { return config_; }

  private:
    // ========== Supervisor ==========

    /// Queue a command, replacing a pending one of the same kind
    void schedule(Command command, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        {
            std::lock_guard<std::mutex> lock(command_mutex_);
            if (stopping_) {
                return;
            }
            for (auto it = commands_.begin(); it != commands_.end();) {
                it = it->second == command ? commands_.erase(it) : std::next(it);
            }
            commands_.emplace(std::chrono::steady_clock::now() + delay, command);
        }
        command_cv_.notify_all();
    }

    void cancel_pending(Command command) {
        std::lock_guard<std::mutex> lock(command_mutex_);
        for (auto it = commands_.begin(); it != commands_.end();) {
            it = it->second == command ? commands_.erase(it) : std::next(it);
        }
    }

    void supervise() {
        while (true) {
            Command command = Command::Boot;
            {
                std::unique_lock<std::mutex> lock(command_mutex_);
                if (stopping_) {
                    return;
                }
                if (commands_.empty()) {
                    command_cv_.wait(lock, [this]() { return stopping_ || !commands_.empty(); });
                    continue;
                }
                auto due = commands_.begin()->first;
                if (due > std::chrono::steady_clock::now()) {
                    command_cv_.wait_until(lock, due);
                    continue;
                }
                command = commands_.begin()->second;
                commands_.erase(commands_.begin());
            }

            BOOST_LOG_TRIVIAL(debug) << "Supervisor: " << command_to_string(command);
            try {
                execute(command);
            } catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "Supervisor command " << command_to_string(command)
                                         << " failed: " << e.what();
            }
        }
    }

    void execute(Command command) {
        switch (command) {
            case Command::Boot:
                boot();
                break;
            case Command::Claim:
                claim();
                break;
            case Command::StartContent:
                start_content();
                break;
            case Command::ReloadPlaylist:
                reload_playlist();
                break;
            case Command::HandleDeletion:
                handle_deletion();
                break;
        }
    }

    void boot() {
        auto opened = cache_.open();
        if (opened.is_error()) {
            BOOST_LOG_TRIVIAL(error) << "Media cache unavailable: " << opened.error_message();
        }

        switch (registration_.resume()) {
            case RegistrationStatus::Activated:
                schedule(Command::StartContent);
                break;
            case RegistrationStatus::Unregistered:
            case RegistrationStatus::Cancelled:
                schedule(Command::Claim);
                break;
            case RegistrationStatus::QrIssued:
            case RegistrationStatus::Claimed:
                // resume() re-entered polling with the stored claim
                break;
        }
    }

    void claim() {
        auto ticket = registration_.request_claim();
        if (ticket.is_error()) {
            BOOST_LOG_TRIVIAL(warning) << "Claim failed, retrying: " << ticket.error_message();
            schedule(Command::Claim, seconds_to_ms(config_.registration_poll_interval));
            return;
        }
        registration_.start_polling();
    }

    void start_content() {
        sync_.start();
        sync_.resume();

        if (sync_.playlist().items.empty()) {
            auto restored = sync_.load_snapshot();
            if (restored.is_error() && restored.error_code() != ErrorCode::FileNotFound) {
                BOOST_LOG_TRIVIAL(warning) << "Playlist snapshot not restored: " << restored.error_message();
            }
        }

        heartbeat_.start();
        reload_playlist();
    }

    void reload_playlist() {
        if (sync_.is_paused()) {
            return;
        }
        auto loaded = sync_.load_full_playlist();
        if (loaded.is_error() && loaded.error_code() != ErrorCode::NotActivated) {
            schedule(Command::ReloadPlaylist, seconds_to_ms(config_.heartbeat_interval));
        }
    }

    void handle_deletion() {
        BOOST_LOG_TRIVIAL(warning) << "Device deleted, restarting registration";
        cancel_pending(Command::ReloadPlaylist);
        sync_.pause();
        heartbeat_.stop();
        registration_.reset();
        schedule(Command::Claim);
    }

    Config config_;
    http::ClientFactory client_factory_;
    std::unique_ptr<CredentialStoreInterface> store_;
    EventBus event_bus_;

    MediaCache cache_;
    RegistrationMachine registration_;
    HeartbeatMonitor heartbeat_;
    ContentSynchronizer sync_;

    std::vector<EventSubscription> subscriptions_;

    std::atomic<bool> running_{false};
    std::thread supervisor_;
    std::multimap<std::chrono::steady_clock::time_point, Command> commands_;
    bool stopping_ = false;
    std::mutex command_mutex_;
    std::condition_variable command_cv_;
};

// ==================== Agent ====================

Agent::Agent(Config config)
    : Agent(config, http::make_client_factory(config.verify_ssl),
            std::make_unique<FileCredentialStore>(config.config_dir)) {}

Agent::Agent(Config config, http::ClientFactory client_factory, std::unique_ptr<CredentialStoreInterface> store)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(client_factory), std::move(store))) {}

Agent::~Agent() = default;

Agent::Agent(Agent&&) noexcept = default;
Agent& Agent::operator=(Agent&&) noexcept = default;

Result<void> Agent::start() {
    return impl_->start();
}

void Agent::stop() {
    impl_->stop();
}

bool Agent::is_running() const {
    return impl_->is_running();
}

Result<void> Agent::on_update_notification(const std::string& message) {
    return impl_->on_update_notification(message);
}

EventSubscription Agent::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

RegistrationStatus Agent::registration_status() const {
    return impl_->registration_status();
}

std::optional<DeviceCredentials> Agent::credentials() const {
    return impl_->credentials();
}

Playlist Agent::playlist() const {
    return impl_->playlist();
}

std::vector<PlayableItem> Agent::playable_items() const {
    return impl_->playable_items();
}

int64_t Agent::message_count() const {
    return impl_->message_count();
}

const Config& Agent::config() const {
    return impl_->config();
}

}  // namespace kioskagent
