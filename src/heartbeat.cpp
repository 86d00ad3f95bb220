#include "kioskagent/heartbeat.hpp"
#include "kioskagent/json.hpp"

#include <boost/log/trivial.hpp>

#include <chrono>

namespace kioskagent {

namespace {

constexpr const char* HEARTBEAT_PATH = "/device-registration/heartbeat";

}  // namespace

HeartbeatMonitor::HeartbeatMonitor(Options options, CredentialStoreInterface& store,
                                   http::ClientFactory client_factory, EventBus& events)
    : options_(std::move(options)), store_(store), client_factory_(std::move(client_factory)), events_(events) {}

HeartbeatMonitor::~HeartbeatMonitor() { stop(); }

HeartbeatOutcome HeartbeatMonitor::check() {
    auto credentials = store_.get_credentials();
    if (!credentials || !credentials->is_activated()) {
        return HeartbeatOutcome::Skipped;
    }

    auto client = client_factory_(options_.base_url, options_.timeout_seconds);

    http::Request request;
    request.method = http::Method::GET;
    request.path = HEARTBEAT_PATH;
    request.headers["X-Api-Key"] = *credentials->api_key;

    auto response = client->send(request);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_checked_at_ = std::chrono::system_clock::now();
    }

    if (response.status_code == 0) {
        BOOST_LOG_TRIVIAL(warning) << "Heartbeat failed: " << response.error_message;
        return HeartbeatOutcome::TransientError;
    }

    // Body signature wins over the status code; the backend sends it with 200
    auto body = json::try_parse(response.body);
    if (body && json::is_deletion_signature(*body)) {
        handle_deletion("deletion signature in heartbeat response");
        return HeartbeatOutcome::Deleted;
    }

    if (response.status_code == 404 || response.status_code == 410) {
        handle_deletion(response.status_code == 404 ? "heartbeat returned 404" : "heartbeat returned 410");
        return HeartbeatOutcome::Deleted;
    }

    if (response.status_code == 401 || response.status_code == 403) {
        BOOST_LOG_TRIVIAL(error) << "Heartbeat rejected with " << response.status_code
                                 << "; api key kept, operator action may be required";
        events_.emit(events::HEARTBEAT_AUTH_FAILED, response.status_code);
        return HeartbeatOutcome::AuthFailed;
    }

    if (!response.success) {
        BOOST_LOG_TRIVIAL(warning) << "Heartbeat returned " << response.status_code << ": "
                                   << json::truncate_for_log(response.body, 256);
        return HeartbeatOutcome::TransientError;
    }

    if (!body) {
        BOOST_LOG_TRIVIAL(warning) << "Heartbeat response is not JSON: " << json::truncate_for_log(response.body);
        return HeartbeatOutcome::TransientError;
    }

    auto count = json::parse_message_count(*body);
    if (!count) {
        BOOST_LOG_TRIVIAL(warning) << "Heartbeat response without messageCount: "
                                   << json::truncate_for_log(response.body);
        return HeartbeatOutcome::TransientError;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (message_count_ != *count) {
            message_count_ = *count;
            changed = true;
        }
    }

    if (changed) {
        BOOST_LOG_TRIVIAL(info) << "Pending messages: " << *count;
        events_.emit(events::HEARTBEAT_MESSAGE_COUNT_CHANGED, *count);
    }
    return HeartbeatOutcome::Alive;
}

void HeartbeatMonitor::handle_deletion(const char* reason) {
    BOOST_LOG_TRIVIAL(warning) << "Device deleted on backend (" << reason << "), clearing credentials";

    if (!store_.clear_all()) {
        BOOST_LOG_TRIVIAL(error) << "Failed to remove stored credentials";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_count_ = 0;
    }

    events_.emit(events::HEARTBEAT_DEVICE_DELETED);
}

void HeartbeatMonitor::start() {
    stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_count_ = 0;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        while (running_) {
            try {
                auto outcome = check();
                BOOST_LOG_TRIVIAL(trace) << "Heartbeat: " << heartbeat_outcome_to_string(outcome);
            } catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "Heartbeat iteration failed: " << e.what();
            }

            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::duration<double>(options_.interval),
                              [this]() { return !running_; });
        }
    });
}

void HeartbeatMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();

    if (!thread_.joinable()) {
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

int64_t HeartbeatMonitor::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_count_;
}

std::optional<Timestamp> HeartbeatMonitor::last_checked_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_checked_at_;
}

}  // namespace kioskagent
