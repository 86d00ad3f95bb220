#include "kioskagent/registration.hpp"
#include "kioskagent/json.hpp"

#include <boost/log/trivial.hpp>

#include <chrono>

namespace kioskagent {

namespace {

constexpr const char* CLAIM_PATH = "/device-registration/qr-registration";
constexpr const char* STATUS_PATH = "/device-registration/device-status/";
constexpr const char* BRANCH_PATH = "/api/v1/branches/current";

std::string describe_failure(const http::Response& response) {
    if (response.status_code == 0) {
        return response.error_message;
    }
    return "HTTP " + std::to_string(response.status_code) + ": " + json::truncate_for_log(response.body, 256);
}

}  // namespace

RegistrationMachine::RegistrationMachine(Options options, CredentialStoreInterface& store,
                                         http::ClientFactory client_factory, EventBus& events)
    : options_(std::move(options)), store_(store), client_factory_(std::move(client_factory)), events_(events) {}

RegistrationMachine::~RegistrationMachine() { stop_thread(); }

// ==================== Claim ====================

Result<ClaimTicket> RegistrationMachine::request_claim() {
    auto client = client_factory_(options_.base_url, options_.timeout_seconds);

    http::Request request;
    request.method = http::Method::POST;
    request.path = CLAIM_PATH;
    request.body = nlohmann::json{{"DeviceType", options_.device_type}}.dump();

    auto response = client->send(request);
    if (!response.success) {
        auto code = http::status_code_to_error_code(response.status_code);
        std::string message = "Claim request failed: " + describe_failure(response);
        BOOST_LOG_TRIVIAL(warning) << message;
        events_.emit(events::REGISTRATION_ERROR, message);
        return Result<ClaimTicket>::error(code, message);
    }

    auto body = json::try_parse(response.body);
    if (!body) {
        BOOST_LOG_TRIVIAL(error) << "Claim response is not JSON: " << json::truncate_for_log(response.body);
        events_.emit(events::REGISTRATION_ERROR, std::string("Claim response is not JSON"));
        return Result<ClaimTicket>::error(ErrorCode::ParseError, "Claim response is not JSON");
    }

    auto parsed = json::parse_claim_response(*body);
    if (parsed.is_error()) {
        BOOST_LOG_TRIVIAL(error) << parsed.error_message() << ": " << json::truncate_for_log(response.body);
        events_.emit(events::REGISTRATION_ERROR, parsed.error_message());
        return parsed;
    }

    const auto& ticket = parsed.value();
    DeviceCredentials credentials;
    credentials.assigned_id = ticket.assigned_id;
    credentials.access_token = ticket.access_token;
    credentials.status = RegistrationStatus::QrIssued;

    if (!store_.set_credentials(credentials)) {
        BOOST_LOG_TRIVIAL(error) << "Failed to persist claim for device " << ticket.assigned_id;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_ = credentials;
        ticket_ = ticket;
    }

    BOOST_LOG_TRIVIAL(info) << "Claim issued for device " << ticket.assigned_id << " (code "
                            << ticket.activation_code << ")";
    set_state(RegistrationStatus::QrIssued);
    events_.emit(events::REGISTRATION_CLAIM_ISSUED, ticket);
    return parsed;
}

// ==================== Status Poll ====================

Result<RegistrationStatus> RegistrationMachine::poll_status() {
    std::optional<DeviceCredentials> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = credentials_;
    }

    if (!current || !current->is_resumable()) {
        return Result<RegistrationStatus>::error(ErrorCode::NotActivated, "No claim to poll");
    }
    if (current->is_activated()) {
        return Result<RegistrationStatus>::ok(RegistrationStatus::Activated);
    }

    auto client = client_factory_(options_.base_url, options_.timeout_seconds);

    http::Request request;
    request.method = http::Method::GET;
    request.path = STATUS_PATH + current->assigned_id;
    request.headers["Authorization"] = "Bearer " + current->access_token;

    auto response = client->send(request);
    if (!response.success) {
        auto code = http::status_code_to_error_code(response.status_code);
        BOOST_LOG_TRIVIAL(warning) << "Status poll failed: " << describe_failure(response);
        return Result<RegistrationStatus>::error(code, describe_failure(response));
    }

    auto body = json::try_parse(response.body);
    if (!body || !body->is_object()) {
        BOOST_LOG_TRIVIAL(error) << "Status response is not a JSON object: "
                                 << json::truncate_for_log(response.body);
        return Result<RegistrationStatus>::error(ErrorCode::ParseError, "Status response is not a JSON object");
    }

    auto updated = json::parse_device_status(*body, *current);

    // Persisted on every successful tick, activated or not
    if (!store_.set_credentials(updated)) {
        BOOST_LOG_TRIVIAL(error) << "Failed to persist device status";
    }

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = state_ == RegistrationStatus::Cancelled;
        credentials_ = updated;
    }

    BOOST_LOG_TRIVIAL(debug) << "Device status: " << registration_status_to_string(updated.status);

    if (updated.is_activated()) {
        BOOST_LOG_TRIVIAL(info) << "Device " << updated.assigned_id << " activated";
        set_state(RegistrationStatus::Activated);
        events_.emit(events::REGISTRATION_ACTIVATED, updated);

        auto branch = ensure_branch_info();
        if (branch.is_error()) {
            BOOST_LOG_TRIVIAL(warning) << "Branch fetch failed, will retry later: " << branch.error_message();
        }
    } else if (!cancelled) {
        set_state(updated.status);
    }

    return Result<RegistrationStatus>::ok(updated.status);
}

// ==================== Branch ====================

Result<BranchInfo> RegistrationMachine::ensure_branch_info() {
    if (auto stored = store_.get_branch_info()) {
        return Result<BranchInfo>::ok(std::move(*stored));
    }

    std::optional<DeviceCredentials> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = credentials_;
    }
    if (!current || !current->is_activated()) {
        return Result<BranchInfo>::error(ErrorCode::NotActivated, "Device is not activated");
    }

    auto client = client_factory_(options_.inventory_base_url, options_.timeout_seconds);

    http::Request request;
    request.method = http::Method::GET;
    request.path = BRANCH_PATH;
    request.headers["X-Api-Key"] = *current->api_key;

    auto response = client->send(request);
    if (!response.success) {
        return Result<BranchInfo>::error(http::status_code_to_error_code(response.status_code),
                                         "Branch fetch failed: " + describe_failure(response));
    }

    auto body = json::try_parse(response.body);
    if (!body) {
        BOOST_LOG_TRIVIAL(error) << "Branch response is not JSON: " << json::truncate_for_log(response.body);
        return Result<BranchInfo>::error(ErrorCode::ParseError, "Branch response is not JSON");
    }

    auto parsed = json::parse_branch_info(*body);
    if (parsed.is_error()) {
        return parsed;
    }

    if (!store_.set_branch_info(parsed.value())) {
        return Result<BranchInfo>::error(ErrorCode::FileError, "Failed to persist branch details");
    }
    BOOST_LOG_TRIVIAL(info) << "Branch " << parsed.value().id << " (" << parsed.value().name << ") stored";
    return parsed;
}

// ==================== Lifecycle ====================

RegistrationStatus RegistrationMachine::resume() {
    auto stored = store_.get_credentials();
    if (!stored || !stored->is_resumable()) {
        BOOST_LOG_TRIVIAL(info) << "No stored registration";
        set_state(RegistrationStatus::Unregistered);
        return RegistrationStatus::Unregistered;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_ = stored;
    }

    if (stored->is_activated()) {
        BOOST_LOG_TRIVIAL(info) << "Device " << stored->assigned_id << " already activated";
        set_state(RegistrationStatus::Activated);
        auto branch = ensure_branch_info();
        if (branch.is_error()) {
            BOOST_LOG_TRIVIAL(warning) << "Branch details unavailable: " << branch.error_message();
        }
        return RegistrationStatus::Activated;
    }

    BOOST_LOG_TRIVIAL(info) << "Resuming claim for device " << stored->assigned_id << " ("
                            << registration_status_to_string(stored->status) << ")";
    set_state(stored->status);
    start_polling();
    return stored->status;
}

void RegistrationMachine::start_polling() {
    stop_thread();

    if (state() == RegistrationStatus::Cancelled) {
        std::optional<DeviceCredentials> current = credentials();
        set_state(current ? current->status : RegistrationStatus::Unregistered);
    }

    polling_ = true;
    poll_thread_ = std::thread([this]() {
        while (polling_) {
            {
                std::unique_lock<std::mutex> lock(poll_mutex_);
                poll_cv_.wait_for(lock, std::chrono::duration<double>(options_.poll_interval),
                                  [this]() { return !polling_; });
            }

            if (!polling_) {
                break;
            }

            auto result = poll_status();
            if (result.is_ok() && result.value() == RegistrationStatus::Activated) {
                polling_ = false;
            } else if (result.is_error() && result.error_code() == ErrorCode::NotActivated) {
                // Claim vanished (reset); nothing left to poll
                polling_ = false;
            }
        }
    });
}

void RegistrationMachine::cancel() {
    stop_thread();
    if (state() != RegistrationStatus::Activated && state() != RegistrationStatus::Unregistered) {
        set_state(RegistrationStatus::Cancelled);
    }
}

void RegistrationMachine::reset() {
    stop_thread();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_.reset();
        ticket_.reset();
    }
    set_state(RegistrationStatus::Unregistered);
}

void RegistrationMachine::stop_thread() {
    {
        std::lock_guard<std::mutex> lock(poll_mutex_);
        polling_ = false;
    }
    poll_cv_.notify_all();

    if (!poll_thread_.joinable()) {
        return;
    }
    // A handler running on the poll thread may cancel; it cannot join itself
    if (poll_thread_.get_id() == std::this_thread::get_id()) {
        poll_thread_.detach();
    } else {
        poll_thread_.join();
    }
}

// ==================== State ====================

void RegistrationMachine::set_state(RegistrationStatus state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }
    BOOST_LOG_TRIVIAL(info) << "Registration state: " << registration_status_to_string(state);
    events_.emit(events::REGISTRATION_STATE_CHANGED, state);
}

RegistrationStatus RegistrationMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<DeviceCredentials> RegistrationMachine::credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

std::optional<ClaimTicket> RegistrationMachine::claim_ticket() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticket_;
}

}  // namespace kioskagent
