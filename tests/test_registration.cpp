#include <gtest/gtest.h>
#include <kioskagent/registration.hpp>

#include "mock_http.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <vector>

namespace kioskagent {
namespace {

using testutil::MockServer;
using testutil::Reply;
using testutil::wait_until;

constexpr const char* BASE = "http://devices.test";
constexpr const char* INVENTORY = "http://inventory.test";
constexpr const char* CLAIM_URL = "http://devices.test/device-registration/qr-registration";
constexpr const char* STATUS_URL = "http://devices.test/device-registration/device-status/guid-1";
constexpr const char* BRANCH_URL = "http://inventory.test/api/v1/branches/current";

constexpr const char* CLAIM_BODY = R"({
    "AssignedGuid": "guid-1",
    "AccessToken": "token-1",
    "QrCodeImage": "data:image/png;base64,iVBORw0KGgo=",
    "Url": "https://portal.example.com/activate/Q7K2"
})";

constexpr const char* ACTIVATED_BODY =
    R"({"deviceStatus":"Activated","apiKey":"key-1","branchId":4,"branch":"Harbor"})";

class RegistrationMachineTest : public ::testing::Test {
  protected:
    RegistrationMachineTest()
        : machine_(RegistrationMachine::Options{BASE, INVENTORY, 11, 0.02, 5}, store_, server_.factory(), bus_) {
        subs_.push_back(bus_.on(events::REGISTRATION_STATE_CHANGED, [this](const EventData& data) {
            std::lock_guard<std::mutex> lock(states_mutex_);
            states_.push_back(std::any_cast<RegistrationStatus>(data));
        }));
    }

    void TearDown() override { machine_.cancel(); }

    std::vector<RegistrationStatus> states() {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return states_;
    }

    MockServer server_;
    MemoryCredentialStore store_;
    EventBus bus_;
    RegistrationMachine machine_;
    std::vector<EventSubscription> subs_;
    std::mutex states_mutex_;
    std::vector<RegistrationStatus> states_;
};

// ==================== Claim ====================

TEST_F(RegistrationMachineTest, ClaimPersistsAndEmitsTicket) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));

    std::optional<ClaimTicket> emitted;
    subs_.push_back(bus_.on(events::REGISTRATION_CLAIM_ISSUED, [&emitted](const EventData& data) {
        emitted = std::any_cast<ClaimTicket>(data);
    }));

    auto result = machine_.request_claim();
    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().activation_code, "Q7K2");
    EXPECT_EQ(result.value().qr_code_image, "iVBORw0KGgo=");

    ASSERT_TRUE(emitted.has_value());
    EXPECT_EQ(emitted->assigned_id, "guid-1");
    EXPECT_EQ(machine_.state(), RegistrationStatus::QrIssued);

    auto stored = store_.get_credentials();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->assigned_id, "guid-1");
    EXPECT_EQ(stored->status, RegistrationStatus::QrIssued);
    EXPECT_FALSE(stored->api_key.has_value());

    auto request = server_.last(CLAIM_URL);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->request.method, http::Method::POST);
    EXPECT_EQ(nlohmann::json::parse(request->request.body)["DeviceType"], 11);
}

TEST_F(RegistrationMachineTest, ClaimFailureEmitsError) {
    server_.on(CLAIM_URL, Reply::json(500, "boom"));

    std::string error;
    subs_.push_back(bus_.on(events::REGISTRATION_ERROR, [&error](const EventData& data) {
        error = std::any_cast<std::string>(data);
    }));

    auto result = machine_.request_claim();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ServerError);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(machine_.state(), RegistrationStatus::Unregistered);
    EXPECT_FALSE(store_.get_credentials().has_value());
}

TEST_F(RegistrationMachineTest, ClaimWithoutGuidIsRejected) {
    server_.on(CLAIM_URL, Reply::json(200, R"({"AccessToken":"t"})"));
    auto result = machine_.request_claim();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ValidationFailed);
}

// ==================== Status Poll ====================

TEST_F(RegistrationMachineTest, PollWithoutClaim) {
    auto result = machine_.poll_status();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::NotActivated);
}

TEST_F(RegistrationMachineTest, ClaimedIsPersistedWithoutActivation) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, R"({"deviceStatus":"Claimed"})"));
    ASSERT_TRUE(machine_.request_claim().is_ok());

    auto result = machine_.poll_status();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), RegistrationStatus::Claimed);
    EXPECT_EQ(machine_.state(), RegistrationStatus::Claimed);
    EXPECT_EQ(store_.get_credentials()->status, RegistrationStatus::Claimed);

    auto request = server_.last(STATUS_URL);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->request.headers.at("Authorization"), "Bearer token-1");
}

TEST_F(RegistrationMachineTest, ActivatedStatusWithoutKeyStaysClaimed) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, R"({"deviceStatus":"Activated"})"));
    ASSERT_TRUE(machine_.request_claim().is_ok());

    auto result = machine_.poll_status();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), RegistrationStatus::Claimed);
    EXPECT_FALSE(store_.get_credentials()->is_activated());
}

TEST_F(RegistrationMachineTest, PollErrorDoesNotTransition) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(503, ""));
    ASSERT_TRUE(machine_.request_claim().is_ok());

    auto result = machine_.poll_status();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(machine_.state(), RegistrationStatus::QrIssued);
    EXPECT_EQ(store_.get_credentials()->status, RegistrationStatus::QrIssued);
}

TEST_F(RegistrationMachineTest, ActivationStoresKeyAndFetchesBranch) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, ACTIVATED_BODY));
    server_.on(BRANCH_URL, Reply::json(200, R"({"success":{"id":4,"name":"Harbor","city":"Bay"}})"));

    std::optional<DeviceCredentials> activated;
    subs_.push_back(bus_.on(events::REGISTRATION_ACTIVATED, [&activated](const EventData& data) {
        activated = std::any_cast<DeviceCredentials>(data);
    }));

    ASSERT_TRUE(machine_.request_claim().is_ok());
    auto result = machine_.poll_status();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), RegistrationStatus::Activated);

    ASSERT_TRUE(activated.has_value());
    EXPECT_EQ(activated->api_key, "key-1");

    auto stored = store_.get_credentials();
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->is_activated());
    EXPECT_EQ(stored->branch_id, 4);

    auto branch = store_.get_branch_info();
    ASSERT_TRUE(branch.has_value());
    EXPECT_EQ(branch->name, "Harbor");
    EXPECT_EQ(server_.last(BRANCH_URL)->request.headers.at("X-Api-Key"), "key-1");
}

TEST_F(RegistrationMachineTest, BranchFetchedOnlyOnce) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, ACTIVATED_BODY));
    server_.on(BRANCH_URL, Reply::json(200, R"({"id":4,"name":"Harbor"})"));

    ASSERT_TRUE(machine_.request_claim().is_ok());
    ASSERT_TRUE(machine_.poll_status().is_ok());
    ASSERT_TRUE(machine_.ensure_branch_info().is_ok());
    EXPECT_EQ(server_.count(BRANCH_URL), 1u);
}

TEST_F(RegistrationMachineTest, BranchFailureDoesNotBlockActivation) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, ACTIVATED_BODY));
    server_.on(BRANCH_URL, Reply::json(502, ""));

    ASSERT_TRUE(machine_.request_claim().is_ok());
    auto result = machine_.poll_status();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(machine_.state(), RegistrationStatus::Activated);
    EXPECT_FALSE(store_.get_branch_info().has_value());
}

// ==================== Background Polling ====================

TEST_F(RegistrationMachineTest, PollingRunsUntilActivated) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on_sequence(STATUS_URL, {Reply::json(200, R"({"deviceStatus":"Pending"})"),
                                     Reply::json(200, R"({"deviceStatus":"Claimed"})"),
                                     Reply::json(200, ACTIVATED_BODY)});
    server_.on(BRANCH_URL, Reply::json(200, R"({"id":4,"name":"Harbor"})"));

    ASSERT_TRUE(machine_.request_claim().is_ok());
    machine_.start_polling();

    ASSERT_TRUE(wait_until([this]() { return machine_.state() == RegistrationStatus::Activated; }));
    ASSERT_TRUE(wait_until([this]() { return !machine_.is_polling(); }));
    EXPECT_EQ(server_.count(STATUS_URL), 3u);

    auto seen = states();
    ASSERT_GE(seen.size(), 3u);
    EXPECT_EQ(seen.front(), RegistrationStatus::QrIssued);
    EXPECT_EQ(seen.back(), RegistrationStatus::Activated);
}

TEST_F(RegistrationMachineTest, CancelStopsPolling) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, R"({"deviceStatus":"Pending"})"));

    ASSERT_TRUE(machine_.request_claim().is_ok());
    machine_.start_polling();
    ASSERT_TRUE(wait_until([this]() { return server_.count(STATUS_URL) >= 1; }));

    machine_.cancel();
    EXPECT_FALSE(machine_.is_polling());
    EXPECT_EQ(machine_.state(), RegistrationStatus::Cancelled);

    auto polls = server_.count(STATUS_URL);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(server_.count(STATUS_URL), polls);

    // The stored claim survives cancellation
    EXPECT_TRUE(store_.get_credentials().has_value());
}

// ==================== Resume ====================

TEST_F(RegistrationMachineTest, ResumeWithoutStoredClaim) {
    EXPECT_EQ(machine_.resume(), RegistrationStatus::Unregistered);
    EXPECT_FALSE(machine_.is_polling());
}

TEST_F(RegistrationMachineTest, ResumeStoredClaimPollsWithoutNewClaim) {
    DeviceCredentials stored;
    stored.assigned_id = "guid-1";
    stored.access_token = "token-1";
    stored.status = RegistrationStatus::Claimed;
    ASSERT_TRUE(store_.set_credentials(stored));
    server_.on(STATUS_URL, Reply::json(200, ACTIVATED_BODY));
    server_.on(BRANCH_URL, Reply::json(200, R"({"id":4})"));

    EXPECT_EQ(machine_.resume(), RegistrationStatus::Claimed);
    ASSERT_TRUE(wait_until([this]() { return machine_.state() == RegistrationStatus::Activated; }));
    EXPECT_EQ(server_.count(CLAIM_URL), 0u);
}

TEST_F(RegistrationMachineTest, ResumeActivatedSkipsPolling) {
    DeviceCredentials stored;
    stored.assigned_id = "guid-1";
    stored.access_token = "token-1";
    stored.status = RegistrationStatus::Activated;
    stored.api_key = "key-1";
    ASSERT_TRUE(store_.set_credentials(stored));
    server_.on(BRANCH_URL, Reply::json(200, R"({"id":4})"));

    EXPECT_EQ(machine_.resume(), RegistrationStatus::Activated);
    EXPECT_FALSE(machine_.is_polling());
    EXPECT_EQ(server_.count(STATUS_URL), 0u);
    EXPECT_TRUE(store_.get_branch_info().has_value());
}

TEST_F(RegistrationMachineTest, ResetForgetsClaim) {
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    ASSERT_TRUE(machine_.request_claim().is_ok());

    machine_.reset();
    EXPECT_EQ(machine_.state(), RegistrationStatus::Unregistered);
    EXPECT_FALSE(machine_.claim_ticket().has_value());
    EXPECT_EQ(machine_.poll_status().error_code(), ErrorCode::NotActivated);
}

}  // namespace
}  // namespace kioskagent
