#include <gtest/gtest.h>
#include <kioskagent/agent.hpp>

#include "mock_http.hpp"

#include <atomic>
#include <memory>

namespace kioskagent {
namespace {

using testutil::MockServer;
using testutil::Reply;
using testutil::TempDirectory;
using testutil::wait_until;

constexpr const char* CLAIM_URL = "http://devices.test/device-registration/qr-registration";
constexpr const char* STATUS_URL = "http://devices.test/device-registration/device-status/guid-1";
constexpr const char* BRANCH_URL = "http://inventory.test/api/v1/branches/current";
constexpr const char* HEARTBEAT_URL = "http://devices.test/device-registration/heartbeat";
constexpr const char* PLAYLIST_URL = "http://devices.test/api/playlist";

constexpr const char* CLAIM_BODY = R"({
    "AssignedGuid": "guid-1",
    "AccessToken": "token-1",
    "QrCodeImage": "iVBORw0KGgo=",
    "Url": "https://portal.example.com/activate/Q7K2"
})";

constexpr const char* PLAYLIST_BODY = R"({
    "playlistId": "pl-1",
    "version": "3",
    "items": [
        {"id": "intro", "type": "video", "url": "http://cdn.test/intro.mp4", "order": 2},
        {"id": "menu", "type": "photo", "url": "http://cdn.test/menu.jpg", "order": 1, "duration": 12}
    ]
})";

constexpr const char* DELETED_BODY = R"({"message":null,"innerException":null,"errors":null,"stackTrace":null})";

class AgentTest : public ::testing::Test {
  protected:
    void TearDown() override {
        if (agent_) {
            agent_->stop();
        }
    }

    Config make_config() const {
        Config config;
        config.base_url = "http://devices.test";
        config.inventory_base_url = "http://inventory.test";
        config.cache_dir = (temp_dir_.path() / "media").string();
        config.config_dir = (temp_dir_.path() / "config").string();
        config.max_cache_bytes = 1024 * 1024;
        config.registration_poll_interval = 0.02;
        config.heartbeat_interval = 0.02;
        config.download_backoff_ms = 5;
        config.max_concurrent_downloads = 2;
        return config;
    }

    /// Build the agent, optionally over a store that already holds an activated device
    void create_agent(bool activated, Config config) {
        auto store = std::make_unique<MemoryCredentialStore>();
        if (activated) {
            DeviceCredentials credentials;
            credentials.assigned_id = "guid-0";
            credentials.access_token = "token-0";
            credentials.status = RegistrationStatus::Activated;
            credentials.api_key = "key-0";
            ASSERT_TRUE(store->set_credentials(credentials));
        }
        agent_ = std::make_unique<Agent>(std::move(config), server_.factory(), std::move(store));
    }

    void serve_content() {
        server_.on(HEARTBEAT_URL, Reply::json(200, R"({"messageCount":2})"));
        server_.on(PLAYLIST_URL, Reply::json(200, PLAYLIST_BODY));
        server_.on("http://cdn.test/intro.mp4", Reply::json(200, "video-bytes"));
        server_.on("http://cdn.test/menu.jpg", Reply::json(200, "photo-bytes"));
    }

    TempDirectory temp_dir_;
    MockServer server_;
    std::atomic<int> tickets_{0};
    std::atomic<int> paused_{0};
    std::atomic<int> stopped_{0};
    std::unique_ptr<Agent> agent_;
    std::vector<EventSubscription> subs_;
};

TEST_F(AgentTest, InvalidConfigurationRefusesToStart) {
    Config config = make_config();
    config.base_url = "";
    create_agent(false, config);

    auto result = agent_->start();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::MissingParameter);
    EXPECT_FALSE(agent_->is_running());
    EXPECT_TRUE(server_.requests().empty());
}

TEST_F(AgentTest, ActivatedDeviceGoesStraightToContent) {
    serve_content();
    create_agent(true, make_config());

    ASSERT_TRUE(agent_->start().is_ok());
    EXPECT_TRUE(agent_->is_running());

    ASSERT_TRUE(wait_until([this]() { return agent_->playable_items().size() == 2; }));
    auto playable = agent_->playable_items();
    EXPECT_EQ(playable[0].item.id, "menu");
    EXPECT_EQ(playable[0].item.duration_seconds, 12);
    EXPECT_EQ(playable[1].item.id, "intro");

    ASSERT_TRUE(wait_until([this]() { return agent_->message_count() == 2; }));
    EXPECT_EQ(server_.count(CLAIM_URL), 0u);
    EXPECT_EQ(agent_->registration_status(), RegistrationStatus::Activated);
    EXPECT_EQ(server_.last(PLAYLIST_URL)->request.headers.at("X-Api-Key"), "key-0");
    EXPECT_TRUE(std::filesystem::exists(temp_dir_.path() / "media" / "playlist_cache.json"));
}

TEST_F(AgentTest, UnregisteredDeviceClaimsAndActivates) {
    serve_content();
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on_sequence(STATUS_URL, {Reply::json(200, R"({"deviceStatus":"Pending"})"),
                                     Reply::json(200, R"({"deviceStatus":"Activated","apiKey":"key-1"})")});
    server_.on(BRANCH_URL, Reply::json(200, R"({"id":4,"name":"Harbor"})"));
    create_agent(false, make_config());

    subs_.push_back(agent_->on(events::REGISTRATION_CLAIM_ISSUED, [this](const EventData&) { ++tickets_; }));

    ASSERT_TRUE(agent_->start().is_ok());
    ASSERT_TRUE(wait_until([this]() { return agent_->playable_items().size() == 2; }));

    EXPECT_EQ(tickets_.load(), 1);
    EXPECT_EQ(agent_->registration_status(), RegistrationStatus::Activated);
    auto credentials = agent_->credentials();
    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->api_key.value_or(""), "key-1");
    EXPECT_EQ(server_.count(BRANCH_URL), 1u);
}

TEST_F(AgentTest, ClaimIsRetriedUntilBackendAnswers) {
    server_.on_sequence(CLAIM_URL, {Reply::unreachable(), Reply::json(503, ""), Reply::json(200, CLAIM_BODY)});
    server_.on(STATUS_URL, Reply::json(200, R"({"deviceStatus":"Pending"})"));
    create_agent(false, make_config());

    ASSERT_TRUE(agent_->start().is_ok());
    ASSERT_TRUE(wait_until([this]() { return agent_->registration_status() == RegistrationStatus::QrIssued; }));
    EXPECT_EQ(server_.count(CLAIM_URL), 3u);
}

TEST_F(AgentTest, NotificationsRejectedBeforeActivation) {
    create_agent(false, make_config());
    auto result = agent_->on_update_notification(R"({"action":"refresh"})");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::NotActivated);
}

TEST_F(AgentTest, NotificationAppliesIncrementalUpdate) {
    serve_content();
    create_agent(true, make_config());
    ASSERT_TRUE(agent_->start().is_ok());
    ASSERT_TRUE(wait_until([this]() { return agent_->playable_items().size() == 2; }));

    ASSERT_TRUE(agent_->on_update_notification(R"({"playlistId":"pl-1","action":"remove","itemId":"intro"})")
                    .is_ok());
    auto playlist = agent_->playlist();
    ASSERT_EQ(playlist.items.size(), 1u);
    EXPECT_EQ(playlist.items[0].id, "menu");
    EXPECT_EQ(agent_->playable_items().size(), 1u);
}

TEST_F(AgentTest, DeletionRestartsRegistration) {
    server_.on_sequence(HEARTBEAT_URL, {Reply::json(200, R"({"messageCount":0})"), Reply::json(200, DELETED_BODY)});
    server_.on(PLAYLIST_URL, Reply::json(200, PLAYLIST_BODY));
    server_.on("http://cdn.test/intro.mp4", Reply::json(200, "video-bytes"));
    server_.on("http://cdn.test/menu.jpg", Reply::json(200, "photo-bytes"));
    server_.on(CLAIM_URL, Reply::json(200, CLAIM_BODY));
    server_.on(STATUS_URL, Reply::json(200, R"({"deviceStatus":"Pending"})"));
    create_agent(true, make_config());

    subs_.push_back(agent_->on(events::SYNC_PAUSED, [this](const EventData&) { ++paused_; }));

    ASSERT_TRUE(agent_->start().is_ok());
    ASSERT_TRUE(wait_until([this]() { return server_.count(CLAIM_URL) == 1; }));
    ASSERT_TRUE(wait_until([this]() { return agent_->registration_status() == RegistrationStatus::QrIssued; }));

    EXPECT_EQ(paused_.load(), 1);
    auto credentials = agent_->credentials();
    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->assigned_id, "guid-1");
    EXPECT_FALSE(credentials->is_activated());

    auto rejected = agent_->on_update_notification(R"({"action":"refresh"})");
    EXPECT_EQ(rejected.error_code(), ErrorCode::NotActivated);
}

TEST_F(AgentTest, StopIsIdempotent) {
    serve_content();
    create_agent(true, make_config());
    ASSERT_TRUE(agent_->start().is_ok());

    subs_.push_back(agent_->on(events::AGENT_STOPPED, [this](const EventData&) { ++stopped_; }));

    agent_->stop();
    agent_->stop();
    EXPECT_FALSE(agent_->is_running());
    EXPECT_EQ(stopped_.load(), 1);
}

}  // namespace
}  // namespace kioskagent
