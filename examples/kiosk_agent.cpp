/**
 * @file kiosk_agent.cpp
 * @brief Kiosk agent daemon
 *
 * Usage: kioskagent [config.json]
 *
 * Loads the base configuration, overlays the environment, starts the agent
 * and feeds it update notifications read from stdin, one JSON message per
 * line. Stops on SIGINT, SIGTERM or end of input.
 */

#include <kioskagent/agent.hpp>
#include <kioskagent/config.hpp>
#include <kioskagent/crypto.hpp>
#include <kioskagent/logging.hpp>

#include <boost/log/trivial.hpp>

#include <poll.h>
#include <unistd.h>

#include <any>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int /*signal*/) {
    g_stop_requested = 1;
}

/// Read available stdin bytes into buffer; false on end of input or error
bool read_stdin(std::string& buffer) {
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&fd, 1, 200);
    if (ready < 0) {
        return errno == EINTR;
    }
    if (ready == 0) {
        return true;
    }

    char chunk[4096];
    ssize_t count = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (count < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (count == 0) {
        return false;
    }
    buffer.append(chunk, static_cast<size_t>(count));
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config.json";

    kioskagent::Config config;
    auto loaded = kioskagent::config::load_config(config_path);
    if (loaded.is_ok()) {
        config = loaded.value();
    } else if (loaded.error_code() == kioskagent::ErrorCode::FileNotFound) {
        std::cerr << "No configuration at " << config_path << ", using defaults\n";
    } else {
        std::cerr << "Invalid configuration " << config_path << ": " << loaded.error_message() << "\n";
        return 1;
    }
    kioskagent::config::apply_environment(config);

    kioskagent::logging::init(config.log_level, config.log_file);

    kioskagent::Agent agent(config);

    auto claim_sub = agent.on(kioskagent::events::REGISTRATION_CLAIM_ISSUED, [&config](const kioskagent::EventData& data) {
        const auto& ticket = std::any_cast<const kioskagent::ClaimTicket&>(data);
        BOOST_LOG_TRIVIAL(info) << "Scan to register this device: " << ticket.url << " (code "
                                << ticket.activation_code << ")";

        auto qr_path = std::filesystem::path(config.config_dir) / "registration_qr.png";
        auto written = kioskagent::crypto::write_qr_image(ticket, qr_path);
        if (written.is_ok()) {
            BOOST_LOG_TRIVIAL(info) << "QR code written to " << qr_path;
        } else {
            BOOST_LOG_TRIVIAL(warning) << "QR code not written: " << written.error_message();
        }
    });

    auto messages_sub = agent.on(kioskagent::events::HEARTBEAT_MESSAGE_COUNT_CHANGED,
                                 [](const kioskagent::EventData& data) {
                                     BOOST_LOG_TRIVIAL(info) << "Messages waiting: " << std::any_cast<int64_t>(data);
                                 });

    auto ready_sub = agent.on(kioskagent::events::DOWNLOAD_SUCCEEDED, [](const kioskagent::EventData& data) {
        const auto& playable = std::any_cast<const kioskagent::PlayableItem&>(data);
        BOOST_LOG_TRIVIAL(info) << "Ready to play " << playable.item.id << " from " << playable.local_path;
    });

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto started = agent.start();
    if (started.is_error()) {
        BOOST_LOG_TRIVIAL(fatal) << "Agent not started: " << started.error_message();
        return 1;
    }

    std::string buffer;
    bool input_open = true;
    while (!g_stop_requested && input_open) {
        input_open = read_stdin(buffer);

        std::string::size_type newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            auto applied = agent.on_update_notification(line);
            if (applied.is_error()) {
                BOOST_LOG_TRIVIAL(warning) << "Notification not applied: " << applied.error_message();
            }
        }
    }

    BOOST_LOG_TRIVIAL(info) << (g_stop_requested ? "Signal received" : "Input closed") << ", shutting down";
    claim_sub.cancel();
    messages_sub.cancel();
    ready_sub.cancel();
    agent.stop();
    return 0;
}
