#pragma once

/**
 * @file mock_http.hpp
 * @brief Scripted HTTP backend shared by the component tests
 *
 * Routes are keyed by the full URL (client base URL + request path). A route
 * holds a sequence of replies; the last one repeats. Unknown routes fail
 * like an unreachable host.
 */

#include <kioskagent/http.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace kioskagent {
namespace testutil {

struct Reply {
    int status = 200;
    std::string body;
    bool transport_error = false;

    static Reply json(int status, std::string body) { return Reply{status, std::move(body), false}; }
    static Reply unreachable() { return Reply{0, "", true}; }
};

struct RecordedRequest {
    std::string url;
    http::Request request;
};

class MockServer {
  public:
    /// Always answer url with reply
    void on(const std::string& url, Reply reply) { on_sequence(url, {std::move(reply)}); }

    /// Answer url with replies in order; the last one repeats
    void on_sequence(const std::string& url, std::vector<Reply> replies) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = Route{std::move(replies), 0};
    }

    /// Delay every reply (simulates a slow backend)
    void set_latency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    /// Called with the URL of every request before it is answered
    void set_observer(std::function<void(const std::string&)> observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = std::move(observer);
    }

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] size_t count(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& recorded : requests_) {
            if (recorded.url == url) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] std::optional<RecordedRequest> last(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
            if (it->url == url) {
                return *it;
            }
        }
        return std::nullopt;
    }

    /// Answer a request; interrupted cuts the simulated latency short
    http::Response handle(const std::string& base_url, const http::Request& request,
                          const std::function<bool()>& interrupted = {}) {
        std::string url = base_url + request.path;
        Reply reply;
        std::chrono::milliseconds latency{0};
        std::function<void(const std::string&)> observer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(RecordedRequest{url, request});
            latency = latency_;
            observer = observer_;
            auto it = routes_.find(url);
            if (it == routes_.end() || it->second.replies.empty()) {
                reply = Reply::unreachable();
            } else {
                auto& route = it->second;
                reply = route.replies[std::min(route.next, route.replies.size() - 1)];
                ++route.next;
            }
        }

        if (observer) {
            observer(url);
        }

        http::Response response;
        auto deadline = std::chrono::steady_clock::now() + latency;
        while (std::chrono::steady_clock::now() < deadline) {
            if (interrupted && interrupted()) {
                response.error_message = "Request canceled";
                return response;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        if (reply.transport_error) {
            response.error_message = "Connection failed";
            return response;
        }
        response.status_code = reply.status;
        response.body = reply.body;
        response.success = reply.status >= 200 && reply.status < 300;
        return response;
    }

    http::ClientFactory factory();

  private:
    struct Route {
        std::vector<Reply> replies;
        size_t next = 0;
    };

    std::map<std::string, Route> routes_;
    std::vector<RecordedRequest> requests_;
    std::chrono::milliseconds latency_{0};
    std::function<void(const std::string&)> observer_;
    mutable std::mutex mutex_;
};

class MockHttpClient : public http::HttpClientInterface {
  public:
    MockHttpClient(MockServer& server, std::string base_url) : server_(server), base_url_(std::move(base_url)) {}

    http::Response send(const http::Request& request) override {
        return server_.handle(base_url_, request, [this]() { return aborted_.load(); });
    }

    http::Response download(const http::Request& request, const std::filesystem::path& destination) override {
        auto response = server_.handle(base_url_, request, [this, &request]() {
            return aborted_.load() || (request.cancelled && request.cancelled());
        });
        if (response.success) {
            std::ofstream out(destination, std::ios::binary | std::ios::trunc);
            out << response.body;
            response.body.clear();
        }
        return response;
    }

    void abort() override { aborted_ = true; }

    bool is_configured() const override { return true; }

  private:
    MockServer& server_;
    std::string base_url_;
    std::atomic<bool> aborted_{false};
};

inline http::ClientFactory MockServer::factory() {
    return [this](const std::string& base_url, int /*timeout_seconds*/) -> std::unique_ptr<http::HttpClientInterface> {
        return std::make_unique<MockHttpClient>(*this, base_url);
    };
}

/// Poll a condition until it holds or the timeout expires
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

/// Temporary directory removed with its content on destruction
class TempDirectory {
  public:
    TempDirectory() {
        path_ = std::filesystem::temp_directory_path() /
                ("kioskagent_test_" +
                 std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + "_" +
                 std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

}  // namespace testutil
}  // namespace kioskagent
