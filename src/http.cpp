#include "kioskagent/http.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <thread>

// Detect SSL support in cpp-httplib
#if defined(CPPHTTPLIB_OPENSSL_SUPPORT)
#define KIOSKAGENT_HTTP_HAS_SSL 1
#else
#define KIOSKAGENT_HTTP_HAS_SSL 0
#endif

namespace kioskagent {
namespace http {

namespace {

std::string describe_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
            return "Connection failed";
        case httplib::Error::Read:
            return "Read failed";
        case httplib::Error::Write:
            return "Write failed";
        case httplib::Error::Canceled:
            return "Request canceled";
#if KIOSKAGENT_HTTP_HAS_SSL
        case httplib::Error::SSLConnection:
            return "SSL connection failed";
        case httplib::Error::SSLServerVerification:
            return "SSL certificate verification failed";
#endif
        default:
            return "Unknown network error";
    }
}

bool is_retryable(httplib::Error error) {
    return error == httplib::Error::Connection || error == httplib::Error::Read ||
           error == httplib::Error::Write;
}

}  // namespace

// ==================== HttpClient Implementation ====================

class HttpClient::Impl {
  public:
    explicit Impl(Config config) : config_(std::move(config)) {
        auto parts = split_url(config_.base_url);
        if (!parts) {
            return;
        }

        // Anything after the origin is a path prefix for every request
        base_path_ = parts->path;
        while (!base_path_.empty() && base_path_.back() == '/') {
            base_path_.pop_back();
        }

        bool use_https = parts->origin.compare(0, 8, "https://") == 0;
#if !KIOSKAGENT_HTTP_HAS_SSL
        if (use_https) {
            // SSL not available - HTTPS URLs will fail at request time
            https_requested_ = true;
            configured_ = true;
            return;
        }
#endif

        client_ = std::make_unique<httplib::Client>(parts->origin);
        client_->set_connection_timeout(config_.timeout_seconds);
        client_->set_read_timeout(config_.timeout_seconds);
        client_->set_write_timeout(config_.timeout_seconds);
        client_->set_follow_location(true);

#if KIOSKAGENT_HTTP_HAS_SSL
        if (use_https && !config_.verify_ssl) {
            client_->enable_server_certificate_verification(false);
        }
#else
        (void)use_https;
#endif

        configured_ = client_->is_valid();
    }

    Response send(const Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        Response response;
        if (!check_usable(response)) {
            return response;
        }

        auto headers = build_headers(request);
        std::string full_path = base_path_ + request.path;

        // Retry loop
        for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
            httplib::Result result = dispatch(request, full_path, headers);

            if (result) {
                response.status_code = result->status;
                response.body = result->body;
                response.success = (result->status >= 200 && result->status < 300);
                return response;
            }

            auto error = result.error();
            if (is_retryable(error) && attempt < config_.max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_interval_ms));
                continue;
            }

            response.error_message = describe_error(error);
            break;
        }

        return response;
    }

    Response download(const Request& request, const std::filesystem::path& destination) {
        std::lock_guard<std::mutex> lock(mutex_);

        Response response;
        if (!check_usable(response)) {
            return response;
        }
        auto cancelled = [this, &request]() {
            return aborted_.load() || (request.cancelled && request.cancelled());
        };
        if (cancelled()) {
            response.error_message = describe_error(httplib::Error::Canceled);
            return response;
        }

        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            response.error_message = "Cannot open " + destination.string() + " for writing";
            return response;
        }

        auto headers = build_headers(request);
        std::string full_path = base_path_ + request.path;

        int status = 0;
        std::string error_body;
        bool write_failed = false;

        auto result = client_->Get(
            full_path, headers,
            [&status, &cancelled](const httplib::Response& r) {
                status = r.status;
                return !cancelled();
            },
            [&](const char* data, size_t length) {
                if (cancelled()) {
                    return false;
                }
                if (status >= 200 && status < 300) {
                    out.write(data, static_cast<std::streamsize>(length));
                    if (!out) {
                        write_failed = true;
                        return false;
                    }
                } else if (error_body.size() < 4096) {
                    error_body.append(data, length);
                }
                return true;
            });

        out.close();

        if (write_failed) {
            response.error_message = "Write to " + destination.string() + " failed";
            return response;
        }
        if (!result) {
            // A socket shut down by abort() surfaces as a read error
            response.error_message =
                cancelled() ? describe_error(httplib::Error::Canceled) : describe_error(result.error());
            return response;
        }

        response.status_code = status;
        response.success = (status >= 200 && status < 300);
        if (!response.success) {
            response.body = std::move(error_body);
        }
        return response;
    }

    void abort() {
        aborted_ = true;
        if (client_) {
            client_->stop();
        }
    }

    bool is_configured() const { return configured_; }

    const std::string& base_url() const { return config_.base_url; }

  private:
    bool check_usable(Response& response) const {
#if !KIOSKAGENT_HTTP_HAS_SSL
        // If HTTPS was requested but SSL is not available, fail gracefully
        if (https_requested_) {
            response.error_message = "HTTPS not supported: cpp-httplib was compiled without SSL support";
            return false;
        }
#endif
        if (!client_ || !configured_) {
            response.error_message = "HTTP client not configured";
            return false;
        }
        return true;
    }

    httplib::Headers build_headers(const Request& request) const {
        httplib::Headers headers;
        for (const auto& [name, value] : default_headers()) {
            if (request.headers.find(name) == request.headers.end()) {
                headers.emplace(name, value);
            }
        }
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }
        headers.emplace("User-Agent", std::string("kioskagent/") + VERSION);
        return headers;
    }

    httplib::Result dispatch(const Request& request, const std::string& path,
                             const httplib::Headers& headers) {
        switch (request.method) {
            case Method::GET:
                return client_->Get(path, headers);
            case Method::POST:
                return client_->Post(path, headers, request.body, request.content_type);
            case Method::PUT:
                return client_->Put(path, headers, request.body, request.content_type);
            case Method::DELETE_METHOD:
                return client_->Delete(path, headers);
        }
        return client_->Get(path, headers);
    }

    Config config_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
#if !KIOSKAGENT_HTTP_HAS_SSL
    bool https_requested_ = false;
#endif
    bool configured_ = false;
    std::atomic<bool> aborted_{false};
    std::mutex mutex_;
};

HttpClient::HttpClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Response HttpClient::send(const Request& request) {
    return impl_->send(request);
}

Response HttpClient::download(const Request& request, const std::filesystem::path& destination) {
    return impl_->download(request, destination);
}

void HttpClient::abort() {
    impl_->abort();
}

bool HttpClient::is_configured() const {
    return impl_->is_configured();
}

const std::string& HttpClient::base_url() const {
    return impl_->base_url();
}

// ==================== Helpers ====================

ClientFactory make_client_factory(bool verify_ssl) {
    return [verify_ssl](const std::string& base_url,
                        int timeout_seconds) -> std::unique_ptr<HttpClientInterface> {
        HttpClient::Config config;
        config.base_url = base_url;
        config.timeout_seconds = timeout_seconds;
        config.verify_ssl = verify_ssl;
        return std::make_unique<HttpClient>(std::move(config));
    };
}

std::optional<UrlParts> split_url(const std::string& url) {
    std::string rest;
    std::string scheme;
    if (url.compare(0, 8, "https://") == 0) {
        scheme = "https://";
        rest = url.substr(8);
    } else if (url.compare(0, 7, "http://") == 0) {
        scheme = "http://";
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    auto slash_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash_pos);
    if (authority.empty()) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.origin = scheme + authority;
    if (slash_pos != std::string::npos) {
        parts.path = rest.substr(slash_pos);
        if (parts.path.front() == '?') {
            parts.path.insert(parts.path.begin(), '/');
        }
    }
    return parts;
}

Headers default_headers() {
    return Headers{{"version", "v1"}, {"Accept", "application/json"}};
}

}  // namespace http
}  // namespace kioskagent
