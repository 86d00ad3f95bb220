#pragma once

/**
 * @file http.hpp
 * @brief HTTP client abstraction for the kiosk agent
 *
 * Provides a clean HTTP client interface using cpp-httplib under the hood.
 * Every request carries the backend's versioning headers; callers add the
 * per-endpoint authentication header.
 */

#include "kioskagent.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kioskagent {
namespace http {

/// HTTP method
enum class Method { GET, POST, PUT, DELETE_METHOD };

/// Header map sent with a request
using Headers = std::map<std::string, std::string>;

/// HTTP response structure
struct Response {
    int status_code = 0;
    std::string body;
    bool success = false;
    std::string error_message;  // Set only for transport failures
};

/// Polled while a download streams; returning true abandons the transfer
using CancelCheck = std::function<bool()>;

/// HTTP request structure
struct Request {
    Method method = Method::GET;
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    Headers headers;
    CancelCheck cancelled;  // Honoured by download()
};

/**
 * @brief HTTP client interface
 *
 * Abstract interface for HTTP operations. Can be mocked for testing.
 */
class HttpClientInterface {
  public:
    virtual ~HttpClientInterface() = default;

    /// Send an HTTP request and return the response
    [[nodiscard]] virtual Response send(const Request& request) = 0;

    /// Stream a GET response body into destination.
    /// On a non-2xx status the file content is unspecified and body holds the error text.
    [[nodiscard]] virtual Response download(const Request& request,
                                            const std::filesystem::path& destination) = 0;

    /// Shut down the connection of a request in progress from another thread.
    /// The request fails as canceled; the client is unusable afterwards.
    virtual void abort() = 0;

    /// Check if the client is properly configured
    [[nodiscard]] virtual bool is_configured() const = 0;
};

/**
 * @brief HTTP client using cpp-httplib
 *
 * Implements HttpClientInterface using cpp-httplib for actual HTTP communication.
 * Supports HTTPS with SSL certificate verification.
 */
class HttpClient : public HttpClientInterface {
  public:
    /// Configuration for the HTTP client
    struct Config {
        std::string base_url;
        int timeout_seconds = 30;
        bool verify_ssl = true;
        int max_retries = 0;
        int retry_interval_ms = 1000;
    };

    /// Construct with configuration
    explicit HttpClient(Config config);

    /// Destructor
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Send an HTTP request
    [[nodiscard]] Response send(const Request& request) override;

    /// Stream a GET response into a file
    [[nodiscard]] Response download(const Request& request,
                                    const std::filesystem::path& destination) override;

    /// Stop the underlying connection; safe while send() or download() runs
    void abort() override;

    /// Check if properly configured
    [[nodiscard]] bool is_configured() const override;

    /// Get the base URL
    [[nodiscard]] const std::string& base_url() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Creates a client bound to a base URL with the given per-request timeout
using ClientFactory =
    std::function<std::unique_ptr<HttpClientInterface>(const std::string& base_url, int timeout_seconds)>;

/// Factory producing cpp-httplib clients
[[nodiscard]] ClientFactory make_client_factory(bool verify_ssl);

/// Absolute URL split into "scheme://host[:port]" and the remaining path + query
struct UrlParts {
    std::string origin;
    std::string path;
};

/// Split an absolute http(s) URL; nullopt if it is not one
[[nodiscard]] std::optional<UrlParts> split_url(const std::string& url);

/// Headers every backend request carries (version: v1, Accept: application/json)
[[nodiscard]] Headers default_headers();

/// Convert HTTP status code to ErrorCode
[[nodiscard]] inline ErrorCode status_code_to_error_code(int status) {
    if (status >= 200 && status < 300) {
        return ErrorCode::Success;
    }

    switch (status) {
        case 0:
            return ErrorCode::NetworkError;
        case 400:
            return ErrorCode::InvalidParameter;
        case 401:
            return ErrorCode::AuthenticationFailed;
        case 403:
            return ErrorCode::PermissionDenied;
        case 404:
        case 410:
            return ErrorCode::NotFound;
        case 408:
            return ErrorCode::ConnectionTimeout;
        case 422:
            return ErrorCode::ValidationFailed;
        default:
            if (status >= 400 && status < 500) {
                return ErrorCode::InvalidParameter;
            }
            if (status >= 500) {
                return ErrorCode::ServerError;
            }
            return ErrorCode::NetworkError;
    }
}

}  // namespace http
}  // namespace kioskagent
