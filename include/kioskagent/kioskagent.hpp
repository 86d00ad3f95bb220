#pragma once

/**
 * @file kioskagent.hpp
 * @brief Kiosk device agent core types
 *
 * Shared vocabulary for the registration, heartbeat, media cache and content
 * synchronization components: error codes, Result, device credentials,
 * playlist and cache records, and the agent configuration.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kioskagent {

/// Library version
constexpr const char* VERSION = "1.0.0";

/// Error codes returned by agent operations
enum class ErrorCode {
    Success = 0,

    // Network errors
    NetworkError,
    ConnectionTimeout,
    SSLError,

    // Authentication/Authorization
    AuthenticationFailed,
    PermissionDenied,

    // Backend responses
    NotFound,
    ServerError,

    // Request errors
    MissingParameter,
    InvalidParameter,

    // Payload errors
    ParseError,
    ValidationFailed,

    // Device state
    NotActivated,
    Cancelled,

    // Cache and file errors
    CacheFull,
    FileError,
    FileNotFound,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::NetworkError:
            return "Network error";
        case ErrorCode::ConnectionTimeout:
            return "Connection timeout";
        case ErrorCode::SSLError:
            return "SSL/TLS error";
        case ErrorCode::AuthenticationFailed:
            return "Authentication failed";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::ServerError:
            return "Server error";
        case ErrorCode::MissingParameter:
            return "Missing required parameter";
        case ErrorCode::InvalidParameter:
            return "Invalid parameter";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::ValidationFailed:
            return "Validation failed";
        case ErrorCode::NotActivated:
            return "Device not activated";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::CacheFull:
            return "Cache full";
        case ErrorCode::FileError:
            return "File error";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Timestamp type used throughout the agent
using Timestamp = std::chrono::system_clock::time_point;

// ==================== Registration ====================

/// Registration lifecycle of the device
enum class RegistrationStatus {
    Unregistered,
    QrIssued,
    Claimed,
    Activated,
    Cancelled
};

/// Convert registration status to the string persisted in registration.json
[[nodiscard]] constexpr const char* registration_status_to_string(RegistrationStatus status) noexcept {
    switch (status) {
        case RegistrationStatus::Unregistered:
            return "Unregistered";
        case RegistrationStatus::QrIssued:
            return "QR issued";
        case RegistrationStatus::Claimed:
            return "Claimed";
        case RegistrationStatus::Activated:
            return "Activated";
        case RegistrationStatus::Cancelled:
            return "Cancelled";
    }
    return "Unregistered";
}

/// Parse a backend or persisted device status.
/// Unrecognised values ("Pending", empty) are treated as an issued claim.
[[nodiscard]] inline RegistrationStatus registration_status_from_string(const std::string& str) noexcept {
    if (str == "Claimed")
        return RegistrationStatus::Claimed;
    if (str == "Activated")
        return RegistrationStatus::Activated;
    return RegistrationStatus::QrIssued;
}

/**
 * @brief Device identity issued by the registration handshake
 *
 * api_key is present if and only if status is Activated.
 */
struct DeviceCredentials {
    std::string assigned_id;
    std::string access_token;
    RegistrationStatus status = RegistrationStatus::QrIssued;
    std::optional<std::string> api_key;
    std::optional<int64_t> branch_id;
    std::optional<std::string> branch_name;

    [[nodiscard]] bool is_activated() const noexcept {
        return status == RegistrationStatus::Activated && api_key.has_value() && !api_key->empty();
    }

    /// True when a claim was issued and can be polled without a new request
    [[nodiscard]] bool is_resumable() const noexcept {
        return !assigned_id.empty() && !access_token.empty();
    }
};

/**
 * @brief Location record fetched once after activation
 */
struct BranchInfo {
    int64_t id = 0;
    std::string name;
    std::string address1;
    std::optional<std::string> address2;
    std::string city;
    std::string state;
    std::optional<std::string> zip;
    std::optional<std::string> country;
    std::optional<std::string> phone;

    /// Verbatim backend object, kept so unmodelled fields survive on disk
    std::string raw_json;
};

/**
 * @brief Scannable claim handed to the registration UI
 */
struct ClaimTicket {
    std::string assigned_id;
    std::string access_token;
    std::string qr_code_image;    // Base64 PNG, data URI prefix removed
    std::string url;
    std::string activation_code;  // Last path segment of url
};

// ==================== Content ====================

/// Kind of media a playlist item renders
enum class MediaKind { Photo, Video };

[[nodiscard]] constexpr const char* media_kind_to_string(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Photo:
            return "photo";
        case MediaKind::Video:
            return "video";
    }
    return "photo";
}

/// Parse media kind; "image" is accepted as an alias of photo
[[nodiscard]] inline std::optional<MediaKind> media_kind_from_string(const std::string& str) noexcept {
    if (str == "photo" || str == "image")
        return MediaKind::Photo;
    if (str == "video")
        return MediaKind::Video;
    return std::nullopt;
}

/**
 * @brief One entry of the playback schedule
 */
struct MediaItem {
    std::string id;
    MediaKind kind = MediaKind::Photo;
    std::string source_url;
    int duration_seconds = 0;  // Photos only
    int order = 0;
    std::optional<std::string> checksum;  // sha256 hex
    std::optional<uint64_t> size_bytes;
};

/**
 * @brief Ordered content schedule the device renders
 */
struct Playlist {
    std::string playlist_id;
    std::string version;
    std::optional<Timestamp> last_updated;
    std::vector<MediaItem> items;

    /// Find an item by id
    [[nodiscard]] const MediaItem* find(const std::string& item_id) const noexcept {
        for (const auto& item : items) {
            if (item.id == item_id) {
                return &item;
            }
        }
        return nullptr;
    }
};

/**
 * @brief A media file held by the local cache
 */
struct CacheEntry {
    std::string key;  // sha256 of source_url
    std::string source_url;
    std::filesystem::path local_path;
    uint64_t size_bytes = 0;
    std::optional<std::string> checksum;
    Timestamp last_accessed_at;
    bool valid = false;
};

/// State of a single item download
enum class DownloadState { Pending, InFlight, Succeeded, Failed };

[[nodiscard]] constexpr const char* download_state_to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::Pending:
            return "pending";
        case DownloadState::InFlight:
            return "in_flight";
        case DownloadState::Succeeded:
            return "succeeded";
        case DownloadState::Failed:
            return "failed";
    }
    return "pending";
}

/**
 * @brief Download bookkeeping for one playlist item
 */
struct DownloadTask {
    MediaItem item;
    int attempts = 0;
    DownloadState state = DownloadState::Pending;
    std::filesystem::path local_path;
    std::string last_error;
};

/// A playlist item whose media is on disk and ready to render
struct PlayableItem {
    MediaItem item;
    std::filesystem::path local_path;
};

/// Incremental playlist update kinds delivered by the real-time channel
enum class UpdateAction { Refresh, Add, Remove, Update };

[[nodiscard]] constexpr const char* update_action_to_string(UpdateAction action) noexcept {
    switch (action) {
        case UpdateAction::Refresh:
            return "refresh";
        case UpdateAction::Add:
            return "add";
        case UpdateAction::Remove:
            return "remove";
        case UpdateAction::Update:
            return "update";
    }
    return "refresh";
}

[[nodiscard]] inline std::optional<UpdateAction> update_action_from_string(const std::string& str) noexcept {
    if (str == "refresh")
        return UpdateAction::Refresh;
    if (str == "add")
        return UpdateAction::Add;
    if (str == "remove")
        return UpdateAction::Remove;
    if (str == "update")
        return UpdateAction::Update;
    return std::nullopt;
}

// ==================== Configuration ====================

/**
 * @brief Configuration for the kiosk agent
 */
struct Config {
    /// Device registration / content backend (BASE_URL)
    std::string base_url = "http://localhost:5000";

    /// Inventory backend serving branch details (BASE_URL_INVENTORY)
    std::string inventory_base_url = "http://localhost:5001";

    /// Device type sent with the claim request
    int device_type = 11;

    /// Directory holding registration.json and branchInfo.json
    std::string config_dir = "Config";

    /// Directory for downloaded media
    std::string cache_dir = "media-cache";

    /// Upper bound on the total size of cached media
    uint64_t max_cache_bytes = 50ULL * 1024 * 1024 * 1024;

    /// Interval between registration status polls in seconds
    double registration_poll_interval = 10.0;

    /// Interval between heartbeats in seconds
    double heartbeat_interval = 60.0;

    /// Per-request timeout for heartbeats in seconds
    int heartbeat_timeout_seconds = 10;

    /// Per-request timeout for API calls in seconds
    int timeout_seconds = 30;

    /// Per-request timeout for media downloads in seconds
    int download_timeout_seconds = 300;

    /// Attempts per media item before it is skipped
    int max_download_attempts = 3;

    /// Backoff before the second download attempt; doubles afterwards
    int download_backoff_ms = 1000;

    /// Download worker pool size
    int max_concurrent_downloads = 3;

    /// Duration applied to photos that arrive without one
    int default_image_duration = 10;

    /// Enable SSL certificate verification (disable only for testing!)
    bool verify_ssl = true;

    /// Minimum log severity (trace, debug, info, warning, error, fatal)
    std::string log_level = "info";

    /// Log file path; empty logs to the console only
    std::string log_file;
};

}  // namespace kioskagent
