#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for kiosk agent types
 *
 * Uses nlohmann/json for parsing backend responses into agent types. Optional
 * backend fields are resolved here so the components only see validated
 * values.
 */

#include "kioskagent.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <sstream>

namespace kioskagent {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/// Parse ISO 8601 timestamp string to Timestamp (UTC)
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    // Parse ISO 8601 format: "2026-01-02T10:30:00Z"
    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        return std::nullopt;
    }

#if defined(_MSC_VER)
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    if (time == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(time);
}

/// Format Timestamp to ISO 8601 string
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

/// Seconds since the Unix epoch
[[nodiscard]] inline int64_t to_unix_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

// ==================== Field Helpers ====================

/// First non-empty string among the given keys (backend mixes PascalCase and camelCase)
[[nodiscard]] inline std::optional<std::string> string_field(const json& j,
                                                             std::initializer_list<const char*> keys) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

/// First integer among the given keys; numeric strings are accepted
[[nodiscard]] inline std::optional<int64_t> int_field(const json& j,
                                                      std::initializer_list<const char*> keys) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end()) {
            continue;
        }
        if (it->is_number_integer()) {
            return it->get<int64_t>();
        }
        if (it->is_number_float()) {
            return static_cast<int64_t>(it->get<double>());
        }
        if (it->is_string()) {
            try {
                return std::stoll(it->get<std::string>());
            } catch (const std::exception&) {
                // Not numeric, try the next key
            }
        }
    }
    return std::nullopt;
}

/// Shorten a raw payload for log output
[[nodiscard]] inline std::string truncate_for_log(const std::string& text, size_t max_length = 512) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length) + "...(" + std::to_string(text.size()) + " bytes)";
}

/// Parse text into a JSON value without throwing; discarded on malformed input
[[nodiscard]] inline std::optional<json> try_parse(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return j;
}

// ==================== Registration ====================

/// Remove a "data:image/png;base64," style prefix
[[nodiscard]] inline std::string strip_data_uri_prefix(const std::string& value) {
    if (value.compare(0, 5, "data:") == 0) {
        auto comma = value.find(',');
        if (comma != std::string::npos) {
            return value.substr(comma + 1);
        }
    }
    return value;
}

/// Parse the claim (QR registration) response
[[nodiscard]] inline Result<ClaimTicket> parse_claim_response(const json& j) {
    if (!j.is_object()) {
        return Result<ClaimTicket>::error(ErrorCode::ParseError, "Claim response is not an object");
    }

    ClaimTicket ticket;
    auto guid = string_field(j, {"AssignedGuid", "assignedGuid"});
    auto token = string_field(j, {"AccessToken", "accessToken"});
    if (!guid || !token) {
        return Result<ClaimTicket>::error(ErrorCode::ValidationFailed,
                                          "Claim response missing AssignedGuid or AccessToken");
    }
    ticket.assigned_id = *guid;
    ticket.access_token = *token;

    if (auto image = string_field(j, {"QrCodeImage", "qrCodeImage", "qrCode"})) {
        ticket.qr_code_image = strip_data_uri_prefix(*image);
    }
    if (auto url = string_field(j, {"Url", "url"})) {
        ticket.url = *url;
        std::string trimmed = *url;
        while (!trimmed.empty() && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        auto slash = trimmed.find_last_of('/');
        ticket.activation_code = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    }

    return Result<ClaimTicket>::ok(std::move(ticket));
}

/**
 * @brief Merge a device-status poll response into the stored credentials
 *
 * Status becomes Activated exactly when a non-empty apiKey is present; a
 * backend "Activated" without a key is recorded as Claimed.
 */
[[nodiscard]] inline DeviceCredentials parse_device_status(const json& j, DeviceCredentials current) {
    std::string status = string_field(j, {"deviceStatus", "DeviceStatus"}).value_or("");
    current.api_key = string_field(j, {"apiKey", "ApiKey"});
    current.branch_id = int_field(j, {"branchId", "BranchId"});
    current.branch_name = string_field(j, {"branch", "Branch"});

    if (current.api_key) {
        current.status = RegistrationStatus::Activated;
    } else {
        current.status = registration_status_from_string(status);
        if (current.status == RegistrationStatus::Activated) {
            current.status = RegistrationStatus::Claimed;
        }
    }
    return current;
}

/// Serialize credentials in the registration.json layout
[[nodiscard]] inline json credentials_to_json(const DeviceCredentials& credentials) {
    json j;
    j["AssignedGuid"] = credentials.assigned_id;
    j["AccessToken"] = credentials.access_token;
    j["DeviceStatus"] = registration_status_to_string(credentials.status);
    j["ApiKey"] = credentials.api_key ? json(*credentials.api_key) : json(nullptr);
    j["BranchId"] = credentials.branch_id ? json(*credentials.branch_id) : json(nullptr);
    j["Branch"] = credentials.branch_name ? json(*credentials.branch_name) : json(nullptr);
    return j;
}

/// Parse registration.json
[[nodiscard]] inline Result<DeviceCredentials> parse_credentials(const json& j) {
    if (!j.is_object()) {
        return Result<DeviceCredentials>::error(ErrorCode::ParseError,
                                                "Credentials document is not an object");
    }

    DeviceCredentials credentials;
    credentials.assigned_id = string_field(j, {"AssignedGuid"}).value_or("");
    credentials.access_token = string_field(j, {"AccessToken"}).value_or("");
    credentials.api_key = string_field(j, {"ApiKey"});
    credentials.branch_id = int_field(j, {"BranchId"});
    credentials.branch_name = string_field(j, {"Branch"});

    // Keep the apiKey <-> Activated invariant even for hand-edited files
    credentials.status = registration_status_from_string(string_field(j, {"DeviceStatus"}).value_or(""));
    if (credentials.api_key) {
        credentials.status = RegistrationStatus::Activated;
    } else if (credentials.status == RegistrationStatus::Activated) {
        credentials.status = RegistrationStatus::Claimed;
    }

    return Result<DeviceCredentials>::ok(std::move(credentials));
}

/// Parse branch details; the inventory API wraps them in "success"
[[nodiscard]] inline Result<BranchInfo> parse_branch_info(const json& j) {
    const json& data = (j.is_object() && j.contains("success") && j["success"].is_object())
                           ? j["success"]
                           : j;
    if (!data.is_object()) {
        return Result<BranchInfo>::error(ErrorCode::ParseError, "Branch response is not an object");
    }

    BranchInfo info;
    info.id = int_field(data, {"id", "Id"}).value_or(0);
    info.name = string_field(data, {"name", "Name"}).value_or("");
    info.address1 = string_field(data, {"address1", "Address1"}).value_or("");
    info.address2 = string_field(data, {"address2", "Address2"});
    info.city = string_field(data, {"city", "City"}).value_or("");
    info.state = string_field(data, {"state", "State"}).value_or("");
    info.zip = string_field(data, {"zip", "Zip", "zipCode", "postalCode"});
    info.country = string_field(data, {"country", "Country"});
    info.phone = string_field(data, {"phone", "Phone"});
    info.raw_json = data.dump();
    return Result<BranchInfo>::ok(std::move(info));
}

/// Serialize branch details, preserving the verbatim backend object when known
[[nodiscard]] inline json branch_info_to_json(const BranchInfo& info) {
    if (!info.raw_json.empty()) {
        auto raw = try_parse(info.raw_json);
        if (raw && raw->is_object()) {
            return *raw;
        }
    }

    json j;
    j["id"] = info.id;
    j["name"] = info.name;
    j["address1"] = info.address1;
    j["city"] = info.city;
    j["state"] = info.state;
    if (info.address2) j["address2"] = *info.address2;
    if (info.zip) j["zip"] = *info.zip;
    if (info.country) j["country"] = *info.country;
    if (info.phone) j["phone"] = *info.phone;
    return j;
}

// ==================== Heartbeat ====================

/**
 * @brief Check for the backend's device-deleted body
 *
 * The signature is an object whose message, innerException, errors and
 * stackTrace keys are all present with an explicit null value.
 */
[[nodiscard]] inline bool is_deletion_signature(const json& j) {
    if (!j.is_object()) {
        return false;
    }
    for (const char* key : {"message", "innerException", "errors", "stackTrace"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_null()) {
            return false;
        }
    }
    return true;
}

/// Heartbeat message counter; nullopt when absent or not a non-negative integer
[[nodiscard]] inline std::optional<int64_t> parse_message_count(const json& j) {
    auto count = int_field(j, {"messageCount", "MessageCount"});
    if (count && *count < 0) {
        return std::nullopt;
    }
    return count;
}

// ==================== Playlist ====================

/**
 * @brief Parse a playlist item
 *
 * Rejects items without id or url and items of unsupported kind. Photos
 * without a duration get default_duration.
 */
[[nodiscard]] inline Result<MediaItem> parse_media_item(const json& j, int default_duration) {
    if (!j.is_object()) {
        return Result<MediaItem>::error(ErrorCode::ValidationFailed, "Item is not an object");
    }

    MediaItem item;
    if (auto id = string_field(j, {"id"})) {
        item.id = *id;
    } else if (auto numeric_id = int_field(j, {"id"})) {
        item.id = std::to_string(*numeric_id);
    } else {
        return Result<MediaItem>::error(ErrorCode::ValidationFailed, "Item missing id");
    }

    auto url = string_field(j, {"url", "sourceUrl"});
    if (!url) {
        return Result<MediaItem>::error(ErrorCode::ValidationFailed, "Item " + item.id + " missing url");
    }
    item.source_url = *url;

    auto kind = media_kind_from_string(string_field(j, {"type", "kind"}).value_or(""));
    if (!kind) {
        return Result<MediaItem>::error(ErrorCode::ValidationFailed,
                                        "Item " + item.id + " has unsupported type");
    }
    item.kind = *kind;

    item.order = static_cast<int>(int_field(j, {"order"}).value_or(0));

    if (item.kind == MediaKind::Photo) {
        auto duration = int_field(j, {"duration", "durationSeconds"});
        item.duration_seconds =
            (duration && *duration > 0) ? static_cast<int>(*duration) : default_duration;
    }

    if (auto checksum = string_field(j, {"checksum", "sha256"})) {
        std::string lowered = *checksum;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        item.checksum = lowered;
    }
    if (auto size = int_field(j, {"size", "sizeBytes"}); size && *size > 0) {
        item.size_bytes = static_cast<uint64_t>(*size);
    }

    return Result<MediaItem>::ok(std::move(item));
}

/// Serialize an item in the backend layout
[[nodiscard]] inline json media_item_to_json(const MediaItem& item) {
    json j;
    j["id"] = item.id;
    j["type"] = media_kind_to_string(item.kind);
    j["url"] = item.source_url;
    j["order"] = item.order;
    if (item.kind == MediaKind::Photo) {
        j["duration"] = item.duration_seconds;
    }
    if (item.checksum) j["checksum"] = *item.checksum;
    if (item.size_bytes) j["size"] = *item.size_bytes;
    return j;
}

/// Stable sort by the order field; ties keep arrival order
inline void sort_by_order(std::vector<MediaItem>& items) {
    std::stable_sort(items.begin(), items.end(),
                     [](const MediaItem& a, const MediaItem& b) { return a.order < b.order; });
}

/**
 * @brief Parse a playlist document
 *
 * Malformed items are dropped; their ids (or positions) and reasons are
 * appended to rejected when given. Duplicate ids keep the first occurrence.
 */
[[nodiscard]] inline Result<Playlist> parse_playlist(const json& j, int default_duration,
                                                     std::vector<std::string>* rejected = nullptr) {
    if (!j.is_object()) {
        return Result<Playlist>::error(ErrorCode::ParseError, "Playlist is not an object");
    }

    Playlist playlist;
    if (auto id = string_field(j, {"playlistId"})) {
        playlist.playlist_id = *id;
    } else if (auto numeric_id = int_field(j, {"playlistId"})) {
        playlist.playlist_id = std::to_string(*numeric_id);
    }
    if (auto version = string_field(j, {"version"})) {
        playlist.version = *version;
    } else if (auto numeric_version = int_field(j, {"version"})) {
        playlist.version = std::to_string(*numeric_version);
    }
    if (auto updated = string_field(j, {"lastUpdated"})) {
        playlist.last_updated = parse_timestamp(*updated);
    }

    auto items = j.find("items");
    if (items != j.end() && !items->is_null() && !items->is_array()) {
        return Result<Playlist>::error(ErrorCode::ParseError, "Playlist items is not an array");
    }

    if (items != j.end() && items->is_array()) {
        size_t position = 0;
        for (const auto& raw : *items) {
            auto parsed = parse_media_item(raw, default_duration);
            if (parsed.is_error()) {
                if (rejected) {
                    rejected->push_back("#" + std::to_string(position) + ": " + parsed.error_message());
                }
            } else if (playlist.find(parsed.value().id) != nullptr) {
                if (rejected) {
                    rejected->push_back("#" + std::to_string(position) + ": duplicate id " +
                                        parsed.value().id);
                }
            } else {
                playlist.items.push_back(std::move(parsed).value());
            }
            ++position;
        }
    }

    sort_by_order(playlist.items);
    return Result<Playlist>::ok(std::move(playlist));
}

/// Serialize a playlist in the backend layout (used for the local snapshot)
[[nodiscard]] inline json playlist_to_json(const Playlist& playlist) {
    json j;
    j["playlistId"] = playlist.playlist_id;
    j["version"] = playlist.version;
    j["lastUpdated"] = playlist.last_updated ? json(format_timestamp(*playlist.last_updated))
                                             : json(nullptr);
    json items = json::array();
    for (const auto& item : playlist.items) {
        items.push_back(media_item_to_json(item));
    }
    j["items"] = std::move(items);
    return j;
}

// ==================== Update Notifications ====================

/**
 * @brief Real-time playlist update message
 *
 * payload keeps the whole message so item bodies and ids can be read by the
 * synchronizer for the specific action.
 */
struct UpdateNotification {
    std::string type;
    std::string playlist_id;
    UpdateAction action = UpdateAction::Refresh;
    json payload;
};

/// Parse a PlaylistUpdated / ContentChanged message. A missing action means refresh.
[[nodiscard]] inline Result<UpdateNotification> parse_update_notification(const json& j) {
    if (!j.is_object()) {
        return Result<UpdateNotification>::error(ErrorCode::ParseError,
                                                 "Notification is not an object");
    }

    UpdateNotification notification;
    notification.type = string_field(j, {"type"}).value_or("PlaylistUpdated");
    if (notification.type != "PlaylistUpdated" && notification.type != "ContentChanged") {
        return Result<UpdateNotification>::error(ErrorCode::InvalidParameter,
                                                 "Unsupported notification type " + notification.type);
    }

    if (auto id = string_field(j, {"playlistId"})) {
        notification.playlist_id = *id;
    } else if (auto numeric_id = int_field(j, {"playlistId"})) {
        notification.playlist_id = std::to_string(*numeric_id);
    }

    if (notification.type == "PlaylistUpdated") {
        auto action_name = string_field(j, {"action"});
        if (action_name) {
            auto action = update_action_from_string(*action_name);
            if (!action) {
                return Result<UpdateNotification>::error(ErrorCode::InvalidParameter,
                                                         "Unsupported action " + *action_name);
            }
            notification.action = *action;
        }
    }

    notification.payload = j;
    return Result<UpdateNotification>::ok(std::move(notification));
}

}  // namespace json
}  // namespace kioskagent
