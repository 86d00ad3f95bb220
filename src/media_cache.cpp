#include "kioskagent/media_cache.hpp"
#include "kioskagent/crypto.hpp"
#include "kioskagent/json.hpp"
#include "kioskagent/storage.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>

namespace kioskagent {

namespace fs = std::filesystem;

namespace {

constexpr const char* INDEX_FILE = "cache_index.json";
constexpr const char* PART_SUFFIX = ".part";
constexpr const char* TMP_SUFFIX = ".tmp";
constexpr size_t KEY_LENGTH = 64;

bool is_cache_key(const std::string& name) {
    return name.size() == KEY_LENGTH && std::all_of(name.begin(), name.end(), [](unsigned char c) {
               return std::isdigit(c) || (c >= 'a' && c <= 'f');
           });
}

/// File extension of the URL's last path segment, lowercased; empty when it has none
std::string extension_for(const std::string& source_url) {
    auto parts = http::split_url(source_url);
    if (!parts) {
        return "";
    }
    std::string path = parts->path.substr(0, parts->path.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == name.size() || name.size() - dot > 6) {
        return "";
    }

    std::string ext = name.substr(dot);
    for (size_t i = 1; i < ext.size(); ++i) {
        auto c = static_cast<unsigned char>(ext[i]);
        if (!std::isalnum(c)) {
            return "";
        }
        ext[i] = static_cast<char>(std::tolower(c));
    }
    return ext;
}

bool has_suffix(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

/// Releases a key reserved in in_flight_ and wakes waiters
class MediaCache::InFlightGuard {
  public:
    InFlightGuard(MediaCache& cache, std::string key) : cache_(cache), key_(std::move(key)) {}
    ~InFlightGuard() {
        {
            std::lock_guard<std::mutex> lock(cache_.mutex_);
            cache_.in_flight_.erase(key_);
        }
        cache_.in_flight_cv_.notify_all();
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

  private:
    MediaCache& cache_;
    std::string key_;
};

MediaCache::MediaCache(Options options, http::ClientFactory client_factory)
    : options_(std::move(options)), client_factory_(std::move(client_factory)) {}

std::string MediaCache::key_for(const std::string& source_url) {
    return crypto::sha256_hex(source_url);
}

fs::path MediaCache::index_path() const {
    return options_.cache_dir / INDEX_FILE;
}

// ==================== Startup ====================

Result<void> MediaCache::open() {
    std::error_code ec;
    fs::create_directories(options_.cache_dir, ec);
    if (ec) {
        return Result<void>::error(ErrorCode::FileError,
                                   "Cannot create " + options_.cache_dir.string() + ": " + ec.message());
    }

    // Leftovers of downloads or index writes interrupted by a crash
    for (auto it = fs::directory_iterator(options_.cache_dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (has_suffix(name, PART_SUFFIX) || has_suffix(name, TMP_SUFFIX)) {
            BOOST_LOG_TRIVIAL(info) << "Removing stray " << it->path();
            files::remove_file(it->path());
        }
    }
    if (ec) {
        return Result<void>::error(ErrorCode::FileError,
                                   "Cannot scan " + options_.cache_dir.string() + ": " + ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    total_size_ = 0;
    load_index();
    adopt_unindexed_files();

    if (total_size_ > options_.max_bytes) {
        BOOST_LOG_TRIVIAL(warning) << "Cache holds " << total_size_ << " bytes, above the cap of "
                                   << options_.max_bytes;
        if (!evict_until_fits(0)) {
            BOOST_LOG_TRIVIAL(warning) << "Referenced entries keep the cache above its cap";
        }
    }

    save_index();
    BOOST_LOG_TRIVIAL(info) << "Media cache ready: " << entries_.size() << " files, " << total_size_ << " bytes";
    return Result<void>::ok();
}

void MediaCache::load_index() {
    auto content = files::read_file(index_path());
    if (!content) {
        return;
    }

    auto j = json::try_parse(*content);
    if (!j || !j->is_object() || !j->contains("entries") || !(*j)["entries"].is_array()) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring malformed cache index " << index_path();
        return;
    }

    for (const auto& raw : (*j)["entries"]) {
        auto key = json::string_field(raw, {"key"});
        auto file = json::string_field(raw, {"file"});
        auto size = json::int_field(raw, {"size"});
        if (!key || !file || !size || *size <= 0) {
            continue;
        }

        fs::path path = options_.cache_dir / *file;
        std::error_code ec;
        auto actual = fs::file_size(path, ec);
        if (ec || actual != static_cast<uint64_t>(*size)) {
            BOOST_LOG_TRIVIAL(info) << "Dropping index entry " << *key << ": file missing or resized";
            if (!ec) {
                files::remove_file(path);
            }
            continue;
        }

        CacheEntry entry;
        entry.key = *key;
        entry.source_url = json::string_field(raw, {"source_url"}).value_or("");
        entry.local_path = path;
        entry.size_bytes = actual;
        entry.checksum = json::string_field(raw, {"checksum"});
        entry.last_accessed_at = json::from_unix_seconds(json::int_field(raw, {"last_accessed"}).value_or(0));
        entry.valid = true;

        total_size_ += entry.size_bytes;
        entries_[entry.key] = std::move(entry);
    }
}

void MediaCache::adopt_unindexed_files() {
    std::error_code ec;
    for (auto it = fs::directory_iterator(options_.cache_dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }

        std::string name = it->path().filename().string();
        std::string key = name.substr(0, name.find('.'));
        if (!is_cache_key(key) || entries_.count(key) > 0) {
            continue;
        }

        std::error_code size_ec;
        auto size = fs::file_size(it->path(), size_ec);
        if (size_ec || size == 0) {
            continue;
        }

        // Source unknown until an item with this key asks for it; oldest for LRU
        CacheEntry entry;
        entry.key = key;
        entry.local_path = it->path();
        entry.size_bytes = size;
        entry.last_accessed_at = Timestamp{};
        entry.valid = true;

        BOOST_LOG_TRIVIAL(info) << "Re-adopting cached file " << name;
        total_size_ += size;
        entries_[key] = std::move(entry);
    }
}

// ==================== Ensure ====================

Result<CacheEntry> MediaCache::ensure(const MediaItem& item, const http::CancelCheck& cancelled) {
    const std::string key = key_for(item.source_url);

    std::optional<CacheEntry> existing;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        in_flight_cv_.wait(lock, [this, &key]() { return in_flight_.count(key) == 0; });
        in_flight_.insert(key);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            existing = it->second;
        }
    }
    InFlightGuard guard(*this, key);

    if (existing) {
        bool valid = is_valid(*existing, item);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (valid && it != entries_.end()) {
            it->second.last_accessed_at = std::chrono::system_clock::now();
            if (it->second.source_url.empty()) {
                it->second.source_url = item.source_url;
            }
            save_index();
            return Result<CacheEntry>::ok(it->second);
        }
        if (it != entries_.end()) {
            BOOST_LOG_TRIVIAL(warning) << "Cached file for item " << item.id << " is invalid, downloading again";
            drop_entry(it);
            save_index();
        }
    }

    return download(item, key, cancelled);
}

void MediaCache::abort_downloads() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* client : active_clients_) {
        client->abort();
    }
}

bool MediaCache::is_valid(const CacheEntry& entry, const MediaItem& item) const {
    std::error_code ec;
    auto size = fs::file_size(entry.local_path, ec);
    if (ec || size == 0 || size != entry.size_bytes) {
        return false;
    }
    if (item.size_bytes && *item.size_bytes != size) {
        return false;
    }
    if (item.checksum) {
        if (entry.checksum) {
            return *entry.checksum == *item.checksum;
        }
        auto actual = crypto::sha256_file_hex(entry.local_path);
        return actual && *actual == *item.checksum;
    }
    return true;
}

Result<CacheEntry> MediaCache::download(const MediaItem& item, const std::string& key,
                                        const http::CancelCheck& cancelled) {
    auto parts = http::split_url(item.source_url);
    if (!parts) {
        return Result<CacheEntry>::error(ErrorCode::InvalidParameter, "Unsupported media URL " + item.source_url);
    }

    std::error_code ec;
    fs::create_directories(options_.cache_dir, ec);
    fs::path part = options_.cache_dir / (key + PART_SUFFIX);

    auto client = client_factory_(parts->origin, options_.download_timeout_seconds);

    http::Request request;
    request.method = http::Method::GET;
    request.path = parts->path.empty() ? "/" : parts->path;
    request.headers["Accept"] = "*/*";
    request.cancelled = cancelled;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_clients_.insert(client.get());
    }

    // Registered first: an abort_downloads() from here on reaches this client
    http::Response response;
    if (cancelled && cancelled()) {
        response.error_message = "Request canceled";
    } else {
        BOOST_LOG_TRIVIAL(debug) << "Downloading " << item.source_url;
        response = client->download(request, part);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_clients_.erase(client.get());
    }
    if (!response.success) {
        files::remove_file(part);
        if (response.status_code == 0) {
            return Result<CacheEntry>::error(ErrorCode::NetworkError,
                                             "Download of " + item.source_url + " failed: " + response.error_message);
        }
        return Result<CacheEntry>::error(http::status_code_to_error_code(response.status_code),
                                         "Download of " + item.source_url + " returned " +
                                             std::to_string(response.status_code));
    }

    auto size = fs::file_size(part, ec);
    if (ec) {
        files::remove_file(part);
        return Result<CacheEntry>::error(ErrorCode::FileError, "Cannot stat " + part.string() + ": " + ec.message());
    }
    if (size == 0) {
        files::remove_file(part);
        return Result<CacheEntry>::error(ErrorCode::ValidationFailed, "Empty download for item " + item.id);
    }
    if (item.size_bytes && *item.size_bytes != size) {
        files::remove_file(part);
        return Result<CacheEntry>::error(ErrorCode::ValidationFailed,
                                         "Item " + item.id + " is " + std::to_string(size) + " bytes, expected " +
                                             std::to_string(*item.size_bytes));
    }

    std::optional<std::string> checksum;
    if (item.checksum) {
        checksum = crypto::sha256_file_hex(part);
        if (!checksum) {
            files::remove_file(part);
            return Result<CacheEntry>::error(ErrorCode::FileError, "Cannot read " + part.string());
        }
        if (*checksum != *item.checksum) {
            files::remove_file(part);
            return Result<CacheEntry>::error(ErrorCode::ValidationFailed, "Checksum mismatch for item " + item.id);
        }
    }

    return admit(item, key, part, size, std::move(checksum));
}

Result<CacheEntry> MediaCache::admit(const MediaItem& item, const std::string& key, const fs::path& part,
                                     uint64_t size, std::optional<std::string> checksum) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (size > options_.max_bytes || !evict_until_fits(size)) {
        files::remove_file(part);
        return Result<CacheEntry>::error(ErrorCode::CacheFull, "No room for item " + item.id + " (" +
                                                                   std::to_string(size) + " bytes)");
    }

    fs::path final_path = options_.cache_dir / (key + extension_for(item.source_url));
    std::error_code ec;
    fs::rename(part, final_path, ec);
    if (ec) {
        files::remove_file(part);
        return Result<CacheEntry>::error(ErrorCode::FileError,
                                         "Cannot move download into place: " + ec.message());
    }

    CacheEntry entry;
    entry.key = key;
    entry.source_url = item.source_url;
    entry.local_path = final_path;
    entry.size_bytes = size;
    entry.checksum = std::move(checksum);
    entry.last_accessed_at = std::chrono::system_clock::now();
    entry.valid = true;

    total_size_ += size;
    entries_[key] = entry;
    save_index();

    BOOST_LOG_TRIVIAL(info) << "Cached item " << item.id << " (" << size << " bytes)";
    return Result<CacheEntry>::ok(std::move(entry));
}

// ==================== Eviction ====================

bool MediaCache::evict_until_fits(uint64_t incoming) {
    if (total_size_ + incoming <= options_.max_bytes) {
        return true;
    }

    std::vector<std::map<std::string, CacheEntry>::iterator> candidates;
    uint64_t evictable = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (referenced_.count(it->first) > 0 || in_flight_.count(it->first) > 0) {
            continue;
        }
        candidates.push_back(it);
        evictable += it->second.size_bytes;
    }

    // Nothing is evicted unless the cap can actually be met
    if (total_size_ - evictable + incoming > options_.max_bytes) {
        return false;
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        return a->second.last_accessed_at < b->second.last_accessed_at;
    });

    for (auto it : candidates) {
        if (total_size_ + incoming <= options_.max_bytes) {
            break;
        }
        BOOST_LOG_TRIVIAL(info) << "Evicting " << it->second.local_path.filename() << " ("
                                << it->second.size_bytes << " bytes)";
        drop_entry(it);
    }
    save_index();
    return true;
}

void MediaCache::drop_entry(std::map<std::string, CacheEntry>::iterator it) {
    files::remove_file(it->second.local_path);
    total_size_ -= std::min(total_size_, it->second.size_bytes);
    entries_.erase(it);
}

void MediaCache::save_index() {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [key, entry] : entries_) {
        nlohmann::json j;
        j["key"] = key;
        j["source_url"] = entry.source_url;
        j["file"] = entry.local_path.filename().string();
        j["size"] = entry.size_bytes;
        j["checksum"] = entry.checksum ? nlohmann::json(*entry.checksum) : nlohmann::json(nullptr);
        j["last_accessed"] = json::to_unix_seconds(entry.last_accessed_at);
        list.push_back(std::move(j));
    }

    nlohmann::json index;
    index["version"] = 1;
    index["entries"] = std::move(list);
    if (!files::write_file_atomic(index_path(), index.dump(2))) {
        BOOST_LOG_TRIVIAL(error) << "Failed to write cache index";
    }
}

// ==================== Queries ====================

std::optional<CacheEntry> MediaCache::lookup(const std::string& source_url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key_for(source_url));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MediaCache::set_referenced(std::set<std::string> keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    referenced_ = std::move(keys);
}

bool MediaCache::is_referenced(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return referenced_.count(key) > 0;
}

bool MediaCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    drop_entry(it);
    save_index();
    return true;
}

uint64_t MediaCache::total_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_size_;
}

std::vector<CacheEntry> MediaCache::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

}  // namespace kioskagent
