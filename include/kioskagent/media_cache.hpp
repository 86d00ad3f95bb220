#pragma once

/**
 * @file media_cache.hpp
 * @brief Size-bounded on-disk media cache
 *
 * Files are keyed by the SHA-256 of their source URL. Downloads land in
 * "<key>.part", are validated and then renamed into place; the index
 * (cache_index.json) is rewritten through a temporary file after every
 * change. Eviction is least-recently-used and never touches entries the
 * current playlist references.
 */

#include "kioskagent/http.hpp"
#include "kioskagent/kioskagent.hpp"

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kioskagent {

/**
 * @brief Media cache manager
 *
 * Safe for concurrent use. Downloads for distinct keys run in parallel; a
 * second ensure() for a key that is already downloading waits for the first.
 * The internal lock is never held during network I/O.
 */
class MediaCache {
  public:
    struct Options {
        std::filesystem::path cache_dir;
        uint64_t max_bytes = 50ULL * 1024 * 1024 * 1024;
        int download_timeout_seconds = 300;
    };

    MediaCache(Options options, http::ClientFactory client_factory);

    MediaCache(const MediaCache&) = delete;
    MediaCache& operator=(const MediaCache&) = delete;

    /**
     * @brief Prepare the cache directory
     *
     * Removes stray partial downloads, loads the index, re-adopts files the
     * index does not know about and evicts down to the cap.
     */
    Result<void> open();

    /**
     * @brief Return a valid cached file for the item, downloading if needed
     *
     * Errors: NetworkError and HTTP-derived codes for failed downloads,
     * ValidationFailed for empty, wrongly sized or corrupt files, CacheFull
     * when the file cannot fit even after eviction, FileError for local I/O.
     * A download abandoned through cancelled or abort_downloads() is a
     * NetworkError and leaves no partial file.
     */
    Result<CacheEntry> ensure(const MediaItem& item, const http::CancelCheck& cancelled = {});

    /// Abort every download in progress; their ensure() calls return promptly
    void abort_downloads();

    /// Entry for a source URL without validation or download
    [[nodiscard]] std::optional<CacheEntry> lookup(const std::string& source_url) const;

    /// Replace the set of keys protected from eviction
    void set_referenced(std::set<std::string> keys);

    [[nodiscard]] bool is_referenced(const std::string& key) const;

    /// Delete an entry and its file; false if unknown
    bool remove(const std::string& key);

    [[nodiscard]] uint64_t total_size() const;
    [[nodiscard]] uint64_t capacity() const { return options_.max_bytes; }
    [[nodiscard]] std::vector<CacheEntry> entries() const;
    [[nodiscard]] std::filesystem::path index_path() const;

    /// Cache key of a source URL
    [[nodiscard]] static std::string key_for(const std::string& source_url);

  private:
    class InFlightGuard;

    Result<CacheEntry> download(const MediaItem& item, const std::string& key, const http::CancelCheck& cancelled);
    Result<CacheEntry> admit(const MediaItem& item, const std::string& key, const std::filesystem::path& part,
                             uint64_t size, std::optional<std::string> checksum);
    bool is_valid(const CacheEntry& entry, const MediaItem& item) const;

    // Callers hold mutex_
    bool evict_until_fits(uint64_t incoming);
    void drop_entry(std::map<std::string, CacheEntry>::iterator it);
    void save_index();
    void load_index();
    void adopt_unindexed_files();

    Options options_;
    http::ClientFactory client_factory_;

    std::map<std::string, CacheEntry> entries_;
    std::set<std::string> referenced_;
    std::set<std::string> in_flight_;
    std::set<http::HttpClientInterface*> active_clients_;
    uint64_t total_size_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable in_flight_cv_;
};

}  // namespace kioskagent
