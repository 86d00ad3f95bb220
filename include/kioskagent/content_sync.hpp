#pragma once

/**
 * @file content_sync.hpp
 * @brief Playlist synchronization and media download scheduling
 */

#include "kioskagent/events.hpp"
#include "kioskagent/http.hpp"
#include "kioskagent/kioskagent.hpp"
#include "kioskagent/media_cache.hpp"
#include "kioskagent/playlist.hpp"
#include "kioskagent/storage.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kioskagent {

/// Wait before the next attempt after failed_attempts failures: base_ms doubled
/// per earlier failure, capped at five minutes. Non-positive bases give zero.
[[nodiscard]] std::chrono::milliseconds retry_backoff(int base_ms, int failed_attempts);

/**
 * @brief Reconciles the remote playlist with the local media cache
 *
 * The playlist is fetched with the device api key and every item is handed
 * to a bounded worker pool that calls MediaCache::ensure(). Failed downloads
 * are retried with exponential backoff and skipped after max_attempts; a
 * CacheFull result skips at once. A failed fetch never discards the last
 * known good playlist, which is also kept on disk as a snapshot.
 */
class ContentSynchronizer {
  public:
    struct Options {
        std::string base_url;
        int timeout_seconds = 30;
        int max_attempts = 3;
        int backoff_ms = 1000;  // doubled after each failed attempt
        int workers = 3;
        std::filesystem::path snapshot_path;  // empty disables the snapshot
        int default_image_duration = 10;
    };

    ContentSynchronizer(Options options, CredentialStoreInterface& store, MediaCache& cache,
                        http::ClientFactory client_factory, EventBus& events);

    /// Stops the workers
    ~ContentSynchronizer();

    ContentSynchronizer(const ContentSynchronizer&) = delete;
    ContentSynchronizer& operator=(const ContentSynchronizer&) = delete;

    /// Spawn the download workers
    void start();

    /// Stop and join the download workers, aborting downloads in progress.
    /// Queued and interrupted tasks stay queued for the next start().
    void stop();

    [[nodiscard]] bool is_running() const { return running_; }

    /// Fetch the playlist, replace the active one and schedule every item
    Result<Playlist> load_full_playlist();

    /**
     * @brief Apply one incremental update
     *
     * payload is the notification body. add and update read the item from
     * its "item" member (or the payload itself when it carries an id);
     * remove reads "itemId" (or the item's id). add of a known id behaves as
     * update, and update of an unknown id behaves as add.
     */
    Result<void> apply_update(UpdateAction action, const nlohmann::json& payload);

    /// Parse a notification message and apply it
    Result<void> apply_notification(const std::string& message);

    /// Stop starting queued downloads; scheduling continues to queue
    void pause();

    void resume();

    [[nodiscard]] bool is_paused() const { return paused_; }

    /// Copy of the active playlist
    [[nodiscard]] Playlist playlist() const { return playlist_.snapshot(); }

    /// Items in playlist order whose media is on disk
    [[nodiscard]] std::vector<PlayableItem> playable_items() const;

    /// Download bookkeeping for an item
    [[nodiscard]] std::optional<DownloadTask> download_task(const std::string& item_id) const;

    /// Restore the playlist snapshot written by an earlier run and schedule its items
    Result<void> load_snapshot();

    /// Write the active playlist to the snapshot file
    bool save_snapshot() const;

    /// Wait until no download is queued or running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

  private:
    struct TaskSlot {
        DownloadTask task;
        uint64_t generation = 0;
    };

    // Callers hold write_mutex_. References are published before tasks are
    // scheduled, so no download is admitted against a stale referenced set.
    void publish_references();
    Result<void> upsert_item(const nlohmann::json& item_json, UpdateAction action);
    Result<void> remove_item(const nlohmann::json& payload);

    // Callers hold task_mutex_
    void reconcile_tasks(const Playlist& playlist);
    void schedule_locked(const MediaItem& item);

    void worker_loop();
    void run_task(const std::string& item_id, const MediaItem& item, uint64_t generation);

    Options options_;
    CredentialStoreInterface& store_;
    MediaCache& cache_;
    http::ClientFactory client_factory_;
    EventBus& events_;

    PlaylistStore playlist_;
    // Held across a whole playlist change: playlist, cache references, tasks and snapshot
    std::mutex write_mutex_;

    std::map<std::string, TaskSlot> tasks_;
    std::deque<std::string> queue_;
    std::set<std::string> queued_;
    int active_ = 0;
    uint64_t next_generation_ = 1;
    mutable std::mutex task_mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> paused_{false};
    std::vector<std::thread> workers_;
};

}  // namespace kioskagent
