#include "kioskagent/content_sync.hpp"
#include "kioskagent/json.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>

namespace kioskagent {

namespace {

constexpr const char* PLAYLIST_PATH = "/api/playlist";
constexpr int64_t MAX_BACKOFF_MS = 5 * 60 * 1000;

std::optional<std::string> id_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (auto id = json::string_field(j, keys)) {
        return id;
    }
    if (auto numeric = json::int_field(j, keys)) {
        return std::to_string(*numeric);
    }
    return std::nullopt;
}

bool same_content(const MediaItem& a, const MediaItem& b) {
    return a.source_url == b.source_url && a.checksum == b.checksum && a.size_bytes == b.size_bytes;
}

}  // namespace

std::chrono::milliseconds retry_backoff(int base_ms, int failed_attempts) {
    if (base_ms <= 0) {
        return std::chrono::milliseconds(0);
    }
    int64_t delay = std::min<int64_t>(base_ms, MAX_BACKOFF_MS);
    for (int i = 1; i < failed_attempts && delay < MAX_BACKOFF_MS; ++i) {
        delay = std::min<int64_t>(delay * 2, MAX_BACKOFF_MS);
    }
    return std::chrono::milliseconds(delay);
}

ContentSynchronizer::ContentSynchronizer(Options options, CredentialStoreInterface& store, MediaCache& cache,
                                         http::ClientFactory client_factory, EventBus& events)
    : options_(std::move(options)),
      store_(store),
      cache_(cache),
      client_factory_(std::move(client_factory)),
      events_(events) {}

ContentSynchronizer::~ContentSynchronizer() { stop(); }

// ==================== Workers ====================

void ContentSynchronizer::start() {
    if (running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        stopping_ = false;
    }
    running_ = true;

    int count = std::max(1, options_.workers);
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    BOOST_LOG_TRIVIAL(debug) << "Started " << count << " download workers";
}

void ContentSynchronizer::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    cache_.abort_downloads();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    running_ = false;
    idle_cv_.notify_all();
}

void ContentSynchronizer::worker_loop() {
    while (true) {
        std::string item_id;
        MediaItem item;
        uint64_t generation = 0;
        {
            std::unique_lock<std::mutex> lock(task_mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || (!paused_ && !queue_.empty()); });
            if (stopping_) {
                return;
            }

            item_id = queue_.front();
            queue_.pop_front();
            queued_.erase(item_id);

            auto it = tasks_.find(item_id);
            if (it == tasks_.end() || it->second.task.state != DownloadState::Pending) {
                // Removed or already handled since it was queued
                lock.unlock();
                idle_cv_.notify_all();
                continue;
            }
            it->second.task.state = DownloadState::InFlight;
            item = it->second.task.item;
            generation = it->second.generation;
            ++active_;
        }

        run_task(item_id, item, generation);

        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

void ContentSynchronizer::run_task(const std::string& item_id, const MediaItem& item, uint64_t generation) {
    std::optional<CacheEntry> entry;
    std::string last_error;
    int attempts = 0;
    bool interrupted = false;

    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        if (stopping_) {
            interrupted = true;
            break;
        }
        attempts = attempt;
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            auto it = tasks_.find(item_id);
            if (it == tasks_.end() || it->second.generation != generation) {
                return;  // Superseded by an update or removed
            }
            it->second.task.attempts = attempt;
        }

        auto result = cache_.ensure(item, [this]() { return stopping_.load(); });
        if (result.is_ok()) {
            entry = std::move(result).value();
            break;
        }
        if (stopping_) {
            interrupted = true;
            break;
        }

        last_error = result.error_message();
        BOOST_LOG_TRIVIAL(warning) << "Download of item " << item.id << " failed (attempt " << attempt << "/"
                                   << options_.max_attempts << "): " << last_error;

        if (result.error_code() == ErrorCode::CacheFull || result.error_code() == ErrorCode::InvalidParameter) {
            break;
        }

        if (attempt < options_.max_attempts) {
            auto delay = retry_backoff(options_.backoff_ms, attempt);
            std::unique_lock<std::mutex> lock(task_mutex_);
            if (work_cv_.wait_for(lock, delay, [this]() { return stopping_.load(); })) {
                interrupted = true;
                break;
            }
        }
    }

    std::optional<PlayableItem> ready;
    std::optional<DownloadTask> skipped;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        auto it = tasks_.find(item_id);
        if (it == tasks_.end() || it->second.generation != generation) {
            return;
        }

        auto& task = it->second.task;
        task.attempts = attempts;
        if (entry) {
            task.state = DownloadState::Succeeded;
            task.local_path = entry->local_path;
            task.last_error.clear();
            ready = PlayableItem{task.item, task.local_path};
        } else if (interrupted) {
            // Picked up again when the workers restart
            task.state = DownloadState::Pending;
            task.attempts = 0;
            if (queued_.insert(item_id).second) {
                queue_.push_back(item_id);
            }
        } else {
            task.state = DownloadState::Failed;
            task.last_error = last_error;
            skipped = task;
        }
    }

    if (ready) {
        events_.emit(events::DOWNLOAD_SUCCEEDED, *ready);
    } else if (skipped) {
        BOOST_LOG_TRIVIAL(error) << "Skipping item " << item_id << " after " << skipped->attempts
                                 << " attempt(s): " << skipped->last_error;
        events_.emit(events::DOWNLOAD_SKIPPED, *skipped);
    }
}

void ContentSynchronizer::schedule_locked(const MediaItem& item) {
    auto& slot = tasks_[item.id];
    slot.task = DownloadTask{};
    slot.task.item = item;
    slot.task.state = DownloadState::Pending;
    slot.generation = next_generation_++;

    if (queued_.insert(item.id).second) {
        queue_.push_back(item.id);
    }
    work_cv_.notify_all();
}

void ContentSynchronizer::reconcile_tasks(const Playlist& playlist) {
    std::set<std::string> ids;
    for (const auto& item : playlist.items) {
        ids.insert(item.id);
    }

    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (ids.count(it->first) == 0) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& item : playlist.items) {
        auto it = tasks_.find(item.id);
        if (it != tasks_.end() && same_content(it->second.task.item, item) &&
            it->second.task.state != DownloadState::Failed) {
            it->second.task.item = item;
            continue;
        }
        schedule_locked(item);
    }
}

void ContentSynchronizer::publish_references() {
    std::set<std::string> keys;
    for (const auto& item : playlist_.snapshot().items) {
        keys.insert(MediaCache::key_for(item.source_url));
    }
    cache_.set_referenced(std::move(keys));
}

// ==================== Playlist ====================

Result<Playlist> ContentSynchronizer::load_full_playlist() {
    auto credentials = store_.get_credentials();
    if (!credentials || !credentials->is_activated()) {
        return Result<Playlist>::error(ErrorCode::NotActivated, "Device is not activated");
    }

    auto client = client_factory_(options_.base_url, options_.timeout_seconds);

    http::Request request;
    request.method = http::Method::GET;
    request.path = PLAYLIST_PATH;
    request.headers["X-Api-Key"] = *credentials->api_key;

    auto response = client->send(request);
    if (!response.success) {
        auto code = response.status_code == 0 ? ErrorCode::NetworkError
                                              : http::status_code_to_error_code(response.status_code);
        std::string message = response.status_code == 0
                                  ? "Playlist fetch failed: " + response.error_message
                                  : "Playlist fetch returned " + std::to_string(response.status_code);
        BOOST_LOG_TRIVIAL(warning) << message << "; keeping the current playlist";
        events_.emit(events::PLAYLIST_FETCH_FAILED, message);
        return Result<Playlist>::error(code, message);
    }

    auto body = json::try_parse(response.body);
    if (!body) {
        BOOST_LOG_TRIVIAL(error) << "Playlist response is not JSON: " << json::truncate_for_log(response.body);
        events_.emit(events::PLAYLIST_FETCH_FAILED, std::string("Playlist response is not JSON"));
        return Result<Playlist>::error(ErrorCode::ParseError, "Playlist response is not JSON");
    }

    std::vector<std::string> rejected;
    auto parsed = json::parse_playlist(*body, options_.default_image_duration, &rejected);
    if (parsed.is_error()) {
        BOOST_LOG_TRIVIAL(error) << parsed.error_message() << ": " << json::truncate_for_log(response.body);
        events_.emit(events::PLAYLIST_FETCH_FAILED, parsed.error_message());
        return parsed;
    }
    for (const auto& reason : rejected) {
        BOOST_LOG_TRIVIAL(warning) << "Rejected playlist item " << reason;
    }

    const Playlist& playlist = parsed.value();
    {
        std::lock_guard<std::mutex> writer(write_mutex_);
        playlist_.replace(playlist);
        publish_references();
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            reconcile_tasks(playlist);
        }
        if (!save_snapshot()) {
            BOOST_LOG_TRIVIAL(warning) << "Playlist snapshot not written";
        }
    }

    BOOST_LOG_TRIVIAL(info) << "Playlist " << playlist.playlist_id << " version " << playlist.version << " loaded with "
                            << playlist.items.size() << " items";
    events_.emit(events::PLAYLIST_LOADED, playlist);
    return parsed;
}

Result<void> ContentSynchronizer::apply_update(UpdateAction action, const nlohmann::json& payload) {
    if (action == UpdateAction::Refresh) {
        auto result = load_full_playlist();
        if (result.is_error()) {
            return Result<void>::error(result.error_code(), result.error_message());
        }
        events_.emit(events::PLAYLIST_UPDATED, action);
        return Result<void>::ok();
    }

    auto result = Result<void>::ok();
    {
        std::lock_guard<std::mutex> writer(write_mutex_);
        if (action == UpdateAction::Remove) {
            result = remove_item(payload);
        } else {
            bool wrapped = payload.is_object() && payload.contains("item") && payload["item"].is_object();
            result = upsert_item(wrapped ? payload["item"] : payload, action);
        }
        if (result.is_ok() && !save_snapshot()) {
            BOOST_LOG_TRIVIAL(warning) << "Playlist snapshot not written";
        }
    }
    if (result.is_error()) {
        BOOST_LOG_TRIVIAL(warning) << "Playlist " << update_action_to_string(action)
                                   << " not applied: " << result.error_message();
        return result;
    }

    events_.emit(events::PLAYLIST_UPDATED, action);
    return result;
}

Result<void> ContentSynchronizer::upsert_item(const nlohmann::json& item_json, UpdateAction action) {
    auto id = id_field(item_json, {"id"});
    if (!id) {
        return Result<void>::error(ErrorCode::ValidationFailed, "Update carries no item id");
    }

    auto existing = playlist_.find(*id);
    nlohmann::json merged = item_json;
    if (existing) {
        // Fields absent from the update keep their current values
        merged = json::media_item_to_json(*existing);
        merged.merge_patch(item_json);
    } else if (action == UpdateAction::Update) {
        BOOST_LOG_TRIVIAL(info) << "Update for unknown item " << *id << ", adding it";
    }

    auto parsed = json::parse_media_item(merged, options_.default_image_duration);
    if (parsed.is_error()) {
        return Result<void>::error(parsed.error_code(), parsed.error_message());
    }
    const MediaItem& item = parsed.value();

    playlist_.upsert(item);
    publish_references();

    std::lock_guard<std::mutex> lock(task_mutex_);
    auto it = tasks_.find(item.id);
    if (it == tasks_.end() || !existing || !same_content(*existing, item) ||
        it->second.task.state == DownloadState::Failed) {
        schedule_locked(item);
    } else {
        it->second.task.item = item;
    }
    BOOST_LOG_TRIVIAL(info) << (existing ? "Updated" : "Added") << " playlist item " << item.id;
    return Result<void>::ok();
}

Result<void> ContentSynchronizer::remove_item(const nlohmann::json& payload) {
    auto id = id_field(payload, {"itemId"});
    if (!id && payload.is_object() && payload.contains("item")) {
        id = id_field(payload["item"], {"id"});
    }
    if (!id) {
        id = id_field(payload, {"id"});
    }
    if (!id) {
        return Result<void>::error(ErrorCode::ValidationFailed, "Remove carries no item id");
    }

    if (!playlist_.remove(*id)) {
        return Result<void>::error(ErrorCode::NotFound, "No playlist item " + *id);
    }

    // The cached file stays; it is merely no longer protected from eviction
    publish_references();
    std::lock_guard<std::mutex> lock(task_mutex_);
    tasks_.erase(*id);
    BOOST_LOG_TRIVIAL(info) << "Removed playlist item " << *id;
    return Result<void>::ok();
}

Result<void> ContentSynchronizer::apply_notification(const std::string& message) {
    auto j = json::try_parse(message);
    if (!j) {
        BOOST_LOG_TRIVIAL(error) << "Notification is not JSON: " << json::truncate_for_log(message);
        return Result<void>::error(ErrorCode::ParseError, "Notification is not JSON");
    }

    auto parsed = json::parse_update_notification(*j);
    if (parsed.is_error()) {
        BOOST_LOG_TRIVIAL(warning) << parsed.error_message();
        return Result<void>::error(parsed.error_code(), parsed.error_message());
    }

    const auto& notification = parsed.value();
    UpdateAction action = notification.action;
    std::string current_id = playlist_.snapshot().playlist_id;
    if (action != UpdateAction::Refresh && !notification.playlist_id.empty() && !current_id.empty() &&
        notification.playlist_id != current_id) {
        BOOST_LOG_TRIVIAL(info) << "Notification for playlist " << notification.playlist_id << " while showing "
                                << current_id << ", refreshing";
        action = UpdateAction::Refresh;
    }

    BOOST_LOG_TRIVIAL(debug) << notification.type << " " << update_action_to_string(action);
    return apply_update(action, notification.payload);
}

// ==================== Pause / Resume ====================

void ContentSynchronizer::pause() {
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (paused_) {
            return;
        }
        paused_ = true;
    }
    BOOST_LOG_TRIVIAL(info) << "Content synchronization paused";
    events_.emit(events::SYNC_PAUSED);
}

void ContentSynchronizer::resume() {
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (!paused_) {
            return;
        }
        paused_ = false;
    }
    work_cv_.notify_all();
    BOOST_LOG_TRIVIAL(info) << "Content synchronization resumed";
    events_.emit(events::SYNC_RESUMED);
}

// ==================== Queries ====================

std::vector<PlayableItem> ContentSynchronizer::playable_items() const {
    Playlist playlist = playlist_.snapshot();

    std::vector<PlayableItem> result;
    std::lock_guard<std::mutex> lock(task_mutex_);
    for (const auto& item : playlist.items) {
        auto it = tasks_.find(item.id);
        if (it != tasks_.end() && it->second.task.state == DownloadState::Succeeded) {
            result.push_back(PlayableItem{item, it->second.task.local_path});
        }
    }
    return result;
}

std::optional<DownloadTask> ContentSynchronizer::download_task(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(task_mutex_);
    auto it = tasks_.find(item_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

bool ContentSynchronizer::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(task_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && active_ == 0; });
}

// ==================== Snapshot ====================

Result<void> ContentSynchronizer::load_snapshot() {
    if (options_.snapshot_path.empty()) {
        return Result<void>::error(ErrorCode::MissingParameter, "No snapshot path configured");
    }

    auto content = files::read_file(options_.snapshot_path);
    if (!content) {
        return Result<void>::error(ErrorCode::FileNotFound, "No playlist snapshot");
    }

    auto j = json::try_parse(*content);
    if (!j) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring malformed playlist snapshot";
        return Result<void>::error(ErrorCode::ParseError, "Playlist snapshot is not JSON");
    }

    auto parsed = json::parse_playlist(*j, options_.default_image_duration);
    if (parsed.is_error()) {
        return Result<void>::error(parsed.error_code(), parsed.error_message());
    }

    const Playlist& playlist = parsed.value();
    {
        std::lock_guard<std::mutex> writer(write_mutex_);
        playlist_.replace(playlist);
        publish_references();
        std::lock_guard<std::mutex> lock(task_mutex_);
        reconcile_tasks(playlist);
    }

    BOOST_LOG_TRIVIAL(info) << "Restored playlist snapshot with " << playlist.items.size() << " items";
    events_.emit(events::PLAYLIST_LOADED, playlist);
    return Result<void>::ok();
}

bool ContentSynchronizer::save_snapshot() const {
    if (options_.snapshot_path.empty()) {
        return true;
    }
    return files::write_file_atomic(options_.snapshot_path, json::playlist_to_json(playlist_.snapshot()).dump(2));
}

}  // namespace kioskagent
