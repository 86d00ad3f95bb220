#include "kioskagent/playlist.hpp"
#include "kioskagent/json.hpp"

#include <algorithm>

namespace kioskagent {

void PlaylistStore::replace(Playlist playlist) {
    json::sort_by_order(playlist.items);

    std::lock_guard<std::mutex> lock(mutex_);
    playlist_ = std::move(playlist);
    loaded_ = true;
}

std::optional<MediaItem> PlaylistStore::upsert(const MediaItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = true;

    auto it = std::find_if(playlist_.items.begin(), playlist_.items.end(),
                           [&item](const MediaItem& existing) { return existing.id == item.id; });
    if (it != playlist_.items.end()) {
        MediaItem previous = *it;
        *it = item;
        json::sort_by_order(playlist_.items);
        return previous;
    }

    playlist_.items.push_back(item);
    json::sort_by_order(playlist_.items);
    return std::nullopt;
}

std::optional<MediaItem> PlaylistStore::remove(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(playlist_.items.begin(), playlist_.items.end(),
                           [&item_id](const MediaItem& existing) { return existing.id == item_id; });
    if (it == playlist_.items.end()) {
        return std::nullopt;
    }
    MediaItem removed = *it;
    playlist_.items.erase(it);
    return removed;
}

std::optional<MediaItem> PlaylistStore::find(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const MediaItem* item = playlist_.find(item_id);
    if (item == nullptr) {
        return std::nullopt;
    }
    return *item;
}

Playlist PlaylistStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playlist_;
}

bool PlaylistStore::has_playlist() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

size_t PlaylistStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playlist_.items.size();
}

}  // namespace kioskagent
