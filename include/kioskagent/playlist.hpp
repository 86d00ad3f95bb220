#pragma once

/**
 * @file playlist.hpp
 * @brief Thread-safe holder of the active playlist
 */

#include "kioskagent/kioskagent.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace kioskagent {

/**
 * @brief Active playlist guarded for concurrent readers and a single writer
 *
 * Items stay sorted by order; ties keep arrival order.
 */
class PlaylistStore {
  public:
    /// Replace the whole playlist
    void replace(Playlist playlist);

    /// Insert a new item or replace the item with the same id; returns the replaced item
    std::optional<MediaItem> upsert(const MediaItem& item);

    /// Remove an item by id; returns the removed item
    std::optional<MediaItem> remove(const std::string& item_id);

    [[nodiscard]] std::optional<MediaItem> find(const std::string& item_id) const;

    /// Copy of the current playlist
    [[nodiscard]] Playlist snapshot() const;

    /// True once a playlist was loaded or restored
    [[nodiscard]] bool has_playlist() const;

    [[nodiscard]] size_t size() const;

  private:
    Playlist playlist_;
    bool loaded_ = false;
    mutable std::mutex mutex_;
};

}  // namespace kioskagent
