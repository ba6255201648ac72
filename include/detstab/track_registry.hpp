// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/track.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace detstab {

/**
 * Tracks of one source, bucketed by class label.
 *
 * Tracks are addressed by generated ids; each bucket keeps creation order.
 * A track stays in the bucket of the label it was created with. Ids are
 * never reused, not even after clear().
 */
class TrackRegistry {
public:
    using Bucket = std::vector<Track>;
    using Buckets = std::map<std::string, Bucket>;

    explicit TrackRegistry(int history_size = 10);

    /**
     * Create a new provisional track from a detection
     * @return Reference valid until the next create/remove/clear
     */
    Track& create(const Detection& det);

    Track* find(TrackId id);
    const Track* find(TrackId id) const;

    /// Tracks of one label in creation order (empty if none)
    const Bucket& bucket(const std::string& class_name) const;
    const Buckets& buckets() const { return buckets_; }

    /// Clear the transient matched flag on every track
    void begin_frame();

    /**
     * Drop every track for which the predicate holds; empty buckets go too
     * @return Number of tracks removed
     */
    size_t remove_if(const std::function<bool(const Track&)>& pred);

    /// Every track id in creation order
    std::vector<TrackId> ids() const;

    std::map<std::string, int> counts_by_class() const;

    void clear();
    size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }
    TrackId next_id() const { return next_id_; }

private:
    int history_size_;
    TrackId next_id_;
    Buckets buckets_;
    std::unordered_map<TrackId, std::string> index_;   // id -> bucket label
};

} // namespace detstab
