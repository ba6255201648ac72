// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/track_registry.hpp>
#include <algorithm>

namespace detstab {

TrackRegistry::TrackRegistry(int history_size)
    : history_size_(history_size)
    , next_id_(1)
{
}

Track& TrackRegistry::create(const Detection& det) {
    const TrackId id = next_id_++;
    Bucket& bucket = buckets_[det.class_name];
    bucket.emplace_back(id, det, history_size_);
    index_[id] = det.class_name;
    return bucket.back();
}

Track* TrackRegistry::find(TrackId id) {
    return const_cast<Track*>(static_cast<const TrackRegistry&>(*this).find(id));
}

const Track* TrackRegistry::find(TrackId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    auto bucket_it = buckets_.find(it->second);
    if (bucket_it == buckets_.end()) {
        return nullptr;
    }
    for (const auto& track : bucket_it->second) {
        if (track.id() == id) {
            return &track;
        }
    }
    return nullptr;
}

const TrackRegistry::Bucket& TrackRegistry::bucket(const std::string& class_name) const {
    static const Bucket empty;
    auto it = buckets_.find(class_name);
    return (it != buckets_.end()) ? it->second : empty;
}

void TrackRegistry::begin_frame() {
    for (auto& [cls, tracks] : buckets_) {
        for (auto& track : tracks) {
            track.begin_frame();
        }
    }
}

size_t TrackRegistry::remove_if(const std::function<bool(const Track&)>& pred) {
    size_t removed = 0;

    for (auto it = buckets_.begin(); it != buckets_.end();) {
        Bucket& tracks = it->second;

        // Filter into a fresh bucket instead of erasing while scanning
        Bucket kept;
        kept.reserve(tracks.size());
        for (auto& track : tracks) {
            if (pred(track)) {
                index_.erase(track.id());
                ++removed;
            } else {
                kept.push_back(std::move(track));
            }
        }
        tracks = std::move(kept);

        if (tracks.empty()) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }

    return removed;
}

std::vector<TrackId> TrackRegistry::ids() const {
    std::vector<TrackId> out;
    out.reserve(index_.size());
    for (const auto& [id, cls] : index_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::map<std::string, int> TrackRegistry::counts_by_class() const {
    std::map<std::string, int> counts;
    for (const auto& [cls, tracks] : buckets_) {
        counts[cls] = static_cast<int>(tracks.size());
    }
    return counts;
}

void TrackRegistry::clear() {
    buckets_.clear();
    index_.clear();
}

} // namespace detstab
