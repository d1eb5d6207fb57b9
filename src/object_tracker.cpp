#include "object_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace hazard {

ObjectTracker::ObjectTracker(const TrackerConfig& cfg) : cfg_(cfg) {
    cfg_.stability_frames = std::max(1, cfg_.stability_frames);
    cfg_.smooth_min = std::clamp(cfg_.smooth_min, 0.0f, 1.0f);
    cfg_.smooth_max = std::clamp(cfg_.smooth_max, cfg_.smooth_min, 1.0f);
    cfg_.score_alpha = std::clamp(cfg_.score_alpha, 0.0f, 1.0f);
}

void ObjectTracker::reset() {
    objects_.clear();
    evicted_.clear();
    next_id_ = 1;
    last_save_.reset();
}

void ObjectTracker::recompute_confidence(TrackedObject& obj) const {
    obj.confidence = cfg_.weight_detection * obj.detection_confidence + cfg_.weight_stability * obj.stability;
}

void ObjectTracker::match(TrackedObject& obj, const Observation& obs, double now) {
    const float s = cfg_.smooth_min + (cfg_.smooth_max - cfg_.smooth_min) * obj.stability;
    obj.x = s * obj.x + (1.0f - s) * obs.center_x;
    obj.y = s * obj.y + (1.0f - s) * obs.center_y;
    obj.width = s * obj.width + (1.0f - s) * obs.width;
    obj.height = s * obj.height + (1.0f - s) * obs.height;
    obj.area = s * obj.area + (1.0f - s) * obs.area;

    obj.detection_confidence = (1.0f - cfg_.score_alpha) * obj.detection_confidence + cfg_.score_alpha * obs.score;
    obj.best_score = std::max(obj.best_score, obs.score);
    obj.hits++;
    obj.stability = std::max(obj.stability,
                             std::min(1.0f, static_cast<float>(obj.hits) / static_cast<float>(cfg_.stability_frames)));
    obj.missed_frames = 0;
    obj.last_seen = std::max(obj.last_seen, now);
    obj.state = TrackState::Tracked;
    recompute_confidence(obj);
}

void ObjectTracker::spawn(const Observation& obs, double now) {
    TrackedObject obj;
    obj.id = next_id_++;
    obj.x = obs.center_x;
    obj.y = obs.center_y;
    obj.width = obs.width;
    obj.height = obs.height;
    obj.area = obs.area;
    obj.class_label = obs.class_label;
    obj.first_seen = now;
    obj.last_seen = now;
    obj.detection_confidence = obs.score;
    obj.best_score = obs.score;
    obj.stability = 0.0f;
    obj.hits = 1;
    obj.state = TrackState::New;
    recompute_confidence(obj);
    objects_.emplace(obj.id, std::move(obj));
}

std::map<uint64_t, TrackedObject>::iterator ObjectTracker::evict(std::map<uint64_t, TrackedObject>::iterator it) {
    TrackedObject gone = it->second;
    gone.state = TrackState::Evicted;
    evicted_.push_back(std::move(gone));
    return objects_.erase(it);
}

std::vector<TrackedObject> ObjectTracker::update(const std::vector<Observation>& observations, double now) {
    evicted_.clear();

    // Timed-out objects go before matching so a late reappearance starts over.
    for (auto it = objects_.begin(); it != objects_.end();) {
        if (now - it->second.last_seen > cfg_.evict_timeout_sec) {
            it = evict(it);
        } else {
            ++it;
        }
    }

    std::vector<uint64_t> claimed;
    claimed.reserve(observations.size());
    std::vector<const Observation*> unmatched;

    for (const auto& obs : observations) {
        TrackedObject* best = nullptr;
        float best_dist = std::numeric_limits<float>::max();
        for (auto& kv : objects_) {
            TrackedObject& obj = kv.second;
            if (obj.class_label != obs.class_label) continue;
            if (std::find(claimed.begin(), claimed.end(), obj.id) != claimed.end()) continue;
            const float dist = std::hypot(obs.center_x - obj.x, obs.center_y - obj.y);
            if (dist < cfg_.match_distance && dist < best_dist) {
                best = &obj;
                best_dist = dist;
            }
        }
        if (best) {
            match(*best, obs, now);
            claimed.push_back(best->id);
        } else {
            unmatched.push_back(&obs);
        }
    }

    for (auto it = objects_.begin(); it != objects_.end();) {
        TrackedObject& obj = it->second;
        if (std::find(claimed.begin(), claimed.end(), obj.id) == claimed.end()) {
            obj.missed_frames++;
            obj.detection_confidence *= cfg_.miss_decay;
            recompute_confidence(obj);
            if (obj.missed_frames > cfg_.stale_after_missed) obj.state = TrackState::Stale;

            if (obj.confidence < cfg_.confidence_floor) {
                it = evict(it);
                continue;
            }
        }
        ++it;
    }

    for (const Observation* obs : unmatched) spawn(*obs, now);

    std::vector<TrackedObject> live;
    live.reserve(objects_.size());
    for (const auto& kv : objects_) live.push_back(kv.second);
    return live;
}

bool ObjectTracker::should_save(const TrackedObject& obj, double now) {
    auto it = objects_.find(obj.id);
    if (it == objects_.end()) return false;
    TrackedObject& live = it->second;

    // Only objects detected in the current frame.
    if (live.missed_frames != 0) return false;
    if (live.confidence < cfg_.save_min_confidence) return false;
    if (live.stability < cfg_.save_min_stability) return false;
    if (live.area < cfg_.save_min_area) return false;
    if (last_save_ && now - *last_save_ < cfg_.save_cooldown_sec) return false;
    if (live.last_saved_at && now - *live.last_saved_at < cfg_.save_cooldown_sec) return false;

    last_save_ = now;
    live.last_saved_at = now;
    return true;
}

std::optional<TrackedObject> ObjectTracker::find(uint64_t id) const {
    auto it = objects_.find(id);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

}  // namespace hazard
