#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "config.hpp"
#include "frame_types.hpp"

namespace hazard {

// Greedy nearest-centre tracker. Each observation claims the closest live
// object of its class within match_distance; unclaimed observations spawn
// new objects.
class ObjectTracker {
public:
    explicit ObjectTracker(const TrackerConfig& cfg);

    // Returns the live set after this cycle, in creation order.
    std::vector<TrackedObject> update(const std::vector<Observation>& observations, double now);

    // Objects dropped by the last update(), with state Evicted.
    const std::vector<TrackedObject>& evicted() const { return evicted_; }

    // True when the object was matched this cycle, qualifies and the global cooldown has elapsed.
    // A true result records the save, so the next true is at least one
    // cooldown later.
    bool should_save(const TrackedObject& obj, double now);

    std::optional<TrackedObject> find(uint64_t id) const;
    size_t size() const { return objects_.size(); }
    std::optional<double> last_save_time() const { return last_save_; }
    void reset();

private:
    void match(TrackedObject& obj, const Observation& obs, double now);
    void spawn(const Observation& obs, double now);
    std::map<uint64_t, TrackedObject>::iterator evict(std::map<uint64_t, TrackedObject>::iterator it);
    void recompute_confidence(TrackedObject& obj) const;

    TrackerConfig cfg_;
    std::map<uint64_t, TrackedObject> objects_;
    std::vector<TrackedObject> evicted_;
    uint64_t next_id_{1};
    std::optional<double> last_save_;
};

}  // namespace hazard
