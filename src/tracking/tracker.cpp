#include "matchtrack/tracking/tracker.h"
#include "matchtrack/core/errors.h"
#include "matchtrack/util/rect_utils.h"

#include <algorithm>
#include <iostream>
#include <set>

namespace matchtrack {
namespace tracking {

namespace {

std::string make_track_id(int& next_id) {
    return "track_" + std::to_string(next_id++);
}

// Лучший свободный трек того же класса с IoU > threshold, -1 если нет.
int best_iou_match(const std::vector<TrackSlot>& tracks,
                   const std::vector<char>& used,
                   const Detection& det,
                   float threshold) {
    int best_idx = -1;
    float best_iou = threshold;
    for (size_t i = 0; i < tracks.size(); ++i) {
        if (used[i] || tracks[i].label != det.label) continue;
        const float v = util::iou(tracks[i].bbox, det.bbox);
        if (v > best_iou) {
            best_iou = v;
            best_idx = (int)i;
        }
    }
    return best_idx;
}

void prune_aged(std::vector<TrackSlot>& tracks, int frame_number, int max_age) {
    tracks.erase(std::remove_if(tracks.begin(), tracks.end(),
                                [&](const TrackSlot& t) { return frame_number - t.last_frame > max_age; }),
                 tracks.end());
}

std::vector<std::string> slot_ids(const std::vector<TrackSlot>& tracks) {
    std::vector<std::string> ids;
    ids.reserve(tracks.size());
    for (const auto& t : tracks) ids.push_back(t.id);
    return ids;
}

} // namespace

bool parse_tracker_kind(std::string_view text, TrackerKind& out) {
    if (text == "iou") { out = TrackerKind::Iou; return true; }
    if (text == "predictive") { out = TrackerKind::Predictive; return true; }
    return false;
}

// ---------------- IouTracker ----------------

IouTracker::IouTracker(const TrackerConfig& cfg) : cfg_(cfg) {}

TrackAssignments IouTracker::update(int frame_number, double /*timestamp*/, const std::vector<Detection>& detections) {
    prune_aged(tracks_, frame_number, cfg_.max_age);

    TrackAssignments out;
    std::vector<char> used(tracks_.size(), 0);
    int spawned = 0;

    for (size_t di = 0; di < detections.size(); ++di) {
        const Detection& det = detections[di];
        const int ti = best_iou_match(tracks_, used, det, cfg_.iou_threshold);
        if (ti >= 0) {
            used[ti] = 1;
            tracks_[ti].bbox = det.bbox;
            tracks_[ti].last_frame = frame_number;
            out[di] = tracks_[ti].id;
            continue;
        }
        TrackSlot slot;
        slot.id = make_track_id(next_id_);
        slot.bbox = det.bbox;
        slot.last_frame = frame_number;
        slot.label = det.label;
        out[di] = slot.id;
        tracks_.push_back(slot);
        used.push_back(1);
        ++spawned;
    }

    if (cfg_.log) {
        std::cout << "[TRK] frame=" << frame_number
                  << " dets=" << detections.size()
                  << " new=" << spawned
                  << " tracks=" << tracks_.size() << std::endl;
    }
    return out;
}

std::vector<std::string> IouTracker::active_track_ids() const {
    return slot_ids(tracks_);
}

void IouTracker::reset() {
    tracks_.clear();
    next_id_ = 0;
}

// ---------------- PredictiveTracker ----------------

PredictiveTracker::PredictiveTracker(const TrackerConfig& cfg, TrackPredictor* predictor)
    : cfg_(cfg), predictor_(predictor) {}

TrackAssignments PredictiveTracker::update(int frame_number,
                                           double timestamp,
                                           const std::vector<Detection>& detections) {
    if (!predictor_) {
        throw TrackingError("predictive tracker has no track predictor");
    }

    const double dt = has_time_ ? timestamp - last_time_ : 0.0;
    predictor_->predict_all(dt);
    has_time_ = true;
    last_time_ = timestamp;

    // устаревшие треки уходят в lost_, их ещё можно привязать по предсказанию
    for (const auto& t : tracks_) {
        if (frame_number - t.last_frame > cfg_.max_age) lost_.push_back(t);
    }
    prune_aged(tracks_, frame_number, cfg_.max_age);

    TrackAssignments out;
    std::vector<char> used(tracks_.size(), 0);
    std::vector<size_t> unmatched;

    for (size_t di = 0; di < detections.size(); ++di) {
        const Detection& det = detections[di];
        const int ti = best_iou_match(tracks_, used, det, cfg_.iou_threshold);
        if (ti < 0) {
            unmatched.push_back(di);
            continue;
        }
        used[ti] = 1;
        tracks_[ti].bbox = det.bbox;
        tracks_[ti].last_frame = frame_number;
        out[di] = tracks_[ti].id;
    }

    // кандидаты на повторную привязку: не обновлённые в этом кадре треки с валидным предсказанием
    std::set<std::string> taken;
    for (const auto& kv : out) taken.insert(kv.second);

    int spawned = 0;
    int relinked_now = 0;
    for (size_t di : unmatched) {
        const Detection& det = detections[di];

        std::vector<PredictedPosition> candidates;
        for (auto& pred : predictor_->all_predictions(frame_number, timestamp)) {
            if (!taken.count(pred.track_id)) candidates.push_back(pred);
        }

        std::string relink_id;
        if (find_best_match(candidates, det.center, cfg_.reassociation_distance, relink_id)) {
            auto live = std::find_if(tracks_.begin(), tracks_.end(),
                                     [&](const TrackSlot& t) { return t.id == relink_id; });
            if (live != tracks_.end()) {
                live->bbox = det.bbox;
                live->last_frame = frame_number;
            } else {
                auto lost = std::find_if(lost_.begin(), lost_.end(),
                                         [&](const TrackSlot& t) { return t.id == relink_id; });
                TrackSlot slot = lost != lost_.end() ? *lost : TrackSlot{};
                if (lost != lost_.end()) lost_.erase(lost);
                slot.id = relink_id;
                slot.bbox = det.bbox;
                slot.last_frame = frame_number;
                slot.label = det.label;
                tracks_.push_back(slot);
            }
            taken.insert(relink_id);
            out[di] = relink_id;
            ++relinked_now;
            continue;
        }

        TrackSlot slot;
        slot.id = make_track_id(next_id_);
        slot.bbox = det.bbox;
        slot.last_frame = frame_number;
        slot.label = det.label;
        taken.insert(slot.id);
        out[di] = slot.id;
        tracks_.push_back(slot);
        ++spawned;
    }

    for (const auto& kv : out) {
        if (!predictor_->update_track(kv.second, detections[kv.first].center, frame_number, timestamp) && cfg_.log) {
            std::cout << "[TRK] kalman update skipped id=" << kv.second << std::endl;
        }
    }

    // фильтры с протухшим предсказанием больше не нужны, вместе с ними забываем lost-треки
    const std::vector<std::string> removed = predictor_->prune_stale(timestamp);
    for (const auto& id : removed) {
        lost_.erase(std::remove_if(lost_.begin(), lost_.end(),
                                   [&](const TrackSlot& t) { return t.id == id; }),
                    lost_.end());
    }

    relinked_ += relinked_now;
    if (cfg_.log) {
        std::cout << "[TRK] frame=" << frame_number
                  << " dets=" << detections.size()
                  << " new=" << spawned
                  << " relinked=" << relinked_now
                  << " tracks=" << tracks_.size()
                  << " lost=" << lost_.size() << std::endl;
    }
    return out;
}

std::vector<std::string> PredictiveTracker::active_track_ids() const {
    return slot_ids(tracks_);
}

void PredictiveTracker::reset() {
    tracks_.clear();
    lost_.clear();
    next_id_ = 0;
    relinked_ = 0;
    has_time_ = false;
    last_time_ = 0.0;
    if (predictor_) predictor_->reset();
}

// ---------------- variant ----------------

Tracker make_tracker(const TrackerConfig& cfg, TrackPredictor* predictor) {
    if (cfg.kind == TrackerKind::Predictive) {
        return Tracker(std::in_place_type<PredictiveTracker>, cfg, predictor);
    }
    return Tracker(std::in_place_type<IouTracker>, cfg);
}

TrackAssignments update_tracker(Tracker& tracker,
                                int frame_number,
                                double timestamp,
                                const std::vector<Detection>& detections) {
    return std::visit([&](auto& t) { return t.update(frame_number, timestamp, detections); }, tracker);
}

std::string tracker_id(const Tracker& tracker) {
    return std::visit([](const auto& t) { return std::string(t.id()); }, tracker);
}

} // namespace tracking
} // namespace matchtrack
