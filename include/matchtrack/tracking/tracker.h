#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/tracking/track_predictor.h"

namespace matchtrack {
namespace tracking {

enum class TrackerKind {
    Iou,
    Predictive
};

bool parse_tracker_kind(std::string_view text, TrackerKind& out);

struct TrackerConfig {
    TrackerKind kind = TrackerKind::Iou;
    // IoU для сопоставления (строго больше)
    float iou_threshold = 0.3f;
    // Трек без детекций дольше max_age кадров удаляется
    int max_age = 30;
    // Радиус повторной привязки к предсказанию Калмана (нормализованные координаты)
    float reassociation_distance = 0.1f;
    bool log = false;
};

// индекс детекции -> track id
using TrackAssignments = std::map<size_t, std::string>;

struct TrackSlot {
    std::string id;
    cv::Rect2f bbox;
    int last_frame = 0;
    std::string label;
};

// Жадное сопоставление по IoU с тем же классом, без предсказания.
class IouTracker {
public:
    explicit IouTracker(const TrackerConfig& cfg);

    TrackAssignments update(int frame_number, double timestamp, const std::vector<Detection>& detections);

    std::vector<std::string> active_track_ids() const;
    void reset();

    const char* id() const { return "iou-tracker-v1"; }

private:
    TrackerConfig cfg_;
    int next_id_ = 0;
    std::vector<TrackSlot> tracks_;
};

// IoU + повторная привязка потерянных треков через предсказание TrackPredictor.
// predictor не владеется, живёт в AnalysisContext.
class PredictiveTracker {
public:
    PredictiveTracker(const TrackerConfig& cfg, TrackPredictor* predictor);

    TrackAssignments update(int frame_number, double timestamp, const std::vector<Detection>& detections);

    std::vector<std::string> active_track_ids() const;
    void reset();

    const char* id() const { return "predictive-tracker-v1"; }
    int relinked_count() const { return relinked_; }

private:
    TrackerConfig cfg_;
    TrackPredictor* predictor_ = nullptr;
    int next_id_ = 0;
    int relinked_ = 0;
    bool has_time_ = false;
    double last_time_ = 0.0;
    std::vector<TrackSlot> tracks_;
    std::vector<TrackSlot> lost_;
};

using Tracker = std::variant<IouTracker, PredictiveTracker>;

Tracker make_tracker(const TrackerConfig& cfg, TrackPredictor* predictor);
TrackAssignments update_tracker(Tracker& tracker,
                                int frame_number,
                                double timestamp,
                                const std::vector<Detection>& detections);
std::string tracker_id(const Tracker& tracker);

} // namespace tracking
} // namespace matchtrack
