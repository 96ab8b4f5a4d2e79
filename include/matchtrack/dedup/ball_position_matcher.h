#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/geometry/pitch_zones.h"

namespace matchtrack {
namespace dedup {

struct BallMatchConfig {
    // Максимальная разница времени событие-детекция (сек)
    float max_time_diff_sec = 0.5f;
    bool enable_interpolation = true;
    float min_confidence = 0.3f;
};

struct BallPositionMatch {
    cv::Point2f position{0.5f, 0.5f};
    float confidence = 0.0f;
    // нет, если позиция интерполирована между двумя кадрами
    std::optional<int> frame_number;
    double time_diff = 0.0;
    bool interpolated = false;
};

// Видимые детекции с confidence >= min_confidence, по времени.
std::vector<BallDetection> usable_ball_detections(const std::vector<BallDetection>& detections,
                                                  const BallMatchConfig& cfg);

// Ближайшая по времени в пределах max_time_diff_sec. sorted уже отфильтрован и отсортирован.
bool find_nearest_ball_detection(const std::vector<BallDetection>& sorted,
                                 double timestamp,
                                 const BallMatchConfig& cfg,
                                 BallDetection& out);

cv::Point2f interpolate_ball_position(const BallDetection& before, const BallDetection& after, double timestamp);

std::optional<BallPositionMatch> ball_position_at(const std::vector<BallDetection>& detections,
                                                  double timestamp,
                                                  const BallMatchConfig& cfg = BallMatchConfig{});

geometry::PositionEstimate to_position_estimate(const BallPositionMatch& match);

} // namespace dedup
} // namespace matchtrack
