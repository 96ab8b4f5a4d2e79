#include "matchtrack/dedup/ball_position_matcher.h"

#include <algorithm>
#include <cmath>

namespace matchtrack {
namespace dedup {

namespace {

// Ближе 50 мс считаем точным попаданием в кадр.
constexpr double kExactMatchSec = 0.05;

BallPositionMatch from_detection(const BallDetection& d, float confidence, double timestamp) {
    BallPositionMatch m;
    m.position = d.position;
    m.confidence = confidence;
    m.frame_number = d.frame_number;
    m.time_diff = std::fabs(d.timestamp - timestamp);
    m.interpolated = false;
    return m;
}

} // namespace

std::vector<BallDetection> usable_ball_detections(const std::vector<BallDetection>& detections,
                                                  const BallMatchConfig& cfg) {
    std::vector<BallDetection> out;
    for (const auto& d : detections) {
        if (d.visible && d.confidence >= cfg.min_confidence) out.push_back(d);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const BallDetection& a, const BallDetection& b) { return a.timestamp < b.timestamp; });
    return out;
}

bool find_nearest_ball_detection(const std::vector<BallDetection>& sorted,
                                 double timestamp,
                                 const BallMatchConfig& cfg,
                                 BallDetection& out) {
    auto it = std::lower_bound(sorted.begin(), sorted.end(), timestamp,
                               [](const BallDetection& d, double t) { return d.timestamp < t; });

    bool found = false;
    double best = 0.0;
    auto consider = [&](const BallDetection& d) {
        const double diff = std::fabs(d.timestamp - timestamp);
        if (diff <= cfg.max_time_diff_sec && (!found || diff < best)) {
            best = diff;
            out = d;
            found = true;
        }
    };
    if (it != sorted.begin()) consider(*(it - 1));
    if (it != sorted.end()) consider(*it);
    return found;
}

cv::Point2f interpolate_ball_position(const BallDetection& before, const BallDetection& after, double timestamp) {
    const double span = after.timestamp - before.timestamp;
    if (span == 0.0) return before.position;
    const float ratio = (float)((timestamp - before.timestamp) / span);
    return before.position + (after.position - before.position) * ratio;
}

std::optional<BallPositionMatch> ball_position_at(const std::vector<BallDetection>& detections,
                                                  double timestamp,
                                                  const BallMatchConfig& cfg) {
    const std::vector<BallDetection> sorted = usable_ball_detections(detections, cfg);
    if (sorted.empty()) return std::nullopt;

    for (const auto& d : sorted) {
        if (std::fabs(d.timestamp - timestamp) < kExactMatchSec) {
            return from_detection(d, d.confidence, timestamp);
        }
    }

    if (!cfg.enable_interpolation) {
        BallDetection nearest;
        if (!find_nearest_ball_detection(sorted, timestamp, cfg, nearest)) return std::nullopt;
        return from_detection(nearest, nearest.confidence * 0.9f, timestamp);
    }

    const BallDetection* before = nullptr;
    const BallDetection* after = nullptr;
    for (const auto& d : sorted) {
        if (d.timestamp <= timestamp) before = &d;
        if (d.timestamp >= timestamp) {
            after = &d;
            break;
        }
    }

    const double max_diff = cfg.max_time_diff_sec;
    if (!before || !after) {
        const BallDetection* single = before ? before : after;
        if (!single) return std::nullopt;
        const double diff = std::fabs(single->timestamp - timestamp);
        if (diff > max_diff) return std::nullopt;
        const float scale = (float)std::max(0.5, 1.0 - diff / max_diff);
        return from_detection(*single, single->confidence * scale, timestamp);
    }

    const double before_diff = timestamp - before->timestamp;
    const double after_diff = after->timestamp - timestamp;
    if (before_diff > max_diff || after_diff > max_diff) {
        const BallDetection* nearest = before_diff <= after_diff ? before : after;
        const double diff = std::min(before_diff, after_diff);
        if (diff > max_diff) return std::nullopt;
        return from_detection(*nearest, nearest->confidence * 0.8f, timestamp);
    }

    BallPositionMatch m;
    m.position = interpolate_ball_position(*before, *after, timestamp);
    const double span = after->timestamp - before->timestamp;
    const float avg = (before->confidence + after->confidence) / 2.0f;
    m.confidence = avg * (float)std::max(0.7, 1.0 - span / 2.0);
    m.time_diff = std::min(before_diff, after_diff);
    m.interpolated = true;
    return m;
}

geometry::PositionEstimate to_position_estimate(const BallPositionMatch& match) {
    geometry::PositionEstimate p;
    p.position = match.position;
    p.source = geometry::PositionSource::BallDetection;
    p.confidence = match.confidence;
    return p;
}

} // namespace dedup
} // namespace matchtrack
