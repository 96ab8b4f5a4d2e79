#include "matchtrack/tracking/ball_smoother.h"

#include <algorithm>
#include <limits>

namespace matchtrack {
namespace tracking {

bool parse_camera_zoom(std::string_view text, CameraZoom& out) {
    if (text == "near") { out = CameraZoom::Near; return true; }
    if (text == "mid") { out = CameraZoom::Mid; return true; }
    if (text == "far") { out = CameraZoom::Far; return true; }
    return false;
}

float ball_confidence_threshold(CameraZoom zoom) {
    switch (zoom) {
        case CameraZoom::Near: return 0.6f;
        case CameraZoom::Far: return 0.3f;
        case CameraZoom::Mid: break;
    }
    return 0.4f;
}

BallTrack smooth_ball_track(const std::vector<RawBallObservation>& raw,
                            const BallSmoothingConfig& cfg,
                            const PredictionConfig& prediction_cfg,
                            const std::string& model_id) {
    BallTrack track;
    track.model_id = model_id;
    track.detections.reserve(raw.size());

    const double fps = cfg.fps > 0.0 ? cfg.fps : 30.0;
    const double dt = 1.0 / fps;

    std::optional<KalmanFilter2D> kf;
    int last_visible_frame = -1;

    for (const auto& obs : raw) {
        BallDetection out;
        out.frame_number = obs.frame_number;
        out.timestamp = obs.timestamp;

        const bool accepted = obs.detection && obs.detection->confidence >= cfg.min_confidence;
        if (accepted) {
            const cv::Point2f& center = obs.detection->center;
            if (!kf) {
                kf.emplace(center, cv::Point2f(0.0f, 0.0f), prediction_cfg, obs.timestamp, obs.frame_number);
            } else {
                kf->predict(dt);
                kf->update(center, obs.frame_number, obs.timestamp);
            }
            last_visible_frame = obs.frame_number;
            out.position = kf->position();
            out.confidence = obs.detection->confidence;
            out.visible = true;
        } else {
            const double since_visible = last_visible_frame >= 0
                                         ? (double)(obs.frame_number - last_visible_frame) / fps
                                         : std::numeric_limits<double>::infinity();
            if (kf && since_visible < (double)cfg.max_gap_sec) {
                kf->predict(dt);
                out.position = kf->position();
                out.confidence = (float)std::max(0.1, 0.9 - since_visible);
                out.visible = false;
                out.interpolated = true;
            } else {
                out.position = cv::Point2f(0.5f, 0.5f);
                out.confidence = 0.0f;
                out.visible = false;
            }
        }
        track.detections.push_back(out);
    }

    size_t visible = 0;
    double conf_sum = 0.0;
    for (const auto& d : track.detections) {
        if (d.visible) {
            ++visible;
            conf_sum += d.confidence;
        }
    }
    track.avg_confidence = visible > 0 ? (float)(conf_sum / (double)visible) : 0.0f;
    track.visibility_rate = track.detections.empty()
                            ? 0.0f
                            : (float)visible / (float)track.detections.size();
    return track;
}

} // namespace tracking
} // namespace matchtrack
