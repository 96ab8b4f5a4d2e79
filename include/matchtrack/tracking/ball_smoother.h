#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/tracking/kalman_filter.h"

namespace matchtrack {
namespace tracking {

enum class CameraZoom {
    Near,
    Mid,
    Far
};

bool parse_camera_zoom(std::string_view text, CameraZoom& out);

// Порог confidence детекции мяча по зуму камеры: near 0.6, mid 0.4, far 0.3.
float ball_confidence_threshold(CameraZoom zoom);

struct BallSmoothingConfig {
    double fps = 30.0;
    // Дольше этого мяч не "дорисовывается" предсказанием (сек)
    float max_gap_sec = 1.0f;
    float min_confidence = 0.4f;
};

// Сырой результат детектора мяча на кадре (nullopt = мяча нет).
struct RawBallObservation {
    int frame_number = 0;
    double timestamp = 0.0;
    std::optional<Detection> detection;
};

// Калман-сглаживание трека мяча с заполнением коротких пропусков предсказанием.
BallTrack smooth_ball_track(const std::vector<RawBallObservation>& raw,
                            const BallSmoothingConfig& cfg,
                            const PredictionConfig& prediction_cfg,
                            const std::string& model_id);

} // namespace tracking
} // namespace matchtrack
