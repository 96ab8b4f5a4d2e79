#pragma once

#include <opencv2/video/tracking.hpp>

#include <string>

namespace matchtrack {
namespace tracking {

struct PredictionConfig {
    // Шум процесса (ускорение), Q масштабируется dt^4/4, dt^3/2, dt^2
    float process_noise = 0.1f;
    // Шум измерения, R = measurement_noise^2 * I
    float measurement_noise = 0.5f;
    // Затухание confidence в секунду без наблюдений
    float confidence_decay_rate = 0.2f;
    // Максимальное время предсказания без наблюдений (сек)
    float max_prediction_time = 5.0f;
};

struct PredictedPosition {
    std::string track_id;
    int frame_number = 0;
    cv::Point2f position{0.0f, 0.0f};
    cv::Point2f velocity{0.0f, 0.0f};
    float confidence = 0.0f;
    int last_observed_frame = 0;
    double time_since_observation = 0.0;
};

// Constant-velocity фильтр, состояние [x, y, vx, vy], измерение только x,y.
class KalmanFilter2D {
public:
    // timestamp/frame_number: момент первого наблюдения, от него считается устаревание
    KalmanFilter2D(const cv::Point2f& position,
                   const cv::Point2f& velocity,
                   const PredictionConfig& cfg,
                   double timestamp = 0.0,
                   int frame_number = 0);

    void predict(double dt);

    // false, если ковариация невязки вырождена: состояние не меняется.
    bool update(const cv::Point2f& position, int frame_number, double timestamp);

    cv::Point2f position() const;
    cv::Point2f velocity() const;

    float confidence(double current_time) const;
    bool is_prediction_valid(double current_time) const;

    PredictedPosition to_predicted(const std::string& track_id, int frame_number, double current_time) const;

    double last_update_time() const { return last_update_time_; }
    int last_observation_frame() const { return last_observation_frame_; }

private:
    void set_dt(double dt);

    cv::KalmanFilter kf_;
    PredictionConfig cfg_;
    double last_update_time_ = 0.0;
    int last_observation_frame_ = 0;
};

} // namespace tracking
} // namespace matchtrack
