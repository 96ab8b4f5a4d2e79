#include "matchtrack/tracking/kalman_filter.h"

#include <algorithm>
#include <cmath>

namespace matchtrack {
namespace tracking {

namespace {
constexpr double kSingularEps = 1e-10;
}

KalmanFilter2D::KalmanFilter2D(const cv::Point2f& position,
                               const cv::Point2f& velocity,
                               const PredictionConfig& cfg,
                               double timestamp,
                               int frame_number)
        : kf_(4, 2, 0, CV_64F), cfg_(cfg), last_update_time_(timestamp), last_observation_frame_(frame_number) {
    kf_.measurementMatrix = (cv::Mat_<double>(2, 4) <<
            1, 0, 0, 0,
            0, 1, 0, 0);
    const double r = (double)cfg_.measurement_noise * (double)cfg_.measurement_noise;
    kf_.measurementNoiseCov = cv::Mat::eye(2, 2, CV_64F) * r;
    kf_.errorCovPost = cv::Mat::eye(4, 4, CV_64F);
    kf_.statePost = (cv::Mat_<double>(4, 1) << position.x, position.y, velocity.x, velocity.y);
    kf_.statePost.copyTo(kf_.statePre);
    kf_.errorCovPost.copyTo(kf_.errorCovPre);
}

void KalmanFilter2D::set_dt(double dt) {
    kf_.transitionMatrix = (cv::Mat_<double>(4, 4) <<
            1, 0, dt, 0,
            0, 1, 0, dt,
            0, 0, 1, 0,
            0, 0, 0, 1);

    // white-noise acceleration
    const double q = (double)cfg_.process_noise * (double)cfg_.process_noise;
    const double dt2 = dt * dt;
    const double dt3 = dt2 * dt;
    const double dt4 = dt3 * dt;
    kf_.processNoiseCov = (cv::Mat_<double>(4, 4) <<
            dt4 * q / 4.0, 0, dt3 * q / 2.0, 0,
            0, dt4 * q / 4.0, 0, dt3 * q / 2.0,
            dt3 * q / 2.0, 0, dt2 * q, 0,
            0, dt3 * q / 2.0, 0, dt2 * q);
}

void KalmanFilter2D::predict(double dt) {
    if (dt <= 0.0) {
        return;
    }
    set_dt(dt);
    // predict() пишет statePre/errorCovPre и копирует их в statePost/errorCovPost
    kf_.predict();
}

bool KalmanFilter2D::update(const cv::Point2f& position, int frame_number, double timestamp) {
    // correct() работает от statePre, а update может прийти без predict()
    kf_.statePost.copyTo(kf_.statePre);
    kf_.errorCovPost.copyTo(kf_.errorCovPre);

    const cv::Mat s = kf_.measurementMatrix * kf_.errorCovPre * kf_.measurementMatrix.t() +
                      kf_.measurementNoiseCov;
    if (std::abs(cv::determinant(s)) < kSingularEps) {
        return false;
    }

    const cv::Mat z = (cv::Mat_<double>(2, 1) << position.x, position.y);
    kf_.correct(z);
    last_update_time_ = timestamp;
    last_observation_frame_ = frame_number;
    return true;
}

cv::Point2f KalmanFilter2D::position() const {
    return cv::Point2f((float)kf_.statePost.at<double>(0), (float)kf_.statePost.at<double>(1));
}

cv::Point2f KalmanFilter2D::velocity() const {
    return cv::Point2f((float)kf_.statePost.at<double>(2), (float)kf_.statePost.at<double>(3));
}

float KalmanFilter2D::confidence(double current_time) const {
    const double since = current_time - last_update_time_;
    const double decay = std::exp(-(double)cfg_.confidence_decay_rate * since);
    return (float)std::max(0.0, std::min(1.0, decay));
}

bool KalmanFilter2D::is_prediction_valid(double current_time) const {
    return current_time - last_update_time_ <= (double)cfg_.max_prediction_time;
}

PredictedPosition KalmanFilter2D::to_predicted(const std::string& track_id,
                                               int frame_number,
                                               double current_time) const {
    PredictedPosition p;
    p.track_id = track_id;
    p.frame_number = frame_number;
    p.position = position();
    p.velocity = velocity();
    p.confidence = confidence(current_time);
    p.last_observed_frame = last_observation_frame_;
    p.time_since_observation = current_time - last_update_time_;
    return p;
}

} // namespace tracking
} // namespace matchtrack
