#include "matchtrack/tracking/track_predictor.h"
#include "matchtrack/util/rect_utils.h"

#include <tuple>
#include <utility>

namespace matchtrack {
namespace tracking {

TrackPredictor::TrackPredictor(const PredictionConfig& cfg) : cfg_(cfg) {}

void TrackPredictor::init_track(const std::string& track_id,
                                const cv::Point2f& position,
                                const cv::Point2f& velocity,
                                double timestamp,
                                int frame_number) {
    // cv::KalmanFilter копируется поверхностно, поэтому только erase + emplace
    filters_.erase(track_id);
    filters_.emplace(std::piecewise_construct,
                     std::forward_as_tuple(track_id),
                     std::forward_as_tuple(position, velocity, cfg_, timestamp, frame_number));
}

bool TrackPredictor::update_track(const std::string& track_id,
                                  const cv::Point2f& position,
                                  int frame_number,
                                  double timestamp) {
    auto it = filters_.find(track_id);
    if (it == filters_.end()) {
        it = filters_.emplace(std::piecewise_construct,
                              std::forward_as_tuple(track_id),
                              std::forward_as_tuple(position, cv::Point2f(0.0f, 0.0f), cfg_,
                                                    timestamp, frame_number)).first;
    }
    return it->second.update(position, frame_number, timestamp);
}

void TrackPredictor::predict_all(double dt) {
    for (auto& kv : filters_) {
        kv.second.predict(dt);
    }
}

std::optional<PredictedPosition> TrackPredictor::prediction(const std::string& track_id,
                                                            int frame_number,
                                                            double current_time) const {
    auto it = filters_.find(track_id);
    if (it == filters_.end() || !it->second.is_prediction_valid(current_time)) {
        return std::nullopt;
    }
    return it->second.to_predicted(track_id, frame_number, current_time);
}

std::vector<PredictedPosition> TrackPredictor::all_predictions(int frame_number, double current_time) const {
    std::vector<PredictedPosition> out;
    for (const auto& kv : filters_) {
        if (kv.second.is_prediction_valid(current_time)) {
            out.push_back(kv.second.to_predicted(kv.first, frame_number, current_time));
        }
    }
    return out;
}

std::vector<std::string> TrackPredictor::prune_stale(double current_time) {
    std::vector<std::string> removed;
    for (auto it = filters_.begin(); it != filters_.end();) {
        if (!it->second.is_prediction_valid(current_time)) {
            removed.push_back(it->first);
            it = filters_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

bool TrackPredictor::has_track(const std::string& track_id) const {
    return filters_.count(track_id) > 0;
}

float prediction_distance(const PredictedPosition& prediction, const cv::Point2f& observation) {
    return util::pointDistance(prediction.position, observation);
}

bool find_best_match(const std::vector<PredictedPosition>& predictions,
                     const cv::Point2f& observation,
                     float max_distance,
                     std::string& out_track_id) {
    bool found = false;
    float best = max_distance;
    for (const auto& pred : predictions) {
        const float d = prediction_distance(pred, observation);
        if (d < best) {
            best = d;
            out_track_id = pred.track_id;
            found = true;
        }
    }
    return found;
}

} // namespace tracking
} // namespace matchtrack
