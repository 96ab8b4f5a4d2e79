#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "matchtrack/tracking/kalman_filter.h"

namespace matchtrack {
namespace tracking {

// Набор Калман-фильтров по track id. Живёт в AnalysisContext одного матча.
class TrackPredictor {
public:
    explicit TrackPredictor(const PredictionConfig& cfg = PredictionConfig{});

    void init_track(const std::string& track_id,
                    const cv::Point2f& position,
                    const cv::Point2f& velocity = cv::Point2f(0.0f, 0.0f),
                    double timestamp = 0.0,
                    int frame_number = 0);

    // Создаёт фильтр, если трека ещё нет. false, если update был пропущен (вырожденная S).
    bool update_track(const std::string& track_id,
                      const cv::Point2f& position,
                      int frame_number,
                      double timestamp);

    void predict_all(double dt);

    std::optional<PredictedPosition> prediction(const std::string& track_id,
                                                int frame_number,
                                                double current_time) const;
    std::vector<PredictedPosition> all_predictions(int frame_number, double current_time) const;

    // Удаляет треки с устаревшим предсказанием, возвращает их id.
    std::vector<std::string> prune_stale(double current_time);

    bool has_track(const std::string& track_id) const;
    size_t track_count() const { return filters_.size(); }
    const PredictionConfig& config() const { return cfg_; }

    void reset() { filters_.clear(); }

private:
    PredictionConfig cfg_;
    std::map<std::string, KalmanFilter2D> filters_;
};

float prediction_distance(const PredictedPosition& prediction, const cv::Point2f& observation);

// Ближайшее валидное предсказание строго ближе max_distance.
bool find_best_match(const std::vector<PredictedPosition>& predictions,
                     const cv::Point2f& observation,
                     float max_distance,
                     std::string& out_track_id);

} // namespace tracking
} // namespace matchtrack
