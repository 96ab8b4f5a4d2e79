#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <utility>

#include "matchtrack/config.h"
#include "matchtrack/detect/detection_filter.h"
#include "matchtrack/team/team_classifier.h"
#include "matchtrack/tracking/track_predictor.h"

namespace matchtrack {
namespace pipeline {

// Состояние одного прогона анализа. Создаётся на матч, между матчами ничего не делится.
struct AnalysisContext {
    AnalysisContext(std::string id, const AppConfig &cfg)
        : match_id(std::move(id)),
          predictor(cfg.prediction),
          rng(cfg.match.seed) {}

    std::string match_id;
    detect::MotionHistory motion;
    tracking::TrackPredictor predictor;
    // k-means++ берёт случайность только отсюда
    cv::RNG rng;
    team::TeamClassification teams;
};

} // namespace pipeline
} // namespace matchtrack
