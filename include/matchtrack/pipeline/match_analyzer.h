#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "matchtrack/config.h"
#include "matchtrack/dedup/analysis_window.h"
#include "matchtrack/dedup/deduplication.h"
#include "matchtrack/dedup/event_validation.h"
#include "matchtrack/detect/detection_filter.h"
#include "matchtrack/detect/detector.h"
#include "matchtrack/events/event_types.h"
#include "matchtrack/geometry/homography.h"
#include "matchtrack/pipeline/analysis_context.h"
#include "matchtrack/team/team_classifier.h"

namespace matchtrack {
namespace pipeline {

// Вход одного матча. Детекции приходят отдельно, через детекторы.
struct MatchInput {
    std::string match_id;
    cv::Size frame_size;
    // номера кадров по возрастанию
    std::vector<int> frames;
    // ключевые кадры гомографии, по frame_number
    std::vector<geometry::HomographyData> homographies;
    // id трека (трекера) -> id игрока
    std::map<std::string, std::string> players;
    std::vector<detect::RosterEntry> roster;
    // id трека детектора -> номер на майке
    std::map<std::string, int> jersey_numbers;

    std::vector<dedup::RawEvent> raw_events;
    std::vector<dedup::AnalysisWindow> windows;
};

struct MatchOutput {
    std::string match_id;
    std::string tracker_id;
    std::string player_model_id;

    std::map<std::string, Track> tracks;
    detect::FilterStats filter_totals;

    BallTrack ball;

    team::TeamClassification teams;
    std::vector<team::TrackTeamMeta> team_metas;

    events::DetectedEvents events;
    std::vector<events::PendingReview> reviews;

    std::vector<dedup::DeduplicatedEvent> dedup_events;
    dedup::DedupStats dedup_stats;
    dedup::ValidationResult validation;
};

class MatchAnalyzer {
public:
    explicit MatchAnalyzer(AppConfig cfg);

    // Полный прогон матча. Бросает AnalysisError на структурно неверном входе.
    MatchOutput run(const MatchInput &input,
                    const detect::PlayerDetector &players,
                    const detect::BallDetector &ball) const;

    const AppConfig &config() const { return cfg_; }

private:
    void track_players(const MatchInput &input,
                       const detect::PlayerDetector &detector,
                       AnalysisContext &ctx,
                       MatchOutput &out) const;
    void track_ball(const MatchInput &input, const detect::BallDetector &detector, MatchOutput &out) const;
    void classify_teams(AnalysisContext &ctx, MatchOutput &out) const;
    void derive_events(const MatchInput &input, MatchOutput &out) const;
    void merge_window_events(const MatchInput &input, MatchOutput &out) const;

    double frame_time(int frame_number) const;

    AppConfig cfg_;
};

// Раскладка командных цветов из [team]; нет обоих цветов -> nullopt.
std::optional<detect::TeamColors> reference_team_colors(const TeamConfig &cfg);

} // namespace pipeline
} // namespace matchtrack
