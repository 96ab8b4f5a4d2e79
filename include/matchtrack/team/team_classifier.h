#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/detect/color.h"
#include "matchtrack/team/kmeans.h"

namespace matchtrack {
namespace team {

// Метка классификации. Referee есть только здесь, в TeamId он превращается в Unknown.
enum class TeamLabel {
    Home,
    Away,
    Referee,
    Unknown
};

const char* to_string(TeamLabel label);
TeamId to_team_id(TeamLabel label);

struct TeamClassification {
    std::map<std::string, TeamLabel> assignments;
    std::string home_color = "#808080";
    std::string away_color = "#808080";
    float confidence = 0.0f;
    std::vector<Cluster> clusters;
};

// Доли bbox, из которых берётся цвет майки (без головы, ног и рук).
struct JerseyRegion {
    float top = 0.15f;
    float bottom = 0.55f;
    float left = 0.25f;
    float right = 0.75f;
};

cv::Rect2f jersey_region(const cv::Rect2f& bbox, const JerseyRegion& region = JerseyRegion{});

// Средний цвет области майки. frame_bgr 8UC3, bbox нормализован.
// Пустая область -> серый (128,128,128).
Rgb extract_dominant_color(const cv::Mat& frame_bgr,
                           const cv::Rect2f& bbox,
                           const JerseyRegion& region = JerseyRegion{});

// Все цвета из кадров треков (TrackFrame::jersey_color).
std::vector<ColorSample> collect_track_samples(const std::map<std::string, Track>& tracks);

// Один усреднённый сэмпл на трек, почти серые сэмплы пропускаются.
std::vector<ColorSample> average_track_samples(const std::vector<ColorSample>& samples);

TeamClassification classify_teams_by_color(const std::vector<ColorSample>& samples,
                                           const KMeansConfig& cfg,
                                           cv::RNG& rng,
                                           const std::optional<detect::TeamColors>& reference = std::nullopt);

struct TrackTeamMeta {
    std::string track_id;
    TeamId team = TeamId::Unknown;
    float team_confidence = 0.0f;
    std::optional<std::string> dominant_color;
    std::string classification_method = "color_clustering";
};

std::vector<TrackTeamMeta> build_team_metas(const std::vector<std::string>& track_ids,
                                            const TeamClassification& classification,
                                            const std::vector<ColorSample>& track_samples);

} // namespace team
} // namespace matchtrack
