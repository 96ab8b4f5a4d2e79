#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/geometry/pitch_zones.h"

namespace matchtrack {
namespace dedup {

enum class EventType {
    Pass,
    Carry,
    Turnover,
    Shot,
    SetPiece
};

const char* to_string(EventType type);
bool parse_event_type(std::string_view text, EventType& out);

// Событие, найденное в одном окне анализа.
struct RawEvent {
    std::string match_id;
    std::string window_id;
    // секунды от начала окна
    double relative_timestamp = 0.0;
    // секунды от начала видео
    double absolute_timestamp = 0.0;
    EventType type = EventType::Pass;
    TeamId team = TeamId::Unknown;
    std::optional<std::string> player;
    std::optional<geometry::Zone> zone;
    // нормализованные 0..1
    std::optional<cv::Point2f> position;
    std::optional<float> position_confidence;
    std::map<std::string, std::string> details;
    std::string visual_evidence;
    float confidence = 0.0f;
    // confidence с поправкой на перекрытие окна; нет -> используется confidence
    std::optional<float> window_confidence;
};

float effective_confidence(const RawEvent& e);

// Каноническое событие после слияния дублей из нескольких окон.
struct DeduplicatedEvent {
    std::string match_id;
    double absolute_timestamp = 0.0;
    EventType type = EventType::Pass;
    TeamId team = TeamId::Unknown;
    std::optional<std::string> player;
    std::optional<geometry::Zone> zone;
    std::optional<cv::Point2f> position;
    std::optional<float> position_confidence;
    std::map<std::string, std::string> details;
    std::string visual_evidence;
    // confidence базового (лучшего) события
    float confidence = 0.0f;

    std::vector<std::string> merged_from_windows;
    float adjusted_confidence = 0.0f;
    std::optional<cv::Point2f> merged_position;
    std::optional<geometry::PositionSource> position_source;
    std::optional<float> merged_position_confidence;
    float ensemble_confidence = 0.0f;
};

} // namespace dedup
} // namespace matchtrack
