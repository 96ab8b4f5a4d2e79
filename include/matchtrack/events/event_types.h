#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "matchtrack/core/types.h"

namespace matchtrack {
namespace events {

constexpr const char* kEventVersion = "1.0.0";

struct EventConfig {
    // Максимальное расстояние мяч-игрок для владения (нормализованные координаты)
    float possession_distance_threshold = 0.05f;
    // Минимум кадров владения, иначе сегмент выбрасывается
    int min_possession_frames = 3;
    // Минимальный путь с мячом для carry
    float min_carry_distance = 0.02f;
    // Ниже этого confidence событие уходит на ревью
    float review_threshold = 0.6f;
    double fps = 30.0;
};

// Трек с командой и игроком, как его видит детектор событий.
struct TrackData {
    std::string track_id;
    std::map<int, TrackFrame> frames;
    TeamId team = TeamId::Unknown;
    std::optional<std::string> player_id;
};

// Владение на одном кадре. Промежуточный результат, отдельно не сохраняется.
struct FramePossession {
    int frame_number = 0;
    double timestamp = 0.0;
    std::optional<cv::Point2f> ball_position;
    bool ball_visible = false;
    std::optional<std::string> possessor_track_id;
    std::optional<cv::Point2f> possessor_position;
    std::optional<TeamId> possessor_team;
    std::optional<float> distance;
    float confidence = 0.0f;
};

enum class EndReason {
    Pass,
    Lost,
    Unknown
};

const char* to_string(EndReason reason);

struct PossessionSegment {
    std::string track_id;
    std::optional<std::string> player_id;
    TeamId team = TeamId::Unknown;
    int start_frame = 0;
    int end_frame = 0;
    double start_time = 0.0;
    double end_time = 0.0;
    int frame_count = 0;
    float confidence = 0.0f;
    EndReason end_reason = EndReason::Unknown;
};

struct PlayerRef {
    std::string track_id;
    std::optional<std::string> player_id;
    TeamId team = TeamId::Unknown;
    cv::Point2f position{0.0f, 0.0f};
    float confidence = 0.0f;
};

enum class PassOutcome {
    Complete,
    Incomplete,
    Intercepted
};

const char* to_string(PassOutcome outcome);
bool parse_pass_outcome(const std::string& text, PassOutcome& out);

struct PassEvent {
    std::string event_id;
    std::string match_id;
    int frame_number = 0;
    double timestamp = 0.0;
    PlayerRef kicker;
    std::optional<PlayerRef> receiver;
    PassOutcome outcome = PassOutcome::Incomplete;
    float outcome_confidence = 0.0f;
    float confidence = 0.0f;
    bool needs_review = false;
    // "low_kicker_confidence" / "low_receiver_confidence", пусто если ревью не нужно
    std::string review_reason;
    std::string source = "auto";
    std::string version = kEventVersion;
};

struct CarryEvent {
    std::string event_id;
    std::string match_id;
    std::string track_id;
    std::optional<std::string> player_id;
    TeamId team = TeamId::Unknown;
    int start_frame = 0;
    int end_frame = 0;
    double start_time = 0.0;
    double end_time = 0.0;
    cv::Point2f start_position{0.0f, 0.0f};
    cv::Point2f end_position{0.0f, 0.0f};
    // суммарный путь с мячом
    float carry_index = 0.0f;
    // смещение вдоль направления атаки со знаком
    float progress_index = 0.0f;
    float confidence = 0.0f;
    std::string version = kEventVersion;
};

enum class TurnoverType {
    Lost,
    Won
};

const char* to_string(TurnoverType type);

struct TurnoverEvent {
    std::string event_id;
    std::string match_id;
    TurnoverType turnover_type = TurnoverType::Lost;
    int frame_number = 0;
    double timestamp = 0.0;
    PlayerRef player;
    PlayerRef other_player;
    std::string context = "other";
    float confidence = 0.0f;
    bool needs_review = false;
    std::string version = kEventVersion;
};

struct DetectedEvents {
    std::vector<PossessionSegment> possession_segments;
    std::vector<PassEvent> pass_events;
    std::vector<CarryEvent> carry_events;
    std::vector<TurnoverEvent> turnover_events;
};

enum class ReviewReason {
    LowConfidence,
    AmbiguousPlayer,
    MultipleCandidates
};

const char* to_string(ReviewReason reason);

struct ReviewCandidate {
    std::string track_id;
    std::optional<std::string> player_id;
    float confidence = 0.0f;
};

struct PendingReview {
    std::string event_id;
    std::string event_type;
    ReviewReason reason = ReviewReason::LowConfidence;
    std::vector<ReviewCandidate> candidates;
    bool resolved = false;
};

} // namespace events
} // namespace matchtrack
