#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#define MATCHTRACK_VERSION "1.0.0"

namespace matchtrack {

// Команда трека. Unknown не "по умолчанию одна из двух", а отдельное состояние:
// pass/turnover/validation на нём специально не делают выводов.
enum class TeamId {
    Home,
    Away,
    Unknown
};

const char* to_string(TeamId team);
TeamId parse_team_id(std::string_view text);

enum class GameFormat {
    Eleven,
    Eight,
    Five
};

const char* to_string(GameFormat format);
bool parse_game_format(std::string_view text, GameFormat& out);

// Направление атаки для progressIndex.
enum class AttackDirection {
    None,
    LeftToRight,
    RightToLeft
};

const char* to_string(AttackDirection dir);
bool parse_attack_direction(std::string_view text, AttackDirection& out);

struct Rgb {
    int r = 128;
    int g = 128;
    int b = 128;
};

inline bool operator==(const Rgb& a, const Rgb& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

// Детекция одного кадра. bbox и center нормализованы в [0,1].
struct Detection {
    cv::Rect2f bbox;
    cv::Point2f center{0.0f, 0.0f};
    float confidence = 0.0f;
    std::string label = "person";
    std::optional<float> class_confidence;
    // id трека от внешнего трекера (если детектор его отдаёт)
    std::string track_id;
    // цвет джерси, если кадр уже прошёл через pixel-sampling
    std::optional<Rgb> jersey_color;
};

Detection make_detection(const cv::Rect2f& bbox, float confidence, const std::string& label = "person");

struct TrackFrame {
    int frame_number = 0;
    double timestamp = 0.0;
    cv::Rect2f bbox;
    cv::Point2f center{0.0f, 0.0f};
    float confidence = 0.0f;
    std::optional<Rgb> jersey_color;
};

// Трек: кадры упорядочены по номеру кадра.
struct Track {
    std::string track_id;
    std::map<int, TrackFrame> frames;
};

struct BallDetection {
    int frame_number = 0;
    double timestamp = 0.0;
    cv::Point2f position{0.5f, 0.5f};
    float confidence = 0.0f;
    bool visible = false;
    // true, если позиция получена предсказанием, а не наблюдением
    bool interpolated = false;
};

struct BallTrack {
    std::string model_id;
    std::vector<BallDetection> detections;
    float avg_confidence = 0.0f;
    float visibility_rate = 0.0f;
};

} // namespace matchtrack
