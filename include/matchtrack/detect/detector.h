#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "matchtrack/core/types.h"

namespace matchtrack {
namespace detect {

enum class DetectorKind {
    Placeholder,
    Recorded
};

bool parse_detector_kind(std::string_view text, DetectorKind& out);
const char* to_string(DetectorKind kind);

// Ничего не находит. Используется, когда модели нет (пустой прогон, тесты пайплайна).
struct PlaceholderPlayerDetector {
    std::vector<Detection> detect(int frame_number) const;
    const char* model_id() const { return "placeholder-player"; }
};

struct PlaceholderBallDetector {
    std::optional<Detection> detect(int frame_number) const;
    const char* model_id() const { return "placeholder-ball"; }
};

// Проигрывает сохранённый выход модели по номеру кадра.
// Конструктор проверяет данные и бросает DetectionError на мусоре.
class RecordedPlayerDetector {
public:
    explicit RecordedPlayerDetector(std::map<int, std::vector<Detection>> frames,
                                    std::string model_id = "recorded-player");

    std::vector<Detection> detect(int frame_number) const;
    const std::string& model_id() const { return model_id_; }
    size_t frame_count() const { return frames_.size(); }

private:
    std::map<int, std::vector<Detection>> frames_;
    std::string model_id_;
};

class RecordedBallDetector {
public:
    explicit RecordedBallDetector(std::map<int, Detection> frames,
                                  std::string model_id = "recorded-ball");

    std::optional<Detection> detect(int frame_number) const;
    const std::string& model_id() const { return model_id_; }

private:
    std::map<int, Detection> frames_;
    std::string model_id_;
};

using PlayerDetector = std::variant<PlaceholderPlayerDetector, RecordedPlayerDetector>;
using BallDetector = std::variant<PlaceholderBallDetector, RecordedBallDetector>;

std::vector<Detection> detect_players(const PlayerDetector& detector, int frame_number);
std::optional<Detection> detect_ball(const BallDetector& detector, int frame_number);

std::string model_id(const PlayerDetector& detector);
std::string model_id(const BallDetector& detector);

// Проверка одной детекции: bbox и confidence в [0,1]. false + причина в reason.
bool is_valid_detection(const Detection& det, std::string& reason);

} // namespace detect
} // namespace matchtrack
