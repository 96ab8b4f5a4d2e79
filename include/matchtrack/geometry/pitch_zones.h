#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string_view>

#include "matchtrack/core/types.h"
#include "matchtrack/geometry/homography.h"

namespace matchtrack {
namespace geometry {

// Трети поля относительно команды: defensive у своих ворот.
enum class Zone {
    Defensive,
    Middle,
    Attacking
};

const char* to_string(Zone zone);
bool parse_zone(std::string_view text, Zone& out);

struct ZoneBounds {
    float x_min = 0.0f;
    float x_max = 1.0f;
    float y_min = 0.0f;
    float y_max = 1.0f;
};

// Для away трети зеркальны. Unknown считается как home.
ZoneBounds zone_bounds(Zone zone, TeamId team);
cv::Point2f zone_center(Zone zone, TeamId team);
cv::Point2f position_in_zone(Zone zone, float rel_x, float rel_y, TeamId team);
Zone zone_from_position(const cv::Point2f& p, TeamId team);

// Источник позиции события, в порядке убывания приоритета.
enum class PositionSource {
    BallDetection,
    Merged,
    ModelOutput,
    ZoneConversion,
    Unknown
};

const char* to_string(PositionSource source);

struct PositionEstimate {
    cv::Point2f position{0.5f, 0.5f};
    PositionSource source = PositionSource::Unknown;
    float confidence = 0.0f;
};

// Центр зоны с confidence 0.5; без зоны -> центр поля с 0.1.
PositionEstimate position_from_zone(const std::optional<Zone>& zone, TeamId team);

// Строгий приоритет: мяч > оценка модели > зона > центр. Без усреднения между источниками.
PositionEstimate select_best_position(const std::optional<PositionEstimate>& ball,
                                      const std::optional<PositionEstimate>& model,
                                      const std::optional<PositionEstimate>& zone);

cv::Point2f normalized_to_meters(const cv::Point2f& p, const FieldSize& size = FieldSize{});
cv::Point2f meters_to_normalized(const cv::Point2f& p, const FieldSize& size = FieldSize{});
float distance_meters(const cv::Point2f& a, const cv::Point2f& b, const FieldSize& size = FieldSize{});

} // namespace geometry
} // namespace matchtrack
