#include "matchtrack/geometry/pitch_zones.h"

#include <algorithm>
#include <cmath>

namespace matchtrack {
namespace geometry {

namespace {

constexpr float kThird = 0.333f;
constexpr float kTwoThirds = 0.667f;

} // namespace

const char* to_string(Zone zone) {
    switch (zone) {
        case Zone::Defensive: return "defensive_third";
        case Zone::Attacking: return "attacking_third";
        case Zone::Middle: break;
    }
    return "middle_third";
}

bool parse_zone(std::string_view text, Zone& out) {
    if (text == "defensive_third") { out = Zone::Defensive; return true; }
    if (text == "middle_third") { out = Zone::Middle; return true; }
    if (text == "attacking_third") { out = Zone::Attacking; return true; }
    return false;
}

ZoneBounds zone_bounds(Zone zone, TeamId team) {
    const bool away = team == TeamId::Away;
    switch (zone) {
        case Zone::Defensive:
            return away ? ZoneBounds{kTwoThirds, 1.0f, 0.0f, 1.0f} : ZoneBounds{0.0f, kThird, 0.0f, 1.0f};
        case Zone::Attacking:
            return away ? ZoneBounds{0.0f, kThird, 0.0f, 1.0f} : ZoneBounds{kTwoThirds, 1.0f, 0.0f, 1.0f};
        case Zone::Middle:
            break;
    }
    return ZoneBounds{kThird, kTwoThirds, 0.0f, 1.0f};
}

cv::Point2f zone_center(Zone zone, TeamId team) {
    const ZoneBounds b = zone_bounds(zone, team);
    return cv::Point2f((b.x_min + b.x_max) / 2.0f, (b.y_min + b.y_max) / 2.0f);
}

cv::Point2f position_in_zone(Zone zone, float rel_x, float rel_y, TeamId team) {
    const ZoneBounds b = zone_bounds(zone, team);
    const float cx = std::max(0.0f, std::min(1.0f, rel_x));
    const float cy = std::max(0.0f, std::min(1.0f, rel_y));
    return cv::Point2f(b.x_min + cx * (b.x_max - b.x_min),
                       b.y_min + cy * (b.y_max - b.y_min));
}

Zone zone_from_position(const cv::Point2f& p, TeamId team) {
    for (Zone zone : {Zone::Defensive, Zone::Middle, Zone::Attacking}) {
        const ZoneBounds b = zone_bounds(zone, team);
        if (p.x >= b.x_min && p.x <= b.x_max && p.y >= b.y_min && p.y <= b.y_max) {
            return zone;
        }
    }
    return Zone::Middle;
}

const char* to_string(PositionSource source) {
    switch (source) {
        case PositionSource::BallDetection: return "ball_detection";
        case PositionSource::Merged: return "merged";
        case PositionSource::ModelOutput: return "model_output";
        case PositionSource::ZoneConversion: return "zone_conversion";
        case PositionSource::Unknown: break;
    }
    return "unknown";
}

PositionEstimate position_from_zone(const std::optional<Zone>& zone, TeamId team) {
    PositionEstimate est;
    if (!zone) {
        est.position = cv::Point2f(0.5f, 0.5f);
        est.source = PositionSource::Unknown;
        est.confidence = 0.1f;
        return est;
    }
    est.position = zone_center(*zone, team);
    est.source = PositionSource::ZoneConversion;
    est.confidence = 0.5f;
    return est;
}

PositionEstimate select_best_position(const std::optional<PositionEstimate>& ball,
                                      const std::optional<PositionEstimate>& model,
                                      const std::optional<PositionEstimate>& zone) {
    if (ball) return *ball;
    if (model) return *model;
    if (zone) return *zone;
    return position_from_zone(std::nullopt, TeamId::Unknown);
}

cv::Point2f normalized_to_meters(const cv::Point2f& p, const FieldSize& size) {
    return cv::Point2f(p.x * size.length, p.y * size.width);
}

cv::Point2f meters_to_normalized(const cv::Point2f& p, const FieldSize& size) {
    return cv::Point2f(p.x / size.length, p.y / size.width);
}

float distance_meters(const cv::Point2f& a, const cv::Point2f& b, const FieldSize& size) {
    const cv::Point2f am = normalized_to_meters(a, size);
    const cv::Point2f bm = normalized_to_meters(b, size);
    return std::hypot(bm.x - am.x, bm.y - am.y);
}

} // namespace geometry
} // namespace matchtrack
