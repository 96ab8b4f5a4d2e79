#include "matchtrack/detect/detector.h"
#include "matchtrack/core/errors.h"

#include <cmath>
#include <utility>

namespace matchtrack {
namespace detect {

namespace {

bool in_unit(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

void check_or_throw(const Detection& det, int frame_number) {
    std::string reason;
    if (!is_valid_detection(det, reason)) {
        throw DetectionError("frame " + std::to_string(frame_number) + ": " + reason);
    }
}

} // namespace

bool parse_detector_kind(std::string_view text, DetectorKind& out) {
    if (text == "placeholder") { out = DetectorKind::Placeholder; return true; }
    if (text == "recorded") { out = DetectorKind::Recorded; return true; }
    return false;
}

const char* to_string(DetectorKind kind) {
    return kind == DetectorKind::Placeholder ? "placeholder" : "recorded";
}

bool is_valid_detection(const Detection& det, std::string& reason) {
    if (!in_unit(det.confidence)) {
        reason = "confidence outside [0,1]";
        return false;
    }
    const cv::Rect2f& b = det.bbox;
    if (!in_unit(b.x) || !in_unit(b.y) || !in_unit(b.width) || !in_unit(b.height)) {
        reason = "bbox outside normalized range";
        return false;
    }
    if (det.class_confidence && !in_unit(*det.class_confidence)) {
        reason = "class confidence outside [0,1]";
        return false;
    }
    return true;
}

std::vector<Detection> PlaceholderPlayerDetector::detect(int /*frame_number*/) const {
    return {};
}

std::optional<Detection> PlaceholderBallDetector::detect(int /*frame_number*/) const {
    return std::nullopt;
}

RecordedPlayerDetector::RecordedPlayerDetector(std::map<int, std::vector<Detection>> frames, std::string model_id)
    : frames_(std::move(frames)), model_id_(std::move(model_id)) {
    for (const auto& kv : frames_) {
        for (const auto& det : kv.second) check_or_throw(det, kv.first);
    }
}

std::vector<Detection> RecordedPlayerDetector::detect(int frame_number) const {
    auto it = frames_.find(frame_number);
    if (it == frames_.end()) return {};
    return it->second;
}

RecordedBallDetector::RecordedBallDetector(std::map<int, Detection> frames, std::string model_id)
    : frames_(std::move(frames)), model_id_(std::move(model_id)) {
    for (const auto& kv : frames_) check_or_throw(kv.second, kv.first);
}

std::optional<Detection> RecordedBallDetector::detect(int frame_number) const {
    auto it = frames_.find(frame_number);
    if (it == frames_.end()) return std::nullopt;
    return it->second;
}

std::vector<Detection> detect_players(const PlayerDetector& detector, int frame_number) {
    return std::visit([&](const auto& d) { return d.detect(frame_number); }, detector);
}

std::optional<Detection> detect_ball(const BallDetector& detector, int frame_number) {
    return std::visit([&](const auto& d) { return d.detect(frame_number); }, detector);
}

std::string model_id(const PlayerDetector& detector) {
    return std::visit([](const auto& d) { return std::string(d.model_id()); }, detector);
}

std::string model_id(const BallDetector& detector) {
    return std::visit([](const auto& d) { return std::string(d.model_id()); }, detector);
}

} // namespace detect
} // namespace matchtrack
