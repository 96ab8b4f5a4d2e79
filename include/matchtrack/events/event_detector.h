#pragma once

#include <map>
#include <string>
#include <vector>

#include "matchtrack/events/event_types.h"

namespace matchtrack {
namespace events {

// "<type>_<frame>", детерминированно для одного и того же входа.
std::string make_event_id(const std::string& type, int frame_number);

// Смещение вдоль атаки: LTR -> dx, RTL -> -dx, без направления 0.
float calculate_progress(const cv::Point2f& start, const cv::Point2f& end, AttackDirection direction);

using PossessionIndex = std::map<int, FramePossession>;

PossessionIndex index_possessions(const std::vector<FramePossession>& possessions);

std::vector<PassEvent> detect_pass_events(const std::vector<PossessionSegment>& segments,
                                          const std::string& match_id,
                                          const EventConfig& cfg,
                                          const PossessionIndex& by_frame);

std::vector<CarryEvent> detect_carry_events(const std::vector<PossessionSegment>& segments,
                                            const std::string& match_id,
                                            const EventConfig& cfg,
                                            const PossessionIndex& by_frame,
                                            AttackDirection direction);

// Пара lost/won на каждую смену известных разных команд.
std::vector<TurnoverEvent> detect_turnover_events(const std::vector<PossessionSegment>& segments,
                                                  const std::string& match_id,
                                                  const EventConfig& cfg,
                                                  const PossessionIndex& by_frame);

// Кадры берутся из трека мяча (по возрастанию).
DetectedEvents detect_all_events(const std::vector<TrackData>& tracks,
                                 const std::map<int, BallDetection>& ball,
                                 const std::string& match_id,
                                 AttackDirection direction,
                                 const EventConfig& cfg);

} // namespace events
} // namespace matchtrack
