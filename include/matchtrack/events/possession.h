#pragma once

#include <map>
#include <string>
#include <vector>

#include "matchtrack/events/event_types.h"

namespace matchtrack {
namespace events {

struct ClosestPlayer {
    std::string track_id;
    cv::Point2f position{0.0f, 0.0f};
    float distance = 0.0f;
    TeamId team = TeamId::Unknown;
};

// Ближайший к мячу трек среди тех, у кого есть этот кадр. false, если таких нет.
bool find_closest_player(const cv::Point2f& ball_position,
                         const std::vector<TrackData>& tracks,
                         int frame_number,
                         ClosestPlayer& out);

std::vector<FramePossession> detect_frame_possessions(const std::vector<TrackData>& tracks,
                                                      const std::map<int, BallDetection>& ball,
                                                      const std::vector<int>& frame_numbers,
                                                      const EventConfig& cfg);

// Причина конца сегмента при смене владельца: pass только внутри одной известной команды.
EndReason determine_end_reason(TeamId previous, TeamId next);

// Один проход по кадрам. Сегменты короче min_possession_frames выбрасываются.
// player_map: track id -> player id (нет записи = игрок не опознан).
std::vector<PossessionSegment> build_possession_segments(const std::vector<FramePossession>& possessions,
                                                         const std::map<std::string, std::string>& player_map,
                                                         const EventConfig& cfg);

} // namespace events
} // namespace matchtrack
