#include "matchtrack/events/possession.h"
#include "matchtrack/util/rect_utils.h"

#include <algorithm>
#include <optional>

namespace matchtrack {
namespace events {

namespace {

struct OpenSegment {
    std::string track_id;
    TeamId team = TeamId::Unknown;
    int start_frame = 0;
    double start_time = 0.0;
    double confidence_sum = 0.0;
    int frame_count = 0;
};

PossessionSegment finalize(const OpenSegment& seg,
                           int end_frame,
                           double end_time,
                           const std::map<std::string, std::string>& player_map,
                           EndReason reason) {
    PossessionSegment out;
    out.track_id = seg.track_id;
    auto it = player_map.find(seg.track_id);
    if (it != player_map.end()) out.player_id = it->second;
    out.team = seg.team;
    out.start_frame = seg.start_frame;
    out.end_frame = end_frame;
    out.start_time = seg.start_time;
    out.end_time = end_time;
    out.frame_count = seg.frame_count;
    out.confidence = (float)(seg.confidence_sum / (double)seg.frame_count);
    out.end_reason = reason;
    return out;
}

} // namespace

bool find_closest_player(const cv::Point2f& ball_position,
                         const std::vector<TrackData>& tracks,
                         int frame_number,
                         ClosestPlayer& out) {
    bool found = false;
    for (const auto& t : tracks) {
        auto it = t.frames.find(frame_number);
        if (it == t.frames.end()) continue;

        const float d = util::pointDistance(ball_position, it->second.center);
        if (!found || d < out.distance) {
            out.track_id = t.track_id;
            out.position = it->second.center;
            out.distance = d;
            out.team = t.team;
            found = true;
        }
    }
    return found;
}

std::vector<FramePossession> detect_frame_possessions(const std::vector<TrackData>& tracks,
                                                      const std::map<int, BallDetection>& ball,
                                                      const std::vector<int>& frame_numbers,
                                                      const EventConfig& cfg) {
    std::vector<FramePossession> out;
    out.reserve(frame_numbers.size());

    for (int frame : frame_numbers) {
        FramePossession fp;
        fp.frame_number = frame;
        fp.timestamp = cfg.fps > 0.0 ? (double)frame / cfg.fps : 0.0;

        auto bit = ball.find(frame);
        if (bit == ball.end() || !bit->second.visible) {
            if (bit != ball.end()) fp.ball_position = bit->second.position;
            out.push_back(fp);
            continue;
        }

        const BallDetection& b = bit->second;
        fp.ball_position = b.position;
        fp.ball_visible = true;

        ClosestPlayer closest;
        const bool found = find_closest_player(b.position, tracks, frame, closest);
        if (!found || closest.distance > cfg.possession_distance_threshold) {
            // мяч свободен: владельца нет, но расстояние до ближайшего сохраняем
            if (found) fp.distance = closest.distance;
            fp.confidence = b.confidence;
            out.push_back(fp);
            continue;
        }

        const float thr = cfg.possession_distance_threshold;
        float proximity = 0.0f;
        if (thr > 0.0f) {
            proximity = std::max(0.0f, 1.0f - closest.distance / thr);
        } else {
            proximity = closest.distance == 0.0f ? 1.0f : 0.0f;
        }

        fp.possessor_track_id = closest.track_id;
        fp.possessor_position = closest.position;
        fp.possessor_team = closest.team;
        fp.distance = closest.distance;
        fp.confidence = b.confidence * proximity;
        out.push_back(fp);
    }
    return out;
}

EndReason determine_end_reason(TeamId previous, TeamId next) {
    if (previous == next && previous != TeamId::Unknown) return EndReason::Pass;
    return EndReason::Lost;
}

std::vector<PossessionSegment> build_possession_segments(const std::vector<FramePossession>& possessions,
                                                         const std::map<std::string, std::string>& player_map,
                                                         const EventConfig& cfg) {
    std::vector<PossessionSegment> segments;
    std::optional<OpenSegment> cur;

    for (size_t i = 0; i < possessions.size(); ++i) {
        const FramePossession& fp = possessions[i];

        if (fp.possessor_track_id && fp.possessor_team && fp.possessor_position) {
            if (!cur || cur->track_id != *fp.possessor_track_id) {
                if (cur && cur->frame_count >= cfg.min_possession_frames) {
                    const FramePossession& prev = possessions[i - 1];
                    segments.push_back(finalize(*cur, prev.frame_number, prev.timestamp, player_map,
                                                determine_end_reason(cur->team, *fp.possessor_team)));
                }
                OpenSegment seg;
                seg.track_id = *fp.possessor_track_id;
                seg.team = *fp.possessor_team;
                seg.start_frame = fp.frame_number;
                seg.start_time = fp.timestamp;
                seg.confidence_sum = fp.confidence;
                seg.frame_count = 1;
                cur = seg;
            } else {
                cur->confidence_sum += fp.confidence;
                cur->frame_count += 1;
            }
        } else if (cur && !fp.possessor_track_id) {
            // мяч потерян: видим, но ничей -> lost, не видим -> unknown
            if (cur->frame_count >= cfg.min_possession_frames) {
                segments.push_back(finalize(*cur, fp.frame_number, fp.timestamp, player_map,
                                            fp.ball_visible ? EndReason::Lost : EndReason::Unknown));
            }
            cur.reset();
        }
    }

    if (cur && cur->frame_count >= cfg.min_possession_frames) {
        const FramePossession& last = possessions.back();
        segments.push_back(finalize(*cur, last.frame_number, last.timestamp, player_map, EndReason::Unknown));
    }
    return segments;
}

} // namespace events
} // namespace matchtrack
