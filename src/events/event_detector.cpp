#include "matchtrack/events/event_detector.h"
#include "matchtrack/events/possession.h"
#include "matchtrack/util/rect_utils.h"

#include <algorithm>

namespace matchtrack {
namespace events {

namespace {

bool same_known_team(TeamId a, TeamId b) {
    return a == b && a != TeamId::Unknown;
}

PassOutcome pass_outcome(TeamId kicker, TeamId receiver) {
    if (same_known_team(kicker, receiver)) return PassOutcome::Complete;
    if (receiver == TeamId::Unknown) return PassOutcome::Incomplete;
    return PassOutcome::Intercepted;
}

// Минимум из двух сегментов, вдвое меньше, если хоть одна команда неизвестна.
float outcome_confidence(const PossessionSegment& a, const PossessionSegment& b) {
    const float m = std::min(a.confidence, b.confidence);
    if (a.team != TeamId::Unknown && b.team != TeamId::Unknown) return m;
    return m * 0.5f;
}

const cv::Point2f* possessor_at(const PossessionIndex& by_frame, int frame) {
    auto it = by_frame.find(frame);
    if (it == by_frame.end() || !it->second.possessor_position) return nullptr;
    return &*it->second.possessor_position;
}

// Последний кадр сегмента, где трек реально держал мяч. end_frame может быть
// кадром свободного мяча, на нём позиции владельца нет.
const FramePossession* last_held(const PossessionIndex& by_frame, const PossessionSegment& seg) {
    auto it = by_frame.upper_bound(seg.end_frame);
    while (it != by_frame.begin()) {
        --it;
        if (it->first < seg.start_frame) break;
        const FramePossession& fp = it->second;
        if (fp.possessor_track_id && *fp.possessor_track_id == seg.track_id && fp.possessor_position) {
            return &fp;
        }
    }
    return nullptr;
}

PlayerRef make_ref(const PossessionSegment& seg, const cv::Point2f& pos) {
    PlayerRef ref;
    ref.track_id = seg.track_id;
    ref.player_id = seg.player_id;
    ref.team = seg.team;
    ref.position = pos;
    ref.confidence = seg.confidence;
    return ref;
}

} // namespace

std::string make_event_id(const std::string& type, int frame_number) {
    return type + "_" + std::to_string(frame_number);
}

float calculate_progress(const cv::Point2f& start, const cv::Point2f& end, AttackDirection direction) {
    const float dx = end.x - start.x;
    switch (direction) {
        case AttackDirection::LeftToRight: return dx;
        case AttackDirection::RightToLeft: return -dx;
        case AttackDirection::None: break;
    }
    return 0.0f;
}

PossessionIndex index_possessions(const std::vector<FramePossession>& possessions) {
    PossessionIndex out;
    for (const auto& fp : possessions) out[fp.frame_number] = fp;
    return out;
}

std::vector<PassEvent> detect_pass_events(const std::vector<PossessionSegment>& segments,
                                          const std::string& match_id,
                                          const EventConfig& cfg,
                                          const PossessionIndex& by_frame) {
    std::vector<PassEvent> out;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const PossessionSegment& cur = segments[i];
        const PossessionSegment& next = segments[i + 1];
        if (cur.track_id == next.track_id) continue;

        const FramePossession* kick = last_held(by_frame, cur);
        const cv::Point2f* receiver_pos = possessor_at(by_frame, next.start_frame);
        if (!kick) continue;
        const cv::Point2f* kicker_pos = &*kick->possessor_position;

        PassEvent p;
        p.event_id = make_event_id("pass", cur.end_frame);
        p.match_id = match_id;
        p.frame_number = cur.end_frame;
        p.timestamp = cur.end_time;
        p.kicker = make_ref(cur, *kicker_pos);
        p.outcome = pass_outcome(cur.team, next.team);
        p.outcome_confidence = outcome_confidence(cur, next);
        p.confidence = (cur.confidence + next.confidence) / 2.0f * p.outcome_confidence;
        p.needs_review = p.confidence < cfg.review_threshold;
        if (p.needs_review) {
            // слабая сторона: ниже порога или, если обе выше, меньшая из двух
            const bool kicker_weak = cur.confidence < cfg.review_threshold ||
                                     (next.confidence >= cfg.review_threshold && cur.confidence < next.confidence);
            p.review_reason = kicker_weak ? "low_kicker_confidence" : "low_receiver_confidence";
        }
        if (p.outcome != PassOutcome::Incomplete && receiver_pos) {
            p.receiver = make_ref(next, *receiver_pos);
        }
        out.push_back(p);
    }
    return out;
}

std::vector<CarryEvent> detect_carry_events(const std::vector<PossessionSegment>& segments,
                                            const std::string& match_id,
                                            const EventConfig& cfg,
                                            const PossessionIndex& by_frame,
                                            AttackDirection direction) {
    std::vector<CarryEvent> out;
    for (const auto& seg : segments) {
        std::vector<cv::Point2f> path;
        auto it = by_frame.lower_bound(seg.start_frame);
        for (; it != by_frame.end() && it->first <= seg.end_frame; ++it) {
            const FramePossession& fp = it->second;
            if (fp.possessor_track_id && *fp.possessor_track_id == seg.track_id && fp.possessor_position) {
                path.push_back(*fp.possessor_position);
            }
        }
        if (path.size() < 2) continue;

        const float carry_index = util::pathLength(path);
        if (carry_index < cfg.min_carry_distance) continue;

        CarryEvent c;
        c.event_id = make_event_id("carry", seg.start_frame);
        c.match_id = match_id;
        c.track_id = seg.track_id;
        c.player_id = seg.player_id;
        c.team = seg.team;
        c.start_frame = seg.start_frame;
        c.end_frame = seg.end_frame;
        c.start_time = seg.start_time;
        c.end_time = seg.end_time;
        c.start_position = path.front();
        c.end_position = path.back();
        c.carry_index = carry_index;
        c.progress_index = calculate_progress(path.front(), path.back(), direction);
        c.confidence = seg.confidence;
        out.push_back(c);
    }
    return out;
}

std::vector<TurnoverEvent> detect_turnover_events(const std::vector<PossessionSegment>& segments,
                                                  const std::string& match_id,
                                                  const EventConfig& cfg,
                                                  const PossessionIndex& by_frame) {
    std::vector<TurnoverEvent> out;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const PossessionSegment& cur = segments[i];
        const PossessionSegment& next = segments[i + 1];
        if (cur.team == next.team || cur.team == TeamId::Unknown || next.team == TeamId::Unknown) continue;

        const FramePossession* lose = last_held(by_frame, cur);
        const cv::Point2f* winner_pos = possessor_at(by_frame, next.start_frame);
        if (!lose || !winner_pos) continue;
        const cv::Point2f* loser_pos = &*lose->possessor_position;

        const float confidence = std::min(cur.confidence, next.confidence);
        const bool needs_review = confidence < cfg.review_threshold;

        TurnoverEvent lost;
        lost.event_id = make_event_id("turnover_lost", cur.end_frame);
        lost.match_id = match_id;
        lost.turnover_type = TurnoverType::Lost;
        lost.frame_number = cur.end_frame;
        lost.timestamp = cur.end_time;
        lost.player = make_ref(cur, *loser_pos);
        lost.other_player = make_ref(next, *winner_pos);
        lost.confidence = confidence;
        lost.needs_review = needs_review;

        TurnoverEvent won = lost;
        won.event_id = make_event_id("turnover_won", next.start_frame);
        won.turnover_type = TurnoverType::Won;
        won.frame_number = next.start_frame;
        won.timestamp = next.start_time;
        std::swap(won.player, won.other_player);

        out.push_back(lost);
        out.push_back(won);
    }
    return out;
}

DetectedEvents detect_all_events(const std::vector<TrackData>& tracks,
                                 const std::map<int, BallDetection>& ball,
                                 const std::string& match_id,
                                 AttackDirection direction,
                                 const EventConfig& cfg) {
    DetectedEvents out;

    std::vector<int> frames;
    frames.reserve(ball.size());
    for (const auto& kv : ball) frames.push_back(kv.first);
    if (frames.empty()) return out;

    const std::vector<FramePossession> possessions = detect_frame_possessions(tracks, ball, frames, cfg);
    const PossessionIndex by_frame = index_possessions(possessions);

    std::map<std::string, std::string> player_map;
    for (const auto& t : tracks) {
        if (t.player_id) player_map[t.track_id] = *t.player_id;
    }

    out.possession_segments = build_possession_segments(possessions, player_map, cfg);
    out.pass_events = detect_pass_events(out.possession_segments, match_id, cfg, by_frame);
    out.carry_events = detect_carry_events(out.possession_segments, match_id, cfg, by_frame, direction);
    out.turnover_events = detect_turnover_events(out.possession_segments, match_id, cfg, by_frame);
    return out;
}

} // namespace events
} // namespace matchtrack
