#include "matchtrack/pipeline/match_analyzer.h"

#include "matchtrack/detect/color.h"
#include "matchtrack/events/event_detector.h"
#include "matchtrack/events/review_queue.h"
#include "matchtrack/tracking/ball_smoother.h"
#include "matchtrack/tracking/tracker.h"

#include <iostream>
#include <utility>

namespace matchtrack {
namespace pipeline {

std::optional<detect::TeamColors> reference_team_colors(const TeamConfig &cfg) {
    if (!cfg.home_color || !cfg.away_color) {
        return std::nullopt;
    }
    detect::TeamColors colors;
    colors.home = detect::hex_to_rgb(*cfg.home_color);
    colors.away = detect::hex_to_rgb(*cfg.away_color);
    return colors;
}

MatchAnalyzer::MatchAnalyzer(AppConfig cfg) : cfg_(std::move(cfg)) {
    finalize_app_config(cfg_);
}

double MatchAnalyzer::frame_time(int frame_number) const {
    return cfg_.match.fps > 0.0 ? (double)frame_number / cfg_.match.fps : 0.0;
}

MatchOutput MatchAnalyzer::run(const MatchInput &input,
                               const detect::PlayerDetector &players,
                               const detect::BallDetector &ball) const {
    AnalysisContext ctx(input.match_id, cfg_);

    MatchOutput out;
    out.match_id = input.match_id;
    out.player_model_id = detect::model_id(players);

    if (cfg_.logging.pipeline) {
        std::cout << "[PIPE] match " << input.match_id << ": " << input.frames.size()
                  << " frames, " << input.raw_events.size() << " raw events" << std::endl;
    }

    // 1. игроки: детекция -> фильтр -> трекинг
    track_players(input, players, ctx, out);
    // 2. мяч
    track_ball(input, ball, out);
    // 3. команды
    classify_teams(ctx, out);
    // 4. события по трекам
    derive_events(input, out);
    // 5. события окон: слияние, позиции, проверка
    merge_window_events(input, out);

    if (cfg_.logging.pipeline) {
        std::cout << "[PIPE] match " << input.match_id << " done: tracks=" << out.tracks.size()
                  << " passes=" << out.events.pass_events.size()
                  << " carries=" << out.events.carry_events.size()
                  << " turnovers=" << out.events.turnover_events.size()
                  << " reviews=" << out.reviews.size()
                  << " events=" << out.dedup_events.size() << std::endl;
    }
    return out;
}

void MatchAnalyzer::track_players(const MatchInput &input,
                                  const detect::PlayerDetector &detector,
                                  AnalysisContext &ctx,
                                  MatchOutput &out) const {
    detect::DetectionFilter filter(cfg_.filter, &ctx.motion);
    tracking::Tracker tracker = tracking::make_tracker(cfg_.tracker, &ctx.predictor);
    out.tracker_id = tracking::tracker_id(tracker);

    const std::optional<detect::TeamColors> colors = reference_team_colors(cfg_.team);

    for (int frame : input.frames) {
        const double t = frame_time(frame);

        geometry::HomographyData h;
        const bool has_h = geometry::homography_for_frame(input.homographies, frame, h);

        detect::FrameContext fctx;
        fctx.frame_number = frame;
        fctx.frame_size = input.frame_size;
        fctx.homography = has_h ? &h : nullptr;
        fctx.roster = input.roster.empty() ? nullptr : &input.roster;
        fctx.jersey_numbers = input.jersey_numbers.empty() ? nullptr : &input.jersey_numbers;
        fctx.team_colors = colors ? &*colors : nullptr;

        const std::vector<Detection> raw = detect::detect_players(detector, frame);
        const std::vector<Detection> kept = filter.process(raw, fctx);
        const tracking::TrackAssignments assigned = tracking::update_tracker(tracker, frame, t, kept);

        for (const auto &kv : assigned) {
            const Detection &det = kept[kv.first];
            Track &track = out.tracks[kv.second];
            track.track_id = kv.second;

            TrackFrame tf;
            tf.frame_number = frame;
            tf.timestamp = t;
            tf.bbox = det.bbox;
            tf.center = det.center;
            tf.confidence = det.confidence;
            tf.jersey_color = det.jersey_color;
            track.frames[frame] = tf;
        }
    }

    out.filter_totals = filter.total_stats();
    if (cfg_.logging.pipeline) {
        const detect::FilterStats &st = out.filter_totals;
        std::cout << "[PIPE] players: in=" << st.input << " out=" << st.output
                  << " tracks=" << out.tracks.size() << " tracker=" << out.tracker_id << std::endl;
    }
}

void MatchAnalyzer::track_ball(const MatchInput &input, const detect::BallDetector &detector, MatchOutput &out) const {
    std::vector<tracking::RawBallObservation> raw;
    raw.reserve(input.frames.size());
    for (int frame : input.frames) {
        tracking::RawBallObservation obs;
        obs.frame_number = frame;
        obs.timestamp = frame_time(frame);
        obs.detection = detect::detect_ball(detector, frame);
        raw.push_back(obs);
    }

    out.ball = tracking::smooth_ball_track(raw, cfg_.ball, cfg_.prediction, detect::model_id(detector));

    if (cfg_.logging.pipeline) {
        std::cout << "[BALL] frames=" << out.ball.detections.size()
                  << " visibility=" << out.ball.visibility_rate
                  << " avg_conf=" << out.ball.avg_confidence << std::endl;
    }
}

void MatchAnalyzer::classify_teams(AnalysisContext &ctx, MatchOutput &out) const {
    const std::vector<team::ColorSample> samples = team::collect_track_samples(out.tracks);
    const std::vector<team::ColorSample> per_track = team::average_track_samples(samples);

    ctx.teams = team::classify_teams_by_color(per_track, cfg_.kmeans, ctx.rng, reference_team_colors(cfg_.team));
    out.teams = ctx.teams;

    std::vector<std::string> ids;
    ids.reserve(out.tracks.size());
    for (const auto &kv : out.tracks) {
        ids.push_back(kv.first);
    }
    out.team_metas = team::build_team_metas(ids, out.teams, per_track);

    if (cfg_.logging.team) {
        std::cout << "[TEAM] samples=" << per_track.size()
                  << " clusters=" << out.teams.clusters.size()
                  << " home=" << out.teams.home_color
                  << " away=" << out.teams.away_color
                  << " confidence=" << out.teams.confidence << std::endl;
    }
}

void MatchAnalyzer::derive_events(const MatchInput &input, MatchOutput &out) const {
    std::vector<events::TrackData> tracks;
    tracks.reserve(out.tracks.size());
    for (const auto &kv : out.tracks) {
        events::TrackData td;
        td.track_id = kv.first;
        td.frames = kv.second.frames;

        auto team_it = out.teams.assignments.find(kv.first);
        td.team = team_it != out.teams.assignments.end() ? team::to_team_id(team_it->second) : TeamId::Unknown;

        auto player_it = input.players.find(kv.first);
        if (player_it != input.players.end()) td.player_id = player_it->second;
        tracks.push_back(std::move(td));
    }

    std::map<int, BallDetection> ball;
    for (const auto &b : out.ball.detections) {
        ball[b.frame_number] = b;
    }

    out.events = events::detect_all_events(tracks, ball, input.match_id, cfg_.match.attack_direction, cfg_.events);
    out.reviews = events::extract_pending_reviews(out.events, cfg_.events.review_threshold);

    if (cfg_.logging.events) {
        std::cout << "[EVT] segments=" << out.events.possession_segments.size()
                  << " passes=" << out.events.pass_events.size()
                  << " carries=" << out.events.carry_events.size()
                  << " turnovers=" << out.events.turnover_events.size()
                  << " pending_reviews=" << out.reviews.size() << std::endl;
    }
}

void MatchAnalyzer::merge_window_events(const MatchInput &input, MatchOutput &out) const {
    if (input.raw_events.empty()) {
        return;
    }

    dedup::validate_raw_events(input.raw_events);

    std::map<std::string, const dedup::AnalysisWindow *> windows;
    for (const auto &w : input.windows) {
        windows[w.window_id] = &w;
    }

    std::vector<dedup::RawEvent> raw = input.raw_events;
    for (auto &e : raw) {
        auto it = windows.find(e.window_id);
        if (it == windows.end() || e.window_confidence) continue;
        e.window_confidence = dedup::window_adjusted_confidence(e.confidence, e.absolute_timestamp,
                                                                *it->second, cfg_.windows);
    }

    out.dedup_events = dedup::deduplicate_events(raw, cfg_.dedup);
    out.dedup_stats = dedup::calculate_dedup_stats(raw, out.dedup_events);
    dedup::resolve_event_positions(out.dedup_events, out.ball.detections, cfg_.ball_match);
    out.validation = dedup::validate_events(out.dedup_events, cfg_.validation);

    for (auto &e : out.dedup_events) {
        const bool ball_match = e.position_source && *e.position_source == geometry::PositionSource::BallDetection;
        e.ensemble_confidence = dedup::ensemble_confidence(e, false, false, ball_match);
    }

    if (cfg_.logging.dedup) {
        std::cout << "[DEDUP] raw=" << out.dedup_stats.total_raw
                  << " dedup=" << out.dedup_stats.total_deduplicated
                  << " merged=" << out.dedup_stats.merged_count
                  << " avg_cluster=" << out.dedup_stats.average_cluster_size << std::endl;
        std::cout << "[DEDUP] " << dedup::summarize_validation_result(out.validation) << std::endl;
    }
}

} // namespace pipeline
} // namespace matchtrack
