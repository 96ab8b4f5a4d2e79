#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "matchtrack/config.h"
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Загрузка config.toml
//
//  - Ошибка в секции не роняет анализ: оставляем дефолты и возвращаем false.
//  - Имена ключей совпадают с config.toml.
// ============================================================================

namespace matchtrack {

namespace {

const toml::table &require_table(const toml::table &tbl, std::string_view name) {
    const auto *node = tbl.get(name);
    if (!node) {
        throw std::runtime_error("missing [" + std::string(name) + "] table");
    }
    const auto *t = node->as_table();
    if (!t) {
        throw std::runtime_error("invalid [" + std::string(name) + "] table");
    }
    return *t;
}

// Строковый ключ через парсер enum'а.
template <typename E, typename Parse>
E read_enum(const toml::table &tbl, std::string_view key, Parse parse) {
    const std::string text = read_required<std::string>(tbl, key);
    E out{};
    if (!parse(text, out)) {
        throw std::runtime_error("invalid value " + std::string(key) + "=" + text);
    }
    return out;
}

} // namespace

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
    // ---------------------------- [logging] ---------------------------
    try {
        const auto &logging = require_table(tbl, "logging");
        cfg.pipeline = read_required<bool>(logging, "pipeline");
        cfg.filter = read_required<bool>(logging, "filter");
        cfg.tracker = read_required<bool>(logging, "tracker");
        cfg.team = read_required<bool>(logging, "team");
        cfg.events = read_required<bool>(logging, "events");
        cfg.dedup = read_required<bool>(logging, "dedup");
        return true;
    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_match_config(const toml::table &tbl, MatchConfig &cfg) {
    // ----------------------------- [match] ----------------------------
    try {
        const auto &match = require_table(tbl, "match");
        MatchConfig next = cfg;
        next.game_format = read_enum<GameFormat>(match, "game_format",
            [](std::string_view s, GameFormat &o) { return parse_game_format(s, o); });
        next.fps = read_required<double>(match, "fps");
        if (next.fps <= 0.0) {
            throw std::runtime_error("invalid value fps");
        }
        next.attack_direction = read_enum<AttackDirection>(match, "attack_direction",
            [](std::string_view s, AttackDirection &o) { return parse_attack_direction(s, o); });
        next.camera_zoom = read_enum<tracking::CameraZoom>(match, "camera_zoom",
            [](std::string_view s, tracking::CameraZoom &o) { return tracking::parse_camera_zoom(s, o); });
        next.seed = (std::uint64_t)read_required<std::int64_t>(match, "seed");
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "match config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_filter_config(const toml::table &tbl, AppConfig &cfg) {
    // ----------------------------- [filter] ---------------------------
    try {
        const auto &filter = require_table(tbl, "filter");
        detect::DetectionFilter::Config next = cfg.filter;
        next.min_confidence = read_required<float>(filter, "min_confidence");
        next.min_movement = read_required<float>(filter, "min_movement");
        next.motion_window_frames = read_required<int>(filter, "motion_window_frames");
        next.color_similarity_threshold = read_required<float>(filter, "color_similarity_threshold");
        next.filter_outside_pitch = read_required<bool>(filter, "filter_outside_pitch");
        const bool has_max = read_optional<int>(filter, "max_players", next.max_players);
        cfg.filter = next;
        cfg.max_players_set = has_max;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "filter config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_tracker_config(const toml::table &tbl, tracking::TrackerConfig &cfg) {
    // ---------------------------- [tracker] ---------------------------
    try {
        const auto &tracker = require_table(tbl, "tracker");
        tracking::TrackerConfig next = cfg;
        next.kind = read_enum<tracking::TrackerKind>(tracker, "kind",
            [](std::string_view s, tracking::TrackerKind &o) { return tracking::parse_tracker_kind(s, o); });
        next.iou_threshold = read_required<float>(tracker, "iou_threshold");
        next.max_age = read_required<int>(tracker, "max_age");
        next.reassociation_distance = read_required<float>(tracker, "reassociation_distance");
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "tracker config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_detector_config(const toml::table &tbl, detect::DetectorKind &kind) {
    // ---------------------------- [detector] --------------------------
    try {
        const auto &detector = require_table(tbl, "detector");
        kind = read_enum<detect::DetectorKind>(detector, "kind",
            [](std::string_view s, detect::DetectorKind &o) { return detect::parse_detector_kind(s, o); });
        return true;
    } catch (const std::exception &e) {
        std::cerr << "detector config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_prediction_config(const toml::table &tbl, tracking::PredictionConfig &cfg) {
    // --------------------------- [prediction] -------------------------
    try {
        const auto &pred = require_table(tbl, "prediction");
        tracking::PredictionConfig next = cfg;
        next.process_noise = read_required<float>(pred, "process_noise");
        next.measurement_noise = read_required<float>(pred, "measurement_noise");
        next.confidence_decay_rate = read_required<float>(pred, "confidence_decay_rate");
        next.max_prediction_time = read_required<float>(pred, "max_prediction_time");
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "prediction config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_ball_config(const toml::table &tbl, AppConfig &cfg) {
    // ------------------------------ [ball] ----------------------------
    try {
        const auto &ball = require_table(tbl, "ball");
        tracking::BallSmoothingConfig next = cfg.ball;
        next.max_gap_sec = read_required<float>(ball, "max_gap_sec");
        const bool has_min = read_optional<float>(ball, "min_confidence", next.min_confidence);
        cfg.ball = next;
        cfg.ball_min_confidence_set = has_min;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "ball config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_kmeans_config(const toml::table &tbl, team::KMeansConfig &cfg) {
    // ----------------------------- [kmeans] ---------------------------
    try {
        const auto &km = require_table(tbl, "kmeans");
        team::KMeansConfig next = cfg;
        next.k = read_required<int>(km, "k");
        next.max_iterations = read_required<int>(km, "max_iterations");
        next.convergence_threshold = read_required<float>(km, "convergence_threshold");
        next.use_hsv = read_required<bool>(km, "use_hsv");
        next.min_samples = read_required<int>(km, "min_samples");
        if (next.k <= 0) {
            throw std::runtime_error("invalid value k");
        }
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "kmeans config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_team_config(const toml::table &tbl, TeamConfig &cfg) {
    // ------------------------------ [team] ----------------------------
    try {
        const auto &team = require_table(tbl, "team");
        TeamConfig next;
        std::string color;
        if (read_optional<std::string>(team, "home_color", color)) next.home_color = color;
        if (read_optional<std::string>(team, "away_color", color)) next.away_color = color;
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "team config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_events_config(const toml::table &tbl, events::EventConfig &cfg) {
    // ----------------------------- [events] ---------------------------
    try {
        const auto &ev = require_table(tbl, "events");
        events::EventConfig next = cfg;
        next.possession_distance_threshold = read_required<float>(ev, "possession_distance_threshold");
        next.min_possession_frames = read_required<int>(ev, "min_possession_frames");
        next.min_carry_distance = read_required<float>(ev, "min_carry_distance");
        next.review_threshold = read_required<float>(ev, "review_threshold");
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "events config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_dedup_config(const toml::table &tbl, dedup::DedupConfig &cfg) {
    // ------------------------------ [dedup] ---------------------------
    try {
        const auto &dd = require_table(tbl, "dedup");
        dedup::DedupConfig next = cfg;
        next.time_threshold = read_required<double>(dd, "time_threshold");
        next.confidence_boost_per_detection = read_required<float>(dd, "confidence_boost_per_detection");

        // [dedup.type_thresholds] необязательна, ключи по имени типа события
        if (const auto *types = dd["type_thresholds"].as_table()) {
            for (const auto &kv : *types) {
                dedup::EventType type;
                if (!dedup::parse_event_type(kv.first.str(), type)) {
                    throw std::runtime_error("unknown event type " + std::string(kv.first.str()));
                }
                const auto v = kv.second.value<double>();
                if (!v) {
                    throw std::runtime_error("invalid value type_thresholds." + std::string(kv.first.str()));
                }
                next.type_thresholds[type] = *v;
            }
        }
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "dedup config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_windows_config(const toml::table &tbl, dedup::WindowConfig &cfg) {
    // ----------------------------- [windows] --------------------------
    try {
        const auto &w = require_table(tbl, "windows");
        dedup::WindowConfig next = cfg;
        next.overlap_confidence_scale = read_required<float>(w, "overlap_confidence_scale");
        read_optional<double>(w, "window_size_sec", next.window_size_sec);
        read_optional<double>(w, "overlap_sec", next.overlap_sec);
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "windows config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_validation_config(const toml::table &tbl, dedup::ValidationConfig &cfg) {
    // --------------------------- [validation] -------------------------
    try {
        const auto &v = require_table(tbl, "validation");
        dedup::ValidationConfig next = cfg;
        next.min_event_interval = read_required<double>(v, "min_event_interval");
        next.max_movement_speed = read_required<double>(v, "max_movement_speed");
        next.enable_warnings = read_required<bool>(v, "enable_warnings");
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "validation config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_ball_match_config(const toml::table &tbl, dedup::BallMatchConfig &cfg) {
    // --------------------------- [ball_match] -------------------------
    try {
        const auto &bm = require_table(tbl, "ball_match");
        dedup::BallMatchConfig next = cfg;
        next.max_time_diff_sec = read_required<float>(bm, "max_time_diff_sec");
        next.enable_interpolation = read_required<bool>(bm, "enable_interpolation");
        next.min_confidence = read_required<float>(bm, "min_confidence");
        cfg = next;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "ball_match config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_app_config(const toml::table &tbl, AppConfig &cfg) {
    bool ok = true;
    ok &= load_logging_config(tbl, cfg.logging);
    ok &= load_match_config(tbl, cfg.match);
    ok &= load_filter_config(tbl, cfg);
    ok &= load_tracker_config(tbl, cfg.tracker);
    ok &= load_detector_config(tbl, cfg.detector_kind);
    ok &= load_prediction_config(tbl, cfg.prediction);
    ok &= load_ball_config(tbl, cfg);
    ok &= load_kmeans_config(tbl, cfg.kmeans);
    ok &= load_team_config(tbl, cfg.team);
    ok &= load_events_config(tbl, cfg.events);
    ok &= load_dedup_config(tbl, cfg.dedup);
    ok &= load_windows_config(tbl, cfg.windows);
    ok &= load_validation_config(tbl, cfg.validation);
    ok &= load_ball_match_config(tbl, cfg.ball_match);
    finalize_app_config(cfg);
    return ok;
}

void finalize_app_config(AppConfig &cfg) {
    if (!cfg.max_players_set) {
        cfg.filter.max_players = detect::default_filter_config(cfg.match.game_format).max_players;
    }
    cfg.filter.game_format = cfg.match.game_format;
    cfg.filter.log = cfg.logging.filter;

    cfg.tracker.log = cfg.logging.tracker;

    if (!cfg.ball_min_confidence_set) {
        cfg.ball.min_confidence = tracking::ball_confidence_threshold(cfg.match.camera_zoom);
    }
    cfg.ball.fps = cfg.match.fps;
    cfg.events.fps = cfg.match.fps;
}

void print_app_config(const AppConfig &cfg) {
    std::cout << "[CFG] config: format=" << to_string(cfg.match.game_format)
              << " fps=" << cfg.match.fps
              << " attack=" << to_string(cfg.match.attack_direction)
              << " seed=" << cfg.match.seed << std::endl;
    std::cout << "[CFG] config: filter min_conf=" << cfg.filter.min_confidence
              << " min_move=" << cfg.filter.min_movement
              << " window=" << cfg.filter.motion_window_frames
              << " max_players=" << cfg.filter.max_players
              << " pitch=" << (cfg.filter.filter_outside_pitch ? "on" : "off") << std::endl;
    std::cout << "[CFG] config: tracker=" << (cfg.tracker.kind == tracking::TrackerKind::Predictive ? "predictive" : "iou")
              << " iou=" << cfg.tracker.iou_threshold
              << " max_age=" << cfg.tracker.max_age
              << " detector=" << detect::to_string(cfg.detector_kind) << std::endl;
    std::cout << "[CFG] config: ball min_conf=" << cfg.ball.min_confidence
              << " max_gap=" << cfg.ball.max_gap_sec
              << " kmeans k=" << cfg.kmeans.k
              << " hsv=" << (cfg.kmeans.use_hsv ? "on" : "off")
              << " min_samples=" << cfg.kmeans.min_samples << std::endl;
    std::cout << "[CFG] config: events dist=" << cfg.events.possession_distance_threshold
              << " min_frames=" << cfg.events.min_possession_frames
              << " min_carry=" << cfg.events.min_carry_distance
              << " review=" << cfg.events.review_threshold
              << " dedup=" << cfg.dedup.time_threshold
              << " max_speed=" << cfg.validation.max_movement_speed << std::endl;
}

} // namespace matchtrack
