#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ

#include "matchtrack/core/types.h"
#include "matchtrack/dedup/analysis_window.h"
#include "matchtrack/dedup/ball_position_matcher.h"
#include "matchtrack/dedup/deduplication.h"
#include "matchtrack/dedup/event_validation.h"
#include "matchtrack/detect/detection_filter.h"
#include "matchtrack/detect/detector.h"
#include "matchtrack/events/event_types.h"
#include "matchtrack/team/kmeans.h"
#include "matchtrack/tracking/ball_smoother.h"
#include "matchtrack/tracking/kalman_filter.h"
#include "matchtrack/tracking/tracker.h"

namespace matchtrack {

template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key " + std::string(key));
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value " + std::string(key));
    }
    return *value;
}

// Ключа нет -> false и out не трогаем. Ключ есть, но не того типа -> исключение.
template <typename T>
static bool read_optional(const toml::table &tbl, std::string_view key, T &out) {
    const auto *node = tbl.get(key);
    if (!node) {
        return false;
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value " + std::string(key));
    }
    out = *value;
    return true;
}

struct LoggingConfig {
    bool pipeline = true;
    bool filter = false;
    bool tracker = false;
    bool team = true;
    bool events = true;
    bool dedup = true;
};

struct MatchConfig {
    GameFormat game_format = GameFormat::Eleven;
    double fps = 30.0;
    AttackDirection attack_direction = AttackDirection::None;
    tracking::CameraZoom camera_zoom = tracking::CameraZoom::Mid;
    // seed генератора k-means++ (результат воспроизводим)
    std::uint64_t seed = 42;
};

struct TeamConfig {
    // Эталонные цвета формы, hex
    std::optional<std::string> home_color;
    std::optional<std::string> away_color;
};

struct AppConfig {
    LoggingConfig logging;
    MatchConfig match;

    detect::DetectionFilter::Config filter;
    // max_players задан явно, иначе берётся по формату игры
    bool max_players_set = false;

    tracking::TrackerConfig tracker;
    detect::DetectorKind detector_kind = detect::DetectorKind::Recorded;
    tracking::PredictionConfig prediction;

    tracking::BallSmoothingConfig ball;
    // min_confidence мяча задан явно, иначе берётся по зуму камеры
    bool ball_min_confidence_set = false;

    team::KMeansConfig kmeans;
    TeamConfig team;
    events::EventConfig events;

    dedup::DedupConfig dedup;
    dedup::WindowConfig windows;
    dedup::ValidationConfig validation;
    dedup::BallMatchConfig ball_match;
};

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);
bool load_match_config(const toml::table &tbl, MatchConfig &cfg);
bool load_filter_config(const toml::table &tbl, AppConfig &cfg);
bool load_tracker_config(const toml::table &tbl, tracking::TrackerConfig &cfg);
bool load_detector_config(const toml::table &tbl, detect::DetectorKind &kind);
bool load_prediction_config(const toml::table &tbl, tracking::PredictionConfig &cfg);
bool load_ball_config(const toml::table &tbl, AppConfig &cfg);
bool load_kmeans_config(const toml::table &tbl, team::KMeansConfig &cfg);
bool load_team_config(const toml::table &tbl, TeamConfig &cfg);
bool load_events_config(const toml::table &tbl, events::EventConfig &cfg);
bool load_dedup_config(const toml::table &tbl, dedup::DedupConfig &cfg);
bool load_windows_config(const toml::table &tbl, dedup::WindowConfig &cfg);
bool load_validation_config(const toml::table &tbl, dedup::ValidationConfig &cfg);
bool load_ball_match_config(const toml::table &tbl, dedup::BallMatchConfig &cfg);

// Все секции по очереди. false, если хоть одна не загрузилась (её дефолты остаются).
bool load_app_config(const toml::table &tbl, AppConfig &cfg);

// Производные значения: max_players по формату, порог мяча по зуму, fps и флаги логов в модули.
void finalize_app_config(AppConfig &cfg);

void print_app_config(const AppConfig &cfg);

} // namespace matchtrack
