#include <gtest/gtest.h>

#include <string>
#include <toml++/toml.h>

#include "matchtrack/config.h"

using namespace matchtrack;

namespace {

const char *kConfig = R"(
[logging]
pipeline = true
filter = true
tracker = false
team = true
events = true
dedup = false

[match]
game_format = "five"
fps = 25.0
attack_direction = "LTR"
camera_zoom = "near"
seed = 7

[filter]
min_confidence = 0.35
min_movement = 12.0
motion_window_frames = 20
color_similarity_threshold = 0.5
filter_outside_pitch = false

[tracker]
kind = "predictive"
iou_threshold = 0.25
max_age = 10
reassociation_distance = 0.08

[detector]
kind = "placeholder"

[prediction]
process_noise = 0.2
measurement_noise = 0.4
confidence_decay_rate = 0.3
max_prediction_time = 2.0

[ball]
max_gap_sec = 0.5

[kmeans]
k = 2
max_iterations = 50
convergence_threshold = 0.002
use_hsv = false
min_samples = 4

[team]
home_color = "#ff0000"

[events]
possession_distance_threshold = 0.04
min_possession_frames = 2
min_carry_distance = 0.03
review_threshold = 0.5

[dedup]
time_threshold = 1.5
confidence_boost_per_detection = 0.2

[dedup.type_thresholds]
shot = 1.5

[windows]
overlap_confidence_scale = 0.8
window_size_sec = 30.0

[validation]
min_event_interval = 0.4
max_movement_speed = 10.0
enable_warnings = false

[ball_match]
max_time_diff_sec = 0.3
enable_interpolation = false
min_confidence = 0.2
)";

std::string with(const std::string &from, const std::string &to, std::string text = kConfig) {
    const size_t pos = text.find(from);
    if (pos != std::string::npos) text.replace(pos, from.size(), to);
    return text;
}

} // namespace

TEST(Config, LoadsEverySection) {
    const toml::table tbl = toml::parse(kConfig);
    AppConfig cfg;
    ASSERT_TRUE(load_app_config(tbl, cfg));

    EXPECT_TRUE(cfg.logging.filter);
    EXPECT_FALSE(cfg.logging.dedup);
    EXPECT_EQ(cfg.match.game_format, GameFormat::Five);
    EXPECT_EQ(cfg.match.attack_direction, AttackDirection::LeftToRight);
    EXPECT_EQ(cfg.match.seed, 7u);
    EXPECT_FLOAT_EQ(cfg.filter.min_confidence, 0.35f);
    EXPECT_FALSE(cfg.filter.filter_outside_pitch);
    EXPECT_EQ(cfg.tracker.kind, tracking::TrackerKind::Predictive);
    EXPECT_EQ(cfg.tracker.max_age, 10);
    EXPECT_EQ(cfg.detector_kind, detect::DetectorKind::Placeholder);
    EXPECT_FLOAT_EQ(cfg.prediction.measurement_noise, 0.4f);
    EXPECT_FALSE(cfg.kmeans.use_hsv);
    ASSERT_TRUE(cfg.team.home_color.has_value());
    EXPECT_EQ(*cfg.team.home_color, "#ff0000");
    EXPECT_FALSE(cfg.team.away_color.has_value());
    EXPECT_EQ(cfg.events.min_possession_frames, 2);
    EXPECT_DOUBLE_EQ(cfg.dedup.type_thresholds.at(dedup::EventType::Shot), 1.5);
    EXPECT_DOUBLE_EQ(cfg.dedup.type_thresholds.at(dedup::EventType::Pass), 2.0);
    EXPECT_DOUBLE_EQ(cfg.windows.window_size_sec, 30.0);
    EXPECT_DOUBLE_EQ(cfg.windows.overlap_sec, 15.0);
    EXPECT_FALSE(cfg.validation.enable_warnings);
    EXPECT_FALSE(cfg.ball_match.enable_interpolation);
}

TEST(Config, DerivedValues) {
    AppConfig cfg;
    ASSERT_TRUE(load_app_config(toml::parse(kConfig), cfg));

    // без явных ключей: по формату игры и зуму камеры
    EXPECT_EQ(cfg.filter.max_players, 15);
    EXPECT_EQ(cfg.filter.game_format, GameFormat::Five);
    EXPECT_FLOAT_EQ(cfg.ball.min_confidence, 0.6f);
    EXPECT_DOUBLE_EQ(cfg.ball.fps, 25.0);
    EXPECT_DOUBLE_EQ(cfg.events.fps, 25.0);
    EXPECT_TRUE(cfg.filter.log);
    EXPECT_FALSE(cfg.tracker.log);
}

TEST(Config, ExplicitValuesSurviveFinalize) {
    const std::string text = with("filter_outside_pitch = false",
                                  "filter_outside_pitch = false\nmax_players = 30");
    const std::string text2 = with("max_gap_sec = 0.5", "max_gap_sec = 0.5\nmin_confidence = 0.45", text);
    AppConfig cfg;
    ASSERT_TRUE(load_app_config(toml::parse(text2), cfg));
    EXPECT_EQ(cfg.filter.max_players, 30);
    EXPECT_FLOAT_EQ(cfg.ball.min_confidence, 0.45f);

    finalize_app_config(cfg);
    EXPECT_EQ(cfg.filter.max_players, 30);
    EXPECT_FLOAT_EQ(cfg.ball.min_confidence, 0.45f);
}

TEST(Config, BadSectionKeepsDefaults) {
    AppConfig cfg;
    EXPECT_FALSE(load_app_config(toml::parse(with("kind = \"predictive\"", "kind = \"hungarian\"")), cfg));
    EXPECT_EQ(cfg.tracker.kind, tracking::TrackerKind::Iou);
    EXPECT_FLOAT_EQ(cfg.tracker.iou_threshold, 0.3f);
    // остальные секции загружены
    EXPECT_EQ(cfg.match.game_format, GameFormat::Five);

    AppConfig bad_k;
    EXPECT_FALSE(load_app_config(toml::parse(with("k = 2", "k = 0")), bad_k));
    EXPECT_EQ(bad_k.kmeans.k, 2);
    EXPECT_EQ(bad_k.kmeans.max_iterations, 100);

    AppConfig bad_type;
    EXPECT_FALSE(load_app_config(toml::parse(with("shot = 1.5", "header = 1.5")), bad_type));
    EXPECT_DOUBLE_EQ(bad_type.dedup.time_threshold, 2.0);

    AppConfig bad_fps;
    EXPECT_FALSE(load_app_config(toml::parse(with("fps = 25.0", "fps = 0.0")), bad_fps));
    EXPECT_DOUBLE_EQ(bad_fps.match.fps, 30.0);
    EXPECT_EQ(bad_fps.match.game_format, GameFormat::Eleven);
}

TEST(Config, EmptyFileKeepsAllDefaults) {
    AppConfig cfg;
    EXPECT_FALSE(load_app_config(toml::table{}, cfg));
    EXPECT_EQ(cfg.filter.max_players, 25);
    EXPECT_FLOAT_EQ(cfg.ball.min_confidence, 0.4f);
    EXPECT_EQ(cfg.detector_kind, detect::DetectorKind::Recorded);
    EXPECT_DOUBLE_EQ(cfg.dedup.type_thresholds.at(dedup::EventType::Carry), 3.0);
}

TEST(Config, SingleLoaderReportsMissingKey) {
    const toml::table tbl = toml::parse("[ball_match]\nmax_time_diff_sec = 0.3\n");
    dedup::BallMatchConfig bm;
    EXPECT_FALSE(load_ball_match_config(tbl, bm));
    EXPECT_FLOAT_EQ(bm.max_time_diff_sec, 0.5f);
}
