#include <gtest/gtest.h>

#include "matchtrack/geometry/pitch_zones.h"

using namespace matchtrack;
using namespace matchtrack::geometry;

TEST(PitchZones, ThirdsMirrorForAway) {
    const cv::Point2f home_def = zone_center(Zone::Defensive, TeamId::Home);
    const cv::Point2f away_def = zone_center(Zone::Defensive, TeamId::Away);
    EXPECT_NEAR(home_def.x, 0.1665f, 1e-4);
    EXPECT_NEAR(away_def.x, 0.8335f, 1e-4);
    EXPECT_NEAR(home_def.y, 0.5f, 1e-6);

    EXPECT_EQ(zone_from_position(cv::Point2f(0.9f, 0.5f), TeamId::Home), Zone::Attacking);
    EXPECT_EQ(zone_from_position(cv::Point2f(0.9f, 0.5f), TeamId::Away), Zone::Defensive);
    EXPECT_EQ(zone_from_position(cv::Point2f(1.5f, 0.5f), TeamId::Home), Zone::Middle);
}

TEST(PitchZones, PositionInsideZone) {
    const cv::Point2f p = position_in_zone(Zone::Middle, 0.0f, 1.0f, TeamId::Home);
    EXPECT_NEAR(p.x, 0.333f, 1e-6);
    EXPECT_NEAR(p.y, 1.0f, 1e-6);

    const cv::Point2f clamped = position_in_zone(Zone::Attacking, 2.0f, -1.0f, TeamId::Home);
    EXPECT_NEAR(clamped.x, 1.0f, 1e-6);
    EXPECT_NEAR(clamped.y, 0.0f, 1e-6);
}

TEST(PitchZones, ZoneNames) {
    Zone z;
    ASSERT_TRUE(parse_zone("attacking_third", z));
    EXPECT_EQ(z, Zone::Attacking);
    EXPECT_STREQ(to_string(Zone::Middle), "middle_third");
    EXPECT_FALSE(parse_zone("box", z));
}

TEST(PitchZones, StrictPositionPriority) {
    PositionEstimate ball{cv::Point2f(0.1f, 0.1f), PositionSource::BallDetection, 0.3f};
    PositionEstimate model{cv::Point2f(0.9f, 0.9f), PositionSource::ModelOutput, 0.95f};
    const PositionEstimate zone = position_from_zone(Zone::Middle, TeamId::Home);

    // мяч выигрывает даже с меньшим confidence
    EXPECT_EQ(select_best_position(ball, model, zone).source, PositionSource::BallDetection);
    EXPECT_EQ(select_best_position(std::nullopt, model, zone).source, PositionSource::ModelOutput);
    EXPECT_EQ(select_best_position(std::nullopt, std::nullopt, zone).source, PositionSource::ZoneConversion);
    EXPECT_FLOAT_EQ(zone.confidence, 0.5f);

    const PositionEstimate fallback = select_best_position(std::nullopt, std::nullopt, std::nullopt);
    EXPECT_EQ(fallback.source, PositionSource::Unknown);
    EXPECT_FLOAT_EQ(fallback.confidence, 0.1f);
    EXPECT_FLOAT_EQ(fallback.position.x, 0.5f);
}

TEST(PitchZones, MetersConversion) {
    const cv::Point2f m = normalized_to_meters(cv::Point2f(1.0f, 0.5f));
    EXPECT_FLOAT_EQ(m.x, 105.0f);
    EXPECT_FLOAT_EQ(m.y, 34.0f);
    EXPECT_NEAR(distance_meters(cv::Point2f(0.0f, 0.0f), cv::Point2f(0.1f, 0.0f)), 10.5f, 1e-4);

    const cv::Point2f back = meters_to_normalized(m);
    EXPECT_NEAR(back.x, 1.0f, 1e-6);
}
