#include <gtest/gtest.h>

#include <limits>

#include "matchtrack/core/errors.h"
#include "matchtrack/dedup/deduplication.h"

using namespace matchtrack;
using namespace matchtrack::dedup;

namespace {

RawEvent raw(const std::string &window, double t, EventType type, TeamId team, float conf) {
    RawEvent e;
    e.match_id = "m1";
    e.window_id = window;
    e.absolute_timestamp = t;
    e.relative_timestamp = t;
    e.type = type;
    e.team = team;
    e.confidence = conf;
    return e;
}

std::vector<RawEvent> sample() {
    RawEvent a = raw("w0", 10.0, EventType::Pass, TeamId::Home, 0.7f);
    a.details["outcome"] = "complete";
    RawEvent b = raw("w1", 10.8, EventType::Pass, TeamId::Home, 0.9f);
    b.details["outcome"] = "complete";
    b.player = std::string("p7");
    RawEvent c = raw("w1", 11.0, EventType::Pass, TeamId::Away, 0.6f);
    RawEvent d = raw("w2", 30.0, EventType::Shot, TeamId::Home, 0.8f);
    return {d, c, b, a};
}

} // namespace

TEST(Deduplication, ClustersByTypeTeamAndTime) {
    const DedupConfig cfg;
    const auto out = deduplicate_events(sample(), cfg);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_LE(out.size(), sample().size());

    const DeduplicatedEvent &pass = out[0];
    EXPECT_EQ(pass.type, EventType::Pass);
    EXPECT_EQ(pass.team, TeamId::Home);
    EXPECT_FLOAT_EQ(pass.confidence, 0.9f);
    EXPECT_NEAR(pass.absolute_timestamp, 10.45, 1e-6);
    EXPECT_NEAR(pass.adjusted_confidence, 0.91f, 1e-6);
    ASSERT_EQ(pass.merged_from_windows.size(), 2u);
    EXPECT_EQ(pass.details.at("outcome"), "complete");
    ASSERT_TRUE(pass.player.has_value());
    EXPECT_EQ(*pass.player, "p7");

    EXPECT_EQ(out[1].team, TeamId::Away);
    EXPECT_EQ(out[2].type, EventType::Shot);
}

TEST(Deduplication, TypeThresholdDecidesClustering) {
    DedupConfig cfg;
    const std::vector<RawEvent> shots = {
        raw("w0", 5.0, EventType::Shot, TeamId::Home, 0.5f),
        raw("w1", 6.5, EventType::Shot, TeamId::Home, 0.5f),
    };
    EXPECT_EQ(deduplicate_events(shots, cfg).size(), 2u);

    cfg.type_thresholds.erase(EventType::Shot);
    EXPECT_DOUBLE_EQ(type_threshold(EventType::Shot, cfg), 2.0);
    EXPECT_EQ(deduplicate_events(shots, cfg).size(), 1u);
}

TEST(Deduplication, BoostCountsDistinctWindows) {
    const DedupConfig cfg;
    const std::vector<RawEvent> same_window = {
        raw("w0", 5.0, EventType::Carry, TeamId::Away, 0.6f),
        raw("w0", 6.0, EventType::Carry, TeamId::Away, 0.6f),
    };
    const DeduplicatedEvent e = merge_cluster(same_window, cfg);
    EXPECT_FLOAT_EQ(e.adjusted_confidence, 0.6f);
    EXPECT_EQ(e.merged_from_windows.size(), 2u);
}

TEST(Deduplication, InterleavedEventDoesNotSplitDuplicates) {
    const std::vector<RawEvent> events = {
        raw("w1", 10.0, EventType::Pass, TeamId::Home, 0.8f),
        raw("w1", 10.2, EventType::Turnover, TeamId::Away, 0.7f),
        raw("w2", 10.4, EventType::Pass, TeamId::Home, 0.8f),
    };
    const auto out = deduplicate_events(events, DedupConfig{});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].type, EventType::Pass);
    EXPECT_EQ(out[0].merged_from_windows.size(), 2u);
    EXPECT_NEAR(out[0].absolute_timestamp, 10.2, 1e-6);
    EXPECT_EQ(out[1].type, EventType::Turnover);

    const auto clusters = cluster_events(events, DedupConfig{});
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].size(), 2u);
}

TEST(Deduplication, WindowBoostDiminishes) {
    const DedupConfig cfg;
    const std::vector<RawEvent> three = {
        raw("w0", 5.0, EventType::Pass, TeamId::Home, 0.5f),
        raw("w1", 5.2, EventType::Pass, TeamId::Home, 0.5f),
        raw("w2", 5.4, EventType::Pass, TeamId::Home, 0.5f),
    };
    // 0.5 -> 0.55 -> 0.595
    EXPECT_NEAR(merge_cluster(three, cfg).adjusted_confidence, 0.595f, 1e-6);

    DedupConfig strong;
    strong.confidence_boost_per_detection = 0.6f;
    const float capped = merge_cluster(three, strong).adjusted_confidence;
    EXPECT_LE(capped, 1.0f);
    EXPECT_NEAR(capped, 0.92f, 1e-6);
}

TEST(Deduplication, WindowConfidencePicksBase) {
    RawEvent a = raw("w0", 5.0, EventType::Pass, TeamId::Home, 0.9f);
    a.window_confidence = 0.5f;
    a.zone = geometry::Zone::Attacking;
    RawEvent b = raw("w1", 5.5, EventType::Pass, TeamId::Home, 0.7f);
    const DeduplicatedEvent e = merge_cluster({a, b}, DedupConfig{});
    EXPECT_FLOAT_EQ(e.confidence, 0.7f);
    ASSERT_TRUE(e.zone.has_value());
    EXPECT_EQ(*e.zone, geometry::Zone::Attacking);
}

TEST(Deduplication, DetailsMajorityAndGoalOverride) {
    RawEvent a = raw("w0", 20.0, EventType::Shot, TeamId::Home, 0.8f);
    a.details["shotResult"] = "saved";
    a.visual_evidence = "keeper dives";
    RawEvent b = raw("w1", 20.3, EventType::Shot, TeamId::Home, 0.8f);
    b.details["shotResult"] = "saved";
    RawEvent c = raw("w2", 20.5, EventType::Shot, TeamId::Home, 0.4f);
    c.details["shotResult"] = "goal";
    c.visual_evidence = "net moves";

    const DeduplicatedEvent e = merge_cluster({a, b, c}, DedupConfig{});
    EXPECT_EQ(e.details.at("shotResult"), "goal");
    EXPECT_EQ(e.visual_evidence, "keeper dives; net moves");
}

TEST(Deduplication, ModelPositionsAreWeighted) {
    RawEvent a = raw("w0", 1.0, EventType::Pass, TeamId::Home, 0.8f);
    a.position = cv::Point2f(0.2f, 0.4f);
    a.position_confidence = 0.6f;
    RawEvent b = raw("w1", 1.2, EventType::Pass, TeamId::Home, 0.8f);
    b.position = cv::Point2f(0.4f, 0.4f);
    b.position_confidence = 0.8f;

    const DeduplicatedEvent e = merge_cluster({a, b}, DedupConfig{});
    ASSERT_TRUE(e.merged_position.has_value());
    EXPECT_NEAR(e.merged_position->x, (0.2f * 0.6f + 0.4f * 0.8f) / 1.4f, 1e-5);
    EXPECT_NEAR(*e.merged_position_confidence, 0.75f, 1e-5);
    EXPECT_EQ(*e.position_source, geometry::PositionSource::Merged);
}

TEST(Deduplication, EmptyClusterThrows) {
    EXPECT_THROW(merge_cluster({}, DedupConfig{}), ValidationError);
    EXPECT_TRUE(deduplicate_events({}, DedupConfig{}).empty());
}

TEST(Deduplication, RawEventValidation) {
    EXPECT_NO_THROW(validate_raw_events(sample()));

    auto bad_conf = sample();
    bad_conf[1].confidence = 1.5f;
    EXPECT_THROW(validate_raw_events(bad_conf), ValidationError);

    auto bad_time = sample();
    bad_time[0].absolute_timestamp = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate_raw_events(bad_time), ValidationError);

    auto no_window = sample();
    no_window[2].window_id.clear();
    try {
        validate_raw_events(no_window);
        FAIL() << "empty window id accepted";
    } catch (const ValidationError &e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingField);
        EXPECT_FALSE(e.retryable());
    }
}

TEST(Deduplication, Stats) {
    const auto raw_events = sample();
    const auto out = deduplicate_events(raw_events, DedupConfig{});
    const DedupStats st = calculate_dedup_stats(raw_events, out);
    EXPECT_EQ(st.total_raw, 4);
    EXPECT_EQ(st.total_deduplicated, 3);
    EXPECT_EQ(st.merged_count, 1);
    EXPECT_EQ(st.unique_count, 2);
    EXPECT_FLOAT_EQ(st.average_cluster_size, 2.0f);
    EXPECT_EQ(st.by_type.at(EventType::Pass).raw, 3);
    EXPECT_EQ(st.by_type.at(EventType::Pass).deduplicated, 2);
    EXPECT_EQ(st.by_type.at(EventType::Pass).merged_count, 1);
    EXPECT_EQ(st.by_type.at(EventType::Shot).raw, 1);
}

TEST(Deduplication, ResolvePositionsByPriority) {
    std::vector<DeduplicatedEvent> events(4);
    events[0].absolute_timestamp = 10.0;
    events[0].merged_position = cv::Point2f(0.9f, 0.9f);
    events[0].position_source = geometry::PositionSource::ModelOutput;
    events[1].absolute_timestamp = 50.0;
    events[1].merged_position = cv::Point2f(0.6f, 0.3f);
    events[1].merged_position_confidence = 0.7f;
    events[2].absolute_timestamp = 60.0;
    events[2].zone = geometry::Zone::Attacking;
    events[2].team = TeamId::Home;
    events[3].absolute_timestamp = 80.0;

    BallDetection ball;
    ball.frame_number = 300;
    ball.timestamp = 10.0;
    ball.position = cv::Point2f(0.25f, 0.75f);
    ball.confidence = 0.9f;
    ball.visible = true;

    resolve_event_positions(events, {ball}, BallMatchConfig{});

    EXPECT_EQ(*events[0].position_source, geometry::PositionSource::BallDetection);
    EXPECT_FLOAT_EQ(events[0].merged_position->x, 0.25f);
    EXPECT_FLOAT_EQ(*events[0].merged_position_confidence, 0.9f);

    EXPECT_EQ(*events[1].position_source, geometry::PositionSource::ModelOutput);
    EXPECT_FLOAT_EQ(*events[1].merged_position_confidence, 0.7f);

    EXPECT_EQ(*events[2].position_source, geometry::PositionSource::ZoneConversion);
    EXPECT_FLOAT_EQ(*events[2].merged_position_confidence, 0.5f);

    EXPECT_EQ(*events[3].position_source, geometry::PositionSource::Unknown);
    EXPECT_FLOAT_EQ(events[3].merged_position->x, 0.5f);
    EXPECT_FLOAT_EQ(*events[3].merged_position_confidence, 0.1f);
}
