#include <gtest/gtest.h>

#include "matchtrack/dedup/analysis_window.h"

using namespace matchtrack::dedup;

namespace {

VideoSegment segment(const std::string &id, double start, double end, SegmentType type) {
    VideoSegment s;
    s.segment_id = id;
    s.start_sec = start;
    s.end_sec = end;
    s.type = type;
    return s;
}

} // namespace

TEST(AnalysisWindow, ActivePlayIsSplitWithOverlap) {
    const auto windows = generate_windows({segment("s1", 0.0, 120.0, SegmentType::ActivePlay)});
    ASSERT_EQ(windows.size(), 3u);

    EXPECT_EQ(windows[0].window_id, "s1_w0");
    EXPECT_DOUBLE_EQ(windows[0].absolute_start, 0.0);
    EXPECT_DOUBLE_EQ(windows[0].absolute_end, 60.0);
    EXPECT_DOUBLE_EQ(windows[0].overlap_before, 0.0);
    EXPECT_DOUBLE_EQ(windows[0].overlap_after, 0.0);

    EXPECT_EQ(windows[1].window_id, "s1_w1");
    EXPECT_DOUBLE_EQ(windows[1].absolute_start, 30.0);
    EXPECT_DOUBLE_EQ(windows[1].absolute_end, 105.0);
    EXPECT_DOUBLE_EQ(windows[1].overlap_before, 15.0);

    EXPECT_DOUBLE_EQ(windows[2].absolute_start, 75.0);
    EXPECT_DOUBLE_EQ(windows[2].absolute_end, 135.0);
    EXPECT_DOUBLE_EQ(windows[2].overlap_after, 15.0);

    for (const auto &w : windows) {
        EXPECT_EQ(w.target_fps, 3);
        EXPECT_EQ(w.segment_id, "s1");
    }
    EXPECT_DOUBLE_EQ(total_analysis_duration(windows), 135.0);
}

TEST(AnalysisWindow, StoppageGetsOneContextWindow) {
    const auto windows = generate_windows({
        segment("short", 0.0, 1.5, SegmentType::ActivePlay),
        segment("s2", 200.0, 230.0, SegmentType::Stoppage),
    });
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0].window_id, "s2_w0");
    EXPECT_DOUBLE_EQ(windows[0].absolute_start, 185.0);
    EXPECT_DOUBLE_EQ(windows[0].absolute_end, 245.0);
    EXPECT_EQ(windows[0].target_fps, 1);
    EXPECT_EQ(windows[0].segment_type, SegmentType::Stoppage);
}

TEST(AnalysisWindow, NonPositiveStepGivesSingleWindow) {
    WindowConfig cfg;
    cfg.window_size_sec = 60.0;
    cfg.overlap_sec = 60.0;
    const auto windows = generate_windows({segment("s", 0.0, 120.0, SegmentType::GoalMoment)}, cfg);
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0].target_fps, 5);
}

TEST(AnalysisWindow, CoreAndOverlapConfidence) {
    AnalysisWindow w;
    w.absolute_start = 30.0;
    w.absolute_end = 105.0;
    w.overlap_before = 15.0;
    w.overlap_after = 0.0;
    WindowConfig cfg;

    EXPECT_FALSE(is_in_core_window(40.0, w));
    EXPECT_TRUE(is_in_core_window(45.0, w));
    EXPECT_FALSE(is_in_core_window(105.0, w));

    EXPECT_FLOAT_EQ(window_adjusted_confidence(0.8f, 50.0, w, cfg), 0.8f);
    EXPECT_NEAR(window_adjusted_confidence(0.8f, 40.0, w, cfg), 0.72f, 1e-6);
}

TEST(AnalysisWindow, TimestampLookupAndConversions) {
    const auto windows = generate_windows({segment("s1", 0.0, 120.0, SegmentType::ActivePlay)});
    const auto hits = windows_for_timestamp(50.0, windows);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].window_id, "s1_w0");
    EXPECT_EQ(hits[1].window_id, "s1_w1");
    EXPECT_TRUE(windows_for_timestamp(200.0, windows).empty());

    EXPECT_DOUBLE_EQ(absolute_to_relative(25.0, 10.0), 15.0);
    EXPECT_DOUBLE_EQ(absolute_to_relative(5.0, 10.0), 0.0);
    EXPECT_DOUBLE_EQ(relative_to_absolute(15.0, 10.0), 25.0);
}

TEST(AnalysisWindow, FpsMapFallback) {
    WindowConfig cfg;
    cfg.fps_map.erase(SegmentType::Replay);
    EXPECT_EQ(fps_for_segment(SegmentType::Replay, cfg), 3);
    EXPECT_EQ(fps_for_segment(SegmentType::SetPiece, cfg), 2);

    SegmentType t = SegmentType::ActivePlay;
    EXPECT_TRUE(parse_segment_type("goal_moment", t));
    EXPECT_EQ(t, SegmentType::GoalMoment);
    EXPECT_FALSE(parse_segment_type("halftime", t));
    EXPECT_STREQ(to_string(SegmentType::SetPiece), "set_piece");
}
