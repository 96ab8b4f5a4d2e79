#include <gtest/gtest.h>

#include "matchtrack/core/errors.h"
#include "matchtrack/tracking/tracker.h"

using namespace matchtrack;
using namespace matchtrack::tracking;

namespace {

Detection box(float x, float y, const std::string &label = "person") {
    return make_detection(cv::Rect2f(x, y, 0.05f, 0.1f), 0.9f, label);
}

} // namespace

TEST(IouTracker, KeepsIdAcrossOverlappingFrames) {
    TrackerConfig cfg;
    IouTracker tracker(cfg);

    auto a0 = tracker.update(0, 0.0, {box(0.1f, 0.1f), box(0.6f, 0.6f)});
    ASSERT_EQ(a0.size(), 2u);
    EXPECT_EQ(a0[0], "track_0");
    EXPECT_EQ(a0[1], "track_1");

    auto a1 = tracker.update(1, 1.0 / 30.0, {box(0.605f, 0.6f), box(0.102f, 0.1f)});
    EXPECT_EQ(a1[0], "track_1");
    EXPECT_EQ(a1[1], "track_0");
    EXPECT_EQ(tracker.active_track_ids().size(), 2u);
    EXPECT_STREQ(tracker.id(), "iou-tracker-v1");
}

TEST(IouTracker, LabelMustMatch) {
    IouTracker tracker(TrackerConfig{});
    tracker.update(0, 0.0, {box(0.1f, 0.1f)});
    auto a = tracker.update(1, 0.03, {box(0.1f, 0.1f, "ball")});
    EXPECT_EQ(a[0], "track_1");
}

TEST(IouTracker, DropsTracksOlderThanMaxAge) {
    TrackerConfig cfg;
    cfg.max_age = 2;
    IouTracker tracker(cfg);
    tracker.update(0, 0.0, {box(0.1f, 0.1f)});
    auto a = tracker.update(5, 0.2, {box(0.1f, 0.1f)});
    EXPECT_EQ(a[0], "track_1");
    EXPECT_EQ(tracker.active_track_ids().size(), 1u);

    tracker.reset();
    EXPECT_TRUE(tracker.active_track_ids().empty());
}

TEST(PredictiveTracker, RelinksLostTrackNearPrediction) {
    TrackerConfig cfg;
    cfg.kind = TrackerKind::Predictive;
    cfg.max_age = 1;
    cfg.reassociation_distance = 0.1f;
    TrackPredictor predictor;
    Tracker tracker = make_tracker(cfg, &predictor);
    EXPECT_EQ(tracker_id(tracker), "predictive-tracker-v1");

    auto a0 = update_tracker(tracker, 0, 0.0, {box(0.1f, 0.1f)});
    EXPECT_EQ(a0[0], "track_0");
    update_tracker(tracker, 1, 1.0 / 30.0, {});
    update_tracker(tracker, 2, 2.0 / 30.0, {});

    // IoU-кандидатов нет, но предсказание track_0 рядом
    auto a3 = update_tracker(tracker, 3, 3.0 / 30.0, {box(0.13f, 0.1f)});
    EXPECT_EQ(a3[0], "track_0");
    EXPECT_EQ(std::get<PredictiveTracker>(tracker).relinked_count(), 1);

    // далеко от всех предсказаний: новый трек
    auto a4 = update_tracker(tracker, 4, 4.0 / 30.0, {box(0.13f, 0.1f), box(0.8f, 0.8f)});
    EXPECT_EQ(a4[0], "track_0");
    EXPECT_EQ(a4[1], "track_1");
}

TEST(PredictiveTracker, RequiresPredictor) {
    TrackerConfig cfg;
    cfg.kind = TrackerKind::Predictive;
    Tracker tracker = make_tracker(cfg, nullptr);
    EXPECT_THROW(update_tracker(tracker, 0, 0.0, {box(0.1f, 0.1f)}), TrackingError);
}

TEST(TrackerKind, Parse) {
    TrackerKind k;
    ASSERT_TRUE(parse_tracker_kind("predictive", k));
    EXPECT_EQ(k, TrackerKind::Predictive);
    EXPECT_FALSE(parse_tracker_kind("sort", k));
}
