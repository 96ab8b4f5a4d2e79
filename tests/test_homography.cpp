#include <gtest/gtest.h>

#include "matchtrack/core/errors.h"
#include "matchtrack/geometry/homography.h"

using namespace matchtrack;
using namespace matchtrack::geometry;

namespace {

std::vector<Keypoint> corner_keypoints() {
    std::vector<Keypoint> kps;
    const char *labels[] = {"corner_tl", "corner_tr", "corner_br", "corner_bl"};
    const cv::Point2f screen[] = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};
    for (int i = 0; i < 4; ++i) {
        Keypoint kp;
        kp.label = labels[i];
        kp.screen = screen[i];
        EXPECT_TRUE(pitch_landmark(kp.label, kp.field));
        kp.confidence = 0.8f;
        kps.push_back(kp);
    }
    return kps;
}

} // namespace

TEST(Homography, EstimatesCornerMapping) {
    const HomographyData h = create_homography_data(10, corner_keypoints(), std::nullopt);

    EXPECT_EQ(h.frame_number, 10);
    EXPECT_NEAR(h.confidence, 0.8f, 1e-6);
    EXPECT_LT(reprojection_error(h.matrix, h.keypoints), 1e-3);

    const auto center = screen_to_field(h, cv::Point2f(0.5f, 0.5f));
    ASSERT_TRUE(center.has_value());
    EXPECT_NEAR(center->x, 0.0f, 1e-3);
    EXPECT_NEAR(center->y, 0.0f, 1e-3);
}

TEST(Homography, PerspectiveRoundTrip) {
    // трапеция на экране: дальняя бровка короче
    std::vector<cv::Point2f> src = {{0.3f, 0.2f}, {0.7f, 0.2f}, {0.95f, 0.9f}, {0.05f, 0.9f}};
    std::vector<cv::Point2f> dst = {{-52.5f, 34.0f}, {52.5f, 34.0f}, {52.5f, -34.0f}, {-52.5f, -34.0f}};
    const cv::Matx33d m = estimate_homography_dlt(src, dst);

    HomographyData h;
    h.matrix = m;
    for (size_t i = 0; i < 4; ++i) {
        const auto f = screen_to_field(h, src[i]);
        ASSERT_TRUE(f.has_value());
        EXPECT_NEAR(f->x, dst[i].x, 1e-2);
        EXPECT_NEAR(f->y, dst[i].y, 1e-2);

        const auto s = field_to_screen(h, *f);
        ASSERT_TRUE(s.has_value());
        EXPECT_NEAR(s->x, src[i].x, 1e-3);
        EXPECT_NEAR(s->y, src[i].y, 1e-3);
    }
}

TEST(Homography, RejectsTooFewPoints) {
    std::vector<cv::Point2f> src = {{0, 0}, {1, 0}, {1, 1}};
    std::vector<cv::Point2f> dst = {{0, 0}, {1, 0}, {1, 1}};
    EXPECT_THROW(estimate_homography_dlt(src, dst), ValidationError);

    src.push_back({0, 1});
    EXPECT_THROW(estimate_homography_dlt(src, dst), ValidationError);
}

TEST(Homography, DegenerateMatrixIsNotMapped) {
    HomographyData h;
    h.matrix = cv::Matx33d(1, 0, 0,
                           0, 1, 0,
                           0, 0, 0);
    EXPECT_FALSE(screen_to_field(h, cv::Point2f(0.0f, 0.0f)).has_value());
    EXPECT_FALSE(field_to_screen(h, cv::Point2f(1.0f, 1.0f)).has_value());

    cv::Matx33d inv;
    EXPECT_FALSE(invert_homography(h.matrix, inv));
}

TEST(Homography, KeyframeInterpolation) {
    HomographyData a;
    a.frame_number = 0;
    a.matrix = cv::Matx33d::eye();
    a.confidence = 0.4f;
    HomographyData b = a;
    b.frame_number = 10;
    b.matrix = cv::Matx33d(3, 0, 0, 0, 3, 0, 0, 0, 1);
    b.confidence = 0.8f;

    HomographyData mid;
    ASSERT_TRUE(homography_for_frame({a, b}, 5, mid));
    EXPECT_EQ(mid.frame_number, 5);
    EXPECT_NEAR(mid.matrix(0, 0), 2.0, 1e-9);
    EXPECT_NEAR(mid.confidence, 0.6f, 1e-6);
    EXPECT_TRUE(mid.camera_moving);

    HomographyData before;
    ASSERT_TRUE(homography_for_frame({a, b}, -3, before));
    EXPECT_EQ(before.frame_number, 0);

    HomographyData none;
    EXPECT_FALSE(homography_for_frame({}, 5, none));
}

TEST(Homography, PitchBoundsPerFormat) {
    const FieldSize eleven = field_dimensions(GameFormat::Eleven);
    const FieldSize five = field_dimensions(GameFormat::Five);
    EXPECT_FLOAT_EQ(eleven.length, 105.0f);
    EXPECT_FLOAT_EQ(five.width, 20.0f);

    EXPECT_TRUE(is_on_pitch(cv::Point2f(52.5f, -34.0f), eleven));
    EXPECT_FALSE(is_on_pitch(cv::Point2f(53.0f, 0.0f), eleven));
    EXPECT_FALSE(is_on_pitch(cv::Point2f(25.0f, 0.0f), five));
    EXPECT_FLOAT_EQ(field_distance(cv::Point2f(0, 0), cv::Point2f(3, 4)), 5.0f);
}
