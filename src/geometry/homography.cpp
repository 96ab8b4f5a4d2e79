#include "matchtrack/geometry/homography.h"
#include "matchtrack/core/errors.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace matchtrack {
namespace geometry {

namespace {

constexpr double kEps = 1e-10;

struct Landmark {
    const char* label;
    float x;
    float y;
};

// Разметка 105x68, центр поля в (0,0), y вверх.
const Landmark kLandmarks[] = {
        {"corner_tl", -52.5f, 34.0f},
        {"corner_tr", 52.5f, 34.0f},
        {"corner_bl", -52.5f, -34.0f},
        {"corner_br", 52.5f, -34.0f},
        {"center", 0.0f, 0.0f},
        {"center_top", 0.0f, 34.0f},
        {"center_bottom", 0.0f, -34.0f},
        {"penalty_tl", -52.5f, 20.15f},
        {"penalty_bl", -52.5f, -20.15f},
        {"penalty_front_l", -36.0f, 20.15f},
        {"penalty_front_bl", -36.0f, -20.15f},
        {"penalty_tr", 52.5f, 20.15f},
        {"penalty_br", 52.5f, -20.15f},
        {"penalty_front_r", 36.0f, 20.15f},
        {"penalty_front_br", 36.0f, -20.15f},
        {"goal_l_top", -52.5f, 3.66f},
        {"goal_l_bottom", -52.5f, -3.66f},
        {"goal_r_top", 52.5f, 3.66f},
        {"goal_r_bottom", 52.5f, -3.66f},
        {"center_circle_top", 0.0f, 9.15f},
        {"center_circle_bottom", 0.0f, -9.15f},
        {"center_circle_left", -9.15f, 0.0f},
        {"center_circle_right", 9.15f, 0.0f},
};

// Нормализация Хартли: центр масс в 0, среднее расстояние sqrt(2).
cv::Matx33d normalization_transform(const std::vector<cv::Point2f>& pts) {
    double cx = 0.0;
    double cy = 0.0;
    for (const auto& p : pts) {
        cx += p.x;
        cy += p.y;
    }
    cx /= (double)pts.size();
    cy /= (double)pts.size();

    double mean_dist = 0.0;
    for (const auto& p : pts) {
        mean_dist += std::hypot(p.x - cx, p.y - cy);
    }
    mean_dist /= (double)pts.size();

    const double s = mean_dist > kEps ? std::sqrt(2.0) / mean_dist : 1.0;
    return cv::Matx33d(s, 0.0, -s * cx,
                       0.0, s, -s * cy,
                       0.0, 0.0, 1.0);
}

cv::Point2d apply_similarity(const cv::Matx33d& t, const cv::Point2f& p) {
    return cv::Point2d(t(0, 0) * p.x + t(0, 2), t(1, 1) * p.y + t(1, 2));
}

} // namespace

FieldSize field_dimensions(GameFormat format) {
    switch (format) {
        case GameFormat::Eight: return FieldSize{68.0f, 50.0f};
        case GameFormat::Five: return FieldSize{40.0f, 20.0f};
        case GameFormat::Eleven: break;
    }
    return FieldSize{105.0f, 68.0f};
}

bool pitch_landmark(const std::string& label, cv::Point2f& out) {
    for (const auto& lm : kLandmarks) {
        if (label == lm.label) {
            out = cv::Point2f(lm.x, lm.y);
            return true;
        }
    }
    return false;
}

bool is_degenerate_at(const cv::Matx33d& h, const cv::Point2f& p) {
    const double w = h(2, 0) * p.x + h(2, 1) * p.y + h(2, 2);
    return std::abs(w) < kEps;
}

cv::Point2f transform_point(const cv::Matx33d& h, const cv::Point2f& p) {
    const double x = p.x;
    const double y = p.y;
    const double w = h(2, 0) * x + h(2, 1) * y + h(2, 2);
    if (std::abs(w) < kEps) {
        return cv::Point2f(0.0f, 0.0f);
    }
    return cv::Point2f((float)((h(0, 0) * x + h(0, 1) * y + h(0, 2)) / w),
                       (float)((h(1, 0) * x + h(1, 1) * y + h(1, 2)) / w));
}

bool invert_homography(const cv::Matx33d& m, cv::Matx33d& out) {
    const double det =
            m(0, 0) * (m(1, 1) * m(2, 2) - m(1, 2) * m(2, 1)) -
            m(0, 1) * (m(1, 0) * m(2, 2) - m(1, 2) * m(2, 0)) +
            m(0, 2) * (m(1, 0) * m(2, 1) - m(1, 1) * m(2, 0));
    if (std::abs(det) < kEps) {
        return false;
    }
    const double inv = 1.0 / det;
    out = cv::Matx33d(
            (m(1, 1) * m(2, 2) - m(1, 2) * m(2, 1)) * inv,
            (m(0, 2) * m(2, 1) - m(0, 1) * m(2, 2)) * inv,
            (m(0, 1) * m(1, 2) - m(0, 2) * m(1, 1)) * inv,
            (m(1, 2) * m(2, 0) - m(1, 0) * m(2, 2)) * inv,
            (m(0, 0) * m(2, 2) - m(0, 2) * m(2, 0)) * inv,
            (m(0, 2) * m(1, 0) - m(0, 0) * m(1, 2)) * inv,
            (m(1, 0) * m(2, 1) - m(1, 1) * m(2, 0)) * inv,
            (m(0, 1) * m(2, 0) - m(0, 0) * m(2, 1)) * inv,
            (m(0, 0) * m(1, 1) - m(0, 1) * m(1, 0)) * inv);
    return true;
}

std::optional<cv::Point2f> screen_to_field(const HomographyData& h, const cv::Point2f& screen) {
    if (is_degenerate_at(h.matrix, screen)) {
        return std::nullopt;
    }
    return transform_point(h.matrix, screen);
}

std::optional<cv::Point2f> field_to_screen(const HomographyData& h, const cv::Point2f& field) {
    cv::Matx33d inv;
    if (!invert_homography(h.matrix, inv)) {
        return std::nullopt;
    }
    if (is_degenerate_at(inv, field)) {
        return std::nullopt;
    }
    return transform_point(inv, field);
}

float field_distance(const cv::Point2f& a, const cv::Point2f& b) {
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

bool is_on_pitch(const cv::Point2f& p, const FieldSize& size) {
    const float half_length = size.length / 2.0f;
    const float half_width = size.width / 2.0f;
    return p.x >= -half_length && p.x <= half_length &&
           p.y >= -half_width && p.y <= half_width;
}

cv::Matx33d estimate_homography_dlt(const std::vector<cv::Point2f>& src,
                                    const std::vector<cv::Point2f>& dst) {
    if (src.size() != dst.size()) {
        throw ValidationError("homography: src/dst size mismatch (" + std::to_string(src.size()) +
                              " vs " + std::to_string(dst.size()) + ")");
    }
    if (src.size() < 4) {
        throw ValidationError("homography: need at least 4 correspondences, got " +
                              std::to_string(src.size()));
    }

    const cv::Matx33d t_src = normalization_transform(src);
    const cv::Matx33d t_dst = normalization_transform(dst);

    // A h = 0, по две строки на соответствие
    const int n = (int)src.size();
    cv::Mat a(2 * n, 9, CV_64F, cv::Scalar(0.0));
    for (int i = 0; i < n; ++i) {
        const cv::Point2d s = apply_similarity(t_src, src[(size_t)i]);
        const cv::Point2d d = apply_similarity(t_dst, dst[(size_t)i]);
        const double x = s.x;
        const double y = s.y;
        const double xp = d.x;
        const double yp = d.y;

        double* r0 = a.ptr<double>(2 * i);
        r0[0] = -x; r0[1] = -y; r0[2] = -1.0;
        r0[6] = x * xp; r0[7] = y * xp; r0[8] = xp;

        double* r1 = a.ptr<double>(2 * i + 1);
        r1[3] = -x; r1[4] = -y; r1[5] = -1.0;
        r1[6] = x * yp; r1[7] = y * yp; r1[8] = yp;
    }

    // Правый сингулярный вектор с минимальным сингулярным числом.
    cv::Mat h;
    cv::SVD::solveZ(a, h);

    cv::Matx33d hn;
    for (int k = 0; k < 9; ++k) {
        hn(k / 3, k % 3) = h.at<double>(k);
    }

    cv::Matx33d t_dst_inv;
    if (!invert_homography(t_dst, t_dst_inv)) {
        throw ValidationError("homography: degenerate destination points");
    }
    cv::Matx33d result = t_dst_inv * hn * t_src;
    if (std::abs(result(2, 2)) > kEps) {
        result = result * (1.0 / result(2, 2));
    }
    return result;
}

double reprojection_error(const cv::Matx33d& h, const std::vector<Keypoint>& keypoints) {
    if (keypoints.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    double total = 0.0;
    for (const auto& kp : keypoints) {
        const cv::Point2f projected = transform_point(h, kp.screen);
        total += std::hypot((double)projected.x - kp.field.x, (double)projected.y - kp.field.y);
    }
    return total / (double)keypoints.size();
}

HomographyData create_homography_data(int frame_number,
                                      const std::vector<Keypoint>& keypoints,
                                      const std::optional<FieldSize>& field_size) {
    std::vector<cv::Point2f> screen;
    std::vector<cv::Point2f> field;
    screen.reserve(keypoints.size());
    field.reserve(keypoints.size());
    for (const auto& kp : keypoints) {
        screen.push_back(kp.screen);
        field.push_back(kp.field);
    }

    HomographyData data;
    data.frame_number = frame_number;
    data.matrix = estimate_homography_dlt(screen, field);
    data.keypoints = keypoints;
    data.field_size = field_size;

    float sum = 0.0f;
    for (const auto& kp : keypoints) sum += kp.confidence;
    data.confidence = sum / (float)keypoints.size();
    return data;
}

HomographyData interpolate_homography(const HomographyData& h1,
                                      const HomographyData& h2,
                                      int target_frame) {
    if (h1.frame_number == h2.frame_number) {
        return h1;
    }
    const double t = (double)(target_frame - h1.frame_number) /
                     (double)(h2.frame_number - h1.frame_number);
    const double ct = std::max(0.0, std::min(1.0, t));

    HomographyData out = h1;
    out.frame_number = target_frame;
    out.matrix = h1.matrix + (h2.matrix - h1.matrix) * ct;
    out.confidence = h1.confidence + (float)ct * (h2.confidence - h1.confidence);
    out.camera_moving = true;
    return out;
}

bool homography_for_frame(const std::vector<HomographyData>& keyframes,
                          int frame_number,
                          HomographyData& out) {
    if (keyframes.empty()) {
        return false;
    }
    if (frame_number <= keyframes.front().frame_number) {
        out = keyframes.front();
        return true;
    }
    if (frame_number >= keyframes.back().frame_number) {
        out = keyframes.back();
        return true;
    }
    for (size_t i = 1; i < keyframes.size(); ++i) {
        if (frame_number <= keyframes[i].frame_number) {
            if (frame_number == keyframes[i].frame_number) {
                out = keyframes[i];
            } else {
                out = interpolate_homography(keyframes[i - 1], keyframes[i], frame_number);
            }
            return true;
        }
    }
    out = keyframes.back();
    return true;
}

} // namespace geometry
} // namespace matchtrack
