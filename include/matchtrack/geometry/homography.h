#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

#include "matchtrack/core/types.h"

namespace matchtrack {
namespace geometry {

// Размер поля в метрах. Начало координат поля в центре.
struct FieldSize {
    float length = 105.0f;
    float width = 68.0f;
};

FieldSize field_dimensions(GameFormat format);

// Соответствие точка экрана (нормализованная) <-> точка поля (метры).
struct Keypoint {
    cv::Point2f screen{0.0f, 0.0f};
    cv::Point2f field{0.0f, 0.0f};
    std::string label;
    float confidence = 0.0f;
};

// Матрица переводит экран -> поле.
struct HomographyData {
    int frame_number = 0;
    cv::Matx33d matrix = cv::Matx33d::eye();
    std::vector<Keypoint> keypoints;
    float confidence = 0.0f;
    std::optional<FieldSize> field_size;
    bool camera_moving = false;
};

// Координаты ориентира разметки 11x11 по имени ("corner_tl", "center", "goal_r_top", ...).
bool pitch_landmark(const std::string& label, cv::Point2f& out);

// H*[x,y,1]/w. При |w| < eps возвращает (0,0): это "не отображается", а не координата.
cv::Point2f transform_point(const cv::Matx33d& h, const cv::Point2f& p);
bool is_degenerate_at(const cv::Matx33d& h, const cv::Point2f& p);

// Обратная 3x3 через алгебраические дополнения. false при |det| < eps.
bool invert_homography(const cv::Matx33d& h, cv::Matx33d& out);

std::optional<cv::Point2f> screen_to_field(const HomographyData& h, const cv::Point2f& screen);
std::optional<cv::Point2f> field_to_screen(const HomographyData& h, const cv::Point2f& field);

float field_distance(const cv::Point2f& a, const cv::Point2f& b);
bool is_on_pitch(const cv::Point2f& field_point, const FieldSize& size);

// DLT по >= 4 соответствиям src -> dst, решение через SVD.
// Бросает ValidationError, если точек меньше 4 или списки разной длины.
cv::Matx33d estimate_homography_dlt(const std::vector<cv::Point2f>& src,
                                    const std::vector<cv::Point2f>& dst);

// Средняя ошибка |H(screen) - field| в метрах.
double reprojection_error(const cv::Matx33d& h, const std::vector<Keypoint>& keypoints);

HomographyData create_homography_data(int frame_number,
                                      const std::vector<Keypoint>& keypoints,
                                      const std::optional<FieldSize>& field_size);

// Линейная интерполяция матрицы и confidence между двумя ключевыми кадрами.
HomographyData interpolate_homography(const HomographyData& h1,
                                      const HomographyData& h2,
                                      int target_frame);

// Гомография для кадра из набора ключевых кадров (отсортированных по frame_number).
bool homography_for_frame(const std::vector<HomographyData>& keyframes,
                          int frame_number,
                          HomographyData& out);

} // namespace geometry
} // namespace matchtrack
