#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

#include "matchtrack/core/types.h"

namespace matchtrack {
namespace team {

struct ColorSample {
    std::string track_id;
    Rgb color;
    cv::Point2f position{0.0f, 0.0f};
};

struct Cluster {
    int id = 0;
    Rgb centroid;
    std::vector<ColorSample> samples;
    // средняя дистанция сэмплов до центроида (в метрике кластеризации)
    float avg_distance = 0.0f;
};

struct KMeansConfig {
    int k = 2;
    int max_iterations = 100;
    // Сходимость cv::kmeans: сдвиг центров не больше threshold*255 (RGB) или threshold (HSV-пространство)
    float convergence_threshold = 0.001f;
    // HSV-метрика вместо евклидовой RGB
    bool use_hsv = true;
    // Меньше сэмплов -> кластеризация не запускается
    int min_samples = 6;
};

float rgb_distance(const Rgb& a, const Rgb& b);

// sqrt(4*dh^2 + 2*ds^2 + dv^2), dh по кругу и /180.
float hsv_distance(const Rgb& a, const Rgb& b);

// Метрика, выбранная конфигом.
float cluster_distance(const Rgb& a, const Rgb& b, const KMeansConfig& cfg);

// cv::kmeans (KMEANS_PP_CENTERS) с генератором матча. HSV кластеризуется в пространстве
// (r*cos h, r*sin h, sqrt(2)*s, v), центроиды отдаются средним RGB членов кластера.
// Результат отсортирован по размеру, id перенумерованы.
// Сэмплов меньше min_samples -> пустой вектор, меньше k -> по кластеру на сэмпл.
std::vector<Cluster> kmeans_clustering(const std::vector<ColorSample>& samples,
                                       const KMeansConfig& cfg,
                                       cv::RNG& rng);

} // namespace team
} // namespace matchtrack
