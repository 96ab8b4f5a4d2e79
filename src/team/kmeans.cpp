#include "matchtrack/team/kmeans.h"
#include "matchtrack/detect/color.h"

#include <algorithm>
#include <cmath>

namespace matchtrack {
namespace team {

namespace {

// на малых углах евклидово расстояние в этом пространстве совпадает с hsv_distance
constexpr float kHueRadius = (float)(2.0 / CV_PI);

cv::Mat feature_matrix(const std::vector<ColorSample>& samples, bool use_hsv) {
    cv::Mat features((int)samples.size(), use_hsv ? 4 : 3, CV_32F);
    for (int i = 0; i < features.rows; ++i) {
        const Rgb& c = samples[(size_t)i].color;
        float* row = features.ptr<float>(i);
        if (use_hsv) {
            const detect::Hsv hsv = detect::rgb_to_hsv(c);
            const float h = hsv.h * (float)CV_PI / 180.0f;
            row[0] = kHueRadius * std::cos(h);
            row[1] = kHueRadius * std::sin(h);
            row[2] = std::sqrt(2.0f) * hsv.s;
            row[3] = hsv.v;
        } else {
            row[0] = (float)c.r;
            row[1] = (float)c.g;
            row[2] = (float)c.b;
        }
    }
    return features;
}

// Центроид как средний RGB своих сэмплов. Пустой кластер остаётся серым.
Rgb mean_color(const std::vector<ColorSample>& samples) {
    if (samples.empty()) return Rgb{};
    double r = 0.0, g = 0.0, b = 0.0;
    for (const auto& s : samples) {
        r += s.color.r;
        g += s.color.g;
        b += s.color.b;
    }
    const double n = (double)samples.size();
    return Rgb{(int)std::lround(r / n), (int)std::lround(g / n), (int)std::lround(b / n)};
}

} // namespace

float rgb_distance(const Rgb& a, const Rgb& b) {
    const float dr = (float)(a.r - b.r);
    const float dg = (float)(a.g - b.g);
    const float db = (float)(a.b - b.b);
    return std::sqrt(dr * dr + dg * dg + db * db);
}

float hsv_distance(const Rgb& a, const Rgb& b) {
    const detect::Hsv ha = detect::rgb_to_hsv(a);
    const detect::Hsv hb = detect::rgb_to_hsv(b);

    float dh = std::fabs(ha.h - hb.h);
    dh = std::min(dh, 360.0f - dh) / 180.0f;
    const float ds = ha.s - hb.s;
    const float dv = ha.v - hb.v;
    return std::sqrt(4.0f * dh * dh + 2.0f * ds * ds + dv * dv);
}

float cluster_distance(const Rgb& a, const Rgb& b, const KMeansConfig& cfg) {
    return cfg.use_hsv ? hsv_distance(a, b) : rgb_distance(a, b);
}

std::vector<Cluster> kmeans_clustering(const std::vector<ColorSample>& samples,
                                       const KMeansConfig& cfg,
                                       cv::RNG& rng) {
    if (samples.empty() || cfg.k <= 0 || (int)samples.size() < cfg.min_samples) {
        return {};
    }

    std::vector<Cluster> clusters;
    if ((int)samples.size() < cfg.k) {
        // сэмплов меньше k: каждый сам себе кластер
        for (const auto& s : samples) {
            Cluster cl;
            cl.centroid = s.color;
            cl.samples.push_back(s);
            clusters.push_back(cl);
        }
    } else {
        const cv::Mat features = feature_matrix(samples, cfg.use_hsv);
        const double eps = cfg.use_hsv ? cfg.convergence_threshold : cfg.convergence_threshold * 255.0;

        // cv::kmeans берёт генератор из cv::theRNG(): подставляем состояние генератора матча
        cv::theRNG() = cv::RNG(rng.next());
        cv::Mat labels;
        cv::Mat centers;
        cv::kmeans(features, cfg.k, labels,
                   cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT, cfg.max_iterations, eps),
                   1, cv::KMEANS_PP_CENTERS, centers);

        clusters.resize((size_t)cfg.k);
        for (int i = 0; i < labels.rows; ++i) {
            clusters[(size_t)labels.at<int>(i)].samples.push_back(samples[(size_t)i]);
        }
        for (auto& cl : clusters) cl.centroid = mean_color(cl.samples);
    }

    for (auto& cl : clusters) {
        if (cl.samples.empty()) continue;
        double sum = 0.0;
        for (const auto& s : cl.samples) sum += cluster_distance(s.color, cl.centroid, cfg);
        cl.avg_distance = (float)(sum / (double)cl.samples.size());
    }

    std::stable_sort(clusters.begin(), clusters.end(),
                     [](const Cluster& a, const Cluster& b) { return a.samples.size() > b.samples.size(); });
    for (size_t i = 0; i < clusters.size(); ++i) clusters[i].id = (int)i;
    return clusters;
}

} // namespace team
} // namespace matchtrack
