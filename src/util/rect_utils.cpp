#include "matchtrack/util/rect_utils.h"
#include <cmath>

namespace matchtrack {
namespace util {

float iou(const cv::Rect2f& a, const cv::Rect2f& b) {
    cv::Rect2f inter = a & b;
    float ia = inter.area();
    float ua = a.area() + b.area() - ia;
    if (ua <= 0.0f) return 0.0f;
    return ia / ua;
}

cv::Point2f rectCenter(const cv::Rect2f& r) {
    return cv::Point2f(r.x + r.width * 0.5f, r.y + r.height * 0.5f);
}

float pointDistance(const cv::Point2f& a, const cv::Point2f& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx*dx + dy*dy);
}

float pathLength(const std::vector<cv::Point2f>& points) {
    if (points.size() < 2) return 0.0f;
    float total = 0.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        total += pointDistance(points[i - 1], points[i]);
    }
    return total;
}

cv::Point2f toPixels(const cv::Point2f& p, const cv::Size& frameSize) {
    if (frameSize.width <= 0 || frameSize.height <= 0) return p;
    return cv::Point2f(p.x * (float)frameSize.width, p.y * (float)frameSize.height);
}

cv::Rect2f toPixels(const cv::Rect2f& r, const cv::Size& frameSize) {
    if (frameSize.width <= 0 || frameSize.height <= 0) return r;
    const float w = (float)frameSize.width;
    const float h = (float)frameSize.height;
    return cv::Rect2f(r.x * w, r.y * h, r.width * w, r.height * h);
}

} // namespace util
} // namespace matchtrack
