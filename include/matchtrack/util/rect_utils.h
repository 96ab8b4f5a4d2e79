#pragma once
#include <opencv2/core.hpp>

#include <vector>

namespace matchtrack {
namespace util {

// Intersection over Union. Returns 0..1.
float iou(const cv::Rect2f& a, const cv::Rect2f& b);

cv::Point2f rectCenter(const cv::Rect2f& r);

// Евклидово расстояние между точками.
float pointDistance(const cv::Point2f& a, const cv::Point2f& b);

// Сумма длин отрезков ломаной. Пустая или из одной точки -> 0.
float pathLength(const std::vector<cv::Point2f>& points);

// Перевод нормализованной точки в пиксели кадра. Пустой размер -> точка как есть.
cv::Point2f toPixels(const cv::Point2f& p, const cv::Size& frameSize);

cv::Rect2f toPixels(const cv::Rect2f& r, const cv::Size& frameSize);

} // namespace util
} // namespace matchtrack
