#include "matchtrack/detect/color.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace matchtrack {
namespace detect {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int clamp_channel(int v) {
    return std::max(0, std::min(255, v));
}

} // namespace

Rgb hex_to_rgb(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') hex.remove_prefix(1);
    if (hex.size() != 6) return Rgb{};

    int ch[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[i * 2]);
        const int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return Rgb{};
        ch[i] = hi * 16 + lo;
    }
    return Rgb{ch[0], ch[1], ch[2]};
}

std::string rgb_to_hex(const Rgb& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                  clamp_channel(c.r), clamp_channel(c.g), clamp_channel(c.b));
    return std::string(buf);
}

Hsv rgb_to_hsv(const Rgb& c) {
    // float-вход 0..1: OpenCV отдаёт H в градусах 0..360, S и V в 0..1
    cv::Mat3f px(1, 1, cv::Vec3f(clamp_channel(c.r) / 255.0f,
                                 clamp_channel(c.g) / 255.0f,
                                 clamp_channel(c.b) / 255.0f));
    cv::Mat3f out;
    cv::cvtColor(px, out, cv::COLOR_RGB2HSV);
    const cv::Vec3f v = out(0, 0);
    Hsv hsv;
    hsv.h = v[0] >= 360.0f ? v[0] - 360.0f : v[0];
    hsv.s = v[1];
    hsv.v = v[2];
    return hsv;
}

float color_distance(const Rgb& a, const Rgb& b) {
    const Hsv ha = rgb_to_hsv(a);
    const Hsv hb = rgb_to_hsv(b);

    float dh = std::fabs(ha.h - hb.h);
    dh = std::min(dh, 360.0f - dh) / 180.0f;
    const float ds = std::fabs(ha.s - hb.s);
    const float dv = std::fabs(ha.v - hb.v);
    return 0.5f * dh + 0.3f * ds + 0.2f * dv;
}

bool matches_team_color(const Rgb& color, const TeamColors& teams, float threshold) {
    return color_distance(color, teams.home) < threshold ||
           color_distance(color, teams.away) < threshold;
}

bool is_neutral(const Rgb& c) {
    return std::abs(c.r - c.g) <= 10 && std::abs(c.g - c.b) <= 10 && std::abs(c.r - c.b) <= 10;
}

} // namespace detect
} // namespace matchtrack
