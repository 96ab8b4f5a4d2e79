#pragma once

#include <string>
#include <string_view>

#include "matchtrack/core/types.h"

namespace matchtrack {
namespace detect {

// h: 0..360 градусов, s и v: 0..1
struct Hsv {
    float h = 0.0f;
    float s = 0.0f;
    float v = 0.0f;
};

// "#RRGGBB" или "RRGGBB", регистр не важен. Невалидная строка -> серый (128,128,128).
Rgb hex_to_rgb(std::string_view hex);
std::string rgb_to_hex(const Rgb& c);

Hsv rgb_to_hsv(const Rgb& c);

// Взвешенная HSV-разница: 0.5*hue + 0.3*sat + 0.2*val, hue по кругу, /180.
float color_distance(const Rgb& a, const Rgb& b);

struct TeamColors {
    Rgb home;
    Rgb away;
};

// Цвет близок (< threshold) к цвету хотя бы одной команды.
bool matches_team_color(const Rgb& color, const TeamColors& teams, float threshold);

// Почти серый: все попарные разности каналов <= 10.
bool is_neutral(const Rgb& c);

} // namespace detect
} // namespace matchtrack
