#include "matchtrack/core/types.h"
#include "matchtrack/util/rect_utils.h"

namespace matchtrack {

const char* to_string(TeamId team) {
    switch (team) {
        case TeamId::Home: return "home";
        case TeamId::Away: return "away";
        case TeamId::Unknown: break;
    }
    return "unknown";
}

TeamId parse_team_id(std::string_view text) {
    if (text == "home") return TeamId::Home;
    if (text == "away") return TeamId::Away;
    return TeamId::Unknown;
}

const char* to_string(GameFormat format) {
    switch (format) {
        case GameFormat::Eleven: return "eleven";
        case GameFormat::Eight: return "eight";
        case GameFormat::Five: return "five";
    }
    return "eleven";
}

bool parse_game_format(std::string_view text, GameFormat& out) {
    if (text == "eleven") { out = GameFormat::Eleven; return true; }
    if (text == "eight") { out = GameFormat::Eight; return true; }
    if (text == "five") { out = GameFormat::Five; return true; }
    return false;
}

const char* to_string(AttackDirection dir) {
    switch (dir) {
        case AttackDirection::LeftToRight: return "LTR";
        case AttackDirection::RightToLeft: return "RTL";
        case AttackDirection::None: break;
    }
    return "none";
}

bool parse_attack_direction(std::string_view text, AttackDirection& out) {
    if (text == "LTR") { out = AttackDirection::LeftToRight; return true; }
    if (text == "RTL") { out = AttackDirection::RightToLeft; return true; }
    if (text == "none") { out = AttackDirection::None; return true; }
    return false;
}

Detection make_detection(const cv::Rect2f& bbox, float confidence, const std::string& label) {
    Detection d;
    d.bbox = bbox;
    d.center = util::rectCenter(bbox);
    d.confidence = confidence;
    d.label = label;
    return d;
}

} // namespace matchtrack
