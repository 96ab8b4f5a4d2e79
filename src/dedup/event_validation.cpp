#include "matchtrack/dedup/event_validation.h"
#include "matchtrack/geometry/pitch_zones.h"

#include <algorithm>
#include <cstdio>
#include <map>
#include <sstream>
#include <utility>

namespace matchtrack {
namespace dedup {

namespace {

constexpr double kGoalKickoffWindow = 30.0;

std::vector<DeduplicatedEvent> sorted_by_time(const std::vector<DeduplicatedEvent>& events) {
    std::vector<DeduplicatedEvent> out = events;
    std::stable_sort(out.begin(), out.end(), [](const DeduplicatedEvent& a, const DeduplicatedEvent& b) {
        return a.absolute_timestamp < b.absolute_timestamp;
    });
    return out;
}

bool detail_is(const DeduplicatedEvent& e, const char* key, const char* value) {
    auto it = e.details.find(key);
    return it != e.details.end() && it->second == value;
}

std::string fixed(double v, int digits) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
    return buf;
}

ValidationIssue issue(CheckType type, std::string message, int index, Severity severity = Severity::Low) {
    ValidationIssue out;
    out.type = type;
    out.message = std::move(message);
    out.event_index = index;
    out.related_index = index - 1;
    out.severity = severity;
    return out;
}

// короткие последовательности одной команды, которые нормальны
bool allowed_short_sequence(EventType prev, EventType cur) {
    static const std::pair<EventType, EventType> kAllowed[] = {
        {EventType::Pass, EventType::Shot},
        {EventType::Carry, EventType::Pass},
        {EventType::Carry, EventType::Shot},
        {EventType::SetPiece, EventType::Pass},
        {EventType::SetPiece, EventType::Shot},
    };
    for (const auto& p : kAllowed) {
        if (p.first == prev && p.second == cur) return true;
    }
    return false;
}

// Позиция измерена (мяч или модель), а не подставлена центром зоны или поля.
bool has_field_position(const DeduplicatedEvent& e) {
    if (!e.merged_position) return false;
    if (!e.position_source) return true;
    return *e.position_source != geometry::PositionSource::ZoneConversion &&
           *e.position_source != geometry::PositionSource::Unknown;
}

} // namespace

const char* to_string(CheckType type) {
    switch (type) {
        case CheckType::Temporal: return "temporal";
        case CheckType::Logical: return "logical";
        case CheckType::Positional: return "positional";
    }
    return "temporal";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    return "low";
}

ValidationResult validate_temporal_consistency(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg) {
    ValidationResult r;
    const auto sorted = sorted_by_time(events);

    for (size_t i = 1; i < sorted.size(); ++i) {
        const DeduplicatedEvent& prev = sorted[i - 1];
        const DeduplicatedEvent& cur = sorted[i];
        const double dt = cur.absolute_timestamp - prev.absolute_timestamp;
        const int idx = (int)i;

        if (dt == 0.0 && prev.type == cur.type && prev.team == cur.team) {
            r.errors.push_back(issue(CheckType::Temporal,
                                     "Duplicate event at timestamp " + fixed(cur.absolute_timestamp, 2) +
                                     ": same type (" + to_string(cur.type) + ") and team (" +
                                     matchtrack::to_string(cur.team) + ")",
                                     idx));
        }

        if (dt > 0.0 && dt < cfg.min_event_interval && prev.team == cur.team &&
            !allowed_short_sequence(prev.type, cur.type) && cfg.enable_warnings) {
            r.warnings.push_back(issue(CheckType::Temporal,
                                       "Short interval (" + fixed(dt, 2) + "s) between " + to_string(prev.type) +
                                       " and " + to_string(cur.type) + " by same team",
                                       idx, Severity::Low));
        }

        if (dt < 0.0) {
            r.errors.push_back(issue(CheckType::Temporal, "Events out of order", idx));
        }
    }
    r.valid = r.errors.empty();
    return r;
}

ValidationResult validate_logical_consistency(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg) {
    ValidationResult r;
    const auto sorted = sorted_by_time(events);
    if (!cfg.enable_warnings) return r;

    for (size_t i = 1; i < sorted.size(); ++i) {
        const DeduplicatedEvent& prev = sorted[i - 1];
        const DeduplicatedEvent& cur = sorted[i];
        const int idx = (int)i;

        if (prev.type == EventType::Pass && detail_is(prev, "outcome", "complete") &&
            cur.team != prev.team && cur.type != EventType::Turnover) {
            r.warnings.push_back(issue(CheckType::Logical,
                                       std::string("Completed pass by ") + matchtrack::to_string(prev.team) +
                                       " followed by " + to_string(cur.type) + " by " +
                                       matchtrack::to_string(cur.team) + " without turnover",
                                       idx, Severity::Medium));
        }

        if (prev.type == EventType::Pass && detail_is(prev, "outcome", "intercepted") &&
            cur.team == prev.team && cur.type != EventType::Turnover) {
            r.warnings.push_back(issue(CheckType::Logical,
                                       std::string("Intercepted pass followed by same team (") +
                                       matchtrack::to_string(cur.team) + ") action without possession change",
                                       idx, Severity::Medium));
        }
    }

    // после гола в течение 30 с должен быть розыгрыш (setPiece), не обязательно сразу
    for (size_t i = 0; i < sorted.size(); ++i) {
        const DeduplicatedEvent& goal = sorted[i];
        if (goal.type != EventType::Shot || !detail_is(goal, "shotResult", "goal")) continue;

        bool kickoff = false;
        int first_other = -1;
        for (size_t j = i + 1; j < sorted.size(); ++j) {
            if (sorted[j].absolute_timestamp - goal.absolute_timestamp >= kGoalKickoffWindow) break;
            if (sorted[j].type == EventType::SetPiece) {
                kickoff = true;
                break;
            }
            if (first_other < 0) first_other = (int)j;
        }
        if (kickoff) continue;

        ValidationIssue w = issue(CheckType::Logical, "Goal scored but no kickoff detected within 30 seconds",
                                  first_other >= 0 ? first_other : (int)i, Severity::Low);
        w.related_index = (int)i;
        r.warnings.push_back(w);
    }
    r.valid = r.errors.empty();
    return r;
}

ValidationResult validate_positional_consistency(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg) {
    ValidationResult r;
    const auto sorted = sorted_by_time(events);

    for (size_t i = 1; i < sorted.size(); ++i) {
        const DeduplicatedEvent& prev = sorted[i - 1];
        const DeduplicatedEvent& cur = sorted[i];
        if (!has_field_position(prev) || !has_field_position(cur)) continue;

        const double dt = cur.absolute_timestamp - prev.absolute_timestamp;
        if (dt <= 0.0) continue;

        const double dist = geometry::distance_meters(*prev.merged_position, *cur.merged_position);
        const double speed = dist / dt;
        if (speed <= cfg.max_movement_speed) continue;

        // мяч после паса своей команды может лететь быстрее игрока
        if (prev.type == EventType::Pass && prev.team == cur.team) continue;

        if (cfg.enable_warnings) {
            r.warnings.push_back(issue(CheckType::Positional,
                                       "Impossible movement: " + fixed(dist, 1) + "m in " + fixed(dt, 2) +
                                       "s (" + fixed(speed, 1) + " m/s required)",
                                       (int)i,
                                       speed > cfg.max_movement_speed * 2.0 ? Severity::High : Severity::Medium));
        }
    }
    r.valid = r.errors.empty();
    return r;
}

ValidationResult validate_events(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg) {
    ValidationResult out;
    for (const auto& part : {validate_temporal_consistency(events, cfg),
                             validate_logical_consistency(events, cfg),
                             validate_positional_consistency(events, cfg)}) {
        out.warnings.insert(out.warnings.end(), part.warnings.begin(), part.warnings.end());
        out.errors.insert(out.errors.end(), part.errors.begin(), part.errors.end());
    }
    out.valid = out.errors.empty();
    return out;
}

std::string summarize_validation_result(const ValidationResult& result) {
    std::ostringstream os;
    os << "Validation " << (result.valid ? "PASSED" : "FAILED") << "\n";
    os << "  Errors: " << result.errors.size() << "\n";
    os << "  Warnings: " << result.warnings.size();

    if (!result.errors.empty()) {
        os << "\n\nErrors:";
        for (const auto& e : result.errors) {
            os << "\n  [" << to_string(e.type) << "] Event " << e.event_index << ": " << e.message;
        }
    }

    if (!result.warnings.empty()) {
        os << "\n\nWarnings:";
        std::map<CheckType, int> by_type;
        for (const auto& w : result.warnings) by_type[w.type] += 1;
        for (const auto& kv : by_type) {
            os << "\n  " << to_string(kv.first) << ": " << kv.second;
        }
    }
    return os.str();
}

float ensemble_confidence(const DeduplicatedEvent& event, bool scene_match, bool clip_match, bool ball_position_match) {
    float c = event.adjusted_confidence;
    for (bool matched : {scene_match, clip_match, ball_position_match}) {
        if (matched) c = c + 0.05f * (1.0f - c);
    }
    return std::min(1.0f, c);
}

} // namespace dedup
} // namespace matchtrack
