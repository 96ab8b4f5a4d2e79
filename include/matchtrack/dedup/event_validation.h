#pragma once

#include <optional>
#include <string>
#include <vector>

#include "matchtrack/dedup/raw_event.h"

namespace matchtrack {
namespace dedup {

enum class CheckType {
    Temporal,
    Logical,
    Positional
};

enum class Severity {
    Low,
    Medium,
    High
};

const char* to_string(CheckType type);
const char* to_string(Severity severity);

// eventIndex / relatedIndex: индексы в отсортированном по времени списке.
struct ValidationIssue {
    CheckType type = CheckType::Temporal;
    std::string message;
    int event_index = 0;
    std::optional<int> related_index;
    // только у предупреждений
    Severity severity = Severity::Low;
};

struct ValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> warnings;
    std::vector<ValidationIssue> errors;
};

struct ValidationConfig {
    // Минимальный интервал между событиями одной команды (сек)
    double min_event_interval = 0.5;
    // Максимальная скорость игрока (м/с)
    double max_movement_speed = 12.0;
    bool enable_warnings = true;
};

ValidationResult validate_temporal_consistency(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg);
ValidationResult validate_logical_consistency(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg);
ValidationResult validate_positional_consistency(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg);

// Объединение трёх проверок. Результат только информирует, события не отбрасываются.
ValidationResult validate_events(const std::vector<DeduplicatedEvent>& events, const ValidationConfig& cfg = ValidationConfig{});

std::string summarize_validation_result(const ValidationResult& result);

// Каждый подтверждающий источник: c += 0.05 * (1 - c).
float ensemble_confidence(const DeduplicatedEvent& event, bool scene_match, bool clip_match, bool ball_position_match);

} // namespace dedup
} // namespace matchtrack
