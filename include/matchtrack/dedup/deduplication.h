#pragma once

#include <map>
#include <vector>

#include "matchtrack/dedup/ball_position_matcher.h"
#include "matchtrack/dedup/raw_event.h"

namespace matchtrack {
namespace dedup {

struct DedupConfig {
    // Порог по времени для типа без своего значения (сек)
    double time_threshold = 2.0;
    std::map<EventType, double> type_thresholds = {
        {EventType::Shot, 1.0},
        {EventType::Pass, 2.0},
        {EventType::Carry, 3.0},
        {EventType::Turnover, 2.0},
        {EventType::SetPiece, 2.5},
    };
    // Прибавка за каждое дополнительное окно (от оставшегося до 1.0)
    float confidence_boost_per_detection = 0.1f;
};

double type_threshold(EventType type, const DedupConfig& cfg);

// Бросает ValidationError: нечисловой timestamp, confidence вне [0,1], пустой window_id.
void validate_raw_events(const std::vector<RawEvent>& events);

// Кластеры внутри каждой пары (тип, команда): по времени, событие присоединяется к
// открытому кластеру своей пары, если от его последнего события не дальше порога типа.
// Порядок кластеров по времени первого события.
std::vector<std::vector<RawEvent>> cluster_events(const std::vector<RawEvent>& events, const DedupConfig& cfg);

// Пустой кластер -> ValidationError.
DeduplicatedEvent merge_cluster(const std::vector<RawEvent>& cluster, const DedupConfig& cfg);

std::vector<DeduplicatedEvent> deduplicate_events(const std::vector<RawEvent>& events, const DedupConfig& cfg);

struct TypeDedupStats {
    int raw = 0;
    int deduplicated = 0;
    int merged_count = 0;
};

struct DedupStats {
    int total_raw = 0;
    int total_deduplicated = 0;
    int merged_count = 0;
    int unique_count = 0;
    // средний размер только по слитым событиям
    float average_cluster_size = 0.0f;
    std::map<EventType, TypeDedupStats> by_type;
};

DedupStats calculate_dedup_stats(const std::vector<RawEvent>& raw, const std::vector<DeduplicatedEvent>& deduplicated);

// Итоговая позиция события строго по приоритету: мяч, оценка модели, зона, центр.
void resolve_event_positions(std::vector<DeduplicatedEvent>& events,
                             const std::vector<BallDetection>& ball,
                             const BallMatchConfig& cfg);

} // namespace dedup
} // namespace matchtrack
