#include "matchtrack/dedup/deduplication.h"
#include "matchtrack/core/errors.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace matchtrack {
namespace dedup {

namespace {

struct ValueVotes {
    int count = 0;
    double confidence_sum = 0.0;
};

// Значение, подтверждённое большим числом событий; при равенстве больше суммарный confidence.
std::map<std::string, std::string> merge_details(const std::vector<RawEvent>& cluster) {
    std::map<std::string, std::map<std::string, ValueVotes>> votes;
    for (const auto& e : cluster) {
        for (const auto& kv : e.details) {
            if (kv.second.empty()) continue;
            ValueVotes& v = votes[kv.first][kv.second];
            v.count += 1;
            v.confidence_sum += e.confidence;
        }
    }

    std::map<std::string, std::string> out;
    for (const auto& key : votes) {
        const std::string* best = nullptr;
        ValueVotes best_votes;
        for (const auto& val : key.second) {
            const ValueVotes& v = val.second;
            if (!best || v.count > best_votes.count ||
                (v.count == best_votes.count && v.confidence_sum > best_votes.confidence_sum)) {
                best = &val.first;
                best_votes = v;
            }
        }
        out[key.first] = *best;
    }

    // гол не теряем, даже если его видело одно окно
    for (const auto& e : cluster) {
        if (e.type != EventType::Shot) continue;
        auto it = e.details.find("shotResult");
        if (it != e.details.end() && it->second == "goal") {
            out["shotResult"] = "goal";
            break;
        }
    }
    return out;
}

} // namespace

double type_threshold(EventType type, const DedupConfig& cfg) {
    auto it = cfg.type_thresholds.find(type);
    return it != cfg.type_thresholds.end() ? it->second : cfg.time_threshold;
}

void validate_raw_events(const std::vector<RawEvent>& events) {
    for (size_t i = 0; i < events.size(); ++i) {
        const RawEvent& e = events[i];
        const std::string where = "raw event " + std::to_string(i);
        if (!std::isfinite(e.absolute_timestamp) || !std::isfinite(e.relative_timestamp)) {
            throw ValidationError(where + ": timestamp is not finite", ErrorCode::InvalidFormat);
        }
        if (!std::isfinite(e.confidence) || e.confidence < 0.0f || e.confidence > 1.0f) {
            throw ValidationError(where + ": confidence outside [0,1]", ErrorCode::InvalidFormat);
        }
        if (e.window_id.empty()) {
            throw ValidationError(where + ": empty window_id", ErrorCode::MissingField);
        }
    }
}

std::vector<std::vector<RawEvent>> cluster_events(const std::vector<RawEvent>& events, const DedupConfig& cfg) {
    std::vector<std::vector<RawEvent>> clusters;
    if (events.empty()) return clusters;

    std::vector<RawEvent> sorted = events;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const RawEvent& a, const RawEvent& b) { return a.absolute_timestamp < b.absolute_timestamp; });

    // открытый кластер для каждой пары (тип, команда): события других типов между дублями не рвут кластер
    std::map<std::pair<EventType, TeamId>, size_t> open;
    for (const RawEvent& e : sorted) {
        const auto key = std::make_pair(e.type, e.team);
        auto it = open.find(key);
        if (it != open.end()) {
            std::vector<RawEvent>& cluster = clusters[it->second];
            const double dt = std::fabs(e.absolute_timestamp - cluster.back().absolute_timestamp);
            if (dt <= type_threshold(e.type, cfg)) {
                cluster.push_back(e);
                continue;
            }
        }
        open[key] = clusters.size();
        clusters.push_back(std::vector<RawEvent>{e});
    }
    return clusters;
}

DeduplicatedEvent merge_cluster(const std::vector<RawEvent>& cluster, const DedupConfig& cfg) {
    if (cluster.empty()) {
        throw ValidationError("cannot merge empty cluster");
    }

    const RawEvent* base = &cluster.front();
    for (const auto& e : cluster) {
        if (effective_confidence(e) > effective_confidence(*base)) base = &e;
    }

    DeduplicatedEvent out;
    out.match_id = base->match_id;
    out.type = base->type;
    out.team = base->team;
    out.position = base->position;
    out.position_confidence = base->position_confidence;
    out.confidence = base->confidence;

    double conf_sum = 0.0;
    double weighted_t = 0.0;
    double plain_t = 0.0;
    for (const auto& e : cluster) {
        conf_sum += e.confidence;
        weighted_t += e.absolute_timestamp * e.confidence;
        plain_t += e.absolute_timestamp;
    }
    out.absolute_timestamp = conf_sum > 0.0 ? weighted_t / conf_sum : plain_t / (double)cluster.size();

    out.details = merge_details(cluster);

    std::set<std::string> windows;
    for (const auto& e : cluster) {
        out.merged_from_windows.push_back(e.window_id);
        windows.insert(e.window_id);
    }
    // каждое следующее окно закрывает долю boost от оставшегося разрыва до 1
    float adjusted = effective_confidence(*base);
    for (size_t w = 1; w < windows.size(); ++w) {
        adjusted += cfg.confidence_boost_per_detection * (1.0f - adjusted);
    }
    out.adjusted_confidence = std::min(1.0f, adjusted);
    out.ensemble_confidence = out.adjusted_confidence;

    for (const auto& e : cluster) {
        if (e.visual_evidence.empty()) continue;
        if (!out.visual_evidence.empty()) out.visual_evidence += "; ";
        out.visual_evidence += e.visual_evidence;
    }

    out.player = base->player;
    out.zone = base->zone;
    for (const auto& e : cluster) {
        if (!out.player && e.player) out.player = e.player;
        if (!out.zone && e.zone) out.zone = e.zone;
    }

    // позиция модели: среднее, взвешенное по position_confidence
    double px = 0.0, py = 0.0, pc = 0.0;
    int with_pos = 0;
    for (const auto& e : cluster) {
        if (!e.position || !e.position_confidence || *e.position_confidence <= 0.0f) continue;
        px += e.position->x * *e.position_confidence;
        py += e.position->y * *e.position_confidence;
        pc += *e.position_confidence;
        ++with_pos;
    }
    if (with_pos > 0 && pc > 0.0) {
        out.merged_position = cv::Point2f((float)(px / pc), (float)(py / pc));
        const double avg = pc / with_pos;
        out.merged_position_confidence = (float)std::min(1.0, avg + 0.05 * (with_pos - 1));
        out.position_source = with_pos > 1 ? geometry::PositionSource::Merged
                                           : geometry::PositionSource::ModelOutput;
    }
    return out;
}

std::vector<DeduplicatedEvent> deduplicate_events(const std::vector<RawEvent>& events, const DedupConfig& cfg) {
    std::vector<DeduplicatedEvent> out;
    for (const auto& cluster : cluster_events(events, cfg)) {
        out.push_back(merge_cluster(cluster, cfg));
    }
    return out;
}

DedupStats calculate_dedup_stats(const std::vector<RawEvent>& raw, const std::vector<DeduplicatedEvent>& deduplicated) {
    DedupStats st;
    st.total_raw = (int)raw.size();
    st.total_deduplicated = (int)deduplicated.size();

    int merged_size_sum = 0;
    for (const auto& e : raw) st.by_type[e.type].raw += 1;
    for (const auto& e : deduplicated) {
        TypeDedupStats& t = st.by_type[e.type];
        t.deduplicated += 1;
        if (e.merged_from_windows.size() > 1) {
            t.merged_count += 1;
            st.merged_count += 1;
            merged_size_sum += (int)e.merged_from_windows.size();
        } else {
            st.unique_count += 1;
        }
    }
    st.average_cluster_size = st.merged_count > 0 ? (float)merged_size_sum / (float)st.merged_count : 0.0f;
    return st;
}

void resolve_event_positions(std::vector<DeduplicatedEvent>& events,
                             const std::vector<BallDetection>& ball,
                             const BallMatchConfig& cfg) {
    for (auto& e : events) {
        std::optional<geometry::PositionEstimate> from_ball;
        if (auto m = ball_position_at(ball, e.absolute_timestamp, cfg)) {
            from_ball = to_position_estimate(*m);
        }

        std::optional<geometry::PositionEstimate> from_model;
        if (e.merged_position) {
            geometry::PositionEstimate p;
            p.position = *e.merged_position;
            p.source = e.position_source ? *e.position_source : geometry::PositionSource::ModelOutput;
            p.confidence = e.merged_position_confidence ? *e.merged_position_confidence : 0.0f;
            from_model = p;
        }

        std::optional<geometry::PositionEstimate> from_zone;
        if (e.zone) from_zone = geometry::position_from_zone(e.zone, e.team);

        const geometry::PositionEstimate best = geometry::select_best_position(from_ball, from_model, from_zone);
        e.merged_position = best.position;
        e.position_source = best.source;
        e.merged_position_confidence = best.confidence;
    }
}

} // namespace dedup
} // namespace matchtrack
