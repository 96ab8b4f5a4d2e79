#include "matchtrack/dedup/analysis_window.h"

#include <algorithm>

namespace matchtrack {
namespace dedup {

const char* to_string(SegmentType type) {
    switch (type) {
        case SegmentType::ActivePlay: return "active_play";
        case SegmentType::Stoppage: return "stoppage";
        case SegmentType::SetPiece: return "set_piece";
        case SegmentType::GoalMoment: return "goal_moment";
        case SegmentType::Replay: return "replay";
    }
    return "active_play";
}

bool parse_segment_type(std::string_view text, SegmentType& out) {
    if (text == "active_play") { out = SegmentType::ActivePlay; return true; }
    if (text == "stoppage") { out = SegmentType::Stoppage; return true; }
    if (text == "set_piece") { out = SegmentType::SetPiece; return true; }
    if (text == "goal_moment") { out = SegmentType::GoalMoment; return true; }
    if (text == "replay") { out = SegmentType::Replay; return true; }
    return false;
}

int fps_for_segment(SegmentType type, const WindowConfig& cfg) {
    auto it = cfg.fps_map.find(type);
    if (it != cfg.fps_map.end()) return it->second;
    auto active = cfg.fps_map.find(SegmentType::ActivePlay);
    return active != cfg.fps_map.end() ? active->second : 3;
}

std::vector<AnalysisWindow> generate_windows(const std::vector<VideoSegment>& segments, const WindowConfig& cfg) {
    std::vector<AnalysisWindow> out;
    const double overlap = cfg.overlap_sec;
    const double step = cfg.window_size_sec - overlap;

    for (const auto& seg : segments) {
        if (seg.end_sec - seg.start_sec < 2.0) continue;

        const int fps = fps_for_segment(seg.type, cfg);

        if (seg.type == SegmentType::Stoppage || seg.type == SegmentType::Replay) {
            AnalysisWindow w;
            w.window_id = seg.segment_id + "_w0";
            w.absolute_start = std::max(0.0, seg.start_sec - overlap);
            w.absolute_end = seg.end_sec + overlap;
            w.overlap_before = std::min(overlap, seg.start_sec);
            w.overlap_after = overlap;
            w.target_fps = fps;
            w.segment_type = seg.type;
            w.segment_id = seg.segment_id;
            out.push_back(w);
            continue;
        }

        // шаг <= 0 зациклил бы генерацию: одно окно на сегмент
        const double effective_step = step > 0.0 ? step : seg.end_sec - seg.start_sec;

        double ws = seg.start_sec;
        int index = 0;
        while (ws < seg.end_sec) {
            const double we = std::min(ws + cfg.window_size_sec, seg.end_sec + overlap);

            AnalysisWindow w;
            w.window_id = seg.segment_id + "_w" + std::to_string(index);
            w.absolute_start = std::max(0.0, ws - overlap);
            w.absolute_end = we;
            w.overlap_before = index == 0 ? std::min(overlap, ws) : overlap;
            w.overlap_after = we >= seg.end_sec ? overlap : 0.0;
            w.target_fps = fps;
            w.segment_type = seg.type;
            w.segment_id = seg.segment_id;
            out.push_back(w);

            ws += effective_step;
            ++index;
        }
    }
    return out;
}

double absolute_to_relative(double absolute_time, double window_start) {
    return std::max(0.0, absolute_time - window_start);
}

double relative_to_absolute(double relative_time, double window_start) {
    return relative_time + window_start;
}

bool is_in_core_window(double timestamp, const AnalysisWindow& window) {
    const double core_start = window.absolute_start + window.overlap_before;
    const double core_end = window.absolute_end - window.overlap_after;
    return timestamp >= core_start && timestamp < core_end;
}

std::vector<AnalysisWindow> windows_for_timestamp(double timestamp, const std::vector<AnalysisWindow>& windows) {
    std::vector<AnalysisWindow> out;
    for (const auto& w : windows) {
        if (timestamp >= w.absolute_start && timestamp < w.absolute_end) out.push_back(w);
    }
    return out;
}

double total_analysis_duration(const std::vector<AnalysisWindow>& windows) {
    std::vector<AnalysisWindow> sorted = windows;
    std::sort(sorted.begin(), sorted.end(),
              [](const AnalysisWindow& a, const AnalysisWindow& b) { return a.absolute_start < b.absolute_start; });

    double total = 0.0;
    double current_end = 0.0;
    for (const auto& w : sorted) {
        if (w.absolute_start >= current_end) {
            total += w.absolute_end - w.absolute_start;
            current_end = w.absolute_end;
        } else if (w.absolute_end > current_end) {
            total += w.absolute_end - current_end;
            current_end = w.absolute_end;
        }
    }
    return total;
}

float window_adjusted_confidence(float raw, double timestamp, const AnalysisWindow& window, const WindowConfig& cfg) {
    return is_in_core_window(timestamp, window) ? raw : raw * cfg.overlap_confidence_scale;
}

} // namespace dedup
} // namespace matchtrack
