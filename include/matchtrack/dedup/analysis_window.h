#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace matchtrack {
namespace dedup {

enum class SegmentType {
    ActivePlay,
    Stoppage,
    SetPiece,
    GoalMoment,
    Replay
};

const char* to_string(SegmentType type);
bool parse_segment_type(std::string_view text, SegmentType& out);

struct VideoSegment {
    std::string segment_id;
    double start_sec = 0.0;
    double end_sec = 0.0;
    SegmentType type = SegmentType::ActivePlay;
};

struct AnalysisWindow {
    std::string window_id;
    double absolute_start = 0.0;
    double absolute_end = 0.0;
    // перекрытие с соседями (сек), ядро окна без него
    double overlap_before = 0.0;
    double overlap_after = 0.0;
    int target_fps = 3;
    SegmentType segment_type = SegmentType::ActivePlay;
    std::string segment_id;
};

struct WindowConfig {
    double window_size_sec = 60.0;
    double overlap_sec = 15.0;
    // Множитель confidence для событий в зоне перекрытия
    float overlap_confidence_scale = 0.9f;
    std::map<SegmentType, int> fps_map = {
        {SegmentType::ActivePlay, 3},
        {SegmentType::SetPiece, 2},
        {SegmentType::GoalMoment, 5},
        {SegmentType::Stoppage, 1},
        {SegmentType::Replay, 1},
    };
};

int fps_for_segment(SegmentType type, const WindowConfig& cfg);

// Сегменты короче 2 с пропускаются, stoppage/replay дают одно контекстное окно.
std::vector<AnalysisWindow> generate_windows(const std::vector<VideoSegment>& segments,
                                             const WindowConfig& cfg = WindowConfig{});

double absolute_to_relative(double absolute_time, double window_start);
double relative_to_absolute(double relative_time, double window_start);

// [start + overlap_before, end - overlap_after)
bool is_in_core_window(double timestamp, const AnalysisWindow& window);

std::vector<AnalysisWindow> windows_for_timestamp(double timestamp, const std::vector<AnalysisWindow>& windows);

// Длина объединения всех окон.
double total_analysis_duration(const std::vector<AnalysisWindow>& windows);

// В ядре окна raw, в перекрытии raw * overlap_confidence_scale.
float window_adjusted_confidence(float raw, double timestamp, const AnalysisWindow& window, const WindowConfig& cfg);

} // namespace dedup
} // namespace matchtrack
