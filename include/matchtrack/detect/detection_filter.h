#pragma once
#include <opencv2/core.hpp>

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/detect/color.h"
#include "matchtrack/geometry/homography.h"

namespace matchtrack {
namespace detect {

    struct MotionEntry {
        cv::Point2f position;
        int frame_number = 0;
    };

    // Скользящая история позиций по track id (внешний id из детекции).
    // Принадлежит AnalysisContext одного матча.
    class MotionHistory {
    public:
        // Добавляет позиции детекций с track id и выкидывает записи старше окна.
        // frame_size не пустой -> позиции храним в пикселях.
        void update(const std::vector<Detection>& dets,
                    int frame_number,
                    int window_frames,
                    const cv::Size& frame_size);

        // false, если по треку ещё нет истории.
        bool movement(const std::string& track_id, float& out) const;

        const std::deque<MotionEntry>* entries(const std::string& track_id) const;

        // Удаляет треки, не обновлявшиеся дольше max_stale кадров.
        void prune_stale(int current_frame, int max_stale);

        size_t track_count() const { return history_.size(); }
        void clear() { history_.clear(); }

    private:
        std::map<std::string, std::deque<MotionEntry>> history_;
    };

    struct RosterEntry {
        int jersey_number = 0;
        TeamId team = TeamId::Unknown;
    };

    // Сколько отброшено на каждой стадии.
    struct FilterStats {
        int input = 0;
        int confidence_filtered = 0;
        int pitch_filtered = 0;
        int color_filtered = 0;
        int motion_filtered = 0;
        int roster_filtered = 0;
        int top_n_filtered = 0;
        int output = 0;

        FilterStats& operator+=(const FilterStats& o);
    };

    // Всё, что известно о кадре помимо детекций. Указатели не владеющие, nullptr = нет данных.
    struct FrameContext {
        int frame_number = 0;
        cv::Size frame_size;
        const geometry::HomographyData* homography = nullptr;
        const std::vector<RosterEntry>* roster = nullptr;
        // track id -> номер на майке
        const std::map<std::string, int>* jersey_numbers = nullptr;
        const TeamColors* team_colors = nullptr;
    };

    std::vector<Detection> filter_by_confidence(const std::vector<Detection>& dets, float min_confidence);

    // Центр детекции через гомографию в метры поля и проверка границ.
    // Неотображаемая точка (вырожденное w или необратимая матрица) отбрасывается.
    std::vector<Detection> filter_by_pitch(const std::vector<Detection>& dets,
                                           const geometry::HomographyData& homography,
                                           const geometry::FieldSize& field_size);

    // Заглушка до появления настоящего экстрактора цвета: пропускает всё.
    std::vector<Detection> filter_by_team_color(const std::vector<Detection>& dets,
                                                const TeamColors* team_colors,
                                                float similarity_threshold);

    std::vector<Detection> filter_by_motion(const std::vector<Detection>& dets,
                                            const MotionHistory& history,
                                            float min_movement);

    std::vector<Detection> filter_by_roster(const std::vector<Detection>& dets,
                                            const std::vector<RosterEntry>& roster,
                                            const std::map<std::string, int>& jersey_numbers);

    // N лучших по confidence, по убыванию.
    std::vector<Detection> filter_top_n(const std::vector<Detection>& dets, int max_count);

    class DetectionFilter {
    public:
        struct Config {
            // Максимум людей на поле (игроки + судьи)
            int max_players = 25;
            float min_confidence = 0.3f;
            // Минимальный суммарный путь за окно (px, если известен размер кадра)
            float min_movement = 10.0f;
            int motion_window_frames = 30;
            float color_similarity_threshold = 0.4f;
            bool filter_outside_pitch = true;
            GameFormat game_format = GameFormat::Eleven;
            bool log = false;
        };

        DetectionFilter(Config cfg, MotionHistory* history);

        std::vector<Detection> process(const std::vector<Detection>& dets, const FrameContext& ctx);

        const FilterStats& last_stats() const { return last_; }
        const FilterStats& total_stats() const { return total_; }
        const Config& config() const { return cfg_; }

    private:
        Config cfg_;
        MotionHistory* history_;
        FilterStats last_;
        FilterStats total_;
    };

    // Значения по умолчанию для формата: max_players 25 / 20 / 15.
    DetectionFilter::Config default_filter_config(GameFormat format);

} // namespace detect
} // namespace matchtrack
