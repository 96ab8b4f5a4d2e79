#include "matchtrack/detect/detection_filter.h"
#include "matchtrack/util/rect_utils.h"

#include <algorithm>
#include <iostream>
#include <set>

namespace matchtrack {
namespace detect {

    // ---------------- MotionHistory ----------------

    void MotionHistory::update(const std::vector<Detection>& dets,
                               int frame_number,
                               int window_frames,
                               const cv::Size& frame_size) {
        for (const auto& d : dets) {
            if (d.track_id.empty()) continue;

            auto& entries = history_[d.track_id];
            entries.push_back(MotionEntry{util::toPixels(d.center, frame_size), frame_number});

            while (!entries.empty() && frame_number - entries.front().frame_number > window_frames) {
                entries.pop_front();
            }
        }
    }

    bool MotionHistory::movement(const std::string& track_id, float& out) const {
        auto it = history_.find(track_id);
        // одна точка ещё не история: путь не измерить
        if (it == history_.end() || it->second.size() < 2) return false;

        std::vector<cv::Point2f> pts;
        pts.reserve(it->second.size());
        for (const auto& e : it->second) pts.push_back(e.position);
        out = util::pathLength(pts);
        return true;
    }

    const std::deque<MotionEntry>* MotionHistory::entries(const std::string& track_id) const {
        auto it = history_.find(track_id);
        return it == history_.end() ? nullptr : &it->second;
    }

    void MotionHistory::prune_stale(int current_frame, int max_stale) {
        for (auto it = history_.begin(); it != history_.end();) {
            if (it->second.empty() || current_frame - it->second.back().frame_number > max_stale) {
                it = history_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // ---------------- FilterStats ----------------

    FilterStats& FilterStats::operator+=(const FilterStats& o) {
        input += o.input;
        confidence_filtered += o.confidence_filtered;
        pitch_filtered += o.pitch_filtered;
        color_filtered += o.color_filtered;
        motion_filtered += o.motion_filtered;
        roster_filtered += o.roster_filtered;
        top_n_filtered += o.top_n_filtered;
        output += o.output;
        return *this;
    }

    // ---------------- stages ----------------

    std::vector<Detection> filter_by_confidence(const std::vector<Detection>& dets, float min_confidence) {
        std::vector<Detection> out;
        out.reserve(dets.size());
        for (const auto& d : dets) {
            if (d.confidence >= min_confidence) out.push_back(d);
        }
        return out;
    }

    std::vector<Detection> filter_by_pitch(const std::vector<Detection>& dets,
                                           const geometry::HomographyData& homography,
                                           const geometry::FieldSize& field_size) {
        std::vector<Detection> out;
        out.reserve(dets.size());
        for (const auto& d : dets) {
            const auto field = geometry::screen_to_field(homography, d.center);
            if (field && geometry::is_on_pitch(*field, field_size)) out.push_back(d);
        }
        return out;
    }

    std::vector<Detection> filter_by_team_color(const std::vector<Detection>& dets,
                                                const TeamColors* /*team_colors*/,
                                                float /*similarity_threshold*/) {
        return dets;
    }

    std::vector<Detection> filter_by_motion(const std::vector<Detection>& dets,
                                            const MotionHistory& history,
                                            float min_movement) {
        std::vector<Detection> out;
        out.reserve(dets.size());
        for (const auto& d : dets) {
            float moved = 0.0f;
            if (d.track_id.empty() || !history.movement(d.track_id, moved) || moved >= min_movement) {
                out.push_back(d);
            }
        }
        return out;
    }

    std::vector<Detection> filter_by_roster(const std::vector<Detection>& dets,
                                            const std::vector<RosterEntry>& roster,
                                            const std::map<std::string, int>& jersey_numbers) {
        std::set<int> known;
        for (const auto& r : roster) known.insert(r.jersey_number);

        std::vector<Detection> out;
        out.reserve(dets.size());
        for (const auto& d : dets) {
            auto it = d.track_id.empty() ? jersey_numbers.end() : jersey_numbers.find(d.track_id);
            // номер не распознан -> пропускаем
            if (it == jersey_numbers.end() || known.count(it->second)) out.push_back(d);
        }
        return out;
    }

    std::vector<Detection> filter_top_n(const std::vector<Detection>& dets, int max_count) {
        std::vector<Detection> out = dets;
        std::stable_sort(out.begin(), out.end(),
                         [](const Detection& a, const Detection& b) { return a.confidence > b.confidence; });
        if (max_count >= 0 && (int)out.size() > max_count) out.resize(max_count);
        return out;
    }

    // ---------------- DetectionFilter ----------------

    DetectionFilter::Config default_filter_config(GameFormat format) {
        DetectionFilter::Config cfg;
        cfg.game_format = format;
        switch (format) {
            case GameFormat::Eleven: cfg.max_players = 25; break;
            case GameFormat::Eight: cfg.max_players = 20; break;
            case GameFormat::Five: cfg.max_players = 15; break;
        }
        return cfg;
    }

    DetectionFilter::DetectionFilter(Config cfg, MotionHistory* history)
        : cfg_(cfg), history_(history) {}

    std::vector<Detection> DetectionFilter::process(const std::vector<Detection>& dets, const FrameContext& ctx) {
        FilterStats st;
        st.input = (int)dets.size();

        std::vector<Detection> cur = filter_by_confidence(dets, cfg_.min_confidence);
        st.confidence_filtered = st.input - (int)cur.size();

        if (cfg_.filter_outside_pitch && ctx.homography) {
            const geometry::FieldSize size = ctx.homography->field_size
                                             ? *ctx.homography->field_size
                                             : geometry::field_dimensions(cfg_.game_format);
            const int before = (int)cur.size();
            cur = filter_by_pitch(cur, *ctx.homography, size);
            st.pitch_filtered = before - (int)cur.size();
        }

        {
            const int before = (int)cur.size();
            cur = filter_by_team_color(cur, ctx.team_colors, cfg_.color_similarity_threshold);
            st.color_filtered = before - (int)cur.size();
        }

        if (history_) {
            history_->update(cur, ctx.frame_number, cfg_.motion_window_frames, ctx.frame_size);
            const int before = (int)cur.size();
            cur = filter_by_motion(cur, *history_, cfg_.min_movement);
            st.motion_filtered = before - (int)cur.size();
        }

        if (ctx.roster && !ctx.roster->empty() && ctx.jersey_numbers) {
            const int before = (int)cur.size();
            cur = filter_by_roster(cur, *ctx.roster, *ctx.jersey_numbers);
            st.roster_filtered = before - (int)cur.size();
        }

        {
            const int before = (int)cur.size();
            cur = filter_top_n(cur, cfg_.max_players);
            st.top_n_filtered = before - (int)cur.size();
        }

        st.output = (int)cur.size();
        last_ = st;
        total_ += st;

        if (cfg_.log) {
            std::cout << "[FLT] frame=" << ctx.frame_number
                      << " in=" << st.input
                      << " conf=-" << st.confidence_filtered
                      << " pitch=-" << st.pitch_filtered
                      << " color=-" << st.color_filtered
                      << " motion=-" << st.motion_filtered
                      << " roster=-" << st.roster_filtered
                      << " topn=-" << st.top_n_filtered
                      << " out=" << st.output << std::endl;
        }
        return cur;
    }

} // namespace detect
} // namespace matchtrack
