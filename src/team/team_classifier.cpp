#include "matchtrack/team/team_classifier.h"

#include <algorithm>
#include <cmath>

namespace matchtrack {
namespace team {

const char* to_string(TeamLabel label) {
    switch (label) {
        case TeamLabel::Home: return "home";
        case TeamLabel::Away: return "away";
        case TeamLabel::Referee: return "referee";
        case TeamLabel::Unknown: break;
    }
    return "unknown";
}

TeamId to_team_id(TeamLabel label) {
    if (label == TeamLabel::Home) return TeamId::Home;
    if (label == TeamLabel::Away) return TeamId::Away;
    return TeamId::Unknown;
}

cv::Rect2f jersey_region(const cv::Rect2f& bbox, const JerseyRegion& region) {
    return cv::Rect2f(bbox.x + bbox.width * region.left,
                      bbox.y + bbox.height * region.top,
                      bbox.width * (region.right - region.left),
                      bbox.height * (region.bottom - region.top));
}

Rgb extract_dominant_color(const cv::Mat& frame_bgr, const cv::Rect2f& bbox, const JerseyRegion& region) {
    if (frame_bgr.empty() || frame_bgr.channels() != 3) return Rgb{};

    const cv::Rect2f r = jersey_region(bbox, region);
    const float fw = (float)frame_bgr.cols;
    const float fh = (float)frame_bgr.rows;
    cv::Rect px((int)std::floor(r.x * fw),
                (int)std::floor(r.y * fh),
                (int)std::ceil(r.width * fw),
                (int)std::ceil(r.height * fh));
    px &= cv::Rect(0, 0, frame_bgr.cols, frame_bgr.rows);
    if (px.area() <= 0) return Rgb{};

    const cv::Scalar m = cv::mean(frame_bgr(px));
    return Rgb{(int)std::lround(m[2]), (int)std::lround(m[1]), (int)std::lround(m[0])};
}

std::vector<ColorSample> collect_track_samples(const std::map<std::string, Track>& tracks) {
    std::vector<ColorSample> out;
    for (const auto& kv : tracks) {
        for (const auto& f : kv.second.frames) {
            if (!f.second.jersey_color) continue;
            ColorSample s;
            s.track_id = kv.first;
            s.color = *f.second.jersey_color;
            s.position = f.second.center;
            out.push_back(s);
        }
    }
    return out;
}

std::vector<ColorSample> average_track_samples(const std::vector<ColorSample>& samples) {
    struct Acc {
        double r = 0, g = 0, b = 0, x = 0, y = 0;
        int n = 0;
    };
    std::map<std::string, Acc> acc;
    for (const auto& s : samples) {
        if (detect::is_neutral(s.color)) continue;
        Acc& a = acc[s.track_id];
        a.r += s.color.r;
        a.g += s.color.g;
        a.b += s.color.b;
        a.x += s.position.x;
        a.y += s.position.y;
        a.n += 1;
    }

    std::vector<ColorSample> out;
    out.reserve(acc.size());
    for (const auto& kv : acc) {
        const Acc& a = kv.second;
        ColorSample s;
        s.track_id = kv.first;
        s.color = Rgb{(int)std::lround(a.r / a.n), (int)std::lround(a.g / a.n), (int)std::lround(a.b / a.n)};
        s.position = cv::Point2f((float)(a.x / a.n), (float)(a.y / a.n));
        out.push_back(s);
    }
    return out;
}

TeamClassification classify_teams_by_color(const std::vector<ColorSample>& samples,
                                           const KMeansConfig& cfg,
                                           cv::RNG& rng,
                                           const std::optional<detect::TeamColors>& reference) {
    TeamClassification out;

    std::vector<Cluster> clusters = kmeans_clustering(samples, cfg, rng);
    if ((int)samples.size() < cfg.min_samples || clusters.size() < 2) {
        for (const auto& s : samples) out.assignments[s.track_id] = TeamLabel::Unknown;
        out.clusters = clusters;
        return out;
    }

    int home_idx = 0;
    int away_idx = 1;
    if (reference) {
        const float keep = cluster_distance(clusters[0].centroid, reference->home, cfg) +
                           cluster_distance(clusters[1].centroid, reference->away, cfg);
        const float swap = cluster_distance(clusters[0].centroid, reference->away, cfg) +
                           cluster_distance(clusters[1].centroid, reference->home, cfg);
        if (swap < keep) std::swap(home_idx, away_idx);
    }

    for (size_t c = 0; c < clusters.size(); ++c) {
        TeamLabel label = TeamLabel::Referee;
        if ((int)c == home_idx) label = TeamLabel::Home;
        else if ((int)c == away_idx) label = TeamLabel::Away;
        for (const auto& s : clusters[c].samples) out.assignments[s.track_id] = label;
    }

    const Cluster& home = clusters[home_idx];
    const Cluster& away = clusters[away_idx];
    const float separation = cluster_distance(home.centroid, away.centroid, cfg);
    const float intra = (home.avg_distance + away.avg_distance) / 2.0f;
    const float ratio = separation / (intra + 0.001f);
    out.confidence = std::min(1.0f, std::max(0.0f, ratio - 1.0f) / 2.0f);

    out.home_color = detect::rgb_to_hex(home.centroid);
    out.away_color = detect::rgb_to_hex(away.centroid);
    out.clusters = std::move(clusters);
    return out;
}

std::vector<TrackTeamMeta> build_team_metas(const std::vector<std::string>& track_ids,
                                            const TeamClassification& classification,
                                            const std::vector<ColorSample>& track_samples) {
    std::map<std::string, Rgb> colors;
    for (const auto& s : track_samples) colors[s.track_id] = s.color;

    std::vector<TrackTeamMeta> out;
    out.reserve(track_ids.size());
    for (const auto& id : track_ids) {
        TrackTeamMeta meta;
        meta.track_id = id;

        auto it = classification.assignments.find(id);
        const TeamLabel label = it == classification.assignments.end() ? TeamLabel::Unknown : it->second;
        meta.team = to_team_id(label);
        meta.team_confidence = meta.team == TeamId::Unknown ? 0.0f : classification.confidence;

        auto c = colors.find(id);
        if (c != colors.end()) meta.dominant_color = detect::rgb_to_hex(c->second);
        out.push_back(meta);
    }
    return out;
}

} // namespace team
} // namespace matchtrack
