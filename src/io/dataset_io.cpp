#include "matchtrack/io/dataset_io.h"

#include "matchtrack/core/errors.h"
#include "matchtrack/detect/color.h"
#include "matchtrack/geometry/pitch_zones.h"

#include <opencv2/core.hpp>

#include <algorithm>
#include <set>

namespace matchtrack {
namespace io {

namespace {

// ---------------------------------------------------------------------------
// чтение
// ---------------------------------------------------------------------------

cv::FileNode require(const cv::FileNode &node, const char *key, const std::string &where) {
    cv::FileNode n = node[key];
    if (n.empty()) {
        throw ValidationError(where + ": missing " + key, ErrorCode::MissingField);
    }
    return n;
}

double read_number(const cv::FileNode &node, const char *key, const std::string &where) {
    cv::FileNode n = require(node, key, where);
    if (!n.isReal() && !n.isInt()) {
        throw ValidationError(where + ": " + key + " is not a number", ErrorCode::InvalidFormat);
    }
    return n.real();
}

int read_int(const cv::FileNode &node, const char *key, const std::string &where) {
    cv::FileNode n = require(node, key, where);
    if (!n.isInt()) {
        throw ValidationError(where + ": " + key + " is not an integer", ErrorCode::InvalidFormat);
    }
    return (int)n;
}

std::string read_string(const cv::FileNode &node, const char *key, const std::string &where) {
    cv::FileNode n = require(node, key, where);
    if (!n.isString()) {
        throw ValidationError(where + ": " + key + " is not a string", ErrorCode::InvalidFormat);
    }
    return (std::string)n;
}

bool optional_number(const cv::FileNode &node, const char *key, const std::string &where, double &out) {
    if (node[key].empty()) return false;
    out = read_number(node, key, where);
    return true;
}

bool optional_string(const cv::FileNode &node, const char *key, const std::string &where, std::string &out) {
    if (node[key].empty()) return false;
    out = read_string(node, key, where);
    return true;
}

// Необязательная секция должна быть последовательностью, если она есть.
cv::FileNode sequence(const cv::FileNode &root, const char *key, bool required) {
    cv::FileNode n = root[key];
    if (n.empty()) {
        if (required) throw ValidationError(std::string("dataset: missing ") + key, ErrorCode::MissingField);
        return n;
    }
    if (!n.isSeq()) {
        throw ValidationError(std::string("dataset: ") + key + " is not a sequence", ErrorCode::InvalidFormat);
    }
    return n;
}

Detection read_detection(const cv::FileNode &node, const std::string &where) {
    const cv::Rect2f bbox((float)read_number(node, "x", where), (float)read_number(node, "y", where),
                          (float)read_number(node, "w", where), (float)read_number(node, "h", where));
    Detection d = make_detection(bbox, (float)read_number(node, "confidence", where));
    optional_string(node, "label", where, d.label);
    optional_string(node, "track_id", where, d.track_id);

    double cls = 0.0;
    if (optional_number(node, "class_confidence", where, cls)) d.class_confidence = (float)cls;

    std::string color;
    if (optional_string(node, "color", where, color)) d.jersey_color = detect::hex_to_rgb(color);
    return d;
}

void read_frames(const cv::FileNode &root, Dataset &ds, std::set<int> &frames) {
    for (const auto &f : sequence(root, "frames", true)) {
        const int frame = read_int(f, "frame", "frames");
        const std::string where = "frame " + std::to_string(frame);
        frames.insert(frame);

        std::vector<Detection> &dets = ds.players[frame];
        cv::FileNode list = f["detections"];
        if (list.empty()) continue;
        if (!list.isSeq()) {
            throw ValidationError(where + ": detections is not a sequence", ErrorCode::InvalidFormat);
        }
        for (const auto &d : list) {
            dets.push_back(read_detection(d, where));
        }
    }
}

void read_ball(const cv::FileNode &root, Dataset &ds, std::set<int> &frames) {
    for (const auto &b : sequence(root, "ball", false)) {
        const int frame = read_int(b, "frame", "ball");
        const std::string where = "ball frame " + std::to_string(frame);

        Detection d;
        d.center = cv::Point2f((float)read_number(b, "x", where), (float)read_number(b, "y", where));
        d.bbox = cv::Rect2f(d.center.x, d.center.y, 0.0f, 0.0f);
        d.confidence = (float)read_number(b, "confidence", where);
        d.label = "ball";
        ds.ball[frame] = d;
        frames.insert(frame);
    }
}

void read_homographies(const cv::FileNode &root, Dataset &ds) {
    for (const auto &h : sequence(root, "homographies", false)) {
        const int frame = read_int(h, "frame", "homographies");
        const std::string where = "homography " + std::to_string(frame);

        std::vector<geometry::Keypoint> keypoints;
        for (const auto &k : require(h, "keypoints", where)) {
            geometry::Keypoint kp;
            optional_string(k, "label", where, kp.label);
            kp.screen = cv::Point2f((float)read_number(k, "sx", where), (float)read_number(k, "sy", where));
            kp.field = cv::Point2f((float)read_number(k, "fx", where), (float)read_number(k, "fy", where));
            double conf = 1.0;
            optional_number(k, "confidence", where, conf);
            kp.confidence = (float)conf;
            keypoints.push_back(kp);
        }
        ds.input.homographies.push_back(geometry::create_homography_data(frame, keypoints, std::nullopt));
    }
    std::sort(ds.input.homographies.begin(), ds.input.homographies.end(),
              [](const geometry::HomographyData &a, const geometry::HomographyData &b) {
                  return a.frame_number < b.frame_number;
              });
}

void read_identities(const cv::FileNode &root, Dataset &ds) {
    for (const auto &p : sequence(root, "players", false)) {
        ds.input.players[read_string(p, "track_id", "players")] = read_string(p, "player_id", "players");
    }
    for (const auto &r : sequence(root, "roster", false)) {
        detect::RosterEntry e;
        e.jersey_number = read_int(r, "jersey_number", "roster");
        e.team = parse_team_id(read_string(r, "team", "roster"));
        ds.input.roster.push_back(e);
    }
    for (const auto &j : sequence(root, "jersey_numbers", false)) {
        ds.input.jersey_numbers[read_string(j, "track_id", "jersey_numbers")] = read_int(j, "number", "jersey_numbers");
    }
}

dedup::RawEvent read_raw_event(const cv::FileNode &node, const std::string &match_id, size_t index) {
    const std::string where = "raw event " + std::to_string(index);
    dedup::RawEvent e;
    e.match_id = match_id;
    optional_string(node, "match_id", where, e.match_id);
    e.window_id = read_string(node, "window_id", where);
    e.absolute_timestamp = read_number(node, "absolute_timestamp", where);
    e.relative_timestamp = e.absolute_timestamp;
    optional_number(node, "relative_timestamp", where, e.relative_timestamp);

    const std::string type = read_string(node, "type", where);
    if (!dedup::parse_event_type(type, e.type)) {
        throw ValidationError(where + ": unknown type " + type, ErrorCode::InvalidFormat);
    }
    std::string text;
    if (optional_string(node, "team", where, text)) e.team = parse_team_id(text);
    if (optional_string(node, "player", where, text)) e.player = text;
    if (optional_string(node, "zone", where, text)) {
        geometry::Zone zone;
        if (!geometry::parse_zone(text, zone)) {
            throw ValidationError(where + ": unknown zone " + text, ErrorCode::InvalidFormat);
        }
        e.zone = zone;
    }

    double x = 0.0, y = 0.0, v = 0.0;
    if (optional_number(node, "x", where, x) && optional_number(node, "y", where, y)) {
        e.position = cv::Point2f((float)x, (float)y);
    }
    if (optional_number(node, "position_confidence", where, v)) e.position_confidence = (float)v;
    if (optional_number(node, "window_confidence", where, v)) e.window_confidence = (float)v;
    e.confidence = (float)read_number(node, "confidence", where);
    optional_string(node, "visual_evidence", where, e.visual_evidence);

    cv::FileNode details = node["details"];
    if (!details.empty()) {
        if (!details.isMap()) {
            throw ValidationError(where + ": details is not a map", ErrorCode::InvalidFormat);
        }
        for (const auto &kv : details) {
            e.details[kv.name()] = (std::string)kv;
        }
    }
    return e;
}

void read_windows(const cv::FileNode &root, Dataset &ds) {
    size_t i = 0;
    for (const auto &r : sequence(root, "raw_events", false)) {
        ds.input.raw_events.push_back(read_raw_event(r, ds.input.match_id, i++));
    }
    for (const auto &w : sequence(root, "windows", false)) {
        const std::string where = "windows";
        dedup::AnalysisWindow win;
        win.window_id = read_string(w, "window_id", where);
        win.absolute_start = read_number(w, "absolute_start", where);
        win.absolute_end = read_number(w, "absolute_end", where);
        optional_number(w, "overlap_before", where, win.overlap_before);
        optional_number(w, "overlap_after", where, win.overlap_after);
        double fps = win.target_fps;
        if (optional_number(w, "target_fps", where, fps)) win.target_fps = (int)fps;
        std::string text;
        if (optional_string(w, "segment_type", where, text) && !dedup::parse_segment_type(text, win.segment_type)) {
            throw ValidationError(where + ": unknown segment_type " + text, ErrorCode::InvalidFormat);
        }
        optional_string(w, "segment_id", where, win.segment_id);
        ds.input.windows.push_back(win);
    }
}

// ---------------------------------------------------------------------------
// запись
// ---------------------------------------------------------------------------

void write_point(cv::FileStorage &fs, const cv::Point2f &p) {
    fs.write("x", (double)p.x);
    fs.write("y", (double)p.y);
}

void write_player(cv::FileStorage &fs, const char *name, const events::PlayerRef &p) {
    fs << name << "{";
    fs.write("track_id", p.track_id);
    if (p.player_id) fs.write("player_id", *p.player_id);
    fs.write("team", std::string(to_string(p.team)));
    write_point(fs, p.position);
    fs.write("confidence", (double)p.confidence);
    fs << "}";
}

void write_filter_totals(cv::FileStorage &fs, const detect::FilterStats &st) {
    fs << "filter_totals" << "{";
    fs.write("input", st.input);
    fs.write("confidence_filtered", st.confidence_filtered);
    fs.write("pitch_filtered", st.pitch_filtered);
    fs.write("color_filtered", st.color_filtered);
    fs.write("motion_filtered", st.motion_filtered);
    fs.write("roster_filtered", st.roster_filtered);
    fs.write("top_n_filtered", st.top_n_filtered);
    fs.write("output", st.output);
    fs << "}";
}

void write_ball(cv::FileStorage &fs, const BallTrack &ball) {
    fs << "ball_track" << "{";
    fs.write("model_id", ball.model_id);
    fs.write("avg_confidence", (double)ball.avg_confidence);
    fs.write("visibility_rate", (double)ball.visibility_rate);
    fs << "detections" << "[";
    for (const auto &b : ball.detections) {
        fs << "{";
        fs.write("frame", b.frame_number);
        fs.write("timestamp", b.timestamp);
        write_point(fs, b.position);
        fs.write("confidence", (double)b.confidence);
        fs.write("visible", (int)b.visible);
        fs.write("interpolated", (int)b.interpolated);
        fs << "}";
    }
    fs << "]" << "}";
}

void write_teams(cv::FileStorage &fs, const pipeline::MatchOutput &out) {
    fs << "team_classification" << "{";
    fs.write("home_color", out.teams.home_color);
    fs.write("away_color", out.teams.away_color);
    fs.write("confidence", (double)out.teams.confidence);
    fs << "clusters" << "[";
    for (const auto &c : out.teams.clusters) {
        fs << "{";
        fs.write("id", c.id);
        fs.write("centroid", detect::rgb_to_hex(c.centroid));
        fs.write("size", (int)c.samples.size());
        fs.write("avg_distance", (double)c.avg_distance);
        fs << "}";
    }
    fs << "]" << "}";

    fs << "team_metas" << "[";
    for (const auto &m : out.team_metas) {
        fs << "{";
        fs.write("track_id", m.track_id);
        fs.write("team", std::string(to_string(m.team)));
        fs.write("team_confidence", (double)m.team_confidence);
        if (m.dominant_color) fs.write("dominant_color", *m.dominant_color);
        fs.write("classification_method", m.classification_method);
        fs << "}";
    }
    fs << "]";
}

void write_events(cv::FileStorage &fs, const events::DetectedEvents &ev) {
    fs << "possession_segments" << "[";
    for (const auto &s : ev.possession_segments) {
        fs << "{";
        fs.write("track_id", s.track_id);
        if (s.player_id) fs.write("player_id", *s.player_id);
        fs.write("team", std::string(to_string(s.team)));
        fs.write("start_frame", s.start_frame);
        fs.write("end_frame", s.end_frame);
        fs.write("start_time", s.start_time);
        fs.write("end_time", s.end_time);
        fs.write("frame_count", s.frame_count);
        fs.write("confidence", (double)s.confidence);
        fs.write("end_reason", std::string(events::to_string(s.end_reason)));
        fs << "}";
    }
    fs << "]";

    fs << "pass_events" << "[";
    for (const auto &p : ev.pass_events) {
        fs << "{";
        fs.write("event_id", p.event_id);
        fs.write("frame", p.frame_number);
        fs.write("timestamp", p.timestamp);
        write_player(fs, "kicker", p.kicker);
        if (p.receiver) write_player(fs, "receiver", *p.receiver);
        fs.write("outcome", std::string(events::to_string(p.outcome)));
        fs.write("outcome_confidence", (double)p.outcome_confidence);
        fs.write("confidence", (double)p.confidence);
        fs.write("needs_review", (int)p.needs_review);
        if (!p.review_reason.empty()) fs.write("review_reason", p.review_reason);
        fs.write("source", p.source);
        fs.write("version", p.version);
        fs << "}";
    }
    fs << "]";

    fs << "carry_events" << "[";
    for (const auto &c : ev.carry_events) {
        fs << "{";
        fs.write("event_id", c.event_id);
        fs.write("track_id", c.track_id);
        if (c.player_id) fs.write("player_id", *c.player_id);
        fs.write("team", std::string(to_string(c.team)));
        fs.write("start_frame", c.start_frame);
        fs.write("end_frame", c.end_frame);
        fs.write("start_time", c.start_time);
        fs.write("end_time", c.end_time);
        fs << "start_position" << "{";
        write_point(fs, c.start_position);
        fs << "}";
        fs << "end_position" << "{";
        write_point(fs, c.end_position);
        fs << "}";
        fs.write("carry_index", (double)c.carry_index);
        fs.write("progress_index", (double)c.progress_index);
        fs.write("confidence", (double)c.confidence);
        fs.write("version", c.version);
        fs << "}";
    }
    fs << "]";

    fs << "turnover_events" << "[";
    for (const auto &t : ev.turnover_events) {
        fs << "{";
        fs.write("event_id", t.event_id);
        fs.write("turnover_type", std::string(events::to_string(t.turnover_type)));
        fs.write("frame", t.frame_number);
        fs.write("timestamp", t.timestamp);
        write_player(fs, "player", t.player);
        write_player(fs, "other_player", t.other_player);
        fs.write("context", t.context);
        fs.write("confidence", (double)t.confidence);
        fs.write("needs_review", (int)t.needs_review);
        fs.write("version", t.version);
        fs << "}";
    }
    fs << "]";
}

void write_reviews(cv::FileStorage &fs, const std::vector<events::PendingReview> &reviews) {
    fs << "pending_reviews" << "[";
    for (const auto &r : reviews) {
        fs << "{";
        fs.write("event_id", r.event_id);
        fs.write("event_type", r.event_type);
        fs.write("reason", std::string(events::to_string(r.reason)));
        fs.write("resolved", (int)r.resolved);
        fs << "candidates" << "[";
        for (const auto &c : r.candidates) {
            fs << "{";
            fs.write("track_id", c.track_id);
            if (c.player_id) fs.write("player_id", *c.player_id);
            fs.write("confidence", (double)c.confidence);
            fs << "}";
        }
        fs << "]" << "}";
    }
    fs << "]";
}

void write_issue(cv::FileStorage &fs, const dedup::ValidationIssue &issue, bool with_severity) {
    fs << "{";
    fs.write("type", std::string(dedup::to_string(issue.type)));
    fs.write("message", issue.message);
    fs.write("event_index", issue.event_index);
    if (issue.related_index) fs.write("related_index", *issue.related_index);
    if (with_severity) fs.write("severity", std::string(dedup::to_string(issue.severity)));
    fs << "}";
}

void write_dedup(cv::FileStorage &fs, const pipeline::MatchOutput &out) {
    fs << "deduplicated_events" << "[";
    for (const auto &e : out.dedup_events) {
        fs << "{";
        fs.write("timestamp", e.absolute_timestamp);
        fs.write("type", std::string(dedup::to_string(e.type)));
        fs.write("team", std::string(to_string(e.team)));
        if (e.player) fs.write("player", *e.player);
        if (e.zone) fs.write("zone", std::string(geometry::to_string(*e.zone)));
        if (!e.details.empty()) {
            fs << "details" << "{";
            for (const auto &kv : e.details) fs.write(kv.first, kv.second);
            fs << "}";
        }
        if (!e.visual_evidence.empty()) fs.write("visual_evidence", e.visual_evidence);
        fs.write("confidence", (double)e.confidence);
        fs.write("adjusted_confidence", (double)e.adjusted_confidence);
        fs.write("ensemble_confidence", (double)e.ensemble_confidence);
        fs.write("merged_from_windows", e.merged_from_windows);
        if (e.merged_position) {
            fs << "position" << "{";
            write_point(fs, *e.merged_position);
            if (e.position_source) fs.write("source", std::string(geometry::to_string(*e.position_source)));
            if (e.merged_position_confidence) fs.write("confidence", (double)*e.merged_position_confidence);
            fs << "}";
        }
        fs << "}";
    }
    fs << "]";

    const dedup::DedupStats &st = out.dedup_stats;
    fs << "dedup_stats" << "{";
    fs.write("total_raw", st.total_raw);
    fs.write("total_deduplicated", st.total_deduplicated);
    fs.write("merged_count", st.merged_count);
    fs.write("unique_count", st.unique_count);
    fs.write("average_cluster_size", (double)st.average_cluster_size);
    fs << "by_type" << "[";
    for (const auto &kv : st.by_type) {
        fs << "{";
        fs.write("type", std::string(dedup::to_string(kv.first)));
        fs.write("raw", kv.second.raw);
        fs.write("deduplicated", kv.second.deduplicated);
        fs.write("merged_count", kv.second.merged_count);
        fs << "}";
    }
    fs << "]" << "}";

    fs << "validation" << "{";
    fs.write("valid", (int)out.validation.valid);
    fs << "errors" << "[";
    for (const auto &e : out.validation.errors) write_issue(fs, e, false);
    fs << "]";
    fs << "warnings" << "[";
    for (const auto &w : out.validation.warnings) write_issue(fs, w, true);
    fs << "]";
    fs.write("summary", dedup::summarize_validation_result(out.validation));
    fs << "}";
}

} // namespace

Dataset read_dataset(const std::string &path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception &e) {
        throw ValidationError("dataset " + path + ": " + e.what(), ErrorCode::InvalidFormat);
    }
    if (!fs.isOpened()) {
        throw ValidationError("dataset " + path + ": cannot open", ErrorCode::InvalidFormat);
    }

    const cv::FileNode root = fs.root();
    Dataset ds;
    ds.input.match_id = read_string(root, "match_id", "dataset");
    ds.input.frame_size = cv::Size(read_int(root, "frame_width", "dataset"), read_int(root, "frame_height", "dataset"));

    std::set<int> frames;
    read_frames(root, ds, frames);
    read_ball(root, ds, frames);
    read_homographies(root, ds);
    read_identities(root, ds);
    read_windows(root, ds);

    ds.input.frames.assign(frames.begin(), frames.end());
    return ds;
}

void write_result(const std::string &path, const pipeline::MatchOutput &out) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::WRITE);
    } catch (const cv::Exception &e) {
        throw ValidationError("result " + path + ": " + e.what(), ErrorCode::InvalidFormat);
    }
    if (!fs.isOpened()) {
        throw ValidationError("result " + path + ": cannot open for writing", ErrorCode::InvalidFormat);
    }

    fs.write("match_id", out.match_id);
    fs.write("version", std::string(MATCHTRACK_VERSION));
    fs.write("tracker_id", out.tracker_id);
    fs.write("player_model_id", out.player_model_id);
    write_filter_totals(fs, out.filter_totals);
    write_ball(fs, out.ball);
    write_teams(fs, out);
    write_events(fs, out.events);
    write_reviews(fs, out.reviews);
    write_dedup(fs, out);
    fs.release();
}

} // namespace io
} // namespace matchtrack
