#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include <opencv2/core.hpp>

#include "matchtrack/core/errors.h"
#include "matchtrack/geometry/homography.h"
#include "matchtrack/io/dataset_io.h"

using namespace matchtrack;

namespace {

const char *kDataset = R"({
    "match_id": "m-test",
    "frame_width": 1920,
    "frame_height": 1080,
    "frames": [
        { "frame": 0, "detections": [
            { "x": 0.1, "y": 0.2, "w": 0.05, "h": 0.1, "confidence": 0.9,
              "label": "player", "track_id": "d1", "color": "#ff0000" } ] },
        { "frame": 1 }
    ],
    "ball": [ { "frame": 2, "x": 0.5, "y": 0.4, "confidence": 0.8 } ],
    "homographies": [ { "frame": 0, "keypoints": [
        { "label": "corner_tl", "sx": 0.0, "sy": 0.0, "fx": -52.5, "fy": -34.0 },
        { "label": "corner_tr", "sx": 1.0, "sy": 0.0, "fx": 52.5, "fy": -34.0 },
        { "label": "corner_br", "sx": 1.0, "sy": 1.0, "fx": 52.5, "fy": 34.0 },
        { "label": "corner_bl", "sx": 0.0, "sy": 1.0, "fx": -52.5, "fy": 34.0, "confidence": 0.6 } ] } ],
    "players": [ { "track_id": "t1", "player_id": "p-9" } ],
    "roster": [ { "jersey_number": 9, "team": "home" } ],
    "jersey_numbers": [ { "track_id": "d1", "number": 9 } ],
    "raw_events": [
        { "window_id": "w0", "absolute_timestamp": 12.5, "relative_timestamp": 12.5, "type": "pass",
          "confidence": 0.7, "team": "away", "zone": "middle_third", "x": 0.4, "y": 0.6,
          "position_confidence": 0.5, "details": { "outcome": "complete" } }
    ],
    "windows": [
        { "window_id": "w0", "absolute_start": 0.0, "absolute_end": 60.0, "overlap_after": 15.0,
          "target_fps": 3, "segment_type": "active_play", "segment_id": "s1" }
    ]
})";

std::string write_file(const std::string &name, const std::string &text) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << text;
    return path;
}

std::string replaced(std::string text, const std::string &from, const std::string &to) {
    const size_t pos = text.find(from);
    if (pos != std::string::npos) text.replace(pos, from.size(), to);
    return text;
}

} // namespace

TEST(DatasetIo, ReadsAllSections) {
    const io::Dataset ds = io::read_dataset(write_file("matchtrack_dataset.json", kDataset));

    EXPECT_EQ(ds.input.match_id, "m-test");
    EXPECT_EQ(ds.input.frame_size, cv::Size(1920, 1080));
    ASSERT_EQ(ds.input.frames.size(), 3u);
    EXPECT_EQ(ds.input.frames[2], 2);

    ASSERT_EQ(ds.players.at(0).size(), 1u);
    const Detection &d = ds.players.at(0)[0];
    EXPECT_EQ(d.track_id, "d1");
    EXPECT_FLOAT_EQ(d.confidence, 0.9f);
    ASSERT_TRUE(d.jersey_color.has_value());
    EXPECT_EQ(d.jersey_color->r, 255);
    EXPECT_TRUE(ds.players.at(1).empty());

    ASSERT_EQ(ds.ball.count(2), 1u);
    EXPECT_FLOAT_EQ(ds.ball.at(2).center.y, 0.4f);
    EXPECT_EQ(ds.ball.at(2).label, "ball");

    ASSERT_EQ(ds.input.homographies.size(), 1u);
    const auto mid = geometry::screen_to_field(ds.input.homographies[0], cv::Point2f(0.5f, 0.5f));
    ASSERT_TRUE(mid.has_value());
    EXPECT_NEAR(mid->x, 0.0f, 1e-3);
    EXPECT_NEAR(mid->y, 0.0f, 1e-3);
    EXPECT_NEAR(ds.input.homographies[0].confidence, 0.9f, 1e-6);

    EXPECT_EQ(ds.input.players.at("t1"), "p-9");
    ASSERT_EQ(ds.input.roster.size(), 1u);
    EXPECT_EQ(ds.input.roster[0].team, TeamId::Home);
    EXPECT_EQ(ds.input.jersey_numbers.at("d1"), 9);

    ASSERT_EQ(ds.input.raw_events.size(), 1u);
    const dedup::RawEvent &e = ds.input.raw_events[0];
    EXPECT_EQ(e.match_id, "m-test");
    EXPECT_EQ(e.type, dedup::EventType::Pass);
    EXPECT_EQ(e.team, TeamId::Away);
    ASSERT_TRUE(e.zone.has_value());
    EXPECT_EQ(*e.zone, geometry::Zone::Middle);
    ASSERT_TRUE(e.position.has_value());
    EXPECT_FLOAT_EQ(e.position->y, 0.6f);
    EXPECT_EQ(e.details.at("outcome"), "complete");
    EXPECT_FALSE(e.window_confidence.has_value());

    ASSERT_EQ(ds.input.windows.size(), 1u);
    EXPECT_DOUBLE_EQ(ds.input.windows[0].overlap_after, 15.0);
    EXPECT_EQ(ds.input.windows[0].segment_id, "s1");
}

TEST(DatasetIo, StructuralErrors) {
    try {
        io::read_dataset(write_file("matchtrack_no_id.json", replaced(kDataset, "\"match_id\": \"m-test\",", "")));
        FAIL() << "dataset without match_id accepted";
    } catch (const ValidationError &e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingField);
    }

    EXPECT_THROW(io::read_dataset(write_file("matchtrack_bad_type.json",
                                             replaced(kDataset, "\"type\": \"pass\"", "\"type\": \"header\""))),
                 ValidationError);
    EXPECT_THROW(io::read_dataset(write_file("matchtrack_bad_conf.json",
                                             replaced(kDataset, "\"confidence\": 0.9,", "\"confidence\": \"high\","))),
                 ValidationError);
    EXPECT_THROW(io::read_dataset(::testing::TempDir() + "matchtrack_missing.json"), ValidationError);
}

TEST(DatasetIo, WritesResult) {
    pipeline::MatchOutput out;
    out.match_id = "m-out";
    out.tracker_id = "iou";
    out.player_model_id = "recorded";

    dedup::DeduplicatedEvent e;
    e.absolute_timestamp = 3.5;
    e.type = dedup::EventType::Shot;
    e.team = TeamId::Home;
    e.details["shotResult"] = "goal";
    e.merged_from_windows = {"w0", "w1"};
    e.merged_position = cv::Point2f(0.8f, 0.5f);
    e.position_source = geometry::PositionSource::ZoneConversion;
    out.dedup_events.push_back(e);

    const std::string path = ::testing::TempDir() + "matchtrack_result.yml";
    io::write_result(path, out);

    cv::FileStorage fs(path, cv::FileStorage::READ);
    ASSERT_TRUE(fs.isOpened());
    EXPECT_EQ((std::string)fs["match_id"], "m-out");
    EXPECT_EQ((std::string)fs["version"], MATCHTRACK_VERSION);
    EXPECT_EQ((std::string)fs["tracker_id"], "iou");

    const cv::FileNode events = fs["deduplicated_events"];
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ((std::string)events[0]["type"], "shot");
    EXPECT_EQ((std::string)events[0]["details"]["shotResult"], "goal");
    EXPECT_EQ(events[0]["merged_from_windows"].size(), 2u);
    EXPECT_EQ((std::string)events[0]["position"]["source"], "zone_conversion");

    EXPECT_EQ((int)fs["validation"]["valid"], 1);
    EXPECT_EQ((int)fs["dedup_stats"]["total_raw"], 0);
}
