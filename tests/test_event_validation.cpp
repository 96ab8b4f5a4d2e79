#include <gtest/gtest.h>

#include "matchtrack/dedup/event_validation.h"
#include "matchtrack/geometry/pitch_zones.h"

using namespace matchtrack;
using namespace matchtrack::dedup;

namespace {

DeduplicatedEvent event(double t, EventType type, TeamId team) {
    DeduplicatedEvent e;
    e.match_id = "m1";
    e.absolute_timestamp = t;
    e.type = type;
    e.team = team;
    e.confidence = 0.8f;
    e.adjusted_confidence = 0.8f;
    return e;
}

DeduplicatedEvent placed(double t, EventType type, TeamId team, float x) {
    DeduplicatedEvent e = event(t, type, team);
    e.merged_position = cv::Point2f(x, 0.5f);
    return e;
}

} // namespace

TEST(EventValidation, DuplicateTimestampIsError) {
    const std::vector<DeduplicatedEvent> events = {
        event(5.0, EventType::Pass, TeamId::Home),
        event(5.0, EventType::Pass, TeamId::Home),
    };
    const ValidationResult r = validate_temporal_consistency(events, ValidationConfig{});
    EXPECT_FALSE(r.valid);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].type, CheckType::Temporal);
    EXPECT_EQ(r.errors[0].event_index, 1);
    ASSERT_TRUE(r.errors[0].related_index.has_value());
    EXPECT_EQ(*r.errors[0].related_index, 0);

    // другая команда в тот же момент допустима
    const std::vector<DeduplicatedEvent> mixed = {
        event(5.0, EventType::Pass, TeamId::Home),
        event(5.0, EventType::Pass, TeamId::Away),
    };
    EXPECT_TRUE(validate_temporal_consistency(mixed, ValidationConfig{}).valid);
}

TEST(EventValidation, ShortIntervalWarning) {
    const ValidationConfig cfg;
    const std::vector<DeduplicatedEvent> odd = {
        event(1.0, EventType::Pass, TeamId::Home),
        event(1.2, EventType::Carry, TeamId::Home),
    };
    const ValidationResult r = validate_temporal_consistency(odd, cfg);
    EXPECT_TRUE(r.valid);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].severity, Severity::Low);

    const std::vector<DeduplicatedEvent> one_two = {
        event(1.0, EventType::Pass, TeamId::Home),
        event(1.2, EventType::Shot, TeamId::Home),
    };
    EXPECT_TRUE(validate_temporal_consistency(one_two, cfg).warnings.empty());

    ValidationConfig quiet;
    quiet.enable_warnings = false;
    EXPECT_TRUE(validate_temporal_consistency(odd, quiet).warnings.empty());
}

TEST(EventValidation, LogicalSequences) {
    DeduplicatedEvent pass = event(10.0, EventType::Pass, TeamId::Home);
    pass.details["outcome"] = "complete";
    const std::vector<DeduplicatedEvent> events = {pass, event(12.0, EventType::Pass, TeamId::Away)};

    const ValidationResult r = validate_logical_consistency(events, ValidationConfig{});
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].type, CheckType::Logical);
    EXPECT_EQ(r.warnings[0].severity, Severity::Medium);

    const std::vector<DeduplicatedEvent> with_turnover = {pass, event(12.0, EventType::Turnover, TeamId::Away)};
    EXPECT_TRUE(validate_logical_consistency(with_turnover, ValidationConfig{}).warnings.empty());

    ValidationConfig quiet;
    quiet.enable_warnings = false;
    EXPECT_TRUE(validate_logical_consistency(events, quiet).warnings.empty());
}

TEST(EventValidation, GoalWithoutKickoff) {
    DeduplicatedEvent shot = event(100.0, EventType::Shot, TeamId::Home);
    shot.details["shotResult"] = "goal";

    const ValidationResult r = validate_logical_consistency({shot, event(110.0, EventType::Pass, TeamId::Away)},
                                                            ValidationConfig{});
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].message, "Goal scored but no kickoff detected within 30 seconds");

    EXPECT_TRUE(validate_logical_consistency({shot, event(110.0, EventType::SetPiece, TeamId::Away)},
                                             ValidationConfig{}).warnings.empty());
}

TEST(EventValidation, KickoffMayComeAfterOtherEvents) {
    DeduplicatedEvent shot = event(100.0, EventType::Shot, TeamId::Home);
    shot.details["shotResult"] = "goal";

    // празднование, потом розыгрыш с центра
    const std::vector<DeduplicatedEvent> celebrated = {
        shot,
        event(105.0, EventType::Pass, TeamId::Home),
        event(120.0, EventType::SetPiece, TeamId::Away),
    };
    EXPECT_TRUE(validate_logical_consistency(celebrated, ValidationConfig{}).warnings.empty());

    // гол последним событием: розыгрыша нет
    const ValidationResult last = validate_logical_consistency({event(50.0, EventType::Pass, TeamId::Home), shot},
                                                               ValidationConfig{});
    ASSERT_EQ(last.warnings.size(), 1u);
    EXPECT_EQ(last.warnings[0].event_index, 1);
    ASSERT_TRUE(last.warnings[0].related_index.has_value());
    EXPECT_EQ(*last.warnings[0].related_index, 1);

    // розыгрыш позже 30 с не считается
    const ValidationResult late = validate_logical_consistency(
            {shot, event(110.0, EventType::Pass, TeamId::Away), event(135.0, EventType::SetPiece, TeamId::Away)},
            ValidationConfig{});
    ASSERT_EQ(late.warnings.size(), 1u);
    EXPECT_EQ(late.warnings[0].event_index, 1);
    EXPECT_EQ(*late.warnings[0].related_index, 0);
}

TEST(EventValidation, ImpossibleMovement) {
    // 0.4 * 105 = 42 м за секунду
    const std::vector<DeduplicatedEvent> events = {
        placed(1.0, EventType::Carry, TeamId::Home, 0.1f),
        placed(2.0, EventType::Turnover, TeamId::Away, 0.5f),
    };
    const ValidationResult r = validate_positional_consistency(events, ValidationConfig{});
    EXPECT_TRUE(r.valid);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].type, CheckType::Positional);
    EXPECT_EQ(r.warnings[0].severity, Severity::High);
    EXPECT_EQ(r.warnings[0].message, "Impossible movement: 42.0m in 1.00s (42.0 m/s required)");

    const std::vector<DeduplicatedEvent> after_pass = {
        placed(1.0, EventType::Pass, TeamId::Home, 0.1f),
        placed(2.0, EventType::Carry, TeamId::Home, 0.5f),
    };
    EXPECT_TRUE(validate_positional_consistency(after_pass, ValidationConfig{}).warnings.empty());

    // 0.1 * 105 = 10.5 м/с, в пределах
    const std::vector<DeduplicatedEvent> slow = {
        placed(1.0, EventType::Carry, TeamId::Home, 0.1f),
        placed(2.0, EventType::Carry, TeamId::Away, 0.2f),
    };
    EXPECT_TRUE(validate_positional_consistency(slow, ValidationConfig{}).warnings.empty());
}

TEST(EventValidation, SubstitutedPositionsAreNotMeasured) {
    DeduplicatedEvent shot = placed(10.0, EventType::Shot, TeamId::Home, 0.05f);
    shot.position_source = geometry::PositionSource::BallDetection;

    // без данных о позиции: центр поля с confidence 0.1
    DeduplicatedEvent carry = placed(12.0, EventType::Carry, TeamId::Away, 0.5f);
    carry.position_source = geometry::PositionSource::Unknown;
    EXPECT_TRUE(validate_positional_consistency({shot, carry}, ValidationConfig{}).warnings.empty());

    carry.position_source = geometry::PositionSource::ZoneConversion;
    EXPECT_TRUE(validate_positional_consistency({shot, carry}, ValidationConfig{}).warnings.empty());

    // позиция от модели измеряется
    carry.position_source = geometry::PositionSource::ModelOutput;
    EXPECT_EQ(validate_positional_consistency({shot, carry}, ValidationConfig{}).warnings.size(), 1u);
}

TEST(EventValidation, CombinedResultAndSummary) {
    const std::vector<DeduplicatedEvent> events = {
        event(5.0, EventType::Pass, TeamId::Home),
        event(5.0, EventType::Pass, TeamId::Home),
    };
    const ValidationResult r = validate_events(events);
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(summarize_validation_result(r),
              "Validation FAILED\n"
              "  Errors: 1\n"
              "  Warnings: 0\n"
              "\n"
              "Errors:\n"
              "  [temporal] Event 1: Duplicate event at timestamp 5.00: same type (pass) and team (home)");

    EXPECT_EQ(summarize_validation_result(validate_events({})),
              "Validation PASSED\n  Errors: 0\n  Warnings: 0");
}

TEST(EventValidation, EnsembleConfidence) {
    const DeduplicatedEvent e = event(1.0, EventType::Pass, TeamId::Home);
    EXPECT_FLOAT_EQ(ensemble_confidence(e, false, false, false), 0.8f);
    EXPECT_NEAR(ensemble_confidence(e, false, false, true), 0.81f, 1e-6);
    EXPECT_NEAR(ensemble_confidence(e, true, true, true), 0.828525f, 1e-5);

    DeduplicatedEvent sure = e;
    sure.adjusted_confidence = 1.0f;
    EXPECT_FLOAT_EQ(ensemble_confidence(sure, true, true, true), 1.0f);
}
