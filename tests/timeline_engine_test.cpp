#include "test_utils.hpp"
#include "timeline_engine.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

class TimelineEngineTest : public ::testing::Test {
  protected:
    PatientConstants constants;

    TimelineEngine make_engine(TimelineOptions options = quiet_options()) const {
        return TimelineEngine(constants, make_test_resolver(), options);
    }

    static TimeWindow window(double start_hours, double end_hours, double interval_minutes = 15.0) {
        TimeWindow w;
        w.start = at_hours(start_hours);
        w.end = at_hours(end_hours);
        w.interval_minutes = interval_minutes;
        return w;
    }

    static const TimelinePoint *point_at(const Timeline &timeline, TimestampMs t) {
        for (const auto &p : timeline.points) {
            if (std::abs(p.timestamp - t) < 1.0) { return &p; }
        }
        return nullptr;
    }

    ProjectionParameters params(double stabilization_hours = 2.0) const {
        return ProjectionParameters::from_constants(constants, stabilization_hours);
    }
};

// --- Gap fill disabled ---

TEST_F(TimelineEngineTest, SingleReadingRoundTripsWithoutGapFill) {
    TimelineOptions options = quiet_options();
    options.gap_fill_enabled = false;
    const TimelineEngine engine = make_engine(options);

    const GlucoseReading reading = make_reading(at_minutes(30.0), 187.5, ReadingSource::Manual);
    const Timeline timeline = engine.build({ reading }, {}, window(0.0, 2.0), at_hours(1.0));

    ASSERT_EQ(timeline.points.size(), 1u);
    const TimelinePoint &p = timeline.points.front();
    EXPECT_EQ(p.timestamp, reading.timestamp);
    EXPECT_EQ(p.value, reading.value);
    EXPECT_EQ(p.baseline_value, reading.value);
    EXPECT_EQ(p.source, ReadingSource::Manual);
    EXPECT_EQ(p.classification, PointClassification::Actual);
    EXPECT_FALSE(p.connects_to_previous);
    EXPECT_FALSE(timeline.diagnostics.degraded());
}

TEST_F(TimelineEngineTest, NoReadingsWithoutGapFillIsEmpty) {
    TimelineOptions options = quiet_options();
    options.gap_fill_enabled = false;
    const TimelineEngine engine = make_engine(options);

    const Timeline timeline =
      engine.build({}, { make_dose("d", "test_insulin", 3.0, T0) }, window(0.0, 4.0), at_hours(1.0));
    EXPECT_TRUE(timeline.empty());
    EXPECT_TRUE(timeline.diagnostics.empty_input);
    EXPECT_EQ(timeline.diagnostics.warnings.size(), 1u);
}

TEST_F(TimelineEngineTest, ConnectsReadingsWithinThreshold) {
    TimelineOptions options = quiet_options();
    options.gap_fill_enabled = false;
    const TimelineEngine engine = make_engine(options);

    const std::vector<GlucoseReading> readings = {
        make_reading(at_minutes(40.0), 150.0),
        make_reading(T0, 120.0),
        make_reading(at_minutes(15.0), 130.0),
    };
    const Timeline timeline = engine.build(readings, {}, window(0.0, 2.0), at_hours(2.0));

    ASSERT_EQ(timeline.points.size(), 3u);
    EXPECT_STRICTLY_ORDERED(timeline.points);
    EXPECT_FALSE(timeline.points[0].connects_to_previous);
    EXPECT_TRUE(timeline.points[1].connects_to_previous);  // 15 minutes
    EXPECT_FALSE(timeline.points[2].connects_to_previous); // 25 minutes
}

TEST(ReadingGapTest, ClassifiesConsecutivePairs) {
    const std::vector<GlucoseReading> readings = {
        make_reading(at_minutes(40.0), 150.0),
        make_reading(T0, 120.0),
        make_reading(at_minutes(15.0), 130.0),
    };
    const auto links = classify_reading_gaps(readings, 20.0);
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].from, T0);
    EXPECT_DOUBLE_EQ(links[0].gap_minutes, 15.0);
    EXPECT_TRUE(links[0].connectable);
    EXPECT_DOUBLE_EQ(links[1].gap_minutes, 25.0);
    EXPECT_FALSE(links[1].connectable);

    EXPECT_TRUE(classify_reading_gaps({ make_reading(T0, 100.0) }, 20.0).empty());
    EXPECT_TRUE(classify_reading_gaps(readings, 25.0)[1].connectable);
}

// --- Gap fill ---

TEST_F(TimelineEngineTest, NoReadingsProjectsFromTarget) {
    const TimelineEngine engine = make_engine();
    const Timeline timeline = engine.build({}, {}, window(0.0, 1.0), T0);

    ASSERT_EQ(timeline.points.size(), 5u);
    EXPECT_EQ(timeline.points.front().classification, PointClassification::EstimatedAnchor);
    EXPECT_EQ(timeline.points.front().timestamp, T0);
    for (const auto &p : timeline.points) { EXPECT_DOUBLE_EQ(p.value, constants.target_glucose); }
    EXPECT_EQ(timeline.points.back().timestamp, at_hours(1.0));
    EXPECT_TRUE(timeline.diagnostics.empty_input);
    EXPECT_EQ(timeline.summary.actual_points, 0u);
    EXPECT_EQ(timeline.summary.estimated_points, 5u);
}

TEST_F(TimelineEngineTest, SeedsAnchorWhenWindowStartsBeforeFirstReading) {
    const TimelineEngine engine = make_engine();

    const Timeline seeded = engine.build({ make_reading(at_minutes(30.0), 160.0) }, {}, window(0.0, 1.0), T0);
    ASSERT_GE(seeded.points.size(), 3u);
    EXPECT_EQ(seeded.points[0].classification, PointClassification::EstimatedAnchor);
    EXPECT_DOUBLE_EQ(seeded.points[0].value, constants.target_glucose);
    EXPECT_EQ(seeded.points[1].classification, PointClassification::Estimated);
    EXPECT_EQ(seeded.points[1].timestamp, at_minutes(15.0));
    EXPECT_EQ(seeded.points[2].classification, PointClassification::Actual);

    const Timeline unseeded = engine.build({ make_reading(T0, 160.0) }, {}, window(0.0, 1.0), T0);
    EXPECT_EQ(unseeded.points.front().classification, PointClassification::Actual);
    EXPECT_TRUE(points_of(unseeded, PointClassification::EstimatedAnchor).empty());
}

TEST_F(TimelineEngineTest, EstimatesStrictlyBetweenAnchors) {
    TimelineOptions options = quiet_options();
    options.extension = ExtendMode::None;
    const TimelineEngine engine = make_engine(options);
    const std::vector<GlucoseReading> readings = { make_reading(T0, 140.0), make_reading(at_minutes(40.0), 150.0) };
    const Timeline timeline = engine.build(readings, {}, window(0.0, 1.0), T0);

    ASSERT_EQ(timeline.points.size(), 4u);
    EXPECT_EQ(timeline.points[0].timestamp, T0);
    EXPECT_EQ(timeline.points[1].timestamp, at_minutes(15.0));
    EXPECT_EQ(timeline.points[2].timestamp, at_minutes(30.0));
    EXPECT_EQ(timeline.points[3].timestamp, at_minutes(40.0));
    EXPECT_EQ(timeline.points[3].classification, PointClassification::Actual);
    EXPECT_DOUBLE_EQ(timeline.points[3].value, 150.0);

    // Estimates are seeded from the left anchor
    EXPECT_DOUBLE_EQ(timeline.points[1].value, natural_glucose(140.0, 15.0, params()));
}

TEST_F(TimelineEngineTest, ExtensionModes) {
    const std::vector<GlucoseReading> readings = { make_reading(T0, 140.0) };
    const TimestampMs now = at_minutes(70.0);

    TimelineOptions none = quiet_options();
    none.extension = ExtendMode::None;
    EXPECT_EQ(make_engine(none).build(readings, {}, window(0.0, 3.0, 30.0), now).points.size(), 1u);

    TimelineOptions to_now = quiet_options();
    to_now.extension = ExtendMode::ToNow;
    const Timeline until_now = make_engine(to_now).build(readings, {}, window(0.0, 3.0, 30.0), now);
    ASSERT_EQ(until_now.points.size(), 4u);
    EXPECT_EQ(until_now.points[2].timestamp, at_minutes(60.0));
    EXPECT_EQ(until_now.points.back().timestamp, now);

    const Timeline past_end = make_engine(to_now).build(readings, {}, window(0.0, 1.0, 30.0), at_hours(5.0));
    EXPECT_EQ(past_end.points.back().timestamp, at_hours(1.0));

    const Timeline to_end = make_engine().build(readings, {}, window(0.0, 3.0, 30.0), now);
    ASSERT_EQ(to_end.points.size(), 7u);
    EXPECT_EQ(to_end.points.back().timestamp, at_hours(3.0));
    EXPECT_STRICTLY_ORDERED(to_end.points);
}

TEST_F(TimelineEngineTest, ClosingPointNotDuplicatedOnGrid) {
    const Timeline timeline = make_engine().build({}, {}, window(0.0, 1.0, 20.0), T0);
    ASSERT_EQ(timeline.points.size(), 4u);
    EXPECT_STRICTLY_ORDERED(timeline.points);
}

// --- Historical vs future ---

TEST_F(TimelineEngineTest, HistoricalEstimatesIgnoreMealFutureIncludesIt) {
    const TimelineEngine engine = make_engine();
    const std::vector<GlucoseReading> readings = { make_reading(T0, 180.0) };
    const std::vector<EffectSource> sources = { make_meal("lunch", 60.0, at_minutes(30.0)) };
    const TimestampMs now = at_minutes(90.0);

    const Timeline timeline = engine.build(readings, sources, window(0.0, 5.0), now);

    bool saw_active_meal_in_past = false;
    for (const auto &p : points_of(timeline, PointClassification::Estimated)) {
        const double elapsed = minutes_between(T0, p.timestamp);
        EXPECT_DOUBLE_EQ(p.baseline_value, natural_glucose(180.0, elapsed, params()));
        if (p.timestamp < now) {
            EXPECT_EQ(p.phase, TimelinePhase::Historical);
            EXPECT_DOUBLE_EQ(p.value, p.baseline_value);
            saw_active_meal_in_past = saw_active_meal_in_past || p.total_carb_equivalent_active > 0.0;
        } else {
            EXPECT_EQ(p.phase, TimelinePhase::Future);
        }
    }
    EXPECT_TRUE(saw_active_meal_in_past);

    // Two hours in, the meal is at its peak: 60 g carb-equivalent, 240 glucose units
    const TimelinePoint *peak = point_at(timeline, at_hours(2.0));
    ASSERT_NE(peak, nullptr);
    EXPECT_EQ(peak->phase, TimelinePhase::Future);
    EXPECT_NEAR(peak->total_carb_equivalent_active, 60.0, 1e-9);
    EXPECT_NEAR(peak->net_effect, 240.0, 1e-9);
    EXPECT_NEAR(peak->value, natural_glucose(180.0, 120.0, params()) + 240.0, 1e-9);

    // Meal fully absorbed by its adjusted duration
    const TimelinePoint *done = point_at(timeline, at_hours(4.5));
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->total_carb_equivalent_active, 0.0);
    EXPECT_DOUBLE_EQ(done->value, done->baseline_value);
}

TEST_F(TimelineEngineTest, InsulinScenarioClampsAtSafetyFloor) {
    const TimelineEngine engine = make_engine();
    const std::vector<GlucoseReading> readings = { make_reading(T0, 300.0) };
    const std::vector<EffectSource> sources = { make_dose("bolus", "test_insulin", 5.0, T0) };

    const Timeline timeline = engine.build(readings, sources, window(0.0, 4.0), T0);
    const TimelinePoint *peak = point_at(timeline, at_hours(2.0));
    ASSERT_NE(peak, nullptr);
    EXPECT_DOUBLE_EQ(peak->total_insulin_active, 5.0);
    EXPECT_NEAR(peak->net_effect, -250.0, 1e-9);
    EXPECT_DOUBLE_EQ(peak->value, std::max(DEFAULT_SAFETY_FLOOR, natural_glucose(300.0, 120.0, params()) - 250.0));
    EXPECT_EQ(peak->status, GlucoseStatus::Low);

    ASSERT_EQ(peak->contributions.size(), 1u);
    EXPECT_EQ(peak->contributions[0].id, "bolus");
    EXPECT_NEAR(peak->contributions[0].glucose_impact, -250.0, 1e-9);
}

TEST_F(TimelineEngineTest, InsulinScenarioAboveFloor) {
    TimelineOptions options = quiet_options();
    options.stabilization_hours = 100.0;
    const TimelineEngine engine = make_engine(options);
    const std::vector<GlucoseReading> readings = { make_reading(T0, 400.0) };
    const std::vector<EffectSource> sources = { make_dose("bolus", "test_insulin", 5.0, T0) };

    const Timeline timeline = engine.build(readings, sources, window(0.0, 4.0), T0);
    const TimelinePoint *peak = point_at(timeline, at_hours(2.0));
    ASSERT_NE(peak, nullptr);
    EXPECT_NEAR(peak->value, natural_glucose(400.0, 120.0, params(100.0)) - 250.0, 1e-9);
}

TEST_F(TimelineEngineTest, ResistanceScalesInsulinImpact) {
    MedicationCourse blocker;
    blocker.id = "bb";
    blocker.medication_id = "beta_blockers";
    blocker.factor = 2.0;
    blocker.schedule.start_date = at_hours(-24.0);
    blocker.schedule.end_date = at_hours(24.0);

    const std::vector<EffectSource> sources = { make_dose("bolus", "test_insulin", 5.0, T0), blocker };
    const Timeline timeline = make_engine().build({ make_reading(T0, 300.0) }, sources, window(0.0, 4.0), T0);

    const TimelinePoint *peak = point_at(timeline, at_hours(2.0));
    ASSERT_NE(peak, nullptr);
    EXPECT_DOUBLE_EQ(peak->insulin_resistance, 2.0);
    EXPECT_NEAR(peak->net_effect, -125.0, 1e-9);
    EXPECT_DOUBLE_EQ(timeline.summary.insulin_resistance, 2.0);
}

TEST_F(TimelineEngineTest, CourseWithoutDailyTimesHasNoEffect) {
    MedicationCourse pill;
    pill.id = "pill";
    pill.medication_id = "oral_contraceptives";
    pill.factor = 1.5;
    pill.schedule.start_date = at_hours(-24.0 * 30.0);
    pill.schedule.end_date = at_hours(24.0 * 30.0);
    pill.schedule.daily_times = { "not-a-time" };

    const std::vector<EffectSource> sources = { make_dose("bolus", "test_insulin", 5.0, T0), pill };
    const Timeline timeline = make_engine().build({ make_reading(T0, 300.0) }, sources, window(0.0, 4.0), T0);

    EXPECT_DOUBLE_EQ(timeline.summary.insulin_resistance, 1.0);
    const TimelinePoint *peak = point_at(timeline, at_hours(2.0));
    ASSERT_NE(peak, nullptr);
    EXPECT_DOUBLE_EQ(peak->insulin_resistance, 1.0);
    EXPECT_NEAR(peak->net_effect, -250.0, 1e-9);

    const auto &warnings = timeline.diagnostics.warnings;
    EXPECT_TRUE(std::any_of(warnings.begin(), warnings.end(), [](const std::string &w) {
        return w.find("'pill' has no usable daily times") != std::string::npos;
    }));
}

TEST_F(TimelineEngineTest, ActualReadingsAreNeverModified) {
    const std::vector<GlucoseReading> readings = {
        make_reading(at_minutes(20.0), 145.0),
        make_reading(at_minutes(95.0), 210.0, ReadingSource::Manual),
        make_reading(at_minutes(180.0), 90.0),
    };
    const std::vector<EffectSource> sources = {
        make_dose("bolus", "test_insulin", 6.0, at_minutes(30.0)),
        make_meal("meal", 80.0, at_minutes(30.0), AbsorptionClass::Fast, 10.0, 10.0),
    };
    const Timeline timeline = make_engine().build(readings, sources, window(0.0, 6.0), at_hours(1.0));

    const auto actual = points_of(timeline, PointClassification::Actual);
    ASSERT_EQ(actual.size(), readings.size());
    for (size_t i = 0; i < readings.size(); ++i) {
        EXPECT_EQ(actual[i].timestamp, readings[i].timestamp);
        EXPECT_EQ(actual[i].value, readings[i].value);
        EXPECT_EQ(actual[i].source, readings[i].source);
    }
    EXPECT_STRICTLY_ORDERED(timeline.points);
}

TEST_F(TimelineEngineTest, RebuildIsDeterministic) {
    const std::vector<GlucoseReading> readings = { make_reading(at_minutes(10.0), 130.0),
                                                   make_reading(at_minutes(25.0), 138.0) };
    const std::vector<EffectSource> sources = {
        make_dose("bolus", "insulin_aspart", 4.0, at_minutes(20.0)),
        make_meal("meal", 50.0, at_minutes(20.0), AbsorptionClass::Slow, 15.0, 20.0),
        make_activity("walk", 1, at_hours(2.0), at_hours(2.5)),
    };
    const TimelineEngine engine = make_engine();
    const Timeline a = engine.build(readings, sources, window(0.0, 8.0), at_hours(3.0));
    const Timeline b = engine.build(readings, sources, window(0.0, 8.0), at_hours(3.0));

    ASSERT_EQ(a.points.size(), b.points.size());
    for (size_t i = 0; i < a.points.size(); ++i) {
        EXPECT_EQ(a.points[i].timestamp, b.points[i].timestamp);
        EXPECT_EQ(a.points[i].value, b.points[i].value);
        EXPECT_EQ(a.points[i].classification, b.points[i].classification);
    }
}

// --- Degraded input ---

TEST_F(TimelineEngineTest, InvalidRecordsAreDroppedNotFatal) {
    const std::vector<GlucoseReading> readings = {
        make_reading(std::numeric_limits<double>::quiet_NaN(), 120.0),
        make_reading(at_minutes(10.0), -4.0),
        make_reading(at_minutes(20.0), 125.0),
        make_reading(at_hours(30.0), 125.0), // outside the window: ignored, not invalid
    };
    const std::vector<EffectSource> sources = {
        make_dose("negative", "test_insulin", -2.0, T0),
        make_dose("nan", "test_insulin", 2.0, std::numeric_limits<double>::quiet_NaN()),
        make_dose("ok", "test_insulin", 2.0, T0),
    };

    Timeline timeline;
    ASSERT_NO_THROW(timeline = make_engine().build(readings, sources, window(0.0, 2.0), T0));
    EXPECT_EQ(timeline.diagnostics.dropped_readings, 2u);
    EXPECT_EQ(timeline.diagnostics.dropped_sources, 2u);
    EXPECT_EQ(timeline.summary.actual_points, 1u);
    EXPECT_FALSE(timeline.empty());
}

TEST_F(TimelineEngineTest, MissingProfileIsASoftWarning) {
    const std::vector<EffectSource> sources = { make_dose("d", "mystery_insulin", 3.0, T0) };
    const Timeline timeline = make_engine().build({ make_reading(T0, 150.0) }, sources, window(0.0, 4.0), T0);

    EXPECT_EQ(timeline.diagnostics.missing_profiles.count("mystery_insulin"), 1u);
    const TimelinePoint *peak = point_at(timeline, at_hours(2.0));
    ASSERT_NE(peak, nullptr);
    EXPECT_DOUBLE_EQ(peak->total_insulin_active, 3.0);
}

TEST_F(TimelineEngineTest, RejectsMalformedConfiguration) {
    const TimelineEngine engine = make_engine();
    EXPECT_THROW(engine.build({}, {}, window(2.0, 1.0), T0), std::invalid_argument);
    EXPECT_THROW(engine.build({}, {}, window(0.0, 1.0, 0.0), T0), std::invalid_argument);
    EXPECT_THROW(engine.build({}, {}, window(0.0, 1.0, -5.0), T0), std::invalid_argument);
    EXPECT_THROW(engine.build({}, {}, window(0.0, 1.0), std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);

    // Past the end of the calendar, even with a course that is active there
    MedicationCourse endless;
    endless.id = "endless";
    endless.medication_id = "corticosteroids";
    endless.factor = 1.3;
    endless.schedule.start_date = T0;
    endless.schedule.end_date = 1.0e300;
    endless.schedule.daily_times = { "08:00" };
    TimeWindow far;
    far.start = 1.0e15;
    far.end = 1.0e15 + MS_PER_HOUR;
    EXPECT_THROW(far.validate(), std::invalid_argument);
    EXPECT_THROW(engine.build({}, { endless }, far, far.start), std::invalid_argument);
    EXPECT_THROW(engine.build({}, { endless }, window(0.0, 1.0), 1.0e15), std::invalid_argument);

    PatientConstants bad = constants;
    bad.target_glucose = -1.0;
    EXPECT_THROW(TimelineEngine engine_bad(bad), std::invalid_argument);

    TimelineOptions bad_options = quiet_options();
    bad_options.stabilization_hours = 0.0;
    EXPECT_THROW(TimelineEngine engine_bad(constants, bad_options), std::invalid_argument);
}

TEST_F(TimelineEngineTest, EmptyWindowHoldsOnlyAnchor) {
    const Timeline timeline = make_engine().build({}, {}, window(1.0, 1.0), T0);
    ASSERT_EQ(timeline.points.size(), 1u);
    EXPECT_EQ(timeline.points[0].classification, PointClassification::EstimatedAnchor);
}

// --- Summary ---

TEST_F(TimelineEngineTest, SummaryAtNow) {
    const std::vector<EffectSource> sources = {
        make_dose("bolus", "test_insulin", 5.0, T0),
        make_meal("meal", 60.0, T0),
    };
    const Timeline timeline =
      make_engine().build({ make_reading(T0, 120.0) }, sources, window(0.0, 4.0), at_hours(2.0));
    const TimelineSummary &s = timeline.summary;

    EXPECT_EQ(s.at, at_hours(2.0));
    EXPECT_NEAR(s.total_active_insulin, 5.0, 1e-12);
    // Half an hour into the 2.5 h decay
    EXPECT_NEAR(s.total_carb_equivalent, 48.0, 1e-9);
    EXPECT_NEAR(s.insulin_on_board, 5.0 * (1.0 - 1.0625 / 2.0625), 1e-2);
    EXPECT_GT(s.carbs_on_board, 0.0);
    EXPECT_LT(s.carbs_on_board, 60.0);
    EXPECT_DOUBLE_EQ(s.insulin_resistance, 1.0);

    ASSERT_EQ(s.breakdown.size(), 2u);
    EXPECT_NEAR(s.breakdown[0].glucose_impact, -250.0, 1e-9);
    EXPECT_NEAR(s.breakdown[1].glucose_impact, 192.0, 1e-9);
    EXPECT_EQ(s.actual_points, 1u);
    EXPECT_EQ(s.estimated_points, timeline.points.size() - 1);
}

// --- Display helpers ---

TEST_F(TimelineEngineTest, ThinsEstimatedPointsForDisplay) {
    const Timeline timeline =
      make_engine().build({ make_reading(at_minutes(60.0), 120.0) }, {}, window(0.0, 3.0, 5.0), T0);
    const auto thinned = thin_estimated_points(timeline.points);

    const std::vector<double> expected_minutes = { 5.0, 35.0, 75.0, 105.0, 135.0, 165.0 };
    ASSERT_EQ(thinned.size(), expected_minutes.size());
    for (size_t i = 0; i < thinned.size(); ++i) {
        EXPECT_EQ(thinned[i].timestamp, at_minutes(expected_minutes[i]));
        EXPECT_EQ(thinned[i].classification, PointClassification::Estimated);
    }
}

TEST(SuggestIntervalTest, AdaptsToWindowLength) {
    EXPECT_DOUBLE_EQ(suggest_interval_minutes(T0, at_hours(6.0)), 5.0);
    EXPECT_DOUBLE_EQ(suggest_interval_minutes(T0, at_hours(6.5)), 15.0);
    EXPECT_DOUBLE_EQ(suggest_interval_minutes(T0, at_hours(72.0)), 15.0);
    EXPECT_DOUBLE_EQ(suggest_interval_minutes(T0, at_hours(73.0)), 30.0);
}
