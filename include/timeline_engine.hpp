#ifndef TIMELINE_ENGINE_HPP
#define TIMELINE_ENGINE_HPP

#include "active_effect_aggregator.hpp"
#include "diagnostics.hpp"
#include "effect_source.hpp"
#include "glucose_projection.hpp"
#include "kinetic_profile.hpp"
#include "patient_constants.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace glucotrace {

/**
 * @brief Reconstruction grid of a timeline.
 */
struct TimeWindow {
    TimestampMs start = 0.0;
    TimestampMs end = 0.0;
    double interval_minutes = 15.0;

    /**
     * @throws std::invalid_argument for non-finite bounds, bounds off the
     *         calendar (before 1400 or from year 10000), end < start or a
     *         non-positive interval.
     */
    void validate() const;
};

/// Grid spacing for a window: 5 min up to 6 h, 15 min up to 72 h, 30 min beyond.
double
suggest_interval_minutes(TimestampMs start, TimestampMs end);

enum class ExtendMode { None, ToNow, ToWindowEnd };

struct TimelineOptions {
    bool gap_fill_enabled = true;
    double max_connect_gap_minutes = 20.0;
    double stabilization_hours = 2.0;
    ExtendMode extension = ExtendMode::ToWindowEnd;
    double safety_floor = DEFAULT_SAFETY_FLOOR;
    bool log_warnings = true;

    /// @throws std::invalid_argument
    void validate() const;
};

enum class PointClassification { Actual, EstimatedAnchor, Estimated };
enum class TimelinePhase { Historical, Future };

std::string
to_string(PointClassification classification);
std::string
to_string(TimelinePhase phase);
std::string
to_string(ExtendMode mode);

struct TimelinePoint {
    TimestampMs timestamp = 0.0;
    double value = 0.0;
    double baseline_value = 0.0; ///< Projection without insulin or meal overlay.
    PointClassification classification = PointClassification::Estimated;
    TimelinePhase phase = TimelinePhase::Future;
    GlucoseStatus status = GlucoseStatus::Normal;
    bool connects_to_previous = false; ///< Actual readings only.
    ReadingSource source = ReadingSource::Manual;

    std::vector<SourceContribution> contributions;
    double total_insulin_active = 0.0;
    double total_carb_equivalent_active = 0.0;
    double net_effect = 0.0; ///< Carb impact minus insulin impact, in glucose units.
    double insulin_resistance = 1.0;

    bool is_actual() const { return classification == PointClassification::Actual; }
};

/**
 * @brief Aggregates at the caller's "now".
 */
struct TimelineSummary {
    TimestampMs at = 0.0;
    double total_active_insulin = 0.0;
    double total_carb_equivalent = 0.0;
    double insulin_on_board = 0.0;
    double carbs_on_board = 0.0;
    double insulin_resistance = 1.0;
    std::vector<SourceContribution> breakdown;
    std::size_t actual_points = 0;
    std::size_t estimated_points = 0;
};

struct Timeline {
    std::vector<TimelinePoint> points;
    TimelineSummary summary;
    Diagnostics diagnostics;

    bool empty() const { return points.empty(); }
};

/**
 * @brief Gap between two consecutive actual readings.
 */
struct ReadingLink {
    TimestampMs from = 0.0;
    TimestampMs to = 0.0;
    double gap_minutes = 0.0;
    bool connectable = false;
};

/**
 * @brief Sorts @p readings by time and marks each consecutive pair whose gap is
 *        at most @p max_gap_minutes as connectable.
 * @return One link per consecutive pair (size() - 1 entries, or none).
 */
std::vector<ReadingLink>
classify_reading_gaps(std::vector<GlucoseReading> readings, double max_gap_minutes);

/**
 * @brief Sparse subset of the estimated points for tabular display.
 *
 * Keeps Estimated points that are at least @p min_spacing_minutes after the
 * previously kept one and at least @p min_distance_from_actual_minutes away
 * from every actual reading.
 */
std::vector<TimelinePoint>
thin_estimated_points(const std::vector<TimelinePoint> &points,
                      double min_spacing_minutes = 30.0,
                      double min_distance_from_actual_minutes = 15.0);

/**
 * @brief Builds glucose timelines from readings and effect sources.
 *
 * The engine holds only configuration. Each build() call resolves profiles,
 * filters its inputs and computes a fresh timeline; nothing is cached between
 * calls, so one engine may be shared between threads.
 */
class TimelineEngine {
  public:
    /**
     * @throws std::invalid_argument if the constants or options are invalid.
     */
    explicit TimelineEngine(PatientConstants constants, TimelineOptions options = TimelineOptions());

    /// Uses @p resolver instead of the built-in catalogue.
    TimelineEngine(PatientConstants constants, KineticProfileResolver resolver, TimelineOptions options);

    /**
     * @brief Reconciles readings and projected estimates over @p window.
     *
     * @param readings Actual glucose readings; never modified in the output.
     * @param sources Insulin, meal, activity and medication records.
     * @param window Grid to reconstruct.
     * @param now Boundary between historical and future points.
     * @throws std::invalid_argument if @p window is malformed or @p now is not finite.
     */
    Timeline build(const std::vector<GlucoseReading> &readings,
                   const std::vector<EffectSource> &sources,
                   const TimeWindow &window,
                   TimestampMs now) const;

    const PatientConstants &constants() const { return m_constants; }
    const TimelineOptions &options() const { return m_options; }
    const KineticProfileResolver &resolver() const { return m_resolver; }

  private:
    TimelinePoint make_point(TimestampMs at,
                             PointClassification classification,
                             const std::vector<EffectSource> &sources,
                             ProfileCache &profiles,
                             const ProjectionParameters &params,
                             TimestampMs now) const;

    void project_point(TimelinePoint &point,
                       const GlucoseReading &anchor,
                       const ProjectionParameters &params) const;

    PatientConstants m_constants;
    TimelineOptions m_options;
    KineticProfileResolver m_resolver;
};

} // namespace glucotrace

#endif // TIMELINE_ENGINE_HPP
