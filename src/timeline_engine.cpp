#include "timeline_engine.hpp"

#include "record_validation.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace glucotrace {

namespace {

// Upper bound on grid points per timeline; a finer grid is a configuration error.
constexpr double MAX_GRID_POINTS = 1.0e6;

struct Anchor {
    GlucoseReading reading;
    PointClassification classification = PointClassification::Actual;
    bool connects_to_previous = false;
};

double
glucose_impact_of(const SourceContribution &contribution, const ProjectionParameters &params, double resistance) {
    switch (contribution.category) {
        case EffectCategory::Insulin: return -contribution.magnitude * params.insulin_sensitivity_factor / resistance;
        case EffectCategory::Meal: return contribution.magnitude * params.carb_to_bg_factor;
        case EffectCategory::Activity:
        case EffectCategory::Medication: return 0.0; // Folded into the insulin resistance.
    }
    return 0.0;
}

} // namespace

// --- Configuration ---

void
TimeWindow::validate() const {
    if (!std::isfinite(start) || !std::isfinite(end)) {
        throw std::invalid_argument("TimeWindow bounds must be finite.");
    }
    if (!is_calendar_timestamp(start) || !is_calendar_timestamp(end)) {
        std::ostringstream msg;
        msg << "TimeWindow [" << start << ", " << end << "] lies outside the supported calendar range.";
        throw std::invalid_argument(msg.str());
    }
    if (end < start) {
        std::ostringstream msg;
        msg << "TimeWindow end (" << end << ") precedes start (" << start << ").";
        throw std::invalid_argument(msg.str());
    }
    if (!std::isfinite(interval_minutes) || interval_minutes <= 0.0) {
        throw std::invalid_argument("TimeWindow interval_minutes must be positive.");
    }
}

double
suggest_interval_minutes(TimestampMs start, TimestampMs end) {
    const double hours = hours_between(start, end);
    if (hours <= 6.0) { return 5.0; }
    if (hours <= 72.0) { return 15.0; }
    return 30.0;
}

void
TimelineOptions::validate() const {
    if (!std::isfinite(max_connect_gap_minutes) || max_connect_gap_minutes < 0.0) {
        throw std::invalid_argument("max_connect_gap_minutes must be non-negative.");
    }
    if (!std::isfinite(stabilization_hours) || stabilization_hours <= 0.0) {
        throw std::invalid_argument("stabilization_hours must be positive.");
    }
    if (!std::isfinite(safety_floor) || safety_floor <= 0.0) {
        throw std::invalid_argument("safety_floor must be positive.");
    }
}

std::string
to_string(PointClassification classification) {
    switch (classification) {
        case PointClassification::Actual: return "actual";
        case PointClassification::EstimatedAnchor: return "estimated_anchor";
        case PointClassification::Estimated: return "estimated";
    }
    return "estimated";
}

std::string
to_string(TimelinePhase phase) {
    return phase == TimelinePhase::Historical ? "historical" : "future";
}

std::string
to_string(ExtendMode mode) {
    switch (mode) {
        case ExtendMode::None: return "none";
        case ExtendMode::ToNow: return "to_now";
        case ExtendMode::ToWindowEnd: return "to_window_end";
    }
    return "none";
}

// --- Reading gaps and display thinning ---

std::vector<ReadingLink>
classify_reading_gaps(std::vector<GlucoseReading> readings, double max_gap_minutes) {
    std::stable_sort(readings.begin(), readings.end(), [](const GlucoseReading &a, const GlucoseReading &b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<ReadingLink> links;
    for (size_t i = 1; i < readings.size(); ++i) {
        ReadingLink link;
        link.from = readings[i - 1].timestamp;
        link.to = readings[i].timestamp;
        link.gap_minutes = minutes_between(link.from, link.to);
        link.connectable = link.gap_minutes <= max_gap_minutes;
        links.push_back(link);
    }
    return links;
}

std::vector<TimelinePoint>
thin_estimated_points(const std::vector<TimelinePoint> &points,
                      double min_spacing_minutes,
                      double min_distance_from_actual_minutes) {
    std::vector<TimestampMs> actual_times;
    for (const auto &p : points) {
        if (p.is_actual()) { actual_times.push_back(p.timestamp); }
    }

    const double spacing_ms = min_spacing_minutes * MS_PER_MINUTE;
    const double clearance_ms = min_distance_from_actual_minutes * MS_PER_MINUTE;

    std::vector<TimelinePoint> kept;
    for (const auto &p : points) {
        if (p.classification != PointClassification::Estimated) { continue; }
        if (!kept.empty() && p.timestamp - kept.back().timestamp < spacing_ms) { continue; }

        bool near_actual = false;
        for (TimestampMs t : actual_times) {
            if (std::abs(p.timestamp - t) < clearance_ms) {
                near_actual = true;
                break;
            }
        }
        if (!near_actual) { kept.push_back(p); }
    }
    return kept;
}

// --- TimelineEngine ---

TimelineEngine::TimelineEngine(PatientConstants constants, TimelineOptions options)
  : m_constants(std::move(constants))
  , m_options(options) {
    m_constants.validate();
    m_options.validate();
    m_resolver = make_resolver(m_constants);
}

TimelineEngine::TimelineEngine(PatientConstants constants, KineticProfileResolver resolver, TimelineOptions options)
  : m_constants(std::move(constants))
  , m_options(options)
  , m_resolver(std::move(resolver)) {
    m_constants.validate();
    m_options.validate();
}

TimelinePoint
TimelineEngine::make_point(TimestampMs at,
                           PointClassification classification,
                           const std::vector<EffectSource> &sources,
                           ProfileCache &profiles,
                           const ProjectionParameters &params,
                           TimestampMs now) const {
    TimelinePoint point;
    point.timestamp = at;
    point.classification = classification;
    point.phase = at < now ? TimelinePhase::Historical : TimelinePhase::Future;

    point.insulin_resistance = insulin_resistance_at(sources, at, profiles);
    point.contributions = contributions_at(sources, at, profiles);
    for (auto &c : point.contributions) {
        c.glucose_impact = glucose_impact_of(c, params, point.insulin_resistance);
        if (c.category == EffectCategory::Insulin) {
            point.total_insulin_active += c.magnitude;
        } else if (c.category == EffectCategory::Meal) {
            point.total_carb_equivalent_active += c.magnitude;
        }
    }
    point.net_effect = point.total_carb_equivalent_active * params.carb_to_bg_factor -
                       point.total_insulin_active / point.insulin_resistance * params.insulin_sensitivity_factor;
    return point;
}

void
TimelineEngine::project_point(TimelinePoint &point,
                              const GlucoseReading &anchor,
                              const ProjectionParameters &params) const {
    const double elapsed = minutes_between(anchor.timestamp, point.timestamp);
    point.baseline_value = project_baseline(anchor, elapsed, params);
    if (point.phase == TimelinePhase::Historical) {
        point.value = point.baseline_value;
    } else {
        point.value = project_glucose(anchor,
                                      elapsed,
                                      point.total_insulin_active / point.insulin_resistance,
                                      point.total_carb_equivalent_active,
                                      params);
    }
    point.status = classify_status(point.value, params.target_glucose);
}

Timeline
TimelineEngine::build(const std::vector<GlucoseReading> &readings,
                      const std::vector<EffectSource> &sources,
                      const TimeWindow &window,
                      TimestampMs now) const {
    window.validate();
    if (!std::isfinite(now)) { throw std::invalid_argument("TimelineEngine::build requires a finite 'now'."); }
    if (!is_calendar_timestamp(now)) {
        throw std::invalid_argument("TimelineEngine::build 'now' lies outside the supported calendar range.");
    }

    const double step_ms = window.interval_minutes * MS_PER_MINUTE;
    if ((window.end - window.start) / step_ms > MAX_GRID_POINTS) {
        throw std::invalid_argument("TimeWindow interval is too fine for the window length.");
    }

    Timeline timeline;
    Diagnostics &diagnostics = timeline.diagnostics;
    const bool log = m_options.log_warnings;

    std::vector<GlucoseReading> actual = filter_readings(readings, diagnostics, log);
    actual.erase(std::remove_if(actual.begin(),
                                actual.end(),
                                [&window](const GlucoseReading &r) {
                                    return r.timestamp < window.start || r.timestamp > window.end;
                                }),
                 actual.end());
    std::stable_sort(actual.begin(), actual.end(), [](const GlucoseReading &a, const GlucoseReading &b) {
        return a.timestamp < b.timestamp;
    });

    const std::vector<EffectSource> usable = filter_sources(sources, diagnostics, log);

    ProfileCache profiles(m_resolver, m_constants, &diagnostics, log);
    const ProjectionParameters params =
      ProjectionParameters::from_constants(m_constants, m_options.stabilization_hours, m_options.safety_floor);

    for (const auto &source : usable) {
        const auto *course = std::get_if<MedicationCourse>(&source);
        if (course && course->schedule.daily_times.empty() && profiles.profile_for(source).duration_based) {
            diagnostics.warn("TimelineEngine",
                             "Medication course '" + course->id + "' has no usable daily times; it has no effect.",
                             log);
        }
    }

    const std::vector<ReadingLink> links = classify_reading_gaps(actual, m_options.max_connect_gap_minutes);

    std::vector<Anchor> anchors;
    if (m_options.gap_fill_enabled && (actual.empty() || window.start < actual.front().timestamp)) {
        Anchor seed;
        seed.reading.timestamp = window.start;
        seed.reading.value = m_constants.target_glucose;
        seed.classification = PointClassification::EstimatedAnchor;
        anchors.push_back(seed);
    }
    for (size_t i = 0; i < actual.size(); ++i) {
        Anchor a;
        a.reading = actual[i];
        a.connects_to_previous = i > 0 && links[i - 1].connectable;
        anchors.push_back(a);
    }

    if (actual.empty()) {
        diagnostics.empty_input = true;
        diagnostics.warn("TimelineEngine",
                         m_options.gap_fill_enabled
                           ? "No glucose readings in the window; projecting from the target glucose."
                           : "No glucose readings in the window and gap filling is disabled; returning an empty "
                             "timeline.",
                         log);
    }

    TimestampMs extension_end = anchors.empty() ? window.start : anchors.back().reading.timestamp;
    if (m_options.gap_fill_enabled) {
        switch (m_options.extension) {
            case ExtendMode::None: break;
            case ExtendMode::ToNow: extension_end = std::max(extension_end, std::min(now, window.end)); break;
            case ExtendMode::ToWindowEnd: extension_end = std::max(extension_end, window.end); break;
        }
    }

    for (size_t i = 0; i < anchors.size(); ++i) {
        const Anchor &anchor = anchors[i];

        TimelinePoint point =
          make_point(anchor.reading.timestamp, anchor.classification, usable, profiles, params, now);
        point.value = anchor.reading.value;
        point.baseline_value = anchor.reading.value;
        point.source = anchor.reading.source;
        point.connects_to_previous = anchor.connects_to_previous;
        point.status = classify_status(point.value, params.target_glucose);
        timeline.points.push_back(std::move(point));

        if (!m_options.gap_fill_enabled) { continue; }

        const bool last = i + 1 == anchors.size();
        const TimestampMs limit = last ? extension_end : anchors[i + 1].reading.timestamp;
        const TimestampMs origin = anchor.reading.timestamp;

        for (long k = 1;; ++k) {
            const TimestampMs t = origin + static_cast<double>(k) * step_ms;
            if (t >= limit) { break; }
            TimelinePoint estimate = make_point(t, PointClassification::Estimated, usable, profiles, params, now);
            project_point(estimate, anchor.reading, params);
            timeline.points.push_back(std::move(estimate));
        }
        if (last && limit > origin) {
            TimelinePoint closing = make_point(limit, PointClassification::Estimated, usable, profiles, params, now);
            project_point(closing, anchor.reading, params);
            timeline.points.push_back(std::move(closing));
        }
    }

    // --- Summary at now ---
    TimelineSummary &summary = timeline.summary;
    summary.at = now;
    summary.total_active_insulin = aggregate(usable, EffectCategory::Insulin, now, profiles).total;
    summary.total_carb_equivalent = aggregate(usable, EffectCategory::Meal, now, profiles).total;
    summary.insulin_on_board = on_board(usable, EffectCategory::Insulin, now, profiles).total;
    summary.carbs_on_board = on_board(usable, EffectCategory::Meal, now, profiles).total;
    summary.insulin_resistance = insulin_resistance_at(usable, now, profiles);
    summary.breakdown = contributions_at(usable, now, profiles);
    for (auto &c : summary.breakdown) { c.glucose_impact = glucose_impact_of(c, params, summary.insulin_resistance); }
    for (const auto &p : timeline.points) {
        if (p.is_actual()) {
            ++summary.actual_points;
        } else {
            ++summary.estimated_points;
        }
    }

    return timeline;
}

} // namespace glucotrace
