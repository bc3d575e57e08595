#ifndef GLUCOSE_PROJECTION_HPP
#define GLUCOSE_PROJECTION_HPP

#include "effect_source.hpp"
#include "patient_constants.hpp"
#include <string>

namespace glucotrace {

/// Lowest glucose value the projection will report.
constexpr double DEFAULT_SAFETY_FLOOR = 40.0;

/**
 * @brief Parameters of the additive projection model.
 */
struct ProjectionParameters {
    double target_glucose = 100.0;
    double stabilization_hours = 2.0;
    double carb_to_bg_factor = 4.0;
    double insulin_sensitivity_factor = 50.0;
    double safety_floor = DEFAULT_SAFETY_FLOOR;

    static ProjectionParameters from_constants(const PatientConstants &constants,
                                               double stabilization_hours = 2.0,
                                               double safety_floor = DEFAULT_SAFETY_FLOOR);
};

/**
 * @brief Exponential return from @p base_value toward the target:
 *        target + (base - target) * exp(-3 * elapsed_minutes / (60 * stabilization_hours)).
 *
 * Negative elapsed time is treated as zero. Not clamped.
 */
double
natural_glucose(double base_value, double elapsed_minutes, const ProjectionParameters &params);

/**
 * @brief Glucose estimate at @p elapsed_minutes after @p baseline.
 *
 * natural value + active carb-equivalent * carb_to_bg_factor
 *               - active insulin * insulin_sensitivity_factor,
 * clamped to the safety floor. Linear and additive; not a clinical predictor.
 */
double
project_glucose(const GlucoseReading &baseline,
                double elapsed_minutes,
                double active_insulin,
                double active_carb_equivalent,
                const ProjectionParameters &params);

/// project_glucose() with no insulin or carbohydrate overlay.
double
project_baseline(const GlucoseReading &baseline, double elapsed_minutes, const ProjectionParameters &params);

enum class GlucoseStatus { Low, Normal, High };

std::string
to_string(GlucoseStatus status);

/// Low below 70% of target, High above 130% of target.
GlucoseStatus
classify_status(double value, double target_glucose);

} // namespace glucotrace

#endif // GLUCOSE_PROJECTION_HPP
