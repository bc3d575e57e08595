#include "glucose_projection.hpp"

#include <algorithm>
#include <cmath>

namespace glucotrace {

ProjectionParameters
ProjectionParameters::from_constants(const PatientConstants &constants,
                                     double stabilization_hours,
                                     double safety_floor) {
    ProjectionParameters params;
    params.target_glucose = constants.target_glucose;
    params.stabilization_hours = stabilization_hours;
    params.carb_to_bg_factor = constants.carb_to_bg_factor;
    params.insulin_sensitivity_factor = constants.effective_insulin_sensitivity();
    params.safety_floor = safety_floor;
    return params;
}

double
natural_glucose(double base_value, double elapsed_minutes, const ProjectionParameters &params) {
    const double stabilization_minutes = params.stabilization_hours * 60.0;
    const double elapsed = std::max(0.0, elapsed_minutes);
    return params.target_glucose +
           (base_value - params.target_glucose) * std::exp(-3.0 * elapsed / stabilization_minutes);
}

double
project_glucose(const GlucoseReading &baseline,
                double elapsed_minutes,
                double active_insulin,
                double active_carb_equivalent,
                const ProjectionParameters &params) {
    const double natural = natural_glucose(baseline.value, elapsed_minutes, params);
    const double carb_impact = std::max(0.0, active_carb_equivalent) * params.carb_to_bg_factor;
    const double insulin_impact = std::max(0.0, active_insulin) * params.insulin_sensitivity_factor;
    return std::max(params.safety_floor, natural + carb_impact - insulin_impact);
}

double
project_baseline(const GlucoseReading &baseline, double elapsed_minutes, const ProjectionParameters &params) {
    return project_glucose(baseline, elapsed_minutes, 0.0, 0.0, params);
}

std::string
to_string(GlucoseStatus status) {
    switch (status) {
        case GlucoseStatus::Low: return "low";
        case GlucoseStatus::Normal: return "normal";
        case GlucoseStatus::High: return "high";
    }
    return "normal";
}

GlucoseStatus
classify_status(double value, double target_glucose) {
    if (value < target_glucose * 0.7) { return GlucoseStatus::Low; }
    if (value > target_glucose * 1.3) { return GlucoseStatus::High; }
    return GlucoseStatus::Normal;
}

} // namespace glucotrace
