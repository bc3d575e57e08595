#include "patient_constants.hpp"

#include <cmath>
#include <stdexcept>

namespace glucotrace {

namespace {

void
require_positive(double value, const char *name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument(std::string(name) + " must be a positive finite number.");
    }
}

void
require_non_negative(double value, const char *name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative finite number.");
    }
}

} // namespace

double
PatientConstants::effective_insulin_sensitivity() const {
    return insulin_sensitivity_factor > 0.0 ? insulin_sensitivity_factor : correction_factor;
}

double
PatientConstants::absorption_modifier(AbsorptionClass cls) const {
    auto it = absorption_modifiers.find(cls);
    return it != absorption_modifiers.end() ? it->second : 1.0;
}

double
PatientConstants::activity_coefficient(int level) const {
    auto it = activity_coefficients.find(level);
    return it != activity_coefficients.end() ? it->second : 1.0;
}

void
PatientConstants::validate() const {
    require_positive(target_glucose, "target_glucose");
    require_positive(carb_to_bg_factor, "carb_to_bg_factor");
    require_non_negative(protein_factor, "protein_factor");
    require_non_negative(fat_factor, "fat_factor");
    require_non_negative(fiber_factor, "fiber_factor");
    if (!(effective_insulin_sensitivity() > 0.0) || !std::isfinite(effective_insulin_sensitivity())) {
        throw std::invalid_argument("insulin_sensitivity_factor or correction_factor must be positive.");
    }

    for (const auto &pair : absorption_modifiers) {
        if (!std::isfinite(pair.second) || pair.second <= 0.0) {
            throw std::invalid_argument("Absorption modifier for '" + to_string(pair.first) + "' must be positive.");
        }
    }
    for (const auto &pair : activity_coefficients) {
        if (!std::isfinite(pair.second) || pair.second <= 0.0) {
            throw std::invalid_argument("Activity coefficient for level " + std::to_string(pair.first) +
                                        " must be positive.");
        }
    }
    for (const auto &pair : medication_factors) {
        if (!std::isfinite(pair.second.factor) || pair.second.factor <= 0.0) {
            throw std::invalid_argument("Medication factor for '" + pair.first + "' must be positive.");
        }
        try {
            pair.second.profile.validate();
        } catch (const std::invalid_argument &e) {
            throw std::invalid_argument("Medication '" + pair.first + "': " + e.what());
        }
    }
}

KineticProfileResolver
make_resolver(const PatientConstants &constants) {
    KineticProfileResolver resolver;
    for (const auto &pair : constants.medication_factors) { resolver.register_profile(pair.first, pair.second.profile); }
    return resolver;
}

std::vector<MedicationCourse>
medication_courses(const PatientConstants &constants) {
    std::vector<MedicationCourse> courses;
    courses.reserve(constants.medication_schedules.size());
    for (const auto &pair : constants.medication_schedules) {
        MedicationCourse course;
        course.id = "schedule:" + pair.first;
        course.medication_id = pair.first;
        auto factor_it = constants.medication_factors.find(pair.first);
        course.factor = factor_it != constants.medication_factors.end() ? factor_it->second.factor : 1.0;
        course.schedule = pair.second;
        courses.push_back(course);
    }
    return courses;
}

} // namespace glucotrace
