#ifndef PATIENT_CONSTANTS_HPP
#define PATIENT_CONSTANTS_HPP

#include "effect_source.hpp"
#include "kinetic_profile.hpp"
#include <map>
#include <string>
#include <vector>

namespace glucotrace {

/**
 * @brief Kinetic profile of a medication together with its steady-state factor.
 */
struct MedicationFactor {
    double factor = 1.0;
    KineticProfile profile;
};

/**
 * @brief Patient-specific constants supplied by the caller.
 *
 * Defaults are the stock values a new patient starts with.
 */
struct PatientConstants {
    double target_glucose = 100.0;
    double correction_factor = 50.0;
    double insulin_sensitivity_factor = 50.0; // glucose units lowered per active insulin unit
    double carb_to_bg_factor = 4.0;           // glucose units raised per gram carb-equivalent
    double protein_factor = 0.5;
    double fat_factor = 0.2;
    double fiber_factor = 0.1;

    std::map<AbsorptionClass, double> absorption_modifiers = { { AbsorptionClass::VerySlow, 0.6 },
                                                               { AbsorptionClass::Slow, 0.8 },
                                                               { AbsorptionClass::Medium, 1.0 },
                                                               { AbsorptionClass::Fast, 1.2 },
                                                               { AbsorptionClass::VeryFast, 1.4 } };

    // Insulin-need multiplier per activity level (sleep raises it, exercise lowers it).
    std::map<int, double> activity_coefficients = { { -2, 1.2 }, { -1, 1.1 }, { 0, 1.0 }, { 1, 0.9 }, { 2, 0.8 } };

    std::map<std::string, MedicationFactor> medication_factors;
    std::map<std::string, MedicationSchedule> medication_schedules;

    /// insulin_sensitivity_factor when set, otherwise correction_factor.
    double effective_insulin_sensitivity() const;

    /// Modifier for @p cls, 1.0 when the class has no entry.
    double absorption_modifier(AbsorptionClass cls) const;

    /// Coefficient for @p level, 1.0 when the level has no entry.
    double activity_coefficient(int level) const;

    /**
     * @brief Rejects constants that cannot produce a meaningful projection.
     * @throws std::invalid_argument
     */
    void validate() const;
};

/**
 * @brief Builds a resolver from the built-in catalogue plus the patient's
 *        medication_factors profiles.
 */
KineticProfileResolver
make_resolver(const PatientConstants &constants);

/**
 * @brief Turns the schedules kept in the patient constants into medication
 *        courses, using the matching medication_factors entry for the factor.
 *
 * Schedules without a matching factor entry use a factor of 1.0.
 */
std::vector<MedicationCourse>
medication_courses(const PatientConstants &constants);

} // namespace glucotrace

#endif // PATIENT_CONSTANTS_HPP
