#ifndef EFFECT_CURVES_HPP
#define EFFECT_CURVES_HPP

#include "effect_source.hpp"
#include "kinetic_profile.hpp"
#include "patient_constants.hpp"

namespace glucotrace {

// Single-source effect curves.
//
// Every generator takes elapsed hours since the source became active and
// returns a non-negative magnitude. Outside [0, duration_hours) the result is
// exactly 0; this holds for NaN input as well.

/**
 * @brief Insulin action in active units.
 *
 * Triangular: onset-weighted ramp to onset, linear rise to `units` at the
 * peak, linear fall to 0 at the duration. Peakless: ramp to half the dose at
 * onset, then linear decay. Biphasic: weighted sum of a rapid component (half
 * the peak time and duration) and the triangular curve of the profile.
 */
double
insulin_action(double units, const KineticProfile &profile, double elapsed_hours);

/**
 * @brief Carbohydrate-equivalent grams of a meal:
 *        carbs + protein*protein_factor + fat*fat_factor - fiber*fiber_factor, floored at 0.
 */
double
carb_equivalent(const MealRecord &meal, const PatientConstants &constants);

/**
 * @brief Applies an absorption-class modifier and the fat/protein extension
 *        to the base profile of the meal's class.
 *
 * Peak and onset are divided by @p modifier; the duration is extended by
 * 0.02 h per gram of fat and 0.01 h per gram of protein before the division.
 */
KineticProfile
adjust_meal_profile(const KineticProfile &base, const MealRecord &meal, double modifier);

/**
 * @brief Carbohydrate-equivalent absorption rate of a meal.
 *
 * Reaches @p carb_eq at the adjusted peak. The exponent of both the rise and
 * the decay is the absorption modifier, so fast classes rise convexly and
 * decay steeply while slow classes rise concavely with a longer tail.
 */
double
meal_absorption(double carb_eq, const KineticProfile &adjusted, double modifier, double elapsed_hours);

/// Profile of an activity: peak at the end of the activity, then the recovery tail.
KineticProfile
activity_profile(const ActivityRecord &activity);

/// Hours the activity effect lingers after it ends: min(24, 2 + hours*(1 + 0.2*level)).
double
activity_tail_hours(const ActivityRecord &activity);

/**
 * @brief Activity intensity in [0, 1].
 *
 * Ramps from 0.2 to 1.0 while the activity runs (the profile peak marks its
 * end), then decays linearly to 0 over the tail.
 */
double
activity_intensity(const KineticProfile &profile, double elapsed_hours);

/// Signed multiplier relative to 1.0: 1 + (coefficient - 1) * intensity.
inline double
activity_multiplier(double intensity, double coefficient) {
    return 1.0 + (coefficient - 1.0) * intensity;
}

/**
 * @brief Weight in [0, 1] of a medication's steady-state factor, given the
 *        hours since its latest dose.
 *
 * Rises over onset, holds until the peak, tapers to 0 at the duration.
 * Constant-factor profiles always return 1.
 */
double
medication_phase(const KineticProfile &profile, double hours_since_dose);

/// Where a medication course stands at a given time.
struct MedicationState {
    bool active = false;          ///< Inside the schedule's date range.
    double factor = 1.0;          ///< 1 + (course.factor - 1) * phase
    double phase = 0.0;
    TimestampMs last_dose = 0.0;  ///< Only meaningful for duration-based profiles; NaN without daily times.
    double hours_since_dose = 0.0;
};

MedicationState
medication_state_at(const MedicationCourse &course, const KineticProfile &profile, TimestampMs now);

/**
 * @brief Hours elapsed for @p source at @p at in the sense its curve expects.
 *
 * Medication courses measure from their latest daily dose and return NaN when
 * the course is not active at @p at.
 */
double
elapsed_hours_at(const EffectSource &source, const KineticProfile &profile, TimestampMs at);

/**
 * @brief Dispatches to the generator for the source's kind.
 *
 * For meals @p profile must already be adjusted with adjust_meal_profile().
 * Result units: insulin units, carb-equivalent grams, activity intensity,
 * medication phase.
 */
double
effect_at(const EffectSource &source,
          const KineticProfile &profile,
          const PatientConstants &constants,
          double elapsed_hours);

} // namespace glucotrace

#endif // EFFECT_CURVES_HPP
