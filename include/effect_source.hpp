#ifndef EFFECT_SOURCE_HPP
#define EFFECT_SOURCE_HPP

#include "time_utils.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace glucotrace {

enum class AbsorptionClass { VerySlow, Slow, Medium, Fast, VeryFast };

std::string
to_string(AbsorptionClass cls);

/// Accepts the snake_case names used by the meal log ("very_slow" .. "very_fast").
std::optional<AbsorptionClass>
absorption_class_from_string(const std::string &name);

struct InsulinDose {
    std::string id;
    std::string medication_id; ///< Insulin type, e.g. "insulin_lispro".
    double units = 0.0;
    TimestampMs administered_at = 0.0;
};

struct MealRecord {
    std::string id;
    double carbs_grams = 0.0;
    double protein_grams = 0.0;
    double fat_grams = 0.0;
    double fiber_grams = 0.0;
    AbsorptionClass absorption = AbsorptionClass::Medium;
    TimestampMs occurred_at = 0.0;
};

struct ActivityRecord {
    std::string id;
    int level = 0; ///< -2 (sleep) .. 2 (vigorous)
    TimestampMs start_at = 0.0;
    TimestampMs end_at = 0.0;
};

struct MedicationSchedule {
    TimestampMs start_date = 0.0;
    TimestampMs end_date = 0.0;
    std::vector<std::string> daily_times; ///< "HH:MM", UTC
};

struct MedicationCourse {
    std::string id;
    std::string medication_id;
    double factor = 1.0; ///< Steady-state insulin-need multiplier.
    MedicationSchedule schedule;
};

using EffectSource = std::variant<InsulinDose, MealRecord, ActivityRecord, MedicationCourse>;

enum class EffectCategory { Insulin, Meal, Activity, Medication };

std::string
to_string(EffectCategory category);

EffectCategory
category_of(const EffectSource &source);

const std::string &
id_of(const EffectSource &source);

/**
 * @brief The id used to look up the kinetic profile of a source.
 *
 * Insulin and medication use their medication id, meals their absorption
 * class. Activities derive their profile from the record and return "".
 */
std::string
profile_key_of(const EffectSource &source);

enum class ReadingSource { Manual, Sensor };

/// Ground-truth glucose measurement. Never modified by the engine.
struct GlucoseReading {
    TimestampMs timestamp = 0.0;
    double value = 0.0;
    ReadingSource source = ReadingSource::Manual;
};

} // namespace glucotrace

#endif // EFFECT_SOURCE_HPP
