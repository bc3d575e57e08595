#include "effect_source.hpp"

#include <type_traits>

namespace glucotrace {

std::string
to_string(AbsorptionClass cls) {
    switch (cls) {
        case AbsorptionClass::VerySlow: return "very_slow";
        case AbsorptionClass::Slow: return "slow";
        case AbsorptionClass::Medium: return "medium";
        case AbsorptionClass::Fast: return "fast";
        case AbsorptionClass::VeryFast: return "very_fast";
    }
    return "medium";
}

std::optional<AbsorptionClass>
absorption_class_from_string(const std::string &name) {
    if (name == "very_slow") { return AbsorptionClass::VerySlow; }
    if (name == "slow") { return AbsorptionClass::Slow; }
    if (name == "medium") { return AbsorptionClass::Medium; }
    if (name == "fast") { return AbsorptionClass::Fast; }
    if (name == "very_fast") { return AbsorptionClass::VeryFast; }
    return std::nullopt;
}

std::string
to_string(EffectCategory category) {
    switch (category) {
        case EffectCategory::Insulin: return "insulin";
        case EffectCategory::Meal: return "meal";
        case EffectCategory::Activity: return "activity";
        case EffectCategory::Medication: return "medication";
    }
    return "unknown";
}

EffectCategory
category_of(const EffectSource &source) {
    return std::visit(
      [](const auto &s) -> EffectCategory {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, InsulinDose>) {
              return EffectCategory::Insulin;
          } else if constexpr (std::is_same_v<T, MealRecord>) {
              return EffectCategory::Meal;
          } else if constexpr (std::is_same_v<T, ActivityRecord>) {
              return EffectCategory::Activity;
          } else {
              return EffectCategory::Medication;
          }
      },
      source);
}

const std::string &
id_of(const EffectSource &source) {
    return std::visit([](const auto &s) -> const std::string & { return s.id; }, source);
}

std::string
profile_key_of(const EffectSource &source) {
    return std::visit(
      [](const auto &s) -> std::string {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, InsulinDose> || std::is_same_v<T, MedicationCourse>) {
              return s.medication_id;
          } else if constexpr (std::is_same_v<T, MealRecord>) {
              return to_string(s.absorption);
          } else {
              return std::string();
          }
      },
      source);
}

} // namespace glucotrace
