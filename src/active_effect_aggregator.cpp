#include "active_effect_aggregator.hpp"

#include "effect_curves.hpp"
#include "effect_integration.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace glucotrace {

// --- ProfileCache ---

ProfileCache::ProfileCache(const KineticProfileResolver &resolver,
                           const PatientConstants &constants,
                           Diagnostics *diagnostics,
                           bool log_warnings)
  : m_resolver(resolver)
  , m_constants(constants)
  , m_diagnostics(diagnostics)
  , m_log_warnings(log_warnings) {}

const KineticProfile &
ProfileCache::lookup(const std::string &key) {
    auto it = m_cache.find(key);
    if (it != m_cache.end()) { return it->second; }

    KineticProfile profile = m_resolver.resolve(key);
    if (profile.fallback && m_diagnostics) {
        m_diagnostics->missing_profiles.insert(key);
        m_diagnostics->warn("ProfileCache", "No kinetic profile for '" + key + "'; using the default profile.",
                            m_log_warnings);
    }
    return m_cache.emplace(key, profile).first->second;
}

KineticProfile
ProfileCache::profile_for(const EffectSource &source) {
    if (const auto *meal = std::get_if<MealRecord>(&source)) {
        return adjust_meal_profile(
          lookup(profile_key_of(source)), *meal, m_constants.absorption_modifier(meal->absorption));
    }
    if (const auto *activity = std::get_if<ActivityRecord>(&source)) { return activity_profile(*activity); }
    return lookup(profile_key_of(source));
}

// --- Aggregation ---

AggregateResult
aggregate(const std::vector<EffectSource> &sources, EffectCategory category, TimestampMs at, ProfileCache &profiles) {
    AggregateResult result;
    for (const auto &source : sources) {
        if (category_of(source) != category) { continue; }

        const KineticProfile profile = profiles.profile_for(source);
        const double elapsed = elapsed_hours_at(source, profile, at);
        const double value = effect_at(source, profile, profiles.constants(), elapsed);
        if (value > 0.0) {
            result.by_id[id_of(source)] += value;
            result.total += value;
        }
    }
    result.total = std::max(0.0, result.total);
    return result;
}

AggregateResult
aggregate(const std::vector<EffectSource> &sources,
          EffectCategory category,
          TimestampMs at,
          const KineticProfileResolver &resolver,
          const PatientConstants &constants) {
    ProfileCache profiles(resolver, constants);
    return aggregate(sources, category, at, profiles);
}

std::vector<SourceContribution>
contributions_at(const std::vector<EffectSource> &sources, TimestampMs at, ProfileCache &profiles) {
    std::vector<SourceContribution> out;
    for (const auto &source : sources) {
        const KineticProfile profile = profiles.profile_for(source);
        const double value = effect_at(source, profile, profiles.constants(), elapsed_hours_at(source, profile, at));
        if (value > 0.0) {
            SourceContribution contribution;
            contribution.id = id_of(source);
            contribution.category = category_of(source);
            contribution.magnitude = value;
            out.push_back(contribution);
        }
    }
    return out;
}

double
insulin_resistance_at(const std::vector<EffectSource> &sources, TimestampMs at, ProfileCache &profiles) {
    double product = 1.0;
    for (const auto &source : sources) {
        if (const auto *activity = std::get_if<ActivityRecord>(&source)) {
            const KineticProfile profile = activity_profile(*activity);
            const double intensity = activity_intensity(profile, hours_between(activity->start_at, at));
            product *= activity_multiplier(intensity, profiles.constants().activity_coefficient(activity->level));
        } else if (const auto *course = std::get_if<MedicationCourse>(&source)) {
            product *= medication_state_at(*course, profiles.profile_for(source), at).factor;
        }
    }
    return (std::isfinite(product) && product > 0.0) ? product : 1.0;
}

AggregateResult
on_board(const std::vector<EffectSource> &sources, EffectCategory category, TimestampMs at, ProfileCache &profiles) {
    if (category != EffectCategory::Insulin && category != EffectCategory::Meal) {
        throw std::invalid_argument("on_board is only defined for insulin and meal sources, not " +
                                    to_string(category) + ".");
    }

    AggregateResult result;
    for (const auto &source : sources) {
        if (category_of(source) != category) { continue; }

        const KineticProfile profile = profiles.profile_for(source);
        const double elapsed = elapsed_hours_at(source, profile, at);
        if (!(elapsed >= 0.0)) { continue; } // Not taken yet.

        double amount = 0.0;
        if (const auto *dose = std::get_if<InsulinDose>(&source)) {
            amount = dose->units;
        } else {
            amount = carb_equivalent(std::get<MealRecord>(source), profiles.constants());
        }

        const PatientConstants &constants = profiles.constants();
        auto curve = [&](double t) { return effect_at(source, profile, constants, t); };
        const double remaining = amount * remaining_fraction(curve, elapsed, profile.duration_hours);
        if (remaining > 0.0) {
            result.by_id[id_of(source)] += remaining;
            result.total += remaining;
        }
    }
    result.total = std::max(0.0, result.total);
    return result;
}

} // namespace glucotrace
