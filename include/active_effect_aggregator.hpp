#ifndef ACTIVE_EFFECT_AGGREGATOR_HPP
#define ACTIVE_EFFECT_AGGREGATOR_HPP

#include "diagnostics.hpp"
#include "effect_source.hpp"
#include "kinetic_profile.hpp"
#include "patient_constants.hpp"
#include <map>
#include <string>
#include <vector>

namespace glucotrace {

/**
 * @brief Resolves and memoises kinetic profiles for one invocation.
 *
 * Each distinct type id is looked up once. Ids missing from the resolver are
 * reported to the diagnostics the first time they are seen. Meal profiles are
 * adjusted per meal on top of the cached class profile; activity profiles are
 * derived from the record.
 */
class ProfileCache {
  public:
    ProfileCache(const KineticProfileResolver &resolver,
                 const PatientConstants &constants,
                 Diagnostics *diagnostics = nullptr,
                 bool log_warnings = false);

    KineticProfile profile_for(const EffectSource &source);

    const PatientConstants &constants() const { return m_constants; }

  private:
    const KineticProfile &lookup(const std::string &key);

    const KineticProfileResolver &m_resolver;
    const PatientConstants &m_constants;
    Diagnostics *m_diagnostics;
    bool m_log_warnings;
    std::map<std::string, KineticProfile> m_cache;
};

/**
 * @brief Sum of one category's curve outputs at a timestamp.
 */
struct AggregateResult {
    double total = 0.0;
    std::map<std::string, double> by_id; ///< Only sources with a non-zero contribution.
};

/**
 * @brief Magnitude of a single source at a timestamp.
 */
struct SourceContribution {
    std::string id;
    EffectCategory category = EffectCategory::Insulin;
    double magnitude = 0.0;     ///< Units, carb-equivalent grams, intensity or phase.
    double glucose_impact = 0.0; ///< Signed glucose units; filled in by the timeline.
};

/**
 * @brief Sums the contributions of all sources of @p category active at @p at.
 *
 * Sources outside their active window contribute nothing; the total is never
 * negative.
 */
AggregateResult
aggregate(const std::vector<EffectSource> &sources, EffectCategory category, TimestampMs at, ProfileCache &profiles);

/// Convenience overload with a throw-away profile cache.
AggregateResult
aggregate(const std::vector<EffectSource> &sources,
          EffectCategory category,
          TimestampMs at,
          const KineticProfileResolver &resolver,
          const PatientConstants &constants);

/// Every non-zero contribution at @p at, in input order.
std::vector<SourceContribution>
contributions_at(const std::vector<EffectSource> &sources, TimestampMs at, ProfileCache &profiles);

/**
 * @brief Combined insulin-need multiplier at @p at.
 *
 * Product of the activity multipliers and medication factors active at
 * @p at; 1.0 when none are. Values above 1 mean insulin is less effective.
 */
double
insulin_resistance_at(const std::vector<EffectSource> &sources, TimestampMs at, ProfileCache &profiles);

/**
 * @brief Amount of a category not yet absorbed at @p at.
 *
 * Insulin units remaining or carb-equivalent grams still to be absorbed,
 * computed from the area under each source's curve. Sources that have not
 * started yet count as zero.
 *
 * @throws std::invalid_argument for categories without an absorbable amount.
 */
AggregateResult
on_board(const std::vector<EffectSource> &sources, EffectCategory category, TimestampMs at, ProfileCache &profiles);

} // namespace glucotrace

#endif // ACTIVE_EFFECT_AGGREGATOR_HPP
