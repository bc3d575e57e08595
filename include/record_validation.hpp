#ifndef RECORD_VALIDATION_HPP
#define RECORD_VALIDATION_HPP

#include "diagnostics.hpp"
#include "effect_source.hpp"
#include <string>
#include <vector>

namespace glucotrace {

/// Valid timestamp and a finite, non-negative value.
bool
is_valid_reading(const GlucoseReading &reading);

/**
 * @brief Checks timestamps and magnitudes of an effect source.
 * @param reason Receives a short explanation when the source is rejected.
 */
bool
is_valid_source(const EffectSource &source, std::string *reason = nullptr);

/**
 * @brief Drops unusable readings, counting and logging each one.
 */
std::vector<GlucoseReading>
filter_readings(const std::vector<GlucoseReading> &readings, Diagnostics &diagnostics, bool log_warnings);

/**
 * @brief Drops unusable sources. Medication schedules lose any daily time that
 *        does not parse; the rest of the course is kept.
 */
std::vector<EffectSource>
filter_sources(const std::vector<EffectSource> &sources, Diagnostics &diagnostics, bool log_warnings);

} // namespace glucotrace

#endif // RECORD_VALIDATION_HPP
