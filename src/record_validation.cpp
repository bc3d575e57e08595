#include "record_validation.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

namespace glucotrace {

namespace {

bool
is_amount(double grams) {
    return std::isfinite(grams) && grams >= 0.0;
}

bool
reject(std::string *reason, const char *why) {
    if (reason) { *reason = why; }
    return false;
}

} // namespace

bool
is_valid_reading(const GlucoseReading &reading) {
    return is_valid_timestamp(reading.timestamp) && std::isfinite(reading.value) && reading.value >= 0.0;
}

bool
is_valid_source(const EffectSource &source, std::string *reason) {
    return std::visit(
      [reason](const auto &s) -> bool {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, InsulinDose>) {
              if (!is_valid_timestamp(s.administered_at)) { return reject(reason, "invalid administration time"); }
              if (!std::isfinite(s.units) || s.units <= 0.0) { return reject(reason, "dose must be positive"); }
          } else if constexpr (std::is_same_v<T, MealRecord>) {
              if (!is_valid_timestamp(s.occurred_at)) { return reject(reason, "invalid meal time"); }
              if (!is_amount(s.carbs_grams) || !is_amount(s.protein_grams) || !is_amount(s.fat_grams) ||
                  !is_amount(s.fiber_grams)) {
                  return reject(reason, "nutrient amounts must be non-negative");
              }
          } else if constexpr (std::is_same_v<T, ActivityRecord>) {
              if (!is_valid_timestamp(s.start_at) || !is_valid_timestamp(s.end_at)) {
                  return reject(reason, "invalid activity time");
              }
              if (s.end_at < s.start_at) { return reject(reason, "activity ends before it starts"); }
          } else {
              if (!std::isfinite(s.factor) || s.factor <= 0.0) { return reject(reason, "factor must be positive"); }
              if (!is_valid_timestamp(s.schedule.start_date) || !is_valid_timestamp(s.schedule.end_date)) {
                  return reject(reason, "invalid schedule dates");
              }
              if (s.schedule.end_date < s.schedule.start_date) {
                  return reject(reason, "schedule ends before it starts");
              }
          }
          return true;
      },
      source);
}

std::vector<GlucoseReading>
filter_readings(const std::vector<GlucoseReading> &readings, Diagnostics &diagnostics, bool log_warnings) {
    std::vector<GlucoseReading> kept;
    kept.reserve(readings.size());
    for (const auto &reading : readings) {
        if (is_valid_reading(reading)) {
            kept.push_back(reading);
            continue;
        }
        ++diagnostics.dropped_readings;
        std::ostringstream msg;
        msg << "Dropping glucose reading (timestamp " << reading.timestamp << ", value " << reading.value << ").";
        diagnostics.warn("RecordValidation", msg.str(), log_warnings);
    }
    return kept;
}

std::vector<EffectSource>
filter_sources(const std::vector<EffectSource> &sources, Diagnostics &diagnostics, bool log_warnings) {
    std::vector<EffectSource> kept;
    kept.reserve(sources.size());
    for (const auto &source : sources) {
        std::string reason;
        if (!is_valid_source(source, &reason)) {
            ++diagnostics.dropped_sources;
            diagnostics.warn("RecordValidation",
                             "Dropping " + to_string(category_of(source)) + " record '" + id_of(source) + "': " +
                               reason + ".",
                             log_warnings);
            continue;
        }

        if (const auto *course = std::get_if<MedicationCourse>(&source)) {
            MedicationCourse cleaned = *course;
            cleaned.schedule.daily_times.clear();
            for (const auto &entry : course->schedule.daily_times) {
                if (parse_daily_time(entry)) {
                    cleaned.schedule.daily_times.push_back(entry);
                } else {
                    diagnostics.warn("RecordValidation",
                                     "Ignoring daily time '" + entry + "' of medication course '" + course->id + "'.",
                                     log_warnings);
                }
            }
            kept.emplace_back(std::move(cleaned));
        } else {
            kept.push_back(source);
        }
    }
    return kept;
}

} // namespace glucotrace
