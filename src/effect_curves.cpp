#include "effect_curves.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace glucotrace {

namespace {

bool
inside_window(double t, double duration) {
    // Written so that NaN falls outside.
    return t >= 0.0 && t < duration;
}

double
triangular_action(double units, double onset, double peak, double duration, double t) {
    if (!inside_window(t, duration)) { return 0.0; }

    double effect = 0.0;
    if (t < peak) {
        if (t < onset) {
            effect = units * (t / onset) * (peak / duration);
        } else {
            effect = units * (t / peak);
        }
    } else {
        effect = units * (1.0 - (t - peak) / (duration - peak));
    }
    return std::max(0.0, effect);
}

double
peakless_action(double units, double onset, double duration, double t) {
    if (!inside_window(t, duration)) { return 0.0; }

    double effect = 0.0;
    if (t < onset) {
        effect = units * 0.5 * (t / onset);
    } else {
        effect = units * 0.5 * (1.0 - (t - onset) / (duration - onset));
    }
    return std::max(0.0, effect);
}

std::vector<double>
parse_daily_offsets(const std::vector<std::string> &daily_times) {
    std::vector<double> offsets;
    offsets.reserve(daily_times.size());
    for (const auto &entry : daily_times) {
        if (auto parsed = parse_daily_time(entry)) { offsets.push_back(*parsed); }
    }
    return offsets;
}

} // namespace

// --- Insulin ---

double
insulin_action(double units, const KineticProfile &profile, double elapsed_hours) {
    if (!(units > 0.0)) { return 0.0; }

    const double onset = profile.onset_hours;
    const double duration = profile.duration_hours;

    switch (profile.shape) {
        case ProfileShape::Peakless: return peakless_action(units, onset, duration, elapsed_hours);

        case ProfileShape::Biphasic: {
            if (!inside_window(elapsed_hours, duration)) { return 0.0; }
            const double peak = profile.peak_or_duration();
            const double fast_peak = std::max(onset, peak / 2.0);
            const double fast_duration = std::max(duration / 2.0, fast_peak);
            const double f = std::clamp(profile.fast_fraction, 0.0, 1.0);
            return f * triangular_action(units, onset, fast_peak, fast_duration, elapsed_hours) +
                   (1.0 - f) * triangular_action(units, onset, peak, duration, elapsed_hours);
        }

        case ProfileShape::Triangular:
        default: return triangular_action(units, onset, profile.peak_or_duration(), duration, elapsed_hours);
    }
}

// --- Meals ---

double
carb_equivalent(const MealRecord &meal, const PatientConstants &constants) {
    const double total = meal.carbs_grams + meal.protein_grams * constants.protein_factor +
                         meal.fat_grams * constants.fat_factor - meal.fiber_grams * constants.fiber_factor;
    return std::max(0.0, total);
}

KineticProfile
adjust_meal_profile(const KineticProfile &base, const MealRecord &meal, double modifier) {
    const double m = modifier > 0.0 ? modifier : 1.0;
    const double extension = 0.02 * meal.fat_grams + 0.01 * meal.protein_grams;

    KineticProfile adjusted = base;
    adjusted.shape = ProfileShape::Triangular;
    adjusted.onset_hours = base.onset_hours / m;
    adjusted.peak_hours = base.peak_or_duration() / m;
    adjusted.duration_hours = (base.duration_hours + std::max(0.0, extension)) / m;
    return adjusted;
}

double
meal_absorption(double carb_eq, const KineticProfile &adjusted, double modifier, double elapsed_hours) {
    const double duration = adjusted.duration_hours;
    if (!(carb_eq > 0.0) || !inside_window(elapsed_hours, duration)) { return 0.0; }

    const double m = modifier > 0.0 ? modifier : 1.0;
    const double onset = adjusted.onset_hours;
    const double peak = adjusted.peak_or_duration();
    const double t = elapsed_hours;

    if (t < onset) { return 0.0; }
    if (t < peak) {
        const double rise = (t - onset) / (peak - onset);
        return carb_eq * std::pow(rise, m);
    }
    const double s = (t - peak) / (duration - peak);
    return std::max(0.0, carb_eq * std::pow(1.0 - s, m));
}

// --- Activity ---

double
activity_tail_hours(const ActivityRecord &activity) {
    const double activity_hours = std::max(0.0, hours_between(activity.start_at, activity.end_at));
    const double level_weight = std::max(0.0, 1.0 + 0.2 * activity.level);
    return std::min(24.0, 2.0 + activity_hours * level_weight);
}

KineticProfile
activity_profile(const ActivityRecord &activity) {
    const double activity_hours = std::max(0.0, hours_between(activity.start_at, activity.end_at));
    return make_triangular_profile(0.0, activity_hours, activity_hours + activity_tail_hours(activity));
}

double
activity_intensity(const KineticProfile &profile, double elapsed_hours) {
    const double duration = profile.duration_hours;
    if (!inside_window(elapsed_hours, duration)) { return 0.0; }

    const double activity_hours = profile.peak_or_duration();
    if (elapsed_hours < activity_hours) {
        return std::min(1.0, 0.2 + 0.8 * (elapsed_hours / activity_hours));
    }
    const double tail = duration - activity_hours;
    return std::max(0.0, 1.0 - (elapsed_hours - activity_hours) / tail);
}

// --- Medication ---

double
medication_phase(const KineticProfile &profile, double hours_since_dose) {
    if (!profile.duration_based) { return hours_since_dose >= 0.0 ? 1.0 : 0.0; }

    const double duration = profile.duration_hours;
    const double h = hours_since_dose;
    if (!inside_window(h, duration)) { return 0.0; }

    const double onset = profile.onset_hours;
    const double peak = profile.peak_hours.value_or(onset);
    if (h < onset) { return h / onset; }
    if (h < peak) { return 1.0; }
    return std::clamp((duration - h) / (duration - peak), 0.0, 1.0);
}

MedicationState
medication_state_at(const MedicationCourse &course, const KineticProfile &profile, TimestampMs now) {
    MedicationState state;
    const auto &schedule = course.schedule;
    if (!(now >= schedule.start_date && now <= schedule.end_date)) { return state; }

    state.active = true;
    if (!profile.duration_based) {
        state.phase = 1.0;
        state.factor = course.factor;
        return state;
    }

    const auto last_dose = last_daily_dose_time(parse_daily_offsets(schedule.daily_times), now);
    if (!last_dose) {
        // No dose time to measure from: the course stays neutral.
        state.last_dose = std::numeric_limits<double>::quiet_NaN();
        state.hours_since_dose = std::numeric_limits<double>::quiet_NaN();
        return state;
    }
    state.last_dose = *last_dose;
    state.hours_since_dose = hours_between(state.last_dose, now);
    state.phase = medication_phase(profile, state.hours_since_dose);
    state.factor = 1.0 + (course.factor - 1.0) * state.phase;
    return state;
}

// --- Dispatch ---

double
elapsed_hours_at(const EffectSource &source, const KineticProfile &profile, TimestampMs at) {
    return std::visit(
      [&](const auto &s) -> double {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, InsulinDose>) {
              return hours_between(s.administered_at, at);
          } else if constexpr (std::is_same_v<T, MealRecord>) {
              return hours_between(s.occurred_at, at);
          } else if constexpr (std::is_same_v<T, ActivityRecord>) {
              return hours_between(s.start_at, at);
          } else {
              const MedicationState state = medication_state_at(s, profile, at);
              if (!state.active) { return std::numeric_limits<double>::quiet_NaN(); }
              return profile.duration_based ? state.hours_since_dose : 0.0;
          }
      },
      source);
}

double
effect_at(const EffectSource &source,
          const KineticProfile &profile,
          const PatientConstants &constants,
          double elapsed_hours) {
    return std::visit(
      [&](const auto &s) -> double {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, InsulinDose>) {
              return insulin_action(s.units, profile, elapsed_hours);
          } else if constexpr (std::is_same_v<T, MealRecord>) {
              return meal_absorption(carb_equivalent(s, constants),
                                     profile,
                                     constants.absorption_modifier(s.absorption),
                                     elapsed_hours);
          } else if constexpr (std::is_same_v<T, ActivityRecord>) {
              return activity_intensity(profile, elapsed_hours);
          } else {
              return medication_phase(profile, elapsed_hours);
          }
      },
      source);
}

} // namespace glucotrace
