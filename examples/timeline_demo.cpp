#include "glucotrace.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace glucotrace;

int
main() {
    std::cout << "--- Glucose Timeline Example ---" << '\n';

    // --- 1. Patient constants ---
    PatientConstants constants;
    constants.target_glucose = 110.0;
    constants.insulin_sensitivity_factor = 40.0;
    constants.carb_to_bg_factor = 3.5;

    // 2024-03-01T06:00:00Z
    const TimestampMs day_start = 1709272800000.0;
    const TimestampMs now = day_start + 5.0 * MS_PER_HOUR;

    // --- 2. Records supplied by the caller ---
    std::vector<GlucoseReading> readings = {
        { day_start + 0.5 * MS_PER_HOUR, 142.0, ReadingSource::Sensor },
        { day_start + 0.75 * MS_PER_HOUR, 150.0, ReadingSource::Sensor },
        { day_start + 3.0 * MS_PER_HOUR, 128.0, ReadingSource::Manual },
    };

    MealRecord breakfast;
    breakfast.id = "breakfast";
    breakfast.carbs_grams = 55.0;
    breakfast.protein_grams = 20.0;
    breakfast.fat_grams = 12.0;
    breakfast.fiber_grams = 6.0;
    breakfast.absorption = AbsorptionClass::Medium;
    breakfast.occurred_at = day_start + 1.0 * MS_PER_HOUR;

    InsulinDose bolus{ "bolus-1", "insulin_aspart", 4.5, day_start + 0.9 * MS_PER_HOUR };
    InsulinDose lunch_bolus{ "bolus-2", "insulin_aspart", 5.0, now + 0.5 * MS_PER_HOUR };

    MealRecord lunch;
    lunch.id = "lunch";
    lunch.carbs_grams = 70.0;
    lunch.absorption = AbsorptionClass::Fast;
    lunch.occurred_at = now + 0.5 * MS_PER_HOUR;

    ActivityRecord walk{ "walk", 1, day_start + 4.0 * MS_PER_HOUR, day_start + 4.5 * MS_PER_HOUR };

    std::vector<EffectSource> sources = { bolus, breakfast, lunch_bolus, lunch, walk };

    // --- 3. Build the timeline ---
    TimelineOptions options;
    options.log_warnings = true;
    TimelineEngine engine(constants, options);

    TimeWindow window;
    window.start = day_start;
    window.end = day_start + 12.0 * MS_PER_HOUR;
    window.interval_minutes = suggest_interval_minutes(window.start, window.end);

    Timeline timeline = engine.build(readings, sources, window, now);

    std::cout << std::fixed << std::setprecision(1);
    std::cout << "Hour\tValue\tBase\tKind\t\t\tPhase\t\tIOB-act\tCarbEq" << '\n';
    for (const auto &p : thin_estimated_points(timeline.points)) {
        std::cout << hours_between(day_start, p.timestamp) << "\t" << p.value << "\t" << p.baseline_value << "\t"
                  << to_string(p.classification) << "\t\t" << to_string(p.phase) << "\t" << p.total_insulin_active
                  << "\t" << p.total_carb_equivalent_active << '\n';
    }

    std::cout << '\n' << "Actual readings:" << '\n';
    for (const auto &p : timeline.points) {
        if (!p.is_actual()) { continue; }
        std::cout << "  " << hours_between(day_start, p.timestamp) << " h: " << p.value << " ("
                  << to_string(p.status) << (p.connects_to_previous ? ", connected" : "") << ")" << '\n';
    }

    // --- 4. Summary at now ---
    const TimelineSummary &s = timeline.summary;
    std::cout << '\n' << "At now:" << '\n';
    std::cout << "  active insulin:        " << s.total_active_insulin << " U" << '\n';
    std::cout << "  insulin on board:      " << s.insulin_on_board << " U" << '\n';
    std::cout << "  active carb-equivalent: " << s.total_carb_equivalent << " g" << '\n';
    std::cout << "  carbs on board:        " << s.carbs_on_board << " g" << '\n';
    std::cout << "  insulin resistance:    " << std::setprecision(2) << s.insulin_resistance << '\n';
    for (const auto &c : s.breakdown) {
        std::cout << "    " << c.id << " (" << to_string(c.category) << "): " << c.magnitude << " -> "
                  << c.glucose_impact << '\n';
    }
    std::cout << "  points: " << s.actual_points << " actual, " << s.estimated_points << " estimated" << '\n';

    if (timeline.diagnostics.degraded()) {
        std::cout << '\n' << "Diagnostics:" << '\n';
        for (const auto &w : timeline.diagnostics.warnings) { std::cout << "  " << w << '\n'; }
    }

    return 0;
}
