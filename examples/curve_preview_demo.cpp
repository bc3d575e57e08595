#include "glucotrace.hpp"
#include <iostream>
#include <vector>

using namespace glucotrace;

int
main() {
    std::cout << "--- Effect Curve Preview Example ---" << '\n';

    PatientConstants constants;
    KineticProfileResolver resolver = make_resolver(constants);
    ProfileCache profiles(resolver, constants);

    const TimestampMs t0 = 1709272800000.0;

    MealRecord pasta;
    pasta.id = "pasta";
    pasta.carbs_grams = 60.0;
    pasta.absorption = AbsorptionClass::Medium;
    pasta.occurred_at = t0;

    MealRecord pizza = pasta;
    pizza.id = "pizza";
    pizza.fat_grams = 30.0;
    pizza.protein_grams = 25.0;
    pizza.absorption = AbsorptionClass::Slow;

    std::vector<EffectSource> sources = {
        InsulinDose{ "lispro", "insulin_lispro", 5.0, t0 },
        InsulinDose{ "glargine", "insulin_glargine", 20.0, t0 },
        InsulinDose{ "premix", "nph_regular_70_30", 10.0, t0 },
        pasta,
        pizza,
        ActivityRecord{ "run", 2, t0, t0 + MS_PER_HOUR },
    };

    for (const auto &source : sources) {
        const CurvePreview preview = preview_curve(source, profiles);
        std::cout << preview.source_id << " [" << to_string(preview.category) << ", "
                  << to_string(preview.profile.shape) << "]" << '\n';
        std::cout << "  samples:      " << preview.hours.size() << " over " << preview.profile.duration_hours
                  << " h" << '\n';
        std::cout << "  peak:         " << preview.peak_magnitude << " at " << preview.peak_hours << " h" << '\n';
        std::cout << "  area:         " << preview.area << '\n';
        std::cout << "  glucose peak: " << preview.glucose_equivalent_peak << '\n';
    }

    return 0;
}
