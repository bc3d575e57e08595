#include "curve_preview.hpp"

#include "effect_curves.hpp"
#include <cmath>
#include <stdexcept>

namespace glucotrace {

CurvePreview
preview_curve(const EffectSource &source, ProfileCache &profiles, double interval_minutes) {
    if (!std::isfinite(interval_minutes) || interval_minutes <= 0.0) {
        throw std::invalid_argument("preview_curve: interval_minutes must be positive.");
    }

    CurvePreview preview;
    preview.source_id = id_of(source);
    preview.category = category_of(source);
    preview.profile = profiles.profile_for(source);

    const PatientConstants &constants = profiles.constants();
    const double duration = preview.profile.duration_based ? preview.profile.duration_hours : 0.0;
    const double step = interval_minutes / 60.0;

    const Eigen::Index n = static_cast<Eigen::Index>(std::floor(duration / step + 1e-9)) + 1;
    const double last = static_cast<double>(n - 1) * step;
    preview.hours = Eigen::VectorXd::LinSpaced(n, 0.0, last);
    if (duration - last > 1e-9) {
        preview.hours.conservativeResize(n + 1);
        preview.hours(n) = duration;
    } else {
        preview.hours(n - 1) = duration;
    }

    preview.magnitudes = preview.hours.unaryExpr(
      [&](double t) { return effect_at(source, preview.profile, constants, t); });

    Eigen::Index peak_index = 0;
    preview.peak_magnitude = preview.magnitudes.maxCoeff(&peak_index);
    preview.peak_hours = preview.hours(peak_index);

    const Eigen::Index m = preview.hours.size();
    if (m > 1) {
        const Eigen::VectorXd widths = preview.hours.tail(m - 1) - preview.hours.head(m - 1);
        const Eigen::VectorXd heights = preview.magnitudes.tail(m - 1) + preview.magnitudes.head(m - 1);
        preview.area = 0.5 * widths.dot(heights);
    }

    switch (preview.category) {
        case EffectCategory::Insulin:
            preview.glucose_equivalent_peak = -preview.peak_magnitude * constants.effective_insulin_sensitivity();
            break;
        case EffectCategory::Meal:
            preview.glucose_equivalent_peak = preview.peak_magnitude * constants.carb_to_bg_factor;
            break;
        case EffectCategory::Activity:
        case EffectCategory::Medication: preview.glucose_equivalent_peak = 0.0; break;
    }
    return preview;
}

} // namespace glucotrace
