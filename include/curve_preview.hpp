#ifndef CURVE_PREVIEW_HPP
#define CURVE_PREVIEW_HPP

#include "active_effect_aggregator.hpp"
#include "effect_source.hpp"
#include "kinetic_profile.hpp"
#include <Eigen/Core>
#include <string>

namespace glucotrace {

/**
 * @brief One source's effect curve sampled over its active window.
 */
struct CurvePreview {
    std::string source_id;
    EffectCategory category = EffectCategory::Insulin;
    KineticProfile profile; ///< Resolved (and for meals, adjusted) profile.

    Eigen::VectorXd hours;      ///< Elapsed hours of each sample, starting at 0 and ending at the duration.
    Eigen::VectorXd magnitudes; ///< Curve output at each sample.

    double peak_hours = 0.0;
    double peak_magnitude = 0.0;
    double area = 0.0; ///< Trapezoidal area under the sampled curve (magnitude * hours).

    /// Peak converted to glucose units: -peak*isf for insulin, peak*carb_to_bg for meals, 0 otherwise.
    double glucose_equivalent_peak = 0.0;
};

/**
 * @brief Samples @p source on a grid of @p interval_minutes.
 *
 * Non-duration-based medications have no window and yield a single sample.
 *
 * @throws std::invalid_argument if @p interval_minutes is not positive.
 */
CurvePreview
preview_curve(const EffectSource &source, ProfileCache &profiles, double interval_minutes = 5.0);

} // namespace glucotrace

#endif // CURVE_PREVIEW_HPP
