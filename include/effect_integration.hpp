#ifndef EFFECT_INTEGRATION_HPP
#define EFFECT_INTEGRATION_HPP

#include <algorithm>
#include <boost/numeric/odeint.hpp>
#include <cmath>
#include <vector>

namespace glucotrace {

namespace odeint = boost::numeric::odeint;

// Area under an effect curve, dA/dt = curve(t), integrated with FIXED STEP RK4.
template<typename TCurve>
double
integrate_curve(const TCurve &curve, double t_end, double dt_fixed) {
    using StateType = std::vector<double>;
    if (!(t_end > 0.0) || !(dt_fixed > 0.0)) { return 0.0; }

    auto system = [&curve](const StateType & /* a */, StateType &dadt, double t) { dadt[0] = curve(t); };

    StateType state = { 0.0 };
    odeint::runge_kutta4<StateType> stepper;

    double t = 0.0;
    const int n_steps = static_cast<int>(t_end / dt_fixed);
    for (int i = 0; i < n_steps; ++i) {
        stepper.do_step(system, state, t, dt_fixed);
        t += dt_fixed;
    }
    // Final partial step
    const double remaining = t_end - t;
    if (remaining > 1e-12 * std::max(1.0, std::abs(t_end))) { stepper.do_step(system, state, t, remaining); }
    return state[0];
}

/**
 * @brief Fraction of a curve's total area still ahead of @p elapsed.
 *
 * 1 before the curve starts, 0 once @p elapsed reaches @p duration.
 */
template<typename TCurve>
double
remaining_fraction(const TCurve &curve, double elapsed, double duration, double dt_fixed = 1.0 / 60.0) {
    if (std::isnan(elapsed) || elapsed >= duration) { return 0.0; }
    if (elapsed <= 0.0) { return 1.0; }

    const double total = integrate_curve(curve, duration, dt_fixed);
    if (!(total > 0.0)) { return 0.0; }
    const double absorbed = integrate_curve(curve, elapsed, dt_fixed);
    return std::clamp(1.0 - absorbed / total, 0.0, 1.0);
}

} // namespace glucotrace

#endif // EFFECT_INTEGRATION_HPP
