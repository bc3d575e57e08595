#ifndef KINETIC_PROFILE_HPP
#define KINETIC_PROFILE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace glucotrace {

/**
 * @brief Shape of an effect curve.
 *
 * Peakless is an explicit tag; a profile without a peak is not assumed to be
 * peakless unless it says so.
 */
enum class ProfileShape { Triangular, Peakless, Biphasic };

std::string
to_string(ProfileShape shape);

/**
 * @brief Timing parameters of an effect source (insulin, medication, meal class).
 *
 * Invariant: 0 <= onset_hours <= (peak_hours or duration_hours) <= duration_hours.
 */
struct KineticProfile {
    double onset_hours = 0.5;
    std::optional<double> peak_hours = 2.0;
    double duration_hours = 4.0;
    ProfileShape shape = ProfileShape::Triangular;

    /// False for medications whose factor is constant while the course is active.
    bool duration_based = true;

    /// Share of a biphasic (premixed) dose that acts like the rapid component.
    double fast_fraction = 0.3;

    /// Set by the resolver when the profile is the default stand-in for an unknown id.
    bool fallback = false;

    double peak_or_duration() const { return peak_hours ? *peak_hours : duration_hours; }

    /**
     * @brief Checks the ordering invariant and shape requirements.
     * @throws std::invalid_argument describing the first violation.
     */
    void validate() const;
};

KineticProfile
make_triangular_profile(double onset, double peak, double duration);

KineticProfile
make_peakless_profile(double onset, double duration);

KineticProfile
make_biphasic_profile(double onset, double peak, double duration, double fast_fraction);

/// A constant-factor medication profile (no timing).
KineticProfile
make_constant_profile();

/**
 * @brief Maps effect-source type ids (insulin type, medication id, absorption
 *        class) to kinetic profiles.
 *
 * Seeded with a built-in catalogue; callers may register patient-specific
 * profiles on top of it. Lookups never fail.
 */
class KineticProfileResolver {
  public:
    KineticProfileResolver();

    /**
     * @brief Adds or replaces the profile for @p id.
     * @throws std::invalid_argument if @p id is empty or the profile is invalid.
     */
    void register_profile(const std::string &id, const KineticProfile &profile);

    bool contains(const std::string &id) const;

    /**
     * @brief Returns the profile registered for @p id.
     *
     * Unknown ids resolve to default_profile() with `fallback` set so the
     * caller can flag the degraded data.
     */
    KineticProfile resolve(const std::string &id) const;

    std::vector<std::string> ids() const;

    /// onset 0.5h, peak 2h, duration 4h, triangular.
    static KineticProfile default_profile();

  private:
    std::map<std::string, KineticProfile> m_profiles;
};

} // namespace glucotrace

#endif // KINETIC_PROFILE_HPP
