#include "kinetic_profile.hpp"

#include <cmath>
#include <stdexcept>

namespace glucotrace {

std::string
to_string(ProfileShape shape) {
    switch (shape) {
        case ProfileShape::Triangular: return "triangular";
        case ProfileShape::Peakless: return "peakless";
        case ProfileShape::Biphasic: return "biphasic";
    }
    return "unknown";
}

void
KineticProfile::validate() const {
    if (!duration_based) { return; } // Constant-factor medications carry no timing.

    if (!std::isfinite(onset_hours) || !std::isfinite(duration_hours)) {
        throw std::invalid_argument("Profile onset and duration must be finite.");
    }
    if (duration_hours <= 0.0) { throw std::invalid_argument("Profile duration_hours must be positive."); }
    if (onset_hours < 0.0) { throw std::invalid_argument("Profile onset_hours must not be negative."); }
    if (peak_hours) {
        if (!std::isfinite(*peak_hours)) { throw std::invalid_argument("Profile peak_hours must be finite."); }
        if (*peak_hours < onset_hours || *peak_hours > duration_hours) {
            throw std::invalid_argument("Profile peak_hours must lie within [onset_hours, duration_hours].");
        }
    } else if (onset_hours > duration_hours) {
        throw std::invalid_argument("Profile onset_hours must not exceed duration_hours.");
    }
    if (shape != ProfileShape::Peakless && !peak_hours) {
        throw std::invalid_argument("Triangular and biphasic profiles need peak_hours.");
    }
    if (shape == ProfileShape::Biphasic && (fast_fraction < 0.0 || fast_fraction > 1.0)) {
        throw std::invalid_argument("Biphasic fast_fraction must lie within [0, 1].");
    }
}

KineticProfile
make_triangular_profile(double onset, double peak, double duration) {
    KineticProfile p;
    p.onset_hours = onset;
    p.peak_hours = peak;
    p.duration_hours = duration;
    p.shape = ProfileShape::Triangular;
    return p;
}

KineticProfile
make_peakless_profile(double onset, double duration) {
    KineticProfile p;
    p.onset_hours = onset;
    p.peak_hours = std::nullopt;
    p.duration_hours = duration;
    p.shape = ProfileShape::Peakless;
    return p;
}

KineticProfile
make_biphasic_profile(double onset, double peak, double duration, double fast_fraction) {
    KineticProfile p = make_triangular_profile(onset, peak, duration);
    p.shape = ProfileShape::Biphasic;
    p.fast_fraction = fast_fraction;
    return p;
}

KineticProfile
make_constant_profile() {
    KineticProfile p;
    p.onset_hours = 0.0;
    p.peak_hours = std::nullopt;
    p.duration_hours = 0.0;
    p.shape = ProfileShape::Peakless;
    p.duration_based = false;
    return p;
}

// --- Resolver ---

KineticProfileResolver::KineticProfileResolver() {
    // Rapid and short acting insulins
    m_profiles["insulin_lispro"] = make_triangular_profile(0.25, 1.5, 4.5);
    m_profiles["insulin_aspart"] = make_triangular_profile(0.25, 1.5, 4.0);
    m_profiles["insulin_glulisine"] = make_triangular_profile(0.25, 1.5, 4.0);
    m_profiles["regular_insulin"] = make_triangular_profile(0.5, 3.0, 6.0);
    m_profiles["nph_insulin"] = make_triangular_profile(1.5, 6.0, 16.0);

    // Long acting basal insulins have no pronounced peak
    m_profiles["insulin_glargine"] = make_peakless_profile(2.0, 24.0);
    m_profiles["insulin_detemir"] = make_peakless_profile(1.0, 24.0);
    m_profiles["insulin_degludec"] = make_peakless_profile(1.0, 42.0);

    // Premixed
    m_profiles["nph_regular_70_30"] = make_biphasic_profile(0.5, 4.0, 14.0, 0.3);
    m_profiles["nph_regular_50_50"] = make_biphasic_profile(0.5, 3.5, 12.0, 0.5);

    // Chronic medications affecting insulin sensitivity
    m_profiles["corticosteroids"] = make_triangular_profile(4.0, 8.0, 24.0);
    m_profiles["oral_contraceptives"] = make_triangular_profile(24.0, 72.0, 720.0);
    m_profiles["injectable_contraceptives"] = make_triangular_profile(48.0, 168.0, 2160.0);
    m_profiles["thiazolidinediones"] = make_triangular_profile(24.0, 48.0, 168.0);
    m_profiles["beta_blockers"] = make_constant_profile();
    m_profiles["thiazide_diuretics"] = make_constant_profile();
    m_profiles["metformin"] = make_constant_profile();

    // Meal absorption classes share the base timing; the class modifier is
    // applied per meal.
    for (const char *cls : { "very_slow", "slow", "medium", "fast", "very_fast" }) {
        m_profiles[cls] = make_triangular_profile(0.0, 1.5, 4.0);
    }
}

void
KineticProfileResolver::register_profile(const std::string &id, const KineticProfile &profile) {
    if (id.empty()) { throw std::invalid_argument("Profile id cannot be empty."); }
    try {
        profile.validate();
    } catch (const std::invalid_argument &e) {
        throw std::invalid_argument("Invalid profile '" + id + "': " + e.what());
    }
    KineticProfile stored = profile;
    stored.fallback = false;
    m_profiles[id] = stored;
}

bool
KineticProfileResolver::contains(const std::string &id) const {
    return m_profiles.count(id) > 0;
}

KineticProfile
KineticProfileResolver::resolve(const std::string &id) const {
    auto it = m_profiles.find(id);
    if (it != m_profiles.end()) { return it->second; }
    KineticProfile fallback = default_profile();
    fallback.fallback = true;
    return fallback;
}

std::vector<std::string>
KineticProfileResolver::ids() const {
    std::vector<std::string> out;
    out.reserve(m_profiles.size());
    for (const auto &pair : m_profiles) { out.push_back(pair.first); }
    return out;
}

KineticProfile
KineticProfileResolver::default_profile() {
    return make_triangular_profile(0.5, 2.0, 4.0);
}

} // namespace glucotrace
