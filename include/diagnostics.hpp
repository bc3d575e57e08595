#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace glucotrace {

/**
 * @brief Soft problems encountered while building a timeline.
 *
 * Unknown profile ids, dropped records and empty input degrade the result but
 * never abort it; they are collected here and returned alongside the points.
 */
struct Diagnostics {
    std::vector<std::string> warnings;
    std::set<std::string> missing_profiles; ///< Source type ids resolved to the default profile.
    std::size_t dropped_readings = 0;
    std::size_t dropped_sources = 0;
    bool empty_input = false;

    /**
     * @brief Records a warning and, when @p echo is set, writes it to std::cerr.
     * @param component Short tag printed in brackets, e.g. "ProfileCache".
     */
    void warn(const std::string &component, const std::string &message, bool echo);

    bool degraded() const {
        return !missing_profiles.empty() || dropped_readings > 0 || dropped_sources > 0 || empty_input;
    }
};

} // namespace glucotrace

#endif // DIAGNOSTICS_HPP
