#include "diagnostics.hpp"

#include <iostream>

namespace glucotrace {

void
Diagnostics::warn(const std::string &component, const std::string &message, bool echo) {
    warnings.push_back("[" + component + "] " + message);
    if (echo) { std::cerr << "Warning: [" << component << "] " << message << std::endl; }
}

} // namespace glucotrace
