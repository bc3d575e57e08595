#ifndef GLUCOTRACE_HPP
#define GLUCOTRACE_HPP

// Include all library headers here
#include "active_effect_aggregator.hpp"
#include "curve_preview.hpp"
#include "diagnostics.hpp"
#include "effect_curves.hpp"
#include "effect_source.hpp"
#include "glucose_projection.hpp"
#include "kinetic_profile.hpp"
#include "patient_constants.hpp"
#include "record_validation.hpp"
#include "time_utils.hpp"
#include "timeline_engine.hpp"

// This is the main header file for the glucotrace library
// Include this single header to access all functionality

#endif // GLUCOTRACE_HPP
