// TSAM - observation.h
// Dated horizons of a stratigraphic column and their uncertainties

#pragma once

#include <string>
#include <vector>

namespace tsam {

enum class UncertaintyShape { Gaussian, Uniform };

// "normal" selects a Gaussian height error, any other tag a uniform one
UncertaintyShape parse_uncertainty_shape(const std::string& tag);

inline const char* shape_to_string(UncertaintyShape s) {
    switch (s) {
        case UncertaintyShape::Gaussian: return "normal";
        case UncertaintyShape::Uniform: return "uniform";
        default: return "unknown";
    }
}

struct Observation {
    double height = 0.0;                 // stratigraphic height
    double height_uncertainty = 0.0;     // full width; half of it is consumed
    UncertaintyShape height_shape = UncertaintyShape::Gaussian;
    double age = 0.0;                    // Ma
    double age_uncertainty = 0.0;        // one-sided 95% half-width, Ma
};

// One resampled (height, age) pair; lives for a single bootstrap iteration
struct ResampledDraw {
    double height = 0.0;
    double age = 0.0;
};

// Throws ConfigError naming the first offending row (1-based).
// Requires at least two observations with finite values and non-negative
// uncertainties.
void validate_observations(const std::vector<Observation>& observations);

// Highest observed height; 0 for an empty set
double column_top(const std::vector<Observation>& observations);

}  // namespace tsam
