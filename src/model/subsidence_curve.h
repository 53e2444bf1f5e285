#pragma once

// TSAM - Thermal subsidence age curve
//
// Post-rift thermal subsidence of a lithosphere stretched by a factor b
// (McKenzie-style, first Fourier term only):
//
//   S(t) = E0 * (b/pi) * sin(pi/b) * (1 - exp(-t/tau))
//
// Inverting for the time since rifting at stratigraphic height h and adding
// the age of the base a gives the mean age curve
//
//   age(h) = a + tau/T * ln(1 - (h/E0 * pi/b) / sin(pi/b))
//
// E0 and tau come from the physical constants and are fixed for the run.

#include <tsam/config.hpp>
#include <vector>

namespace tsam {

class SubsidenceCurve {
public:
    // Derive E0 and tau. Throws ConfigError for non-physical constants.
    explicit SubsidenceCurve(const PhysicalConstants& constants = PhysicalConstants{});

    // Subsidence correction constant E0 [m]
    double e0() const { return e0_; }
    // Thermal decay time constant tau [s]
    double tau() const { return tau_; }
    // tau expressed in age units (tau / T)
    double tau_units() const { return tau_units_; }

    const PhysicalConstants& constants() const { return constants_; }

    // Mean age at height h. Non-finite outside the model domain
    // (b <= 0, sin(pi/b) == 0, non-positive log argument); never throws.
    double mean_age(double height, double a, double b) const;

    // Partial derivatives of mean_age. d/da is identically 1.
    double d_mean_age_db(double height, double b) const;

    // Argument of the logarithm; the curve is defined where this is > 0
    double log_argument(double height, double b) const;

    bool in_domain(double height, double b) const;

    // Height at which the log argument reaches zero for this b; heights
    // must stay strictly below it. NaN for b <= 0.
    double domain_top(double b) const;

    std::vector<double> mean_ages(const std::vector<double>& heights, double a, double b) const;

private:
    PhysicalConstants constants_;
    double e0_;
    double tau_;
    double tau_units_;

    // pi / (E0 * b * sin(pi/b))
    double height_scale(double b) const;
};

}  // namespace tsam
