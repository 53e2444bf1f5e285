#pragma once

// TSAM - Shared types for the calibration engine

#include <tsam/config.hpp>
#include <vector>

namespace tsam {

// Gaussian priors on a and b for the current iteration. The bootstrap owns
// the only mutable instance; means drift, spreads never change.
struct PriorState {
    double a_mean = 817.0;
    double a_sigma = 5.0;
    double b_mean = 1.3;
    double b_sigma = 0.2;

    static PriorState from_config(const PriorConfig& c) {
        PriorState p;
        p.a_mean = c.a_mean;
        p.a_sigma = c.a_sigma;
        p.b_mean = c.b_mean;
        p.b_sigma = c.b_sigma;
        return p;
    }
};

// One parameter vector drawn from an iteration's approximate posterior
struct PosteriorDraw {
    double a = 0.0;
    double b = 0.0;
    double sigma = 0.0;
};

// One draw per bootstrap iteration, in iteration order
using CompositePosterior = std::vector<PosteriorDraw>;

}  // namespace tsam
