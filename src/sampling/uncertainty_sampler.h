// TSAM - uncertainty_sampler.h
// Per-iteration resampling of observation ages and heights

#pragma once

#include "model/observation.h"
#include <random>
#include <vector>

namespace tsam {

// Run-wide random source. Seeded once by the bootstrap and passed explicitly
// to every consumer; nothing in TSAM holds a hidden generator.
using Rng = std::mt19937;

// Age ~ Normal(age, age_uncertainty / 2). The stored uncertainty is a 95%
// half-width and is halved, not divided by 1.96.
double draw_age(const Observation& obs, Rng& rng);

// Height ~ Normal(height, u/2) for Gaussian tags,
// Uniform[height - u/2, height + u/2] otherwise.
double draw_height(const Observation& obs, Rng& rng);

// Single observation: age first, then height.
// A zero uncertainty returns the stored value without consuming randomness.
ResampledDraw resample(const Observation& obs, Rng& rng);

// One draw per observation for a whole iteration, sorted ascending by height
// (stable, so ties keep stored order). Randomness is consumed as all ages in
// stored order, then all heights in stored order.
std::vector<ResampledDraw> resample_all(const std::vector<Observation>& observations, Rng& rng);

}  // namespace tsam
