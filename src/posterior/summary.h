#pragma once

// TSAM - Posterior queries on the composite posterior
//
// Every reported age is evaluated draw by draw: mean_age(h, a_k, b_k) for
// each posterior draw k. Durations between two heights difference the two
// ages within the same draw, which keeps the correlation between a and b.
// Non-finite curve values (draws outside the curve's domain at that height)
// are excluded from medians and intervals and counted separately.

#include "fit/fit_types.h"
#include "model/subsidence_curve.h"
#include "sampling/uncertainty_sampler.h"

#include <string>
#include <vector>

namespace tsam {

struct Interval {
    double lower = 0.0;
    double upper = 0.0;
    double width() const { return upper - lower; }
};

struct AgeSummary {
    double height = 0.0;
    double median = 0.0;
    double lower = 0.0;        // HPDI bounds
    double upper = 0.0;
    int n_finite = 0;
    int n_nonfinite = 0;
};

struct DifferenceSummary {
    double height1 = 0.0;
    double height2 = 0.0;
    double median = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    int n_finite = 0;
    int n_nonfinite = 0;

    double width() const { return upper - lower; }
};

struct ParameterSummary {
    std::string name;
    double mean = 0.0;
    double sd = 0.0;
    double median = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

// Throws ConfigError unless 0 < prob < 1
void validate_probability(double prob);

// Median of the sample (mean of the two central values for even sizes).
// NaN for an empty sample.
double median(std::vector<double> values);

// Highest posterior density interval: the narrowest window spanning
// round(n * prob) gaps of the sorted sample. NaN bounds for an empty sample.
Interval hpdi(std::vector<double> values, double prob = 0.95);

// Per-draw ages at one height, in posterior order (may contain non-finite)
std::vector<double> ages_at(const SubsidenceCurve& curve, double height,
                            const CompositePosterior& posterior);

AgeSummary summarize(const SubsidenceCurve& curve, double height,
                     const CompositePosterior& posterior, double prob = 0.95);

// Heights must be finite and non-decreasing (ConfigError otherwise)
std::vector<AgeSummary> summarize_heights(const SubsidenceCurve& curve,
                                          const std::vector<double>& heights,
                                          const CompositePosterior& posterior,
                                          double prob = 0.95);

// 0, step, 2*step, ... up to and including top
std::vector<double> make_height_grid(double step, double top);

// Throws ConfigError unless every height is finite and the list is
// non-decreasing
void validate_query_heights(const std::vector<double>& heights);

// age(h1) - age(h2) for every draw, in posterior order
std::vector<double> age_differences(const SubsidenceCurve& curve, double height1, double height2,
                                    const CompositePosterior& posterior);

DifferenceSummary correlated_difference(const SubsidenceCurve& curve, double height1, double height2,
                                        const CompositePosterior& posterior, double prob = 0.95);

// Naive comparison: pairs ages resampled independently (with replacement)
// from each height's marginal distribution. Ignores the a/b correlation and
// is only reported next to correlated_difference.
DifferenceSummary independent_difference(const SubsidenceCurve& curve, double height1, double height2,
                                         const CompositePosterior& posterior, Rng& rng,
                                         double prob = 0.95);

// mean, sd, median and HPDI of a, b and sigma
std::vector<ParameterSummary> summarize_parameters(const CompositePosterior& posterior,
                                                   double prob = 0.95);

}  // namespace tsam
