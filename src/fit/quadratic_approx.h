#pragma once

// TSAM - Quadratic (Laplace) approximation of the curve posterior
//
// Model for one filtered resample:
//   age_i ~ Normal(mean_age(h_i, a, b), sigma)
//   a     ~ Normal(a_mean, a_sigma)
//   b     ~ Normal(b_mean, b_sigma)
//   sigma ~ Uniform(sigma_lower, sigma_upper)
//
// The MAP is found by damped Newton ascent from a fixed start; the posterior
// is then approximated by Normal(MAP, (-H)^-1) with H the Hessian of the
// log-posterior at the MAP, and one draw is taken from it.

#include "fit/fit_types.h"
#include "model/observation.h"
#include "model/subsidence_curve.h"
#include "sampling/uncertainty_sampler.h"

#include <Eigen/Dense>
#include <tsam/config.hpp>
#include <vector>

namespace tsam {

// Parameter vector order: a, b, sigma
constexpr int PARAM_A = 0;
constexpr int PARAM_B = 1;
constexpr int PARAM_SIGMA = 2;

class SubsidencePosterior {
public:
    SubsidencePosterior(const SubsidenceCurve& curve,
                        const std::vector<ResampledDraw>& data,
                        const PriorState& prior,
                        double sigma_lower, double sigma_upper);

    // -inf outside the sigma support or the curve's domain
    double log_posterior(const Eigen::Vector3d& theta) const;

    // Gradient of the smooth part (likelihood + Gaussian priors). Defined for
    // sigma > 0 wherever the curve is finite, including beyond the uniform
    // support so that finite differences work on its edge. NaN elsewhere.
    Eigen::Vector3d gradient(const Eigen::Vector3d& theta) const;

    // Central differences of the analytic gradient, symmetrised; falls back
    // to one-sided differences next to the domain edge.
    Eigen::Matrix3d hessian(const Eigen::Vector3d& theta, double relative_step) const;

    double sigma_lower() const { return sigma_lower_; }
    double sigma_upper() const { return sigma_upper_; }
    size_t size() const { return data_.size(); }

private:
    const SubsidenceCurve& curve_;
    const std::vector<ResampledDraw>& data_;
    PriorState prior_;
    double sigma_lower_;
    double sigma_upper_;
};

struct QuadraticFit {
    Eigen::Vector3d mode = Eigen::Vector3d::Zero();
    Eigen::Matrix3d covariance = Eigen::Matrix3d::Zero();
    Eigen::Matrix3d cholesky = Eigen::Matrix3d::Zero();   // lower factor of covariance
    double log_posterior = 0.0;
    double gradient_norm = 0.0;
    int iterations = 0;
    int points = 0;

    // Exactly one multivariate normal sample; consumes three standard
    // normals from rng.
    PosteriorDraw draw(Rng& rng) const;

    double sd(int param) const;
};

// Throws DataError for fewer than 2 points, FitConvergenceError for an
// infeasible start, a stalled or capped search, or curvature at the MAP that
// is not negative definite.
QuadraticFit fit_quadratic_approximation(const SubsidenceCurve& curve,
                                         const std::vector<ResampledDraw>& data,
                                         const PriorState& prior,
                                         const FitConfig& config);

}  // namespace tsam
