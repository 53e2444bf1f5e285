// TSAM - quadratic_approx.cpp
// MAP search and Laplace approximation for one filtered resample

#include "fit/quadratic_approx.h"
#include "util/errors.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>

namespace tsam {

namespace {

constexpr double kLogSqrt2Pi = 0.91893853320467274178;

std::string describe(const Eigen::Vector3d& x) {
    std::ostringstream ss;
    ss << "a=" << x(PARAM_A) << ", b=" << x(PARAM_B) << ", sigma=" << x(PARAM_SIGMA);
    return ss.str();
}

// Ascent direction from the damped Newton system (-H + lambda I) d = g,
// restricted to the free parameters. lambda grows until the system is
// positive definite.
bool newton_direction(const Eigen::Matrix3d& H, const Eigen::Vector3d& g,
                      const std::array<bool, 3>& free, Eigen::Vector3d& direction) {
    std::vector<int> idx;
    for (int i = 0; i < 3; ++i) {
        if (free[i]) idx.push_back(i);
    }
    direction.setZero();
    if (idx.empty()) return true;

    const int m = static_cast<int>(idx.size());
    Eigen::MatrixXd A(m, m);
    Eigen::VectorXd rhs(m);
    for (int r = 0; r < m; ++r) {
        rhs(r) = g(idx[r]);
        for (int c = 0; c < m; ++c) {
            A(r, c) = -H(idx[r], idx[c]);
        }
    }
    if (!A.allFinite()) return false;

    const double scale = std::max(1.0, A.diagonal().cwiseAbs().maxCoeff());
    double lambda = 0.0;
    for (int attempt = 0; attempt < 24; ++attempt) {
        Eigen::MatrixXd A_reg = A;
        A_reg.diagonal().array() += lambda;
        Eigen::LLT<Eigen::MatrixXd> llt(A_reg);
        if (llt.info() == Eigen::Success) {
            Eigen::VectorXd d = llt.solve(rhs);
            if (d.allFinite()) {
                for (int r = 0; r < m; ++r) direction(idx[r]) = d(r);
                return true;
            }
        }
        lambda = (lambda == 0.0) ? 1e-8 * scale : lambda * 10.0;
    }
    return false;
}

}  // namespace

SubsidencePosterior::SubsidencePosterior(const SubsidenceCurve& curve,
                                         const std::vector<ResampledDraw>& data,
                                         const PriorState& prior,
                                         double sigma_lower, double sigma_upper)
    : curve_(curve), data_(data), prior_(prior),
      sigma_lower_(sigma_lower), sigma_upper_(sigma_upper) {}

double SubsidencePosterior::log_posterior(const Eigen::Vector3d& theta) const {
    const double neg_inf = -std::numeric_limits<double>::infinity();
    const double a = theta(PARAM_A);
    const double b = theta(PARAM_B);
    const double s = theta(PARAM_SIGMA);

    if (!theta.allFinite()) return neg_inf;
    if (!(s > 0.0) || !(s > sigma_lower_) || s > sigma_upper_) return neg_inf;

    const double log_s = std::log(s);
    double lp = 0.0;
    for (const auto& d : data_) {
        const double mu = curve_.mean_age(d.height, a, b);
        if (!std::isfinite(mu)) return neg_inf;
        const double z = (d.age - mu) / s;
        lp += -log_s - kLogSqrt2Pi - 0.5 * z * z;
    }

    const double za = (a - prior_.a_mean) / prior_.a_sigma;
    const double zb = (b - prior_.b_mean) / prior_.b_sigma;
    lp += -std::log(prior_.a_sigma) - kLogSqrt2Pi - 0.5 * za * za;
    lp += -std::log(prior_.b_sigma) - kLogSqrt2Pi - 0.5 * zb * zb;
    lp -= std::log(sigma_upper_ - sigma_lower_);
    return lp;
}

Eigen::Vector3d SubsidencePosterior::gradient(const Eigen::Vector3d& theta) const {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double a = theta(PARAM_A);
    const double b = theta(PARAM_B);
    const double s = theta(PARAM_SIGMA);

    if (!theta.allFinite() || !(s > 0.0)) return Eigen::Vector3d::Constant(nan);

    const double inv_s2 = 1.0 / (s * s);
    double g_a = 0.0, g_b = 0.0, rss = 0.0;
    for (const auto& d : data_) {
        const double mu = curve_.mean_age(d.height, a, b);
        const double dmu_db = curve_.d_mean_age_db(d.height, b);
        if (!std::isfinite(mu) || !std::isfinite(dmu_db)) {
            return Eigen::Vector3d::Constant(nan);
        }
        const double r = d.age - mu;
        g_a += r * inv_s2;
        g_b += r * inv_s2 * dmu_db;
        rss += r * r;
    }
    g_a -= (a - prior_.a_mean) / (prior_.a_sigma * prior_.a_sigma);
    g_b -= (b - prior_.b_mean) / (prior_.b_sigma * prior_.b_sigma);

    const double n = static_cast<double>(data_.size());
    const double g_s = -n / s + rss / (s * s * s);

    return Eigen::Vector3d(g_a, g_b, g_s);
}

Eigen::Matrix3d SubsidencePosterior::hessian(const Eigen::Vector3d& theta,
                                             double relative_step) const {
    Eigen::Matrix3d H;
    const Eigen::Vector3d g0 = gradient(theta);

    for (int j = 0; j < 3; ++j) {
        const double h = relative_step * std::max(1.0, std::abs(theta(j)));
        Eigen::Vector3d xp = theta, xm = theta;
        xp(j) += h;
        xm(j) -= h;
        const Eigen::Vector3d gp = gradient(xp);
        const Eigen::Vector3d gm = gradient(xm);

        if (gp.allFinite() && gm.allFinite()) {
            H.col(j) = (gp - gm) / (2.0 * h);
        } else if (gp.allFinite() && g0.allFinite()) {
            H.col(j) = (gp - g0) / h;
        } else if (gm.allFinite() && g0.allFinite()) {
            H.col(j) = (g0 - gm) / h;
        } else {
            H.col(j).setConstant(std::numeric_limits<double>::quiet_NaN());
        }
    }
    return 0.5 * (H + H.transpose());
}

PosteriorDraw QuadraticFit::draw(Rng& rng) const {
    std::normal_distribution<double> standard(0.0, 1.0);
    Eigen::Vector3d z;
    for (int i = 0; i < 3; ++i) z(i) = standard(rng);

    const Eigen::Vector3d x = mode + cholesky * z;
    PosteriorDraw d;
    d.a = x(PARAM_A);
    d.b = x(PARAM_B);
    d.sigma = x(PARAM_SIGMA);
    return d;
}

double QuadraticFit::sd(int param) const {
    return std::sqrt(covariance(param, param));
}

QuadraticFit fit_quadratic_approximation(const SubsidenceCurve& curve,
                                         const std::vector<ResampledDraw>& data,
                                         const PriorState& prior,
                                         const FitConfig& config) {
    const int n_points = static_cast<int>(data.size());
    if (n_points < 2) {
        throw DataError("Quadratic approximation needs at least 2 points (got " +
                        std::to_string(n_points) + ")", 0, 0, n_points);
    }

    const double lo = config.sigma_lower;
    const double hi = config.sigma_upper;
    if (!(hi > lo) || lo < 0.0) {
        throw ConfigError("sigma prior needs 0 <= lower < upper");
    }
    // Uniform support is open at zero for a Normal scale
    const double sigma_floor = std::max(lo, 0.0) + 1e-8 * (hi - lo);

    SubsidencePosterior post(curve, data, prior, lo, hi);

    auto project = [&](Eigen::Vector3d x) {
        x(PARAM_SIGMA) = std::min(hi, std::max(sigma_floor, x(PARAM_SIGMA)));
        return x;
    };

    Eigen::Vector3d x = project(Eigen::Vector3d(config.start_a, config.start_b, config.start_sigma));
    double f = post.log_posterior(x);
    if (!std::isfinite(f)) {
        throw FitConvergenceError("Starting point (" + describe(x) +
                                  ") lies outside the model domain for this resample");
    }

    QuadraticFit fit;
    fit.points = n_points;

    bool converged = false;
    Eigen::Vector3d g = Eigen::Vector3d::Zero();
    Eigen::Vector3d pg = Eigen::Vector3d::Zero();
    int iter = 0;

    while (iter < config.max_iterations) {
        ++iter;
        g = post.gradient(x);
        if (!g.allFinite()) {
            throw FitConvergenceError("Non-finite gradient at " + describe(x));
        }

        // sigma pinned on its support and pushing outward stays fixed
        std::array<bool, 3> free = {true, true, true};
        if (x(PARAM_SIGMA) >= hi && g(PARAM_SIGMA) > 0.0) free[PARAM_SIGMA] = false;
        if (x(PARAM_SIGMA) <= sigma_floor && g(PARAM_SIGMA) < 0.0) free[PARAM_SIGMA] = false;

        pg = g;
        if (!free[PARAM_SIGMA]) pg(PARAM_SIGMA) = 0.0;

        const double f_scale = std::max(1.0, std::abs(f));
        if (pg.lpNorm<Eigen::Infinity>() < config.gradient_tolerance * f_scale) {
            converged = true;
            break;
        }

        const Eigen::Matrix3d H = post.hessian(x, config.fd_relative_step);
        Eigen::Vector3d d;
        if (!newton_direction(H, g, free, d)) {
            throw FitConvergenceError("No usable Newton direction at " + describe(x));
        }

        // Backtrack over infeasible or non-improving trial points
        double t = 1.0;
        bool accepted = false;
        Eigen::Vector3d x_new = x;
        double f_new = f;
        for (int bt = 0; bt < config.max_backtracks; ++bt) {
            const Eigen::Vector3d trial = project(x + t * d);
            const double f_trial = post.log_posterior(trial);
            if (std::isfinite(f_trial) && f_trial > f) {
                x_new = trial;
                f_new = f_trial;
                accepted = true;
                break;
            }
            t *= 0.5;
        }

        if (!accepted) {
            // No representable ascent left along the Newton direction
            const double predicted_gain = 0.5 * pg.dot(d);
            if (predicted_gain <= config.objective_tolerance * f_scale * 1e2) {
                converged = true;
                break;
            }
            throw FitConvergenceError("Line search failed at " + describe(x));
        }

        const double df = f_new - f;
        const double dx = (x_new - x).lpNorm<Eigen::Infinity>();
        x = x_new;
        f = f_new;

        if (df <= config.objective_tolerance * f_scale &&
            dx <= config.step_tolerance * std::max(1.0, x.lpNorm<Eigen::Infinity>())) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        std::ostringstream ss;
        ss << "MAP search did not converge in " << config.max_iterations
           << " iterations (" << describe(x) << ", |grad|=" << pg.lpNorm<Eigen::Infinity>() << ")";
        throw FitConvergenceError(ss.str());
    }

    // Laplace approximation around the mode
    const Eigen::Matrix3d H = post.hessian(x, config.fd_relative_step);
    if (!H.allFinite()) {
        throw FitConvergenceError("Non-finite curvature at the MAP (" + describe(x) + ")");
    }
    Eigen::LLT<Eigen::Matrix3d> precision(-H);
    if (precision.info() != Eigen::Success) {
        throw FitConvergenceError("Curvature at the MAP is not negative definite (" + describe(x) + ")");
    }
    Eigen::Matrix3d cov = precision.solve(Eigen::Matrix3d::Identity());
    cov = 0.5 * (cov + cov.transpose());

    Eigen::LLT<Eigen::Matrix3d> factor(cov);
    if (factor.info() != Eigen::Success || !cov.allFinite()) {
        throw FitConvergenceError("Posterior covariance is not positive definite (" + describe(x) + ")");
    }

    fit.mode = x;
    fit.covariance = cov;
    fit.cholesky = factor.matrixL();
    fit.log_posterior = f;
    fit.gradient_norm = pg.lpNorm<Eigen::Infinity>();
    fit.iterations = iter;
    return fit;
}

}  // namespace tsam
