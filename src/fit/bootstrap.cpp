// TSAM - bootstrap.cpp
// Bootstrap-and-refit calibration with prior drift between iterations

#include "fit/bootstrap.h"
#include "sampling/superposition_filter.h"
#include "sampling/uncertainty_sampler.h"
#include "util/errors.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace tsam {

namespace {

std::string fmt(double v, int precision = 4) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

void require_spread(const char* name, double v) {
    if (!(v > 0.0) || !std::isfinite(v)) {
        throw ConfigError(std::string("Prior spread '") + name + "' must be positive and finite");
    }
}

}  // namespace

BootstrapCalibrator::BootstrapCalibrator(const SubsidenceCurve& curve,
                                         const BootstrapConfig& config, Logger& log)
    : curve_(curve), config_(config), log_(log) {}

void BootstrapCalibrator::validate(const std::vector<Observation>& observations) const {
    validate_observations(observations);

    if (config_.iterations < 1) {
        throw ConfigError("Bootstrap needs at least 1 iteration (got " +
                          std::to_string(config_.iterations) + ")");
    }
    if (config_.max_attempts < 1) {
        throw ConfigError("max_attempts must be at least 1");
    }

    const auto& p = config_.prior;
    if (!std::isfinite(p.a_mean) || !std::isfinite(p.b_mean)) {
        throw ConfigError("Prior means must be finite");
    }
    require_spread("a_sigma", p.a_sigma);
    require_spread("b_sigma", p.b_sigma);

    const auto& f = config_.fit;
    if (!(f.sigma_upper > f.sigma_lower) || f.sigma_lower < 0.0) {
        throw ConfigError("sigma prior needs 0 <= lower < upper");
    }
    if (!(f.start_sigma > f.sigma_lower) || f.start_sigma > f.sigma_upper) {
        throw ConfigError("Starting sigma " + fmt(f.start_sigma) + " lies outside its prior support");
    }
    if (!(f.start_b > 0.0)) {
        throw ConfigError("Starting b must be positive");
    }
    // Every fit starts at start_b; a column reaching past the curve's domain
    // there fails for any resample
    const double top = column_top(observations);
    if (!curve_.in_domain(top, f.start_b)) {
        throw ConfigError("Column top " + fmt(top, 1) + " lies outside the curve's domain for the "
                          "starting b=" + fmt(f.start_b) + " (heights must stay below " +
                          fmt(curve_.domain_top(f.start_b), 1) + ")");
    }
    if (f.max_iterations < 1 || !(f.fd_relative_step > 0.0)) {
        throw ConfigError("Invalid optimizer settings");
    }
}

BootstrapResult BootstrapCalibrator::run(const std::vector<Observation>& observations) const {
    validate(observations);

    const int n_iter = config_.iterations;
    const int max_attempts = config_.max_attempts;

    BootstrapResult result;
    result.posterior.reserve(n_iter);
    BootstrapStats& stats = result.stats;

    PriorState prior = PriorState::from_config(config_.prior);
    Rng rng(config_.seed);

    log_.section("Bootstrap calibration");
    log_.metric("Observations", static_cast<int>(observations.size()));
    log_.metric("Iterations", n_iter);
    log_.metric("Seed", std::to_string(config_.seed));
    log_.metric("E0 [m]", curve_.e0(), 2);
    log_.metric("tau [age units]", curve_.tau_units(), 4);
    log_.decision("failed-iteration",
                  "retry with fresh resampling, abort after " + std::to_string(max_attempts) + " attempts",
                  "keeps every accepted draw tied to a usable fit and the run reproducible from the seed");

    if (config_.trace_draws && log_.tracing()) {
        log_.table_header("draws", {"iteration", "attempts", "kept", "direction", "a", "b", "sigma"});
    }

    double kept_sum = 0.0;
    double optimizer_sum = 0.0;

    for (int it = 1; it <= n_iter; ++it) {
        const ScanDirection direction = scan_direction(it);
        int attempt = 0;

        while (true) {
            ++attempt;
            ++stats.attempts;
            try {
                const std::vector<ResampledDraw> draws = resample_all(observations, rng);
                const std::vector<ResampledDraw> kept = filter_superposition(draws, direction);
                if (kept.size() < 2) {
                    throw DataError("only " + std::to_string(kept.size()) +
                                    " draw(s) survived the superposition filter",
                                    it, attempt, static_cast<int>(kept.size()));
                }

                const QuadraticFit fit = fit_quadratic_approximation(curve_, kept, prior, config_.fit);
                const PosteriorDraw draw = fit.draw(rng);

                result.posterior.push_back(draw);
                prior.a_mean = draw.a;
                prior.b_mean = draw.b;

                kept_sum += static_cast<double>(kept.size());
                optimizer_sum += fit.iterations;

                if (config_.trace_draws && log_.tracing()) {
                    log_.table_row({std::to_string(it), std::to_string(attempt),
                                    std::to_string(kept.size()), direction_to_string(direction),
                                    fmt(draw.a), fmt(draw.b), fmt(draw.sigma)});
                }
                break;
            } catch (const DataError& e) {
                ++stats.data_failures;
                if (attempt >= max_attempts) {
                    std::ostringstream ss;
                    ss << "Iteration " << it << ": " << e.what() << " in all " << attempt
                       << " attempts (" << direction_to_string(direction) << " scan)";
                    throw DataError(ss.str(), it, attempt, e.kept());
                }
                log_.detail("iteration " + std::to_string(it) + " attempt " +
                            std::to_string(attempt) + ": " + e.what() + ", resampling");
            } catch (const FitConvergenceError& e) {
                ++stats.fit_failures;
                if (attempt >= max_attempts) {
                    std::ostringstream ss;
                    ss << "Iteration " << it << ": fit failed in all " << attempt
                       << " attempts, last error: " << e.what();
                    throw FitConvergenceError(ss.str(), it, attempt);
                }
                log_.detail("iteration " + std::to_string(it) + " attempt " +
                            std::to_string(attempt) + ": " + e.what() + ", resampling");
            }
        }

        log_.progress("Bootstrap", it, n_iter);
    }

    stats.accepted = static_cast<int>(result.posterior.size());
    if (stats.accepted > 0) {
        stats.mean_kept = kept_sum / stats.accepted;
        stats.mean_optimizer_iterations = optimizer_sum / stats.accepted;
    }
    result.final_prior = prior;

    const int retries = stats.attempts - stats.accepted;
    if (retries > 0) {
        log_.warn(std::to_string(retries) + " attempt(s) were resampled (" +
                  std::to_string(stats.data_failures) + " superposition, " +
                  std::to_string(stats.fit_failures) + " fit)");
    }

    log_.section("Bootstrap summary");
    log_.metric("Accepted iterations", stats.accepted);
    log_.metric("Total attempts", stats.attempts);
    log_.metric("Superposition failures", stats.data_failures);
    log_.metric("Fit failures", stats.fit_failures);
    log_.metric("Mean filtered length", stats.mean_kept, 2);
    log_.metric("Mean optimizer iterations", stats.mean_optimizer_iterations, 2);
    log_.metric("Final a_mean", prior.a_mean);
    log_.metric("Final b_mean", prior.b_mean);

    return result;
}

}  // namespace tsam
