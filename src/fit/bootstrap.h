// TSAM - bootstrap.h
// Resample / filter / fit / accept loop producing the composite posterior

#pragma once

#include "fit/fit_types.h"
#include "fit/quadratic_approx.h"
#include "model/observation.h"
#include "model/subsidence_curve.h"
#include "util/logger.h"

#include <tsam/config.hpp>
#include <vector>

namespace tsam {

struct BootstrapStats {
    int accepted = 0;
    int attempts = 0;              // including retries
    int data_failures = 0;         // < 2 draws survived superposition
    int fit_failures = 0;          // quadratic approximation failed
    double mean_kept = 0.0;        // mean filtered length over accepted iterations
    double mean_optimizer_iterations = 0.0;
};

struct BootstrapResult {
    CompositePosterior posterior;
    PriorState final_prior;
    BootstrapStats stats;
};

class BootstrapCalibrator {
public:
    BootstrapCalibrator(const SubsidenceCurve& curve, const BootstrapConfig& config, Logger& log);

    // Runs config.iterations strictly sequential iterations from a generator
    // seeded with config.seed. A failing attempt is retried with a fresh
    // resample (same iteration parity) up to config.max_attempts times; after
    // that the last DataError / FitConvergenceError is rethrown carrying the
    // iteration index. Invalid inputs raise ConfigError before the loop.
    BootstrapResult run(const std::vector<Observation>& observations) const;

    const BootstrapConfig& config() const { return config_; }

private:
    const SubsidenceCurve& curve_;
    BootstrapConfig config_;
    Logger& log_;

    void validate(const std::vector<Observation>& observations) const;
};

}  // namespace tsam
