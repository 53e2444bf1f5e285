// TSAM - Centralized Configuration Structures
// Physical constants, priors, fitter and bootstrap settings in one place
#ifndef TSAM_CONFIG_HPP
#define TSAM_CONFIG_HPP

#include <cstdint>
#include <string>
#include "tsam/version.h"

namespace tsam {

// Global version for all TSAM tools (set by cmake from project version)
constexpr const char* VERSION = TSAM_VERSION_STRING;

// Reference run size and seed
constexpr int DEFAULT_ITERATIONS = 7500;
constexpr std::uint32_t DEFAULT_SEED = 1234;

// Per-iteration retry budget before a run is aborted
constexpr int DEFAULT_MAX_ATTEMPTS = 50;

// Default query grid spacing (same units as height)
constexpr double DEFAULT_GRID_STEP = 5.0;

// Thermal subsidence of a stretched lithosphere, sediment loaded.
// SI units throughout; seconds_per_unit converts tau to the age unit (Myr).
struct PhysicalConstants {
    double lithosphere_thickness = 125.0e3;   // m
    double mantle_density = 3330.0;           // kg/m^3
    double infill_density = 2400.0;           // kg/m^3 (basin fill)
    double thermal_diffusivity = 8.04e-7;     // m^2/s
    double mantle_temperature = 1333.0;       // degC at base of lithosphere
    double thermal_expansion = 3.28e-5;       // 1/K
    double seconds_per_unit = 3.15576e13;     // seconds per Myr
};

// Gaussian priors on the curve parameters. Only the means drift between
// bootstrap iterations; the spreads stay fixed for the whole run.
struct PriorConfig {
    double a_mean = 817.0;
    double a_sigma = 5.0;
    double b_mean = 1.3;
    double b_sigma = 0.2;
};

// Quadratic approximation settings
struct FitConfig {
    // Fixed starting point of every local optimisation
    double start_a = 817.0;
    double start_b = 1.3;
    double start_sigma = 5.0;

    // sigma ~ Uniform(sigma_lower, sigma_upper)
    double sigma_lower = 0.0;
    double sigma_upper = 10.0;

    int max_iterations = 200;
    double gradient_tolerance = 1e-6;
    double objective_tolerance = 1e-10;
    double step_tolerance = 1e-9;
    double fd_relative_step = 1e-5;   // finite-difference step for the Hessian
    int max_backtracks = 60;
};

struct BootstrapConfig {
    int iterations = DEFAULT_ITERATIONS;
    std::uint32_t seed = DEFAULT_SEED;
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    bool trace_draws = false;         // per-iteration table in the trace log

    PriorConfig prior;
    FitConfig fit;
};

// calibrate command
struct CalibrateConfig {
    std::string observations_path;
    std::string heights_path;          // optional list of query heights
    std::string output_dir = ".";
    double grid_step = DEFAULT_GRID_STEP;
    double grid_top = -1.0;            // < 0: top of the observed column
    bool verbose = false;

    PhysicalConstants constants;
    BootstrapConfig bootstrap;
};

// summarize command
struct SummarizeConfig {
    std::string posterior_path;
    std::string heights_path;
    std::string output_path = "age_model.csv";
    double grid_step = DEFAULT_GRID_STEP;
    double grid_top = -1.0;
    double probability = 0.95;

    PhysicalConstants constants;
};

// duration command
struct DurationConfig {
    std::string posterior_path;
    double base_height = 0.0;
    double top_height = 0.0;
    double probability = 0.95;
    bool compare_independent = false;
    std::uint32_t seed = DEFAULT_SEED;

    PhysicalConstants constants;
};

}  // namespace tsam

#endif  // TSAM_CONFIG_HPP
