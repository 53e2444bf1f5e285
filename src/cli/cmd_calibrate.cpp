// TSAM - cmd_calibrate.cpp
// Bootstrap calibration of a stratigraphic column against the subsidence curve

#include "cli_common.h"
#include "fit/bootstrap.h"
#include "io/table_io.h"
#include "model/subsidence_curve.h"
#include "posterior/summary.h"
#include "util/logger.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tsam {

namespace {

std::string fixed(double v, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

}  // namespace

int cmd_calibrate(int argc, char** argv) {
    CLICommand cmd;
    cmd.name = "calibrate";
    cmd.description = "Calibrate an age-depth model against a thermal subsidence curve.";
    cmd.description_extra = {
        "",
        "Each iteration resamples every dated horizon within its uncertainty, drops",
        "draws that break the ordering (scanning from alternate ends), fits the curve",
        "by a quadratic approximation and draws one (a, b, sigma) sample. The draw",
        "becomes the prior mean of the next iteration.",
    };
    cmd.options = {
        {"--observations",  "FILE", "Dated horizons (height, range, age, ageUnc, type)", "", true},
        {"--output",        "DIR",  "Output directory", "."},
        {"--iterations",    "N",    "Bootstrap iterations", std::to_string(DEFAULT_ITERATIONS)},
        {"--seed",          "N",    "Random seed", std::to_string(DEFAULT_SEED)},
        {"--max-attempts",  "N",    "Resamples per iteration before aborting", std::to_string(DEFAULT_MAX_ATTEMPTS)},
        {"--step",          "M",    "Age model grid spacing", "5"},
        {"--top",           "H",    "Age model grid top", "highest observation"},
        {"--heights",       "FILE", "Extra query heights (non-decreasing)"},
        {"--probability",   "P",    "HPDI probability mass", "0.95"},
        {"--prior-a-mean",  "X",    "Prior mean of a (age at the base)", "817"},
        {"--prior-a-sigma", "X",    "Prior sd of a", "5"},
        {"--prior-b-mean",  "X",    "Prior mean of b (stretching factor)", "1.3"},
        {"--prior-b-sigma", "X",    "Prior sd of b", "0.2"},
        {"--sigma-max",     "X",    "Upper bound of the uniform prior on sigma", "10"},
    };
    add_constant_options(cmd);
    cmd.options.push_back({"--trace-draws", "", "Write every accepted draw to the trace log"});
    cmd.options.push_back({"-q, --quiet", "", "Errors only"});
    cmd.options.push_back({"-v, --verbose", "", "Enable verbose output"});
    cmd.options.push_back({"-h, --help", "", "Show this help message"});

    cmd.outputs = {
        {"posterior.csv", "Composite posterior draws: a, b, sigma"},
        {"age_model.csv", "Median age and HPDI on the height grid"},
        {"age_model_heights.csv", "Median age and HPDI at the query heights", "(with --heights)"},
        {"parameters.csv", "Mean, sd, median and HPDI of a, b and sigma"},
        {"tsam_trace.log", "Run trace with settings, retries and statistics"},
    };
    cmd.examples = {
        "tsam calibrate --observations bitter_springs.csv --output run1/",
        "tsam calibrate --observations column.tsv --iterations 1000 --seed 7 --step 10",
    };

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }
    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    Logger log("calibrate", VERSION);
    if (cmd.has_flag(argc, argv, "-v") || cmd.has_flag(argc, argv, "--verbose")) {
        log.console_level = Verbosity::Verbose;
    } else if (cmd.has_flag(argc, argv, "-q") || cmd.has_flag(argc, argv, "--quiet")) {
        log.console_level = Verbosity::Quiet;
    }

    try {
        CalibrateConfig config;
        config.observations_path = cmd.get_option(argc, argv, "--observations");
        config.heights_path = cmd.get_option(argc, argv, "--heights");
        config.output_dir = cmd.get_option(argc, argv, "--output", ".");
        config.grid_step = cmd.get_double(argc, argv, "--step", DEFAULT_GRID_STEP);
        config.grid_top = cmd.get_double(argc, argv, "--top", -1.0);
        config.verbose = log.console_level == Verbosity::Verbose;
        config.constants = read_constant_options(cmd, argc, argv);

        BootstrapConfig& boot = config.bootstrap;
        boot.iterations = cmd.get_int(argc, argv, "--iterations", DEFAULT_ITERATIONS);
        boot.seed = cmd.get_uint32(argc, argv, "--seed", DEFAULT_SEED);
        boot.max_attempts = cmd.get_int(argc, argv, "--max-attempts", DEFAULT_MAX_ATTEMPTS);
        boot.trace_draws = cmd.has_flag(argc, argv, "--trace-draws");
        boot.prior.a_mean = cmd.get_double(argc, argv, "--prior-a-mean", boot.prior.a_mean);
        boot.prior.a_sigma = cmd.get_double(argc, argv, "--prior-a-sigma", boot.prior.a_sigma);
        boot.prior.b_mean = cmd.get_double(argc, argv, "--prior-b-mean", boot.prior.b_mean);
        boot.prior.b_sigma = cmd.get_double(argc, argv, "--prior-b-sigma", boot.prior.b_sigma);
        boot.fit.sigma_upper = cmd.get_double(argc, argv, "--sigma-max", boot.fit.sigma_upper);
        const double prob = cmd.get_double(argc, argv, "--probability", 0.95);
        validate_probability(prob);

        std::filesystem::create_directories(config.output_dir);
        const std::filesystem::path out(config.output_dir);
        if (!log.open_trace((out / "tsam_trace.log").string())) {
            log.warn("Cannot write trace log in " + config.output_dir);
        }

        log.info("Observations:  " + config.observations_path);
        log.info("Output:        " + config.output_dir);
        log.info("Iterations:    " + std::to_string(boot.iterations));
        log.info("Seed:          " + std::to_string(boot.seed));

        const SubsidenceCurve curve(config.constants);
        const std::vector<Observation> observations = read_observations(config.observations_path);
        validate_observations(observations);
        log.info("Loaded " + std::to_string(observations.size()) + " observations");
        log.detail("E0 = " + fixed(curve.e0(), 1) + " m, tau = " + fixed(curve.tau_units(), 3));

        // Query heights are checked before the (long) bootstrap starts
        const double top = config.grid_top >= 0.0 ? config.grid_top : column_top(observations);
        const std::vector<double> grid = make_height_grid(config.grid_step, top);
        std::vector<double> query;
        if (!config.heights_path.empty()) {
            query = read_heights(config.heights_path);
            validate_query_heights(query);
        }

        BootstrapCalibrator calibrator(curve, boot, log);
        const BootstrapResult result = calibrator.run(observations);

        write_posterior((out / "posterior.csv").string(), result.posterior);

        const auto grid_model = summarize_heights(curve, grid, result.posterior, prob);
        write_age_model((out / "age_model.csv").string(), grid_model);

        if (!query.empty()) {
            const auto query_model = summarize_heights(curve, query, result.posterior, prob);
            write_age_model((out / "age_model_heights.csv").string(), query_model);
        }

        int nonfinite = 0;
        for (const auto& s : grid_model) nonfinite += s.n_nonfinite;
        if (nonfinite > 0) {
            log.warn(std::to_string(nonfinite) +
                     " curve evaluations fell outside the model domain and were excluded");
        }

        const auto params = summarize_parameters(result.posterior, prob);
        write_parameter_summary((out / "parameters.csv").string(), params);

        log.section("Posterior parameters");
        log.table_header("parameters", {"name", "mean", "sd", "median", "lower", "upper"});
        for (const auto& p : params) {
            log.table_row({p.name, fixed(p.mean, 4), fixed(p.sd, 4), fixed(p.median, 4),
                           fixed(p.lower, 4), fixed(p.upper, 4)});
            log.info(p.name + ": median " + fixed(p.median, 3) + " [" + fixed(p.lower, 3) +
                     ", " + fixed(p.upper, 3) + "]");
        }

        log.info("Wrote " + std::to_string(result.posterior.size()) + " draws to " +
                 (out / "posterior.csv").string());
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace tsam
