// TSAM - cmd_summarize.cpp
// Age model from an existing composite posterior

#include "cli_common.h"
#include "io/table_io.h"
#include "model/subsidence_curve.h"
#include "posterior/summary.h"
#include "util/errors.h"
#include "util/logger.h"

#include <iostream>

namespace tsam {

int cmd_summarize(int argc, char** argv) {
    CLICommand cmd;
    cmd.name = "summarize";
    cmd.description = "Median age and HPDI at query heights from a saved posterior.";
    cmd.options = {
        {"--posterior",   "FILE", "Posterior draws (a, b, sigma) from 'tsam calibrate'", "", true},
        {"--heights",     "FILE", "Query heights (non-decreasing)"},
        {"--step",        "M",    "Grid spacing when no --heights file is given", "5"},
        {"--top",         "H",    "Grid top when no --heights file is given"},
        {"--probability", "P",    "HPDI probability mass", "0.95"},
        {"--output",      "FILE", "Output table", "age_model.csv"},
    };
    add_constant_options(cmd);
    cmd.options.push_back({"-v, --verbose", "", "Enable verbose output"});
    cmd.options.push_back({"-h, --help", "", "Show this help message"});
    cmd.outputs = {
        {"<output>", "CSV: height, age_median, age_min, age_max"},
    };
    cmd.note = "The physical constants must match the ones used for calibration.";
    cmd.examples = {
        "tsam summarize --posterior run1/posterior.csv --heights samples.txt --output ages.csv",
        "tsam summarize --posterior run1/posterior.csv --step 1 --top 2000",
    };

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }
    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    Logger log("summarize");
    if (cmd.has_flag(argc, argv, "-v") || cmd.has_flag(argc, argv, "--verbose")) {
        log.console_level = Verbosity::Verbose;
    }

    try {
        SummarizeConfig config;
        config.posterior_path = cmd.get_option(argc, argv, "--posterior");
        config.heights_path = cmd.get_option(argc, argv, "--heights");
        config.output_path = cmd.get_option(argc, argv, "--output", "age_model.csv");
        config.grid_step = cmd.get_double(argc, argv, "--step", DEFAULT_GRID_STEP);
        config.grid_top = cmd.get_double(argc, argv, "--top", -1.0);
        config.probability = cmd.get_double(argc, argv, "--probability", 0.95);
        config.constants = read_constant_options(cmd, argc, argv);
        validate_probability(config.probability);

        std::vector<double> heights;
        if (!config.heights_path.empty()) {
            heights = read_heights(config.heights_path);
        } else if (config.grid_top >= 0.0) {
            heights = make_height_grid(config.grid_step, config.grid_top);
        } else {
            throw ConfigError("Give either --heights FILE or --top H");
        }

        const SubsidenceCurve curve(config.constants);
        const CompositePosterior posterior = read_posterior(config.posterior_path);
        log.info("Posterior:     " + config.posterior_path + " (" +
                 std::to_string(posterior.size()) + " draws)");
        log.info("Query heights: " + std::to_string(heights.size()));

        const auto model = summarize_heights(curve, heights, posterior, config.probability);
        for (const auto& s : model) {
            if (s.n_nonfinite > 0) {
                log.warn("height " + std::to_string(s.height) + ": " +
                         std::to_string(s.n_nonfinite) + " draw(s) outside the model domain");
            }
        }
        write_age_model(config.output_path, model);
        log.info("Wrote " + config.output_path);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace tsam
