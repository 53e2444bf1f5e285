// TSAM - test_cli_commands.cpp

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "cli/cli_common.h"
#include "util/errors.h"

namespace tsam {
    int cmd_calibrate(int argc, char** argv);
    int cmd_summarize(int argc, char** argv);
    int cmd_duration(int argc, char** argv);
}

namespace {

namespace fs = std::filesystem;

// argv[0] is the subcommand name, as main() passes it
int run(int (*command)(int, char**), std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return command(static_cast<int>(args.size()), argv.data());
}

void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

int main() {
    const std::string column = "tsam_cli_column.csv";
    write_file(column,
               "height,range,age,ageUnc,type\n"
               "0,20,820,5,normal\n"
               "500,20,750,5,normal\n"
               "1000,20,700,5,normal\n"
               "1500,20,650,5,normal\n"
               "2000,20,600,5,normal\n");

    // Help exits cleanly for every command
    {
        if (run(tsam::cmd_calibrate, {"calibrate", "--help"}) != 0 ||
            run(tsam::cmd_summarize, {"summarize", "-h"}) != 0 ||
            run(tsam::cmd_duration, {"duration", "--help"}) != 0) {
            std::cerr << "help should return 0\n";
            return 1;
        }
    }

    // Interval probability is checked before anything is run or written
    {
        const std::string out = "tsam_cli_bad_prob";
        fs::remove_all(out);
        const int rc = run(tsam::cmd_calibrate, {"calibrate", "--observations", column,
                                                 "--output", out, "--iterations", "5",
                                                 "--probability", "1.5"});
        if (rc != 1) {
            std::cerr << "probability 1.5 should fail calibrate\n";
            return 1;
        }
        if (fs::exists(fs::path(out) / "posterior.csv")) {
            std::cerr << "posterior written despite an invalid probability\n";
            return 1;
        }
        fs::remove_all(out);
    }

    // Negative seeds are rejected, not wrapped
    {
        const std::string out = "tsam_cli_bad_seed";
        fs::remove_all(out);
        const int rc = run(tsam::cmd_calibrate, {"calibrate", "--observations", column,
                                                 "--output", out, "--iterations", "5",
                                                 "--seed", "-5"});
        if (rc != 1 || fs::exists(fs::path(out) / "posterior.csv")) {
            std::cerr << "seed -5 should fail calibrate\n";
            return 1;
        }
        fs::remove_all(out);

        tsam::CLICommand cmd;
        char name[] = "calibrate";
        char flag[] = "--seed";
        char big[] = "4294967296";
        char ok[] = "4294967295";
        char* argv_big[] = {name, flag, big, nullptr};
        char* argv_ok[] = {name, flag, ok, nullptr};
        bool threw = false;
        try {
            cmd.get_uint32(3, argv_big, "--seed", 1);
        } catch (const tsam::ConfigError&) {
            threw = true;
        }
        if (!threw || cmd.get_uint32(3, argv_ok, "--seed", 1) != 4294967295u) {
            std::cerr << "seed range check wrong\n";
            return 1;
        }
    }

    // A column reaching past the curve's domain fails without a posterior
    {
        const std::string tall = "tsam_cli_tall.csv";
        write_file(tall, "height,range,age,ageUnc,type\n0,1,810,1,normal\n3000,1,700,1,normal\n");
        const std::string out = "tsam_cli_tall";
        fs::remove_all(out);
        const int rc = run(tsam::cmd_calibrate, {"calibrate", "--observations", tall,
                                                 "--output", out, "--iterations", "5", "-q"});
        fs::remove(tall);
        if (rc != 1 || fs::exists(fs::path(out) / "posterior.csv")) {
            std::cerr << "column above the domain top should fail calibrate\n";
            return 1;
        }
        fs::remove_all(out);
    }

    // Calibrate, then summarize and time the saved posterior
    {
        const std::string out = "tsam_cli_run";
        fs::remove_all(out);
        int rc = run(tsam::cmd_calibrate, {"calibrate", "--observations", column,
                                           "--output", out, "--iterations", "20",
                                           "--step", "500", "-q"});
        if (rc != 0) {
            std::cerr << "calibrate failed on the reference column\n";
            return 1;
        }
        for (const char* f : {"posterior.csv", "age_model.csv", "parameters.csv", "tsam_trace.log"}) {
            if (!fs::exists(fs::path(out) / f)) {
                std::cerr << "calibrate did not write " << f << "\n";
                return 1;
            }
        }

        const std::string posterior = (fs::path(out) / "posterior.csv").string();
        const std::string model = (fs::path(out) / "summary.csv").string();
        rc = run(tsam::cmd_summarize, {"summarize", "--posterior", posterior,
                                       "--step", "250", "--top", "1000", "--output", model});
        if (rc != 0 || !fs::exists(model)) {
            std::cerr << "summarize failed on a saved posterior\n";
            return 1;
        }

        rc = run(tsam::cmd_summarize, {"summarize", "--posterior", posterior,
                                       "--top", "1000", "--probability", "0"});
        if (rc != 1) {
            std::cerr << "summarize should reject probability 0\n";
            return 1;
        }

        rc = run(tsam::cmd_duration, {"duration", "--posterior", posterior,
                                      "--base", "0", "--top", "1000", "--compare-independent"});
        if (rc != 0) {
            std::cerr << "duration failed on a saved posterior\n";
            return 1;
        }

        rc = run(tsam::cmd_duration, {"duration", "--posterior", posterior,
                                      "--base", "0", "--top", "1000", "--probability", "-0.5"});
        if (rc != 1) {
            std::cerr << "duration should reject a negative probability\n";
            return 1;
        }
        fs::remove_all(out);
    }

    fs::remove(column);
    return 0;
}
