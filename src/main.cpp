// TSAM - Thermal Subsidence Age Model
// Main entry point with git-style subcommand dispatch

#include <tsam/config.hpp>
#include <iostream>
#include <string>

// Forward declarations for subcommands
namespace tsam {
    int cmd_calibrate(int argc, char** argv);
    int cmd_summarize(int argc, char** argv);
    int cmd_duration(int argc, char** argv);
}

constexpr const char* CODENAME = "Thermal Subsidence Age Model";

static void print_version() {
    std::cout << "tsam " << tsam::VERSION << "\n";
    std::cout << CODENAME << "\n";
}

static void print_usage(const char* prog) {
    std::cerr << "TSAM - Thermal Subsidence Age Model\n";
    std::cerr << "Version: " << tsam::VERSION << "\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  calibrate        Bootstrap calibration of a dated column\n";
    std::cerr << "  summarize        Age model at query heights from a saved posterior\n";
    std::cerr << "  duration         Correlated duration between two heights\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help     Show this help message\n";
    std::cerr << "  -v, --version  Show version information\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  tsam calibrate --observations column.csv --output run1/\n";
    std::cerr << "  tsam duration --posterior run1/posterior.csv --base 1200 --top 1450\n";
    std::cerr << "\n";
    std::cerr << "For command-specific help, use: tsam <command> --help\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    }

    if (cmd == "calibrate") {
        return tsam::cmd_calibrate(argc - 1, argv + 1);
    } else if (cmd == "summarize") {
        return tsam::cmd_summarize(argc - 1, argv + 1);
    } else if (cmd == "duration") {
        return tsam::cmd_duration(argc - 1, argv + 1);
    } else {
        std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
}
