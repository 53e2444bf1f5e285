// TSAM - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include "util/errors.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <iostream>
#include <sstream>

namespace tsam {

void CLICommand::print_help() const {
    std::cerr << "Usage: tsam " << name << " [options]\n\n";
    std::cerr << description << "\n";

    for (const auto& line : description_extra) {
        std::cerr << line << "\n";
    }
    std::cerr << "\n";

    std::vector<const CLIOption*> required_opts;
    std::vector<const CLIOption*> optional_opts;

    for (const auto& opt : options) {
        if (opt.required) {
            required_opts.push_back(&opt);
        } else {
            optional_opts.push_back(&opt);
        }
    }

    // Column width from the longest option/output
    const size_t MIN_COL = 21;
    size_t opt_col = MIN_COL;
    size_t out_col = MIN_COL;

    for (const auto& opt : options) {
        size_t len = 2 + opt.name.length();
        if (!opt.arg_name.empty()) len += 1 + opt.arg_name.length();
        if (len + 1 > opt_col) opt_col = len + 1;
    }
    for (const auto& out : outputs) {
        size_t len = 2 + out.filename.length();
        if (len + 1 > out_col) out_col = len + 1;
    }

    if (!required_opts.empty()) {
        std::cerr << "Required:\n";
        for (const auto* opt : required_opts) {
            std::string opt_str = "  " + opt->name;
            if (!opt->arg_name.empty()) {
                opt_str += " " + opt->arg_name;
            }
            while (opt_str.length() < opt_col) opt_str += " ";
            std::cerr << opt_str << opt->description << "\n";
        }
        std::cerr << "\n";
    }

    std::cerr << "Options:\n";
    for (const auto* opt : optional_opts) {
        std::string opt_str = "  " + opt->name;
        if (!opt->arg_name.empty()) {
            opt_str += " " + opt->arg_name;
        }
        while (opt_str.length() < opt_col) opt_str += " ";

        std::string desc = opt->description;
        if (!opt->default_value.empty()) {
            desc += " (default: " + opt->default_value + ")";
        }
        std::cerr << opt_str << desc << "\n";
    }
    std::cerr << "\n";

    if (!outputs.empty()) {
        std::cerr << "Output:\n";
        for (const auto& out : outputs) {
            std::string out_str = "  " + out.filename;
            while (out_str.length() < out_col) out_str += " ";
            std::string desc = out.description;
            if (!out.condition.empty()) {
                desc += " " + out.condition;
            }
            std::cerr << out_str << desc << "\n";
        }
        std::cerr << "\n";
    }

    if (!note.empty()) {
        std::cerr << "Note:\n  " << note << "\n\n";
    }

    if (!examples.empty()) {
        std::cerr << "Example:\n";
        for (const auto& ex : examples) {
            std::cerr << "  " << ex << "\n";
        }
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return true;
        }
    }
    return false;
}

bool CLICommand::has_flag(int argc, char** argv, const std::string& flag) const {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

std::string CLICommand::get_option(int argc, char** argv, const std::string& name,
                                    const std::string& default_val) const {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == name) {
            return argv[i + 1];
        }
    }
    return default_val;
}

double CLICommand::get_double(int argc, char** argv, const std::string& name,
                              double default_val) const {
    const std::string text = get_option(argc, argv, name);
    if (text.empty()) return default_val;

    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        throw ConfigError("Option " + name + " expects a number, got '" + text + "'");
    }
    return v;
}

int CLICommand::get_int(int argc, char** argv, const std::string& name, int default_val) const {
    const std::string text = get_option(argc, argv, name);
    if (text.empty()) return default_val;

    char* end = nullptr;
    const long v = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') {
        throw ConfigError("Option " + name + " expects an integer, got '" + text + "'");
    }
    return static_cast<int>(v);
}

std::uint32_t CLICommand::get_uint32(int argc, char** argv, const std::string& name,
                                     std::uint32_t default_val) const {
    const std::string text = get_option(argc, argv, name);
    if (text.empty()) return default_val;

    // strtoull would silently wrap "-5"
    if (text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Option " + name + " expects a non-negative integer, got '" + text + "'");
    }
    errno = 0;
    const unsigned long long v = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE || v > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigError("Option " + name + " is out of range: " + text);
    }
    return static_cast<std::uint32_t>(v);
}

std::vector<std::string> CLICommand::get_missing_required(int argc, char** argv) const {
    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (opt.required) {
            bool found = false;
            for (int i = 1; i < argc; ++i) {
                if (argv[i] == opt.name && i + 1 < argc) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                missing.push_back(opt.name);
            }
        }
    }
    return missing;
}

bool CLICommand::validate_required(int argc, char** argv) const {
    auto missing = get_missing_required(argc, argv);
    if (missing.empty()) {
        return true;
    }

    std::cerr << "Error: Missing required arguments.\n";
    std::cerr << "Required:";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << " " << missing[i];
    }
    std::cerr << "\n\n";
    print_help();
    return false;
}

namespace {

std::string default_text(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

}  // namespace

void add_constant_options(CLICommand& cmd) {
    const PhysicalConstants d;
    cmd.options.push_back({"--lithosphere-thickness", "M", "Lithosphere thickness L (m)", default_text(d.lithosphere_thickness)});
    cmd.options.push_back({"--mantle-density", "X", "Mantle density (kg/m^3)", default_text(d.mantle_density)});
    cmd.options.push_back({"--infill-density", "X", "Basin infill density (kg/m^3)", default_text(d.infill_density)});
    cmd.options.push_back({"--thermal-diffusivity", "K", "Thermal diffusivity (m^2/s)", default_text(d.thermal_diffusivity)});
    cmd.options.push_back({"--mantle-temperature", "T", "Mantle temperature (degC)", default_text(d.mantle_temperature)});
    cmd.options.push_back({"--thermal-expansion", "A", "Thermal expansion coefficient (1/K)", default_text(d.thermal_expansion)});
}

PhysicalConstants read_constant_options(const CLICommand& cmd, int argc, char** argv) {
    PhysicalConstants c;
    c.lithosphere_thickness = cmd.get_double(argc, argv, "--lithosphere-thickness", c.lithosphere_thickness);
    c.mantle_density = cmd.get_double(argc, argv, "--mantle-density", c.mantle_density);
    c.infill_density = cmd.get_double(argc, argv, "--infill-density", c.infill_density);
    c.thermal_diffusivity = cmd.get_double(argc, argv, "--thermal-diffusivity", c.thermal_diffusivity);
    c.mantle_temperature = cmd.get_double(argc, argv, "--mantle-temperature", c.mantle_temperature);
    c.thermal_expansion = cmd.get_double(argc, argv, "--thermal-expansion", c.thermal_expansion);
    return c;
}

}  // namespace tsam
