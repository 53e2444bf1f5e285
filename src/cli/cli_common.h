// TSAM - cli_common.h
// Common CLI infrastructure for consistent command-line interface

#pragma once

#include <tsam/config.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tsam {

struct CLIOption {
    std::string name;           // e.g., "--observations"
    std::string arg_name;       // e.g., "FILE", "N", "" for flags
    std::string description;
    std::string default_value;  // "" if required or no default
    bool required;

    CLIOption(const std::string& n, const std::string& arg, const std::string& desc,
              const std::string& def = "", bool req = false)
        : name(n), arg_name(arg), description(desc), default_value(def), required(req) {}
};

struct CLIOutput {
    std::string filename;
    std::string description;
    std::string condition;      // e.g., "(with --heights)" or ""

    CLIOutput(const std::string& f, const std::string& d, const std::string& c = "")
        : filename(f), description(d), condition(c) {}
};

struct CLICommand {
    std::string name;
    std::string description;
    std::vector<std::string> description_extra;  // Additional description lines
    std::vector<CLIOption> options;
    std::vector<CLIOutput> outputs;
    std::string note;
    std::vector<std::string> examples;

    // Print formatted help message to stderr
    void print_help() const;

    // Check if help flag is present
    bool has_help_flag(int argc, char** argv) const;

    // Validate required arguments are present
    // Returns true if valid, false otherwise (prints error message)
    bool validate_required(int argc, char** argv) const;

    // Get option value (returns default if not found)
    std::string get_option(int argc, char** argv, const std::string& name,
                           const std::string& default_val = "") const;

    // Numeric options; an unparsable value is a ConfigError naming the option
    double get_double(int argc, char** argv, const std::string& name, double default_val) const;
    int get_int(int argc, char** argv, const std::string& name, int default_val) const;
    // Unsigned 32-bit value; a sign or out-of-range value is a ConfigError
    std::uint32_t get_uint32(int argc, char** argv, const std::string& name,
                             std::uint32_t default_val) const;

    // Check if flag is present
    bool has_flag(int argc, char** argv, const std::string& flag) const;

    // Get list of missing required arguments
    std::vector<std::string> get_missing_required(int argc, char** argv) const;
};

// --lithosphere-thickness, --mantle-density, ... shared by every command
void add_constant_options(CLICommand& cmd);
PhysicalConstants read_constant_options(const CLICommand& cmd, int argc, char** argv);

}  // namespace tsam
