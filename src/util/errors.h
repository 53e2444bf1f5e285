// TSAM - errors.h
// Exception types for configuration and per-iteration failures

#pragma once

#include <stdexcept>
#include <string>

namespace tsam {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed input rows, bad constants or priors, unordered query heights.
// Always raised before the bootstrap loop starts.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

// Failure of a single bootstrap iteration. iteration() is 1-based,
// 0 when the failure happened outside the bootstrap loop.
class IterationError : public Error {
public:
    IterationError(const std::string& msg, int iteration = 0, int attempts = 0)
        : Error(msg), iteration_(iteration), attempts_(attempts) {}

    int iteration() const { return iteration_; }
    int attempts() const { return attempts_; }

private:
    int iteration_;
    int attempts_;
};

// Fewer than two draws survived the superposition filter
class DataError : public IterationError {
public:
    DataError(const std::string& msg, int iteration = 0, int attempts = 0, int kept = 0)
        : IterationError(msg, iteration, attempts), kept_(kept) {}

    int kept() const { return kept_; }

private:
    int kept_;
};

// MAP search did not converge, started outside the model domain, or ended
// on curvature that is not negative definite
class FitConvergenceError : public IterationError {
public:
    FitConvergenceError(const std::string& msg, int iteration = 0, int attempts = 0)
        : IterationError(msg, iteration, attempts) {}
};

}  // namespace tsam
