// TSAM - table_io.h
// Delimited text tables: observations in, posterior and age model out

#pragma once

#include "fit/fit_types.h"
#include "model/observation.h"
#include "posterior/summary.h"

#include <string>
#include <vector>

namespace tsam {

// Header row required. Comma or tab separated (taken from the header line);
// surrounding double quotes are stripped. All failures are ConfigError with
// the file name and line number.

// Columns: height, range, age, ageUnc, type. Others are ignored.
std::vector<Observation> read_observations(const std::string& path);

// Columns: a, b, sigma
CompositePosterior read_posterior(const std::string& path);

// Either a 'height' column or one number per line without a header
std::vector<double> read_heights(const std::string& path);

void write_posterior(const std::string& path, const CompositePosterior& posterior);

// height, age_median, age_min, age_max
void write_age_model(const std::string& path, const std::vector<AgeSummary>& summaries);

// name, mean, sd, median, lower, upper
void write_parameter_summary(const std::string& path, const std::vector<ParameterSummary>& params);

}  // namespace tsam
