// TSAM - observation.cpp

#include "model/observation.h"
#include "util/errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tsam {

UncertaintyShape parse_uncertainty_shape(const std::string& tag) {
    std::string t;
    for (char c : tag) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            t += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return t == "normal" ? UncertaintyShape::Gaussian : UncertaintyShape::Uniform;
}

void validate_observations(const std::vector<Observation>& observations) {
    if (observations.size() < 2) {
        throw ConfigError("At least 2 observations are required (got " +
                          std::to_string(observations.size()) + ")");
    }

    for (size_t i = 0; i < observations.size(); ++i) {
        const auto& o = observations[i];
        const char* problem = nullptr;
        if (!std::isfinite(o.height)) problem = "height is not finite";
        else if (!std::isfinite(o.age)) problem = "age is not finite";
        else if (!std::isfinite(o.height_uncertainty) || o.height_uncertainty < 0.0)
            problem = "height uncertainty must be finite and non-negative";
        else if (!std::isfinite(o.age_uncertainty) || o.age_uncertainty < 0.0)
            problem = "age uncertainty must be finite and non-negative";

        if (problem) {
            std::ostringstream ss;
            ss << "Observation " << (i + 1) << ": " << problem
               << " (height=" << o.height << ", age=" << o.age << ")";
            throw ConfigError(ss.str());
        }
    }
}

double column_top(const std::vector<Observation>& observations) {
    if (observations.empty()) return 0.0;
    return std::max_element(observations.begin(), observations.end(),
                            [](const Observation& x, const Observation& y) {
                                return x.height < y.height;
                            })->height;
}

}  // namespace tsam
