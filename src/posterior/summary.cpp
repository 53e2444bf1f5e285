// TSAM - summary.cpp
// Medians, HPDIs and correlated differences over the composite posterior

#include "posterior/summary.h"
#include "util/errors.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>

namespace tsam {

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

// Keep finite values, return how many were dropped
int keep_finite(const std::vector<double>& in, std::vector<double>& out) {
    out.clear();
    out.reserve(in.size());
    for (double v : in) {
        if (std::isfinite(v)) out.push_back(v);
    }
    return static_cast<int>(in.size() - out.size());
}

DifferenceSummary difference_summary(double h1, double h2, const std::vector<double>& diffs,
                                     double prob) {
    DifferenceSummary s;
    s.height1 = h1;
    s.height2 = h2;
    std::vector<double> finite;
    s.n_nonfinite = keep_finite(diffs, finite);
    s.n_finite = static_cast<int>(finite.size());

    const Interval iv = hpdi(finite, prob);
    s.median = median(std::move(finite));
    s.lower = iv.lower;
    s.upper = iv.upper;
    return s;
}

}  // namespace

void validate_probability(double prob) {
    if (!(prob > 0.0 && prob < 1.0)) {
        throw ConfigError("Interval probability must lie in (0, 1)");
    }
}

double median(std::vector<double> values) {
    const size_t n = values.size();
    if (n == 0) return kNaN;

    const size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (n % 2 == 1) return upper;

    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

Interval hpdi(std::vector<double> values, double prob) {
    validate_probability(prob);

    Interval iv;
    const size_t n = values.size();
    if (n == 0) {
        iv.lower = iv.upper = kNaN;
        return iv;
    }
    std::sort(values.begin(), values.end());
    if (n == 1) {
        iv.lower = iv.upper = values[0];
        return iv;
    }

    const size_t target = static_cast<size_t>(std::llround(static_cast<double>(n) * prob));
    const size_t gap = std::max<size_t>(1, std::min(n - 1, target));

    size_t best = 0;
    double best_width = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i + gap < n; ++i) {
        const double w = values[i + gap] - values[i];
        if (w < best_width) {
            best_width = w;
            best = i;
        }
    }
    iv.lower = values[best];
    iv.upper = values[best + gap];
    return iv;
}

std::vector<double> ages_at(const SubsidenceCurve& curve, double height,
                            const CompositePosterior& posterior) {
    std::vector<double> ages;
    ages.reserve(posterior.size());
    for (const auto& d : posterior) {
        ages.push_back(curve.mean_age(height, d.a, d.b));
    }
    return ages;
}

AgeSummary summarize(const SubsidenceCurve& curve, double height,
                     const CompositePosterior& posterior, double prob) {
    AgeSummary s;
    s.height = height;

    std::vector<double> finite;
    s.n_nonfinite = keep_finite(ages_at(curve, height, posterior), finite);
    s.n_finite = static_cast<int>(finite.size());

    const Interval iv = hpdi(finite, prob);
    s.median = median(std::move(finite));
    s.lower = iv.lower;
    s.upper = iv.upper;
    return s;
}

void validate_query_heights(const std::vector<double>& heights) {
    for (size_t i = 0; i < heights.size(); ++i) {
        if (!std::isfinite(heights[i])) {
            throw ConfigError("Query height " + std::to_string(i + 1) + " is not finite");
        }
        if (i > 0 && heights[i] < heights[i - 1]) {
            std::ostringstream ss;
            ss << "Query heights must be non-decreasing (height " << (i + 1) << " = "
               << heights[i] << " follows " << heights[i - 1] << ")";
            throw ConfigError(ss.str());
        }
    }
}

std::vector<AgeSummary> summarize_heights(const SubsidenceCurve& curve,
                                          const std::vector<double>& heights,
                                          const CompositePosterior& posterior,
                                          double prob) {
    validate_query_heights(heights);
    validate_probability(prob);

    std::vector<AgeSummary> out;
    out.reserve(heights.size());
    for (double h : heights) {
        out.push_back(summarize(curve, h, posterior, prob));
    }
    return out;
}

std::vector<double> make_height_grid(double step, double top) {
    if (!(step > 0.0) || !std::isfinite(step)) {
        throw ConfigError("Grid step must be positive");
    }
    if (!(top >= 0.0) || !std::isfinite(top)) {
        throw ConfigError("Grid top must be a non-negative height");
    }

    std::vector<double> grid;
    const long n = static_cast<long>(std::floor(top / step + 1e-9));
    grid.reserve(n + 1);
    for (long i = 0; i <= n; ++i) {
        grid.push_back(i * step);
    }
    return grid;
}

std::vector<double> age_differences(const SubsidenceCurve& curve, double height1, double height2,
                                    const CompositePosterior& posterior) {
    std::vector<double> diffs;
    diffs.reserve(posterior.size());
    for (const auto& d : posterior) {
        diffs.push_back(curve.mean_age(height1, d.a, d.b) - curve.mean_age(height2, d.a, d.b));
    }
    return diffs;
}

DifferenceSummary correlated_difference(const SubsidenceCurve& curve, double height1, double height2,
                                        const CompositePosterior& posterior, double prob) {
    return difference_summary(height1, height2,
                              age_differences(curve, height1, height2, posterior), prob);
}

DifferenceSummary independent_difference(const SubsidenceCurve& curve, double height1, double height2,
                                         const CompositePosterior& posterior, Rng& rng,
                                         double prob) {
    std::vector<double> ages1, ages2;
    const int dropped1 = keep_finite(ages_at(curve, height1, posterior), ages1);
    const int dropped2 = keep_finite(ages_at(curve, height2, posterior), ages2);

    std::vector<double> diffs;
    if (!ages1.empty() && !ages2.empty()) {
        std::uniform_int_distribution<size_t> pick1(0, ages1.size() - 1);
        std::uniform_int_distribution<size_t> pick2(0, ages2.size() - 1);
        diffs.reserve(posterior.size());
        for (size_t k = 0; k < posterior.size(); ++k) {
            const double x1 = ages1[pick1(rng)];
            const double x2 = ages2[pick2(rng)];
            diffs.push_back(x1 - x2);
        }
    }

    DifferenceSummary s = difference_summary(height1, height2, diffs, prob);
    s.n_nonfinite = std::max(dropped1, dropped2);
    return s;
}

std::vector<ParameterSummary> summarize_parameters(const CompositePosterior& posterior,
                                                   double prob) {
    std::vector<ParameterSummary> out;
    const char* names[] = {"a", "b", "sigma"};

    for (int p = 0; p < 3; ++p) {
        std::vector<double> v;
        v.reserve(posterior.size());
        for (const auto& d : posterior) {
            v.push_back(p == 0 ? d.a : (p == 1 ? d.b : d.sigma));
        }

        ParameterSummary s;
        s.name = names[p];
        if (v.empty()) {
            s.mean = s.sd = s.median = s.lower = s.upper = kNaN;
            out.push_back(s);
            continue;
        }

        s.mean = std::accumulate(v.begin(), v.end(), 0.0) / v.size();
        double ss = 0.0;
        for (double x : v) ss += (x - s.mean) * (x - s.mean);
        s.sd = v.size() > 1 ? std::sqrt(ss / (v.size() - 1)) : 0.0;

        const Interval iv = hpdi(v, prob);
        s.lower = iv.lower;
        s.upper = iv.upper;
        s.median = median(std::move(v));
        out.push_back(s);
    }
    return out;
}

}  // namespace tsam
