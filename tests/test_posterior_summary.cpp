// TSAM - test_posterior_summary.cpp

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>
#include "posterior/summary.h"
#include "util/errors.h"

namespace {

using namespace tsam;

// a and b driven by the same standard normal
CompositePosterior correlated_posterior(int n, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> z(0.0, 1.0);
    CompositePosterior post;
    for (int i = 0; i < n; ++i) {
        const double zi = z(rng);
        PosteriorDraw d;
        d.a = 817.0 + 5.0 * zi;
        d.b = 1.3 + 0.03 * zi;
        d.sigma = 3.0;
        post.push_back(d);
    }
    return post;
}

}  // namespace

int main() {
    const SubsidenceCurve curve;

    // Median
    {
        if (median({3.0, 1.0, 2.0}) != 2.0 || median({4.0, 1.0, 3.0, 2.0}) != 2.5 ||
            !std::isnan(median({}))) {
            std::cerr << "median wrong\n";
            return 1;
        }
    }

    // HPDI picks the narrowest window
    {
        std::vector<double> v;
        for (int i = 1; i <= 100; ++i) v.push_back(i);
        const Interval flat = hpdi(v, 0.9);
        if (flat.lower != 1.0 || flat.upper != 91.0) {
            std::cerr << "flat hpdi wrong: [" << flat.lower << ", " << flat.upper << "]\n";
            return 1;
        }

        const Interval skew = hpdi({100.0, 2.0, 4.0, 1.0, 3.0}, 0.6);
        if (skew.lower != 1.0 || skew.upper != 4.0) {
            std::cerr << "skewed hpdi wrong: [" << skew.lower << ", " << skew.upper << "]\n";
            return 1;
        }

        const Interval one = hpdi({5.0}, 0.95);
        if (one.lower != 5.0 || one.upper != 5.0 || !std::isnan(hpdi({}, 0.95).lower)) {
            std::cerr << "degenerate hpdi wrong\n";
            return 1;
        }

        for (double p : {0.0, 1.0, 1.5, -0.5}) {
            bool rejected = false;
            try {
                validate_probability(p);
            } catch (const ConfigError&) {
                rejected = true;
            }
            if (!rejected) {
                std::cerr << "probability " << p << " should be rejected\n";
                return 1;
            }
        }
        validate_probability(0.95);

        bool threw = false;
        try {
            hpdi(v, 1.0);
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "probability 1 should raise ConfigError\n";
            return 1;
        }
    }

    // Order independent and idempotent
    {
        CompositePosterior post = correlated_posterior(500, 3);
        const AgeSummary s1 = summarize(curve, 1200.0, post);
        const AgeSummary s2 = summarize(curve, 1200.0, post);

        std::mt19937 rng(8);
        std::shuffle(post.begin(), post.end(), rng);
        const AgeSummary s3 = summarize(curve, 1200.0, post);

        if (s1.median != s2.median || s1.lower != s2.lower || s1.upper != s2.upper) {
            std::cerr << "summarize not idempotent\n";
            return 1;
        }
        if (s1.median != s3.median || s1.lower != s3.lower || s1.upper != s3.upper) {
            std::cerr << "summarize depends on draw order\n";
            return 1;
        }
        if (!(s1.lower <= s1.median && s1.median <= s1.upper) || s1.n_finite != 500) {
            std::cerr << "summary interval inconsistent\n";
            return 1;
        }
    }

    // Draws outside the curve's domain are excluded and counted
    {
        CompositePosterior post = correlated_posterior(50, 4);
        PosteriorDraw bad;
        bad.a = 817.0;
        bad.b = -1.0;
        post.push_back(bad);
        const AgeSummary s = summarize(curve, 500.0, post);
        if (s.n_nonfinite != 1 || s.n_finite != 50 || !std::isfinite(s.median) ||
            !std::isfinite(s.lower) || !std::isfinite(s.upper)) {
            std::cerr << "non-finite exclusion wrong: finite=" << s.n_finite
                      << " nonfinite=" << s.n_nonfinite << "\n";
            return 1;
        }
    }

    // Correlated duration is tighter than pairing independent marginals
    {
        const CompositePosterior post = correlated_posterior(4000, 5);
        const DifferenceSummary corr = correlated_difference(curve, 0.0, 1000.0, post);
        Rng rng(6);
        const DifferenceSummary indep = independent_difference(curve, 0.0, 1000.0, post, rng);

        if (!(corr.median > 0.0)) {
            std::cerr << "base should be older than the top: " << corr.median << "\n";
            return 1;
        }
        if (!(corr.width() <= indep.width())) {
            std::cerr << "correlated width " << corr.width() << " exceeds independent width "
                      << indep.width() << "\n";
            return 1;
        }
        if (indep.n_finite != static_cast<int>(post.size())) {
            std::cerr << "independent comparison should pair as many draws as the posterior\n";
            return 1;
        }

        const auto diffs = age_differences(curve, 0.0, 1000.0, post);
        const auto ages0 = ages_at(curve, 0.0, post);
        const auto ages1 = ages_at(curve, 1000.0, post);
        if (std::abs(diffs[7] - (ages0[7] - ages1[7])) > 1e-12) {
            std::cerr << "differences not taken within the same draw\n";
            return 1;
        }
    }

    // Query heights and grids
    {
        const auto grid = make_height_grid(5.0, 20.0);
        if (grid.size() != 5 || grid.front() != 0.0 || grid.back() != 20.0) {
            std::cerr << "grid 0..20 by 5 wrong, size " << grid.size() << "\n";
            return 1;
        }
        if (make_height_grid(5.0, 22.0).back() != 20.0) {
            std::cerr << "grid should stop at the last full step\n";
            return 1;
        }

        bool threw = false;
        try {
            make_height_grid(0.0, 10.0);
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "zero grid step should raise ConfigError\n";
            return 1;
        }

        const CompositePosterior post = correlated_posterior(100, 9);
        threw = false;
        try {
            summarize_heights(curve, {0.0, 500.0, 250.0}, post);
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "decreasing query heights should raise ConfigError\n";
            return 1;
        }

        const auto model = summarize_heights(curve, {0.0, 0.0, 1000.0}, post);
        if (model.size() != 3 || !(model[0].median > model[2].median)) {
            std::cerr << "age model not younger upwards\n";
            return 1;
        }
    }

    // Parameter summaries
    {
        const CompositePosterior post = correlated_posterior(2000, 10);
        const auto params = summarize_parameters(post);
        if (params.size() != 3 || params[0].name != "a" || params[2].name != "sigma") {
            std::cerr << "parameter summary layout wrong\n";
            return 1;
        }
        if (std::abs(params[0].mean - 817.0) > 0.5 || std::abs(params[0].sd - 5.0) > 0.3) {
            std::cerr << "a summary off: mean=" << params[0].mean << " sd=" << params[0].sd << "\n";
            return 1;
        }
        if (params[2].sd != 0.0 || params[2].median != 3.0) {
            std::cerr << "constant sigma summary wrong\n";
            return 1;
        }
    }

    return 0;
}
