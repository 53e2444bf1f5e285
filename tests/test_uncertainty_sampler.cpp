// TSAM - test_uncertainty_sampler.cpp

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>
#include "sampling/uncertainty_sampler.h"

namespace {

void moments(const std::vector<double>& v, double& mean, double& sd) {
    mean = 0.0;
    for (double x : v) mean += x;
    mean /= v.size();
    double ss = 0.0;
    for (double x : v) ss += (x - mean) * (x - mean);
    sd = std::sqrt(ss / (v.size() - 1));
}

}  // namespace

int main() {
    using namespace tsam;
    const int N = 200000;

    // Ages: Normal(age, ageUnc / 2)
    {
        Rng rng(11);
        Observation o;
        o.age = 800.0;
        o.age_uncertainty = 4.0;
        std::vector<double> v;
        v.reserve(N);
        for (int i = 0; i < N; ++i) v.push_back(draw_age(o, rng));
        double mean, sd;
        moments(v, mean, sd);
        if (std::abs(mean - 800.0) > 0.05 || std::abs(sd - 2.0) > 0.02) {
            std::cerr << "age moments off: mean=" << mean << " sd=" << sd << "\n";
            return 1;
        }
    }

    // Gaussian heights: sd is half the stored range
    {
        Rng rng(12);
        Observation o;
        o.height = 1500.0;
        o.height_uncertainty = 20.0;
        o.height_shape = UncertaintyShape::Gaussian;
        std::vector<double> v;
        v.reserve(N);
        for (int i = 0; i < N; ++i) v.push_back(draw_height(o, rng));
        double mean, sd;
        moments(v, mean, sd);
        if (std::abs(mean - 1500.0) > 0.15 || std::abs(sd - 10.0) > 0.1) {
            std::cerr << "gaussian height moments off: mean=" << mean << " sd=" << sd << "\n";
            return 1;
        }
    }

    // Uniform heights stay inside [h - u/2, h + u/2]
    {
        Rng rng(13);
        Observation o;
        o.height = 100.0;
        o.height_uncertainty = 10.0;
        o.height_shape = UncertaintyShape::Uniform;
        std::vector<double> v;
        v.reserve(N);
        for (int i = 0; i < N; ++i) v.push_back(draw_height(o, rng));
        const auto mm = std::minmax_element(v.begin(), v.end());
        if (*mm.first < 95.0 || *mm.second > 105.0) {
            std::cerr << "uniform draw outside support: [" << *mm.first << ", " << *mm.second << "]\n";
            return 1;
        }
        double mean, sd;
        moments(v, mean, sd);
        const double expected_sd = 10.0 / std::sqrt(12.0);
        if (std::abs(mean - 100.0) > 0.05 || std::abs(sd - expected_sd) > 0.03) {
            std::cerr << "uniform height moments off: mean=" << mean << " sd=" << sd << "\n";
            return 1;
        }
    }

    // Zero uncertainty returns the stored value and consumes nothing
    {
        Rng rng(14);
        Rng reference(14);
        Observation o;
        o.height = 42.0;
        o.age = 700.0;
        const ResampledDraw d = resample(o, rng);
        if (d.height != 42.0 || d.age != 700.0) {
            std::cerr << "zero-uncertainty draw changed the value\n";
            return 1;
        }
        if (rng() != reference()) {
            std::cerr << "zero-uncertainty draw consumed randomness\n";
            return 1;
        }
    }

    // Whole-column resample comes back sorted by height
    {
        Rng rng(15);
        std::vector<Observation> obs(6);
        for (int i = 0; i < 6; ++i) {
            obs[i].height = 10.0 * (5 - i);
            obs[i].height_uncertainty = 30.0;
            obs[i].age = 800.0 - i;
            obs[i].age_uncertainty = 2.0;
        }
        for (int rep = 0; rep < 100; ++rep) {
            const auto draws = resample_all(obs, rng);
            if (draws.size() != obs.size()) {
                std::cerr << "resample_all dropped draws\n";
                return 1;
            }
            for (size_t i = 1; i < draws.size(); ++i) {
                if (draws[i].height < draws[i - 1].height) {
                    std::cerr << "resample_all output not sorted by height\n";
                    return 1;
                }
            }
        }
    }

    // Same seed, same draws
    {
        std::vector<Observation> obs(3);
        for (int i = 0; i < 3; ++i) {
            obs[i].height = 100.0 * i;
            obs[i].height_uncertainty = 5.0;
            obs[i].age = 700.0 - 10.0 * i;
            obs[i].age_uncertainty = 3.0;
        }
        Rng r1(99), r2(99);
        const auto d1 = resample_all(obs, r1);
        const auto d2 = resample_all(obs, r2);
        for (size_t i = 0; i < d1.size(); ++i) {
            if (d1[i].height != d2[i].height || d1[i].age != d2[i].age) {
                std::cerr << "resample_all not reproducible from the seed\n";
                return 1;
            }
        }
    }

    // Shape tags
    {
        if (parse_uncertainty_shape(" Normal ") != UncertaintyShape::Gaussian ||
            parse_uncertainty_shape("normal") != UncertaintyShape::Gaussian ||
            parse_uncertainty_shape("uniform") != UncertaintyShape::Uniform ||
            parse_uncertainty_shape("") != UncertaintyShape::Uniform) {
            std::cerr << "shape tag parsing wrong\n";
            return 1;
        }
    }

    return 0;
}
