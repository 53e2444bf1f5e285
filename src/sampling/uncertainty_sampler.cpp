// TSAM - uncertainty_sampler.cpp

#include "sampling/uncertainty_sampler.h"
#include <algorithm>

namespace tsam {

double draw_age(const Observation& obs, Rng& rng) {
    const double sd = obs.age_uncertainty / 2.0;
    if (sd <= 0.0) return obs.age;
    std::normal_distribution<double> dist(obs.age, sd);
    return dist(rng);
}

double draw_height(const Observation& obs, Rng& rng) {
    const double half = obs.height_uncertainty / 2.0;
    if (half <= 0.0) return obs.height;

    if (obs.height_shape == UncertaintyShape::Gaussian) {
        std::normal_distribution<double> dist(obs.height, half);
        return dist(rng);
    }
    std::uniform_real_distribution<double> dist(obs.height - half, obs.height + half);
    return dist(rng);
}

ResampledDraw resample(const Observation& obs, Rng& rng) {
    ResampledDraw d;
    d.age = draw_age(obs, rng);
    d.height = draw_height(obs, rng);
    return d;
}

std::vector<ResampledDraw> resample_all(const std::vector<Observation>& observations, Rng& rng) {
    std::vector<ResampledDraw> draws(observations.size());
    for (size_t i = 0; i < observations.size(); ++i) {
        draws[i].age = draw_age(observations[i], rng);
    }
    for (size_t i = 0; i < observations.size(); ++i) {
        draws[i].height = draw_height(observations[i], rng);
    }

    std::stable_sort(draws.begin(), draws.end(),
                     [](const ResampledDraw& x, const ResampledDraw& y) {
                         return x.height < y.height;
                     });
    return draws;
}

}  // namespace tsam
