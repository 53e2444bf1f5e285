// TSAM - superposition_filter.cpp

#include "sampling/superposition_filter.h"

#include <algorithm>
#include <stdexcept>

namespace tsam {

std::vector<ResampledDraw> filter_superposition(const std::vector<ResampledDraw>& draws,
                                                ScanDirection direction) {
    std::vector<ResampledDraw> kept;
    if (draws.empty()) return kept;

    if (!std::is_sorted(draws.begin(), draws.end(),
                        [](const ResampledDraw& x, const ResampledDraw& y) {
                            return x.height < y.height;
                        })) {
        throw std::invalid_argument("Superposition filter needs draws sorted by height");
    }

    kept.reserve(draws.size());

    if (direction == ScanDirection::BottomUp) {
        kept.push_back(draws.front());
        for (size_t i = 1; i < draws.size(); ++i) {
            if (draws[i].age < kept.back().age) {
                kept.push_back(draws[i]);
            }
        }
        return kept;
    }

    kept.push_back(draws.back());
    for (size_t i = draws.size() - 1; i-- > 0;) {
        if (draws[i].age > kept.back().age) {
            kept.push_back(draws[i]);
        }
    }
    // Collected top to bottom; reversing restores ascending height order
    // (equal heights come back in their input order)
    std::reverse(kept.begin(), kept.end());
    return kept;
}

bool is_superposed(const std::vector<ResampledDraw>& draws) {
    for (size_t i = 1; i < draws.size(); ++i) {
        if (draws[i].height < draws[i - 1].height) return false;
        if (draws[i].age > draws[i - 1].age) return false;
    }
    return true;
}

}  // namespace tsam
