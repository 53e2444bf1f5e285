// TSAM - superposition_filter.h
// Enforce "higher is younger" on a resampled column by dropping the
// individual draws that break the ordering

#pragma once

#include "model/observation.h"
#include <vector>

namespace tsam {

enum class ScanDirection { BottomUp, TopDown };

inline const char* direction_to_string(ScanDirection d) {
    return d == ScanDirection::BottomUp ? "bottom-up" : "top-down";
}

// Odd (1-based) iterations scan bottom-up, even ones top-down, so neither
// end of the section is favoured over a run.
inline ScanDirection scan_direction(int iteration) {
    return (iteration % 2 != 0) ? ScanDirection::BottomUp : ScanDirection::TopDown;
}

// Input must be sorted ascending by height (std::invalid_argument otherwise).
// The result is ascending in height and strictly decreasing in age.
//
// BottomUp: keep the lowest draw, then every draw strictly younger than the
//           last one kept.
// TopDown:  keep the highest draw, then walking down every draw strictly
//           older than the last one kept.
std::vector<ResampledDraw> filter_superposition(const std::vector<ResampledDraw>& draws,
                                                ScanDirection direction);

inline std::vector<ResampledDraw> filter_superposition(const std::vector<ResampledDraw>& draws,
                                                       int iteration) {
    return filter_superposition(draws, scan_direction(iteration));
}

// True when heights are non-decreasing and ages non-increasing
bool is_superposed(const std::vector<ResampledDraw>& draws);

}  // namespace tsam
