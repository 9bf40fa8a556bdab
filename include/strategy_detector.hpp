#pragma once

#include "fragment.hpp"
#include "score_domain.hpp"

#include <vector>

namespace tablestitch {

// Picks a segmentation strategy when neither the caller nor a profile knows it.
// A fragment whose data rows lead with numbers (at least `numericRatio` of them)
// means ScoreDomain; otherwise HeaderRepetition, whether or not a fragment's
// first row repeats an earlier one.
SegmentationStrategy detectStrategy(const std::vector<Fragment>& fragments,
                                    const HeuristicThresholds& thresholds = {});

// True when at least `ratio` of the non-empty rows after the first lead with a
// number. Fragments without such rows never qualify.
bool hasNumericLeadColumn(const Fragment& fragment, double ratio);

// True when some fragment's first row (trimmed, uppercased) repeats the first
// row of an earlier fragment.
bool hasRepeatedFirstRow(const std::vector<Fragment>& fragments);

} // namespace tablestitch
