// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PATTERN_MERGER_H
#define __SEASONALITY_PATTERN_MERGER_H 1

#include <vector>
#include "SeasonalPattern.h"

namespace mkc_seasonality
{
  //
  // class PatternMerger
  //
  // Collapses the patterns of one asset that open on the same day (same
  // start_in) into a single pattern. Numeric fields are averaged with the
  // number of years as weight; years and longest streak take the group
  // maximum; direction is decided by majority with ties going to Long.
  //

  class PatternMerger
  {
  public:
    /**
     * @brief Merges patterns sharing a start offset. Groups appear in the order
     * their offset is first seen; a group of one is passed through unchanged.
     */
    static std::vector<SeasonalPattern> merge(const std::vector<SeasonalPattern>& patterns);

    /**
     * @brief Collapses a non empty group into one pattern.
     * @throws std::invalid_argument for an empty group.
     */
    static SeasonalPattern mergeGroup(const std::vector<SeasonalPattern>& group);
  };
}

#endif
