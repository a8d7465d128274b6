// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PATTERN_RANKER_H
#define __SEASONALITY_PATTERN_RANKER_H 1

#include <vector>
#include "SeasonalPattern.h"

namespace mkc_seasonality
{
  /**
   * @brief Keeps the best pattern per (asset, direction) across all assets and
   * orders the survivors for reporting.
   */
  class PatternRanker
  {
  public:
    static constexpr double kWinRateWeight = 0.6;
    static constexpr double kSharpeWeight = 0.3;
    static constexpr double kAverageReturnWeight = 0.1;

    /**
     * @brief 0.6 * win rate + 0.3 * sharpe + 0.1 * (average return * 100).
     */
    static double computeCompositeScore(const SeasonalPattern& pattern);

    /**
     * @brief Deduplicates by (asset, direction) keeping the highest composite
     * score (the first one seen on equal scores), then sorts by win rate
     * descending with the annualized sharpe as tie break.
     *
     * The result holds at most two patterns per asset.
     */
    static std::vector<SeasonalPattern> rank(const std::vector<SeasonalPattern>& patterns);

    /**
     * @brief Stable sort by win rate descending, then sharpe descending.
     */
    static void sortForReport(std::vector<SeasonalPattern>& patterns);
  };
}

#endif
