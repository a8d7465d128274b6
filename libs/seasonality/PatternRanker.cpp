// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include "PatternRanker.h"

namespace mkc_seasonality
{
  double PatternRanker::computeCompositeScore(const SeasonalPattern& pattern)
  {
    return (kWinRateWeight * pattern.getWinRate()) +
      (kSharpeWeight * pattern.getSharpeAnnualized()) +
      (kAverageReturnWeight * (pattern.getAverageReturn() * 100.0));
  }

  std::vector<SeasonalPattern> PatternRanker::rank(const std::vector<SeasonalPattern>& patterns)
  {
    using GroupKey = std::pair<std::string, TradeDirection>;

    std::map<GroupKey, size_t> bestByGroup;

    for (size_t i = 0; i < patterns.size(); i++)
      {
	GroupKey key(patterns[i].getAsset(), patterns[i].getDirection());

	auto it = bestByGroup.find(key);
	if (it == bestByGroup.end())
	  bestByGroup.emplace(key, i);
	else if (computeCompositeScore(patterns[i]) > computeCompositeScore(patterns[it->second]))
	  it->second = i;
      }

    std::vector<SeasonalPattern> ranked;
    ranked.reserve(bestByGroup.size());

    for (const auto& group : bestByGroup)
      ranked.push_back(patterns[group.second]);

    sortForReport(ranked);
    return ranked;
  }

  void PatternRanker::sortForReport(std::vector<SeasonalPattern>& patterns)
  {
    std::stable_sort(patterns.begin(), patterns.end(),
		     [](const SeasonalPattern& a, const SeasonalPattern& b)
		     {
		       if (a.getWinRate() != b.getWinRate())
			 return a.getWinRate() > b.getWinRate();

		       return a.getSharpeAnnualized() > b.getSharpeAnnualized();
		     });
  }
}
