// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include "PatternMerger.h"

namespace mkc_seasonality
{
  std::vector<SeasonalPattern> PatternMerger::merge(const std::vector<SeasonalPattern>& patterns)
  {
    std::vector<unsigned int> offsetOrder;
    std::map<unsigned int, std::vector<SeasonalPattern>> groups;

    for (const auto& pattern : patterns)
      {
	auto it = groups.find(pattern.getStartIn());
	if (it == groups.end())
	  {
	    offsetOrder.push_back(pattern.getStartIn());
	    groups[pattern.getStartIn()].push_back(pattern);
	  }
	else
	  it->second.push_back(pattern);
      }

    std::vector<SeasonalPattern> merged;
    merged.reserve(offsetOrder.size());

    for (unsigned int offset : offsetOrder)
      {
	const std::vector<SeasonalPattern>& group = groups[offset];

	if (group.size() == 1)
	  merged.push_back(group.front());
	else
	  merged.push_back(mergeGroup(group));
      }

    return merged;
  }

  SeasonalPattern PatternMerger::mergeGroup(const std::vector<SeasonalPattern>& group)
  {
    if (group.empty())
      throw std::invalid_argument("PatternMerger::mergeGroup: empty group");

    if (group.size() == 1)
      return group.front();

    double totalWeight = 0.0;
    for (const auto& pattern : group)
      totalWeight += pattern.getNumYears();

    // A group whose members carry no years is averaged with equal weights.
    bool equalWeights = (totalWeight <= 0.0);
    if (equalWeights)
      totalWeight = static_cast<double>(group.size());

    double length = 0.0;
    double winRate = 0.0;
    double averageReturn = 0.0;
    double sharpe = 0.0;
    double cycleWinRate = 0.0;
    unsigned int numYears = 0;
    unsigned int longest = 0;
    bool cycleSupported = false;
    size_t longCount = 0;

    for (const auto& pattern : group)
      {
	double weight = equalWeights ? 1.0 : static_cast<double>(pattern.getNumYears());

	length += weight * pattern.getPhaseLength();
	winRate += weight * pattern.getWinRate();
	averageReturn += weight * pattern.getAverageReturn();
	sharpe += weight * pattern.getSharpeAnnualized();
	cycleWinRate += weight * pattern.getCycleWinRate();

	numYears = std::max(numYears, pattern.getNumYears());
	longest = std::max(longest, pattern.getLongestStreak());
	cycleSupported = cycleSupported || pattern.isCycleSupported();

	if (pattern.isLong())
	  longCount++;
      }

    size_t shortCount = group.size() - longCount;
    TradeDirection direction = (longCount >= shortCount) ? TradeDirection::LONG : TradeDirection::SHORT;

    const SeasonalPattern& first = group.front();

    return SeasonalPattern(first.getAsset(),
			   direction,
			   first.getStartIn(),
			   static_cast<unsigned int>(std::lround(length / totalWeight)),
			   numYears,
			   winRate / totalWeight,
			   averageReturn / totalWeight,
			   sharpe / totalWeight,
			   cycleWinRate / totalWeight,
			   cycleSupported,
			   longest);
  }
}
