// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SeasonalPattern.h"

namespace mkc_seasonality
{
  std::string directionToString(TradeDirection direction)
  {
    return (direction == TradeDirection::LONG) ? "Long" : "Short";
  }

  bool operator==(const SeasonalPattern& lhs, const SeasonalPattern& rhs)
  {
    return ((lhs.getAsset() == rhs.getAsset()) &&
	    (lhs.getDirection() == rhs.getDirection()) &&
	    (lhs.getStartIn() == rhs.getStartIn()) &&
	    (lhs.getPhaseLength() == rhs.getPhaseLength()) &&
	    (lhs.getNumYears() == rhs.getNumYears()) &&
	    (lhs.getWinRate() == rhs.getWinRate()) &&
	    (lhs.getAverageReturn() == rhs.getAverageReturn()) &&
	    (lhs.getSharpeAnnualized() == rhs.getSharpeAnnualized()) &&
	    (lhs.getCycleWinRate() == rhs.getCycleWinRate()) &&
	    (lhs.isCycleSupported() == rhs.isCycleSupported()) &&
	    (lhs.getLongestStreak() == rhs.getLongestStreak()));
  }

  bool operator!=(const SeasonalPattern& lhs, const SeasonalPattern& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const SeasonalPattern& pattern)
  {
    os << pattern.getAsset() << " " << directionToString(pattern.getDirection())
       << " start_in=" << pattern.getStartIn()
       << " length=" << pattern.getPhaseLength()
       << " n_years=" << pattern.getNumYears()
       << " winrate=" << pattern.getWinRate()
       << " avg_return=" << pattern.getAverageReturn()
       << " sharpe=" << pattern.getSharpeAnnualized()
       << " longest=" << pattern.getLongestStreak();
    return os;
  }
}
