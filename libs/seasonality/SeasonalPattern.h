// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONAL_PATTERN_H
#define __SEASONAL_PATTERN_H 1

#include <ostream>
#include <string>

namespace mkc_seasonality
{
  enum class TradeDirection
  {
    LONG,
    SHORT
  };

  /**
   * @brief Returns "Long" or "Short", the spelling used in reports.
   */
  std::string directionToString(TradeDirection direction);

  /**
   * @brief A calendar anchored window with a historically consistent direction.
   *
   * Produced by PatternScanner, possibly collapsed by PatternMerger and filtered by
   * PatternRanker. Values are stored unrounded; rounding is a reporting concern.
   */
  class SeasonalPattern
  {
  public:
    /**
     * @param asset Symbol the pattern was found on.
     * @param direction Winning direction for the window.
     * @param startIn Days from the reference date until the window opens (0 = today).
     * @param phaseLength Window length in calendar days.
     * @param numYears Number of distinct years that produced a sample.
     * @param winRate Fraction of years in which the direction was profitable.
     * @param averageReturn Mean direction return over the sampled years.
     * @param sharpeAnnualized Annualized risk-adjusted return, in [-10, 10].
     * @param cycleWinRate Win rate of the cycle, currently equal to winRate.
     * @param cycleSupported Coarse significance flag.
     * @param longestStreak Longest run of consecutive winning years.
     */
    SeasonalPattern(const std::string& asset,
		    TradeDirection direction,
		    unsigned int startIn,
		    unsigned int phaseLength,
		    unsigned int numYears,
		    double winRate,
		    double averageReturn,
		    double sharpeAnnualized,
		    double cycleWinRate,
		    bool cycleSupported,
		    unsigned int longestStreak)
      : mAsset(asset),
	mDirection(direction),
	mStartIn(startIn),
	mPhaseLength(phaseLength),
	mNumYears(numYears),
	mWinRate(winRate),
	mAverageReturn(averageReturn),
	mSharpeAnnualized(sharpeAnnualized),
	mCycleWinRate(cycleWinRate),
	mCycleSupported(cycleSupported),
	mLongestStreak(longestStreak)
    {}

    SeasonalPattern(const SeasonalPattern&) = default;
    SeasonalPattern& operator=(const SeasonalPattern&) = default;
    ~SeasonalPattern() = default;

    const std::string& getAsset() const
    {
      return mAsset;
    }

    TradeDirection getDirection() const
    {
      return mDirection;
    }

    bool isLong() const
    {
      return mDirection == TradeDirection::LONG;
    }

    unsigned int getStartIn() const
    {
      return mStartIn;
    }

    unsigned int getPhaseLength() const
    {
      return mPhaseLength;
    }

    unsigned int getNumYears() const
    {
      return mNumYears;
    }

    double getWinRate() const
    {
      return mWinRate;
    }

    double getAverageReturn() const
    {
      return mAverageReturn;
    }

    double getSharpeAnnualized() const
    {
      return mSharpeAnnualized;
    }

    double getCycleWinRate() const
    {
      return mCycleWinRate;
    }

    bool isCycleSupported() const
    {
      return mCycleSupported;
    }

    unsigned int getLongestStreak() const
    {
      return mLongestStreak;
    }

  private:
    std::string mAsset;
    TradeDirection mDirection;
    unsigned int mStartIn;
    unsigned int mPhaseLength;
    unsigned int mNumYears;
    double mWinRate;
    double mAverageReturn;
    double mSharpeAnnualized;
    double mCycleWinRate;
    bool mCycleSupported;
    unsigned int mLongestStreak;
  };

  bool operator==(const SeasonalPattern& lhs, const SeasonalPattern& rhs);
  bool operator!=(const SeasonalPattern& lhs, const SeasonalPattern& rhs);
  std::ostream& operator<<(std::ostream& os, const SeasonalPattern& pattern);
}

#endif
