// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_DIRECTION_EVALUATOR_H
#define __SEASONALITY_DIRECTION_EVALUATOR_H 1

#include <algorithm>
#include <cmath>
#include <vector>
#include "SampleStatistics.h"
#include "SeasonalPattern.h"
#include "WindowSampler.h"

namespace mkc_seasonality
{
  /**
   * @brief Performance of one direction over the yearly samples of a window.
   */
  class DirectionStats
  {
  public:
    DirectionStats(double winRate,
		   double meanReturn,
		   double sharpeAnnualized,
		   unsigned int longestStreak)
      : mWinRate(winRate),
	mMeanReturn(meanReturn),
	mSharpeAnnualized(sharpeAnnualized),
	mLongestStreak(longestStreak)
    {}

    double getWinRate() const
    {
      return mWinRate;
    }

    double getMeanReturn() const
    {
      return mMeanReturn;
    }

    double getSharpeAnnualized() const
    {
      return mSharpeAnnualized;
    }

    unsigned int getLongestStreak() const
    {
      return mLongestStreak;
    }

  private:
    double mWinRate;
    double mMeanReturn;
    double mSharpeAnnualized;
    unsigned int mLongestStreak;
  };

  class DirectionEvaluation
  {
  public:
    DirectionEvaluation(const DirectionStats& longStats,
			const DirectionStats& shortStats,
			TradeDirection winner)
      : mLongStats(longStats),
	mShortStats(shortStats),
	mWinner(winner)
    {}

    const DirectionStats& getLongStats() const
    {
      return mLongStats;
    }

    const DirectionStats& getShortStats() const
    {
      return mShortStats;
    }

    TradeDirection getWinner() const
    {
      return mWinner;
    }

    const DirectionStats& getWinningStats() const
    {
      return (mWinner == TradeDirection::LONG) ? mLongStats : mShortStats;
    }

  private:
    DirectionStats mLongStats;
    DirectionStats mShortStats;
    TradeDirection mWinner;
  };

  /**
   * @brief Scores the yearly samples of a window as a long and as a short trade
   * and selects the better direction.
   *
   * Long trades earn the raw return, short trades its negation. A return of
   * exactly zero is a win for neither.
   */
  class DirectionEvaluator
  {
  public:
    // Trading days per year used to annualize the per window ratio.
    static constexpr double kTradingDaysPerYear = 252.0;
    static constexpr double kMaxAbsoluteSharpe = 10.0;
    static constexpr double kMinStdDev = 1e-10;

    /**
     * @brief Computes the statistics of one direction's returns.
     * @param directionReturns Returns already signed for the direction, in
     * ascending year order.
     * @param phaseLength Window length in days, used to annualize.
     */
    static DirectionStats computeStats(const std::vector<double>& directionReturns,
				       unsigned int phaseLength)
    {
      double winRate = SampleStatistics::computeWinRate(directionReturns);
      double mean = SampleStatistics::computeMean(directionReturns);
      double stdDev = SampleStatistics::computeStdDev(directionReturns, mean);

      double sharpe = 0.0;
      if (stdDev > kMinStdDev && phaseLength > 0)
	{
	  sharpe = (mean / stdDev) * std::sqrt(kTradingDaysPerYear / static_cast<double>(phaseLength));
	  sharpe = std::max(-kMaxAbsoluteSharpe, std::min(kMaxAbsoluteSharpe, sharpe));
	}

      return DirectionStats(winRate, mean, sharpe,
			    SampleStatistics::computeLongestWinningStreak(directionReturns));
    }

    /**
     * @brief Higher win rate wins; on equal win rates the higher mean return
     * wins; full equality goes to LONG.
     */
    static TradeDirection selectWinner(const DirectionStats& longStats,
				       const DirectionStats& shortStats)
    {
      if (longStats.getWinRate() > shortStats.getWinRate())
	return TradeDirection::LONG;

      if (shortStats.getWinRate() > longStats.getWinRate())
	return TradeDirection::SHORT;

      return (longStats.getMeanReturn() >= shortStats.getMeanReturn()) ?
	TradeDirection::LONG : TradeDirection::SHORT;
    }

    /**
     * @brief Evaluates both directions over a set of yearly samples.
     *
     * The samples are put in year order first so the streak is a true
     * chronological run whatever order they were collected in.
     */
    static DirectionEvaluation evaluate(std::vector<WindowSample> samples,
					unsigned int phaseLength)
    {
      std::stable_sort(samples.begin(), samples.end(),
		       [](const WindowSample& a, const WindowSample& b)
		       {
			 return a.getYear() < b.getYear();
		       });

      std::vector<double> longReturns;
      std::vector<double> shortReturns;
      longReturns.reserve(samples.size());
      shortReturns.reserve(samples.size());

      for (const auto& sample : samples)
	{
	  longReturns.push_back(sample.getRawReturn());
	  shortReturns.push_back(-sample.getRawReturn());
	}

      DirectionStats longStats = computeStats(longReturns, phaseLength);
      DirectionStats shortStats = computeStats(shortReturns, phaseLength);

      return DirectionEvaluation(longStats, shortStats, selectWinner(longStats, shortStats));
    }
  };
}

#endif
