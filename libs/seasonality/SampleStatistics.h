// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_SAMPLE_STATISTICS_H
#define __SEASONALITY_SAMPLE_STATISTICS_H 1

#include <cmath>
#include <numeric>
#include <vector>

namespace mkc_seasonality
{
  // Descriptive statistics over per year window returns. The sample counts
  // are small (one value per year) so the plain two pass formulas are used.
  struct SampleStatistics
  {
    /**
     * @brief Computes the arithmetic mean. Returns 0 for an empty sample.
     */
    static double computeMean(const std::vector<double>& data)
    {
      if (data.empty())
	return 0.0;

      double sum = std::accumulate(data.begin(), data.end(), 0.0);
      return sum / static_cast<double>(data.size());
    }

    /**
     * @brief Computes the (unbiased) sample variance given a precomputed mean.
     *        Returns 0 when data.size() < 2.
     */
    static double computeVariance(const std::vector<double>& data, double mean)
    {
      const size_t n = data.size();
      if (n < 2)
	return 0.0;

      double sq_sum = std::accumulate(data.begin(), data.end(), 0.0,
				      [mean](double acc, double val) {
					const double diff = (val - mean);
					return acc + diff * diff;
				      });

      // Unbiased sample variance (N-1)
      return sq_sum / static_cast<double>(n - 1);
    }

    static double computeStdDev(const std::vector<double>& data, double mean)
    {
      return std::sqrt(computeVariance(data, mean));
    }

    /**
     * @brief Fraction of values strictly greater than zero. Zero counts as a loss.
     */
    static double computeWinRate(const std::vector<double>& data)
    {
      if (data.empty())
	return 0.0;

      size_t winners = 0;
      for (double value : data)
	{
	  if (value > 0.0)
	    winners++;
	}

      return static_cast<double>(winners) / static_cast<double>(data.size());
    }

    /**
     * @brief Length of the longest run of strictly positive values, in the
     * order given.
     */
    static unsigned int computeLongestWinningStreak(const std::vector<double>& data)
    {
      unsigned int longest = 0;
      unsigned int current = 0;

      for (double value : data)
	{
	  if (value > 0.0)
	    {
	      current++;
	      if (current > longest)
		longest = current;
	    }
	  else
	    current = 0;
	}

      return longest;
    }
  };
}

#endif
