// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_SCAN_PARAMETERS_H
#define __SEASONALITY_SCAN_PARAMETERS_H 1

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "DateRange.h"
#include "SeasonalityException.h"

namespace mkc_seasonality
{
  /**
   * @brief The search space and acceptance thresholds of one seasonal scan.
   *
   * All validation happens in the constructor so a scan never starts with
   * parameters it cannot honor.
   */
  class ScanParameters
  {
  public:
    /**
     * @param minPhaseLength Shortest window length in days, must be positive.
     * @param maxPhaseLength Longest window length in days, must be >= minPhaseLength.
     * @param minWinRate Minimum win rate of the winning direction, in [0, 1].
     * @param startYear First calendar year of the analysis period.
     * @param endYear Last calendar year of the analysis period, must be >= startYear.
     * @param daysFromToday Number of days after the reference date a pattern may start.
     * @param referenceDate The date treated as "today".
     * @throws ScanParametersException if any value is out of range.
     */
    ScanParameters(int minPhaseLength,
		   int maxPhaseLength,
		   double minWinRate,
		   int startYear,
		   int endYear,
		   int daysFromToday,
		   const TimeSeriesDate& referenceDate)
      : mMinPhaseLength(minPhaseLength),
	mMaxPhaseLength(maxPhaseLength),
	mMinWinRate(minWinRate),
	mStartYear(startYear),
	mEndYear(endYear),
	mDaysFromToday(daysFromToday),
	mReferenceDate(referenceDate)
    {
      if (minPhaseLength <= 0)
	throw ScanParametersException("ScanParameters: minimum phase length must be positive, got " +
				      std::to_string(minPhaseLength));

      if (minPhaseLength > maxPhaseLength)
	throw ScanParametersException("ScanParameters: minimum phase length " +
				      std::to_string(minPhaseLength) +
				      " is greater than maximum phase length " +
				      std::to_string(maxPhaseLength));

      if (!(minWinRate >= 0.0 && minWinRate <= 1.0))
	throw ScanParametersException("ScanParameters: minimum win rate must be between 0 and 1");

      if (startYear < kFirstSupportedYear || endYear > kLastSupportedYear)
	throw ScanParametersException("ScanParameters: analysis years must lie within " +
				      std::to_string(kFirstSupportedYear) + "-" +
				      std::to_string(kLastSupportedYear));

      if (startYear > endYear)
	throw ScanParametersException("ScanParameters: start year " + std::to_string(startYear) +
				      " is after end year " + std::to_string(endYear));

      if (daysFromToday < 0)
	throw ScanParametersException("ScanParameters: days from today must not be negative");

      if (referenceDate.is_special())
	throw ScanParametersException("ScanParameters: reference date is not a valid date");
    }

    ScanParameters(const ScanParameters&) = default;
    ScanParameters& operator=(const ScanParameters&) = default;
    ~ScanParameters() = default;

    int getMinPhaseLength() const
    {
      return mMinPhaseLength;
    }

    int getMaxPhaseLength() const
    {
      return mMaxPhaseLength;
    }

    double getMinWinRate() const
    {
      return mMinWinRate;
    }

    int getStartYear() const
    {
      return mStartYear;
    }

    int getEndYear() const
    {
      return mEndYear;
    }

    int getDaysFromToday() const
    {
      return mDaysFromToday;
    }

    const TimeSeriesDate& getReferenceDate() const
    {
      return mReferenceDate;
    }

    // January 1 of the start year through December 31 of the end year.
    DateRange getAnalysisRange() const
    {
      return yearRange(mStartYear, mEndYear);
    }

  private:
    // Range supported by boost::gregorian::date.
    static constexpr int kFirstSupportedYear = 1400;
    static constexpr int kLastSupportedYear = 9999;

    int mMinPhaseLength;
    int mMaxPhaseLength;
    double mMinWinRate;
    int mStartYear;
    int mEndYear;
    int mDaysFromToday;
    TimeSeriesDate mReferenceDate;
  };
}

#endif
