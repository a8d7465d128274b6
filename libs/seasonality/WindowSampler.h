// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_WINDOW_SAMPLER_H
#define __SEASONALITY_WINDOW_SAMPLER_H 1

#include <cmath>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "DateRange.h"
#include "PriceSeries.h"
#include "number.h"

namespace mkc_seasonality
{
  /**
   * @brief One year's realized raw return over a seasonal window.
   */
  class WindowSample
  {
  public:
    WindowSample(int year, double rawReturn)
      : mYear(year),
	mRawReturn(rawReturn)
    {}

    int getYear() const
    {
      return mYear;
    }

    double getRawReturn() const
    {
      return mRawReturn;
    }

  private:
    int mYear;
    double mRawReturn;
  };

  enum class WindowSampleOutcome
  {
    SAMPLE,
    NO_SAMPLE,
    ERROR
  };

  /**
   * @brief Tagged result of sampling one (start day, phase length, year).
   *
   * NO_SAMPLE is a deliberate skip (too few rows, day does not exist in the
   * year, outlier). ERROR means the calendar arithmetic itself failed.
   */
  class WindowSampleResult
  {
  public:
    static WindowSampleResult makeSample(int year, double rawReturn)
    {
      return WindowSampleResult(WindowSampleOutcome::SAMPLE, year, rawReturn, std::string());
    }

    static WindowSampleResult makeNoSample(int year, const std::string& reason)
    {
      return WindowSampleResult(WindowSampleOutcome::NO_SAMPLE, year, 0.0, reason);
    }

    static WindowSampleResult makeError(int year, const std::string& message)
    {
      return WindowSampleResult(WindowSampleOutcome::ERROR, year, 0.0, message);
    }

    WindowSampleOutcome getOutcome() const
    {
      return mOutcome;
    }

    bool isSample() const
    {
      return mOutcome == WindowSampleOutcome::SAMPLE;
    }

    bool isNoSample() const
    {
      return mOutcome == WindowSampleOutcome::NO_SAMPLE;
    }

    bool isError() const
    {
      return mOutcome == WindowSampleOutcome::ERROR;
    }

    int getYear() const
    {
      return mYear;
    }

    /**
     * @throws std::logic_error if the outcome is not SAMPLE.
     */
    WindowSample getSample() const
    {
      if (!isSample())
	throw std::logic_error("WindowSampleResult::getSample: no sample for year " +
			       std::to_string(mYear) + ": " + mDetail);

      return WindowSample(mYear, mRawReturn);
    }

    // Reason for a skip or the error message. Empty for a sample.
    const std::string& getDetail() const
    {
      return mDetail;
    }

  private:
    WindowSampleResult(WindowSampleOutcome outcome,
		       int year,
		       double rawReturn,
		       const std::string& detail)
      : mOutcome(outcome),
	mYear(year),
	mRawReturn(rawReturn),
	mDetail(detail)
    {}

  private:
    WindowSampleOutcome mOutcome;
    int mYear;
    double mRawReturn;
    std::string mDetail;
  };

  /**
   * @brief Extracts the realized return of a calendar window from each year of a
   * price series.
   *
   * For start day d and phase length L the window of year y runs from
   * January 1 + (d - 1) days through that date + (L - 1) days. Only rows of year y
   * are considered, so a window that runs past December 31 is cut at the year end.
   * The return is measured between the first and last rows inside the window,
   * which is why the window does not have to contain exactly L rows.
   */
  template <class Decimal>
  class WindowSampler
  {
  public:
    // Years with fewer rows than this are partial years and are not sampled.
    static constexpr unsigned long kMinRowsPerYear = 50;

    // Returns larger than this in magnitude are treated as data errors
    // (unadjusted splits and the like).
    static constexpr double kMaxAbsoluteReturn = 1.0;

    explicit WindowSampler(const PriceSeries<Decimal>& series,
			   std::ostream* log = nullptr)
      : mSeries(series),
	mLog(log)
    {}

    /**
     * @brief Rows a window of the given length needs to produce a sample:
     * max(3, ceil(0.6 * phaseLength)).
     */
    static unsigned int minimumRowsForWindow(unsigned int phaseLength)
    {
      unsigned int sixtyPercent = (3 * phaseLength + 4) / 5;
      return (sixtyPercent > 3) ? sixtyPercent : 3;
    }

    /**
     * @brief The calendar window for a start day and phase length in one year.
     * @throws CalendarException if the start day does not exist in the year or
     * the window cannot be represented.
     */
    static DateRange computeWindow(int year, unsigned short startDay, unsigned int phaseLength)
    {
      TimeSeriesDate windowStart = dateFromDayOfYear(year, startDay);

      try
	{
	  TimeSeriesDate windowEnd = windowStart + date_duration(phaseLength - 1);
	  return DateRange(windowStart, windowEnd);
	}
      catch (const std::out_of_range& e)
	{
	  throw CalendarException(std::string("computeWindow: ") + e.what());
	}
    }

    /**
     * @brief Samples the window in a single year.
     */
    WindowSampleResult sampleYear(int year, unsigned short startDay, unsigned int phaseLength) const
    {
      if (phaseLength == 0)
	return WindowSampleResult::makeNoSample(year, "zero phase length");

      if (mSeries.getYearRowCount(year) < kMinRowsPerYear)
	return WindowSampleResult::makeNoSample(year, "fewer than " + std::to_string(kMinRowsPerYear) +
						" rows in year");

      if (!isValidDayOfYear(year, startDay))
	return WindowSampleResult::makeNoSample(year, "day " + std::to_string(startDay) +
						" does not exist in year");

      try
	{
	  DateRange window = computeWindow(year, startDay, phaseLength);
	  auto rows = mSeries.getYearEntriesInRange(year, window);

	  auto numRows = static_cast<unsigned int>(std::distance(rows.first, rows.second));
	  if (numRows < minimumRowsForWindow(phaseLength))
	    return WindowSampleResult::makeNoSample(year, "only " + std::to_string(numRows) +
						    " rows in window");

	  double startClose = num::to_double(rows.first->getCloseValue());
	  double endClose = num::to_double(std::prev(rows.second)->getCloseValue());

	  if (startClose <= 0.0 || endClose <= 0.0)
	    return WindowSampleResult::makeNoSample(year, "non positive close in window");

	  double rawReturn = (endClose - startClose) / startClose;

	  if (std::fabs(rawReturn) > kMaxAbsoluteReturn)
	    {
	      if (mLog)
		(*mLog) << "   [Seasonality] Extreme return filtered out: " << rawReturn
			<< " for " << mSeries.getSymbol() << " in " << year << std::endl;

	      return WindowSampleResult::makeNoSample(year, "extreme return filtered out");
	    }

	  return WindowSampleResult::makeSample(year, rawReturn);
	}
      catch (const CalendarException& e)
	{
	  return WindowSampleResult::makeError(year, e.what());
	}
      catch (const std::out_of_range& e)
	{
	  return WindowSampleResult::makeError(year, e.what());
	}
    }

    /**
     * @brief Samples the window in every year of the series, ascending by year.
     */
    std::vector<WindowSampleResult> sampleAllYears(unsigned short startDay, unsigned int phaseLength) const
    {
      std::vector<WindowSampleResult> results;

      for (int year : mSeries.getYears())
	results.push_back(sampleYear(year, startDay, phaseLength));

      return results;
    }

  private:
    const PriceSeries<Decimal>& mSeries;
    std::ostream* mLog;
  };
}

#endif
