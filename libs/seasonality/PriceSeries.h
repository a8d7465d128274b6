// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PRICE_SERIES_H
#define __SEASONALITY_PRICE_SERIES_H 1

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimeSeries.h"
#include "TimeSeriesException.h"
#include "BoostDateHelper.h"
#include "DateRange.h"

namespace mkc_seasonality
{
  /**
   * @brief The daily price history of one symbol together with its gap dates.
   *
   * A gap date is a row that was present in the source but had no close. Gap dates
   * count toward the row totals used by the data quality gates and never take part
   * in window sampling.
   *
   * The series is immutable once constructed. On construction the entries are
   * indexed by calendar year so the window sampler can address one year's rows
   * without scanning the whole history.
   *
   * @tparam Decimal The numeric type used for prices.
   */
  template <class Decimal>
  class PriceSeries
  {
  public:
    using Entry = OHLCTimeSeriesEntry<Decimal>;
    using ConstIterator = typename std::vector<Entry>::const_iterator;
    using ConstIteratorRange = std::pair<ConstIterator, ConstIterator>;

    /**
     * @param symbol The asset symbol, e.g. "EURUSD=X".
     * @param series The complete rows. Must not be null.
     * @param gapDates Dates whose close was missing. Order does not matter.
     * @throws TimeSeriesException if the series is null or a gap date also has a
     * complete row.
     */
    PriceSeries(const std::string& symbol,
		std::shared_ptr<const OHLCTimeSeries<Decimal>> series,
		std::vector<TimeSeriesDate> gapDates = std::vector<TimeSeriesDate>())
      : mSymbol(symbol),
	mTimeSeries(series),
	mEntries(),
	mGapDates(std::move(gapDates)),
	mYearBounds(),
	mGapsByYear()
    {
      if (!mTimeSeries)
	throw TimeSeriesException("PriceSeries: null time series for " + symbol);

      std::sort(mGapDates.begin(), mGapDates.end());
      mGapDates.erase(std::unique(mGapDates.begin(), mGapDates.end()), mGapDates.end());

      mEntries = mTimeSeries->getEntriesCopy();

      for (const auto& gapDate : mGapDates)
	{
	  if (mTimeSeries->isDateFound(gapDate))
	    throw TimeSeriesException("PriceSeries: " + symbol + " has both a row and a gap on " +
				      boost::gregorian::to_simple_string(gapDate));

	  mGapsByYear[gapDate.year()]++;
	}

      indexYears();
    }

    PriceSeries(const PriceSeries&) = default;
    PriceSeries& operator=(const PriceSeries&) = default;
    ~PriceSeries() = default;

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const OHLCTimeSeries<Decimal>& getTimeSeries() const
    {
      return *mTimeSeries;
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeSeries->getTimeFrame();
    }

    const std::vector<TimeSeriesDate>& getGapDates() const
    {
      return mGapDates;
    }

    // Rows with a close.
    unsigned long getNumEntries() const
    {
      return static_cast<unsigned long>(mEntries.size());
    }

    unsigned long getNumGapDates() const
    {
      return static_cast<unsigned long>(mGapDates.size());
    }

    // Rows with a close plus gap dates.
    unsigned long getTotalRowCount() const
    {
      return getNumEntries() + getNumGapDates();
    }

    /**
     * @brief Fraction of all rows whose close is missing. 0 for an empty series.
     */
    double getMissingCloseFraction() const
    {
      unsigned long total = getTotalRowCount();
      if (total == 0)
	return 0.0;

      return static_cast<double>(getNumGapDates()) / static_cast<double>(total);
    }

    /**
     * @brief Calendar years with at least one row (complete or gap), ascending.
     */
    std::vector<int> getYears() const
    {
      std::vector<int> years;

      for (const auto& yearBound : mYearBounds)
	years.push_back(yearBound.first);

      for (const auto& gapCount : mGapsByYear)
	{
	  if (mYearBounds.find(gapCount.first) == mYearBounds.end())
	    years.push_back(gapCount.first);
	}

      std::sort(years.begin(), years.end());
      return years;
    }

    /**
     * @brief Number of rows, complete or gap, dated in a calendar year.
     */
    unsigned long getYearRowCount(int year) const
    {
      unsigned long count = 0;

      auto it = mYearBounds.find(year);
      if (it != mYearBounds.end())
	count += static_cast<unsigned long>(it->second.second - it->second.first);

      auto gapIt = mGapsByYear.find(year);
      if (gapIt != mGapsByYear.end())
	count += gapIt->second;

      return count;
    }

    /**
     * @brief The complete rows of one calendar year, in date order.
     *
     * Returns an empty range for a year without rows.
     */
    ConstIteratorRange getYearEntries(int year) const
    {
      auto it = mYearBounds.find(year);
      if (it == mYearBounds.end())
	return ConstIteratorRange(mEntries.end(), mEntries.end());

      return ConstIteratorRange(mEntries.begin() + it->second.first,
				mEntries.begin() + it->second.second);
    }

    /**
     * @brief The complete rows of one calendar year that fall inside a date range.
     *
     * Rows of other years are never returned, even when the range extends into them.
     */
    ConstIteratorRange getYearEntriesInRange(int year, const DateRange& range) const
    {
      ConstIteratorRange yearEntries = getYearEntries(year);

      auto first = std::lower_bound(yearEntries.first, yearEntries.second, range.getFirstDate(),
				    [](const Entry& e, const TimeSeriesDate& d)
				    {
				      return e.getDateValue() < d;
				    });

      auto last = std::upper_bound(first, yearEntries.second, range.getLastDate(),
				   [](const TimeSeriesDate& d, const Entry& e)
				   {
				     return d < e.getDateValue();
				   });

      return ConstIteratorRange(first, last);
    }

    /**
     * @brief Restricts the series to an inclusive range of calendar years.
     *
     * A range wider than the available history keeps everything.
     */
    PriceSeries<Decimal> filterByYears(int firstYear, int lastYear) const
    {
      DateRange range = yearRange(firstYear, lastYear);

      auto filtered = std::make_shared<OHLCTimeSeries<Decimal>>(FilterTimeSeries(*mTimeSeries, range));

      std::vector<TimeSeriesDate> filteredGaps;
      std::copy_if(mGapDates.begin(), mGapDates.end(), std::back_inserter(filteredGaps),
		   [&range](const TimeSeriesDate& d)
		   {
		     return range.contains(d);
		   });

      return PriceSeries<Decimal>(mSymbol, filtered, filteredGaps);
    }

  private:
    void indexYears()
    {
      size_t yearStart = 0;

      for (size_t i = 1; i <= mEntries.size(); i++)
	{
	  if (i == mEntries.size() ||
	      mEntries[i].getDateValue().year() != mEntries[yearStart].getDateValue().year())
	    {
	      mYearBounds[mEntries[yearStart].getDateValue().year()] = std::make_pair(yearStart, i);
	      yearStart = i;
	    }
	}
    }

  private:
    std::string mSymbol;
    std::shared_ptr<const OHLCTimeSeries<Decimal>> mTimeSeries;
    std::vector<Entry> mEntries;
    std::vector<TimeSeriesDate> mGapDates;
    std::map<int, std::pair<size_t, size_t>> mYearBounds;
    std::map<int, unsigned long> mGapsByYear;
  };
}

#endif
