// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_TIMESERIES_H
#define __SEASONALITY_TIMESERIES_H 1

#include <algorithm>
#include <iterator>
#include <string>
#include <type_traits>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimeSeriesEntry.h"
#include "TimeSeriesException.h"
#include "DateRange.h"

namespace mkc_seasonality
{
  using boost::posix_time::ptime;
  using boost::gregorian::date;

  /**
   * @brief Represents a time series of Open, High, Low, Close (OHLC) and Volume data.
   * @tparam Decimal The numeric type used for price and volume data.
   *
   * Maintains a single sorted vector of entries (`mData`).
   * - Insertion via `addEntry(...)` keeps the data sorted by timestamp.
   * - Rejects duplicate timestamps and entries of a different time frame.
   */
  template <class Decimal>
  class OHLCTimeSeries
  {
  public:
    using Entry = OHLCTimeSeriesEntry<Decimal>;

    /**
     * @brief Constructs an empty OHLCTimeSeries.
     * @param timeFrame The time frame duration for entries in this series.
     */
    explicit OHLCTimeSeries(TimeFrame::Duration timeFrame)
      : mData(),
	mTimeFrame(timeFrame)
    {}

    /**
     * @brief Constructs an OHLCTimeSeries from a range of entries.
     *
     * The entries are sorted by timestamp after insertion.
     *
     * @throws TimeSeriesException If any entry has a time frame different from `tf`
     * or two entries share a timestamp.
     */
    template<
    class InputIt,
    class = typename std::enable_if<
        std::is_same<typename std::iterator_traits<InputIt>::value_type,
		     OHLCTimeSeriesEntry<Decimal>>::value>::type>
    OHLCTimeSeries(TimeFrame::Duration tf,
		   InputIt first,
		   InputIt last)
      : mData(first, last),
	mTimeFrame(tf)
    {
      for (auto& e : mData)
      {
	if (e.getTimeFrame() != tf)
        {
	  throw TimeSeriesException("OHLCTimeSeries constructor: time frame mismatch for provided entries.");
        }
      }

      std::sort(mData.begin(), mData.end(),
		[](auto const &a, auto const &b)
		{
		  return a.getDateTime() < b.getDateTime();
		});

      auto dup = std::adjacent_find(mData.begin(), mData.end(),
				    [](auto const &a, auto const &b)
				    {
				      return a.getDateTime() == b.getDateTime();
				    });
      if (dup != mData.end())
	throw TimeSeriesException("OHLCTimeSeries constructor: duplicate timestamp " +
				  boost::posix_time::to_simple_string(dup->getDateTime()));
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    /**
     * @brief Number of entries in the series.
     */
    unsigned long getNumEntries() const
    {
      return static_cast<unsigned long>(mData.size());
    }

    /**
     * @brief Inserts a new OHLC entry, keeping the series sorted.
     * @throws TimeSeriesException If an entry with the same timestamp already exists,
     * or if the entry's time frame does not match the series' time frame.
     */
    void addEntry(Entry entry)
    {
      if (entry.getTimeFrame() != mTimeFrame)
      {
        throw TimeSeriesException("OHLCTimeSeries::addEntry: time frame mismatch for entry " + boost::posix_time::to_simple_string(entry.getDateTime()));
      }

      auto it = std::lower_bound(mData.begin(), mData.end(), entry,
                                 [](const Entry& a, const Entry& b)
                                 {
                                   return a.getDateTime() < b.getDateTime();
                                 });

      if (it != mData.end() && it->getDateTime() == entry.getDateTime())
      {
        throw TimeSeriesException("OHLCTimeSeries::addEntry: duplicate timestamp " + boost::posix_time::to_simple_string(entry.getDateTime()));
      }

      mData.insert(it, std::move(entry));
    }

    /**
     * @brief Retrieves the time series entry for a specific date.
     * @throws TimeSeriesDataNotFoundException if no entry exists for the specified date.
     */
    Entry getTimeSeriesEntry(const date& d) const
    {
      auto it = lowerBound(d);
      if (it == mData.end() || it->getDateValue() != d)
      {
	throw TimeSeriesDataNotFoundException("Entry not found for date: " + boost::gregorian::to_simple_string(d));
      }
      return *it;
    }

    bool isDateFound(const date& d) const
    {
      try
      {
        getTimeSeriesEntry(d);
        return true;
      }
      catch (const TimeSeriesDataNotFoundException&)
      {
        return false;
      }
    }

    const date getFirstDate() const
    {
      if (mData.empty())
	throw TimeSeriesException("OHLCTimeSeries::getFirstDate: no entries in time series");
      return mData.front().getDateValue();
    }

    const date getLastDate() const
    {
      if (mData.empty())
	throw TimeSeriesException("OHLCTimeSeries::getLastDate: no entries in time series");
      return mData.back().getDateValue();
    }

    /**
     * @brief Copies the entries whose date falls inside an inclusive date range.
     *
     * Both ends are located by binary search so the cost is proportional to the
     * size of the range, not the series.
     */
    std::vector<Entry> getEntriesInRange(const DateRange& range) const
    {
      auto first = lowerBound(range.getFirstDate());
      auto last = std::upper_bound(first, mData.end(), range.getLastDate(),
				   [](const date& d, const Entry& e)
				   {
				     return d < e.getDateValue();
				   });
      return std::vector<Entry>(first, last);
    }

    std::vector<Entry> getEntriesCopy() const
    {
      return mData;
    }

  private:
    typename std::vector<Entry>::const_iterator lowerBound(const date& d) const
    {
      return std::lower_bound(mData.begin(), mData.end(), d,
			      [](const Entry& e, const date& dval)
			      {
				return e.getDateValue() < dval;
			      });
    }

  private:
    std::vector<Entry> mData;
    TimeFrame::Duration mTimeFrame;
  };

  template <class Decimal>
  bool operator==(const OHLCTimeSeries<Decimal>& lhs,
		  const OHLCTimeSeries<Decimal>& rhs)
  {
    if (lhs.getTimeFrame() != rhs.getTimeFrame()) return false;
    if (lhs.getNumEntries() != rhs.getNumEntries()) return false;

    return lhs.getEntriesCopy() == rhs.getEntriesCopy();
  }

  template <class Decimal>
  bool operator!=(const OHLCTimeSeries<Decimal>& lhs,
		  const OHLCTimeSeries<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @brief Creates a new OHLCTimeSeries containing only the entries within a date range.
   *
   * The range may extend past either end of the series; it is clamped to the
   * available data, so filtering to an analysis period wider than the history
   * simply returns the whole series.
   */
  template <class Decimal>
  OHLCTimeSeries<Decimal> FilterTimeSeries(const OHLCTimeSeries<Decimal>& series,
					   const DateRange& dates)
  {
    auto entries = series.getEntriesInRange(dates);
    return OHLCTimeSeries<Decimal>(series.getTimeFrame(), entries.begin(), entries.end());
  }

} // namespace mkc_seasonality

#endif // __SEASONALITY_TIMESERIES_H
