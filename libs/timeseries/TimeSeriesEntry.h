// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_TIMESERIES_ENTRY_H
#define __SEASONALITY_TIMESERIES_ENTRY_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BoostDateHelper.h"
#include "TimeFrame.h"
#include "number.h"

namespace mkc_seasonality
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  extern time_duration getDefaultBarTime();

  //
  // class TimeSeriesEntryException
  //

  class TimeSeriesEntryException : public std::domain_error
  {
  public:
    TimeSeriesEntryException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~TimeSeriesEntryException()
    {}

  };

  //
  // class OHLCTimeSeriesEntry
  //
  // One daily price row. The constructor rejects bars whose high/low do not
  // bracket the open and close.
  //

  template <class Decimal> class OHLCTimeSeriesEntry
  {
  public:
    OHLCTimeSeriesEntry (const ptime& entryDateTime,
			 const Decimal& open,
			 const Decimal& high,
			 const Decimal& low,
			 const Decimal& close,
			 const Decimal& volumeForEntry,
			 TimeFrame::Duration timeFrame)
        : mDateTime(entryDateTime),
	  mDate(entryDateTime.date()),
          mOpen(open),
          mHigh(high),
          mLow(low),
          mClose(close),
          mVolume(volumeForEntry),
          mTimeFrame(timeFrame)
    {
        if (high < open)
	  throwInconsistentBar ("high of " + num::toString (high) + " is less than open of " + num::toString (open));

        if (high < low)
	  throwInconsistentBar ("high of " + num::toString (high) + " is less than low of " + num::toString (low));

        if (high < close)
	  throwInconsistentBar ("high of " + num::toString (high) + " is less than close of " + num::toString (close));

        if (low > open)
	  throwInconsistentBar ("low of " + num::toString (low) + " is greater than open of " + num::toString (open));

        if (low > close)
	  throwInconsistentBar ("low of " + num::toString (low) + " is greater than close of " + num::toString (close));
    }

    OHLCTimeSeriesEntry (const boost::gregorian::date& entryDate,
			 const Decimal& open,
			 const Decimal& high,
			 const Decimal& low,
			 const Decimal& close,
			 const Decimal& volumeForEntry,
			 TimeFrame::Duration timeFrame)
      :  OHLCTimeSeriesEntry (ptime(entryDate, getDefaultBarTime()),
			      open, high, low, close,
			      volumeForEntry, timeFrame)
    {
    }

    OHLCTimeSeriesEntry (const OHLCTimeSeriesEntry<Decimal>& rhs) = default;
    OHLCTimeSeriesEntry<Decimal>& operator=(const OHLCTimeSeriesEntry<Decimal> &rhs) = default;

    ~OHLCTimeSeriesEntry()
      {}

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    const boost::gregorian::date& getDateValue() const
    {
      return mDate;
    }

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    const Decimal& getOpenValue() const
    {
      return mOpen;
    }

    const Decimal& getHighValue() const
    {
      return mHigh;
    }

    const Decimal& getLowValue() const
    {
      return mLow;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    const Decimal& getVolumeValue() const
    {
      return mVolume;
    }

  private:
    void throwInconsistentBar (const std::string& detail) const
    {
      throw TimeSeriesEntryException (std::string ("TimeSeriesEntryException: on - ") +
				      boost::posix_time::to_simple_string (mDateTime) +
				      std::string (" ") + detail);
    }

  private:
    ptime mDateTime;
    boost::gregorian::date mDate;
    Decimal mOpen;
    Decimal mHigh;
    Decimal mLow;
    Decimal mClose;
    Decimal mVolume;
    TimeFrame::Duration mTimeFrame;
  };

  template <class Decimal>
  bool operator==(const OHLCTimeSeriesEntry<Decimal>& lhs, const OHLCTimeSeriesEntry<Decimal>& rhs)
  {
    return ((lhs.getDateTime() == rhs.getDateTime()) &&
	    (lhs.getOpenValue() == rhs.getOpenValue()) &&
	    (lhs.getHighValue() == rhs.getHighValue()) &&
	    (lhs.getLowValue() == rhs.getLowValue()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getTimeFrame() == rhs.getTimeFrame()) &&
	    (lhs.getVolumeValue() == rhs.getVolumeValue()));
  }

  template <class Decimal>
  bool operator!=(const OHLCTimeSeriesEntry<Decimal>& lhs, const OHLCTimeSeriesEntry<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}


#endif
