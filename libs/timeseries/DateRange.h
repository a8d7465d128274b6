// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_DATE_RANGE_H
#define __SEASONALITY_DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TimeSeriesEntry.h"

namespace mkc_seasonality
{
  using boost::posix_time::ptime;

  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  // Inclusive range of bar timestamps.
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : DateRange(ptime(firstDate, getDefaultBarTime()),
		  ptime(lastDate, getDefaultBarTime()))
    {}

    DateRange(const ptime& firstDate, const ptime& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    boost::gregorian::date getFirstDate() const
    {
      return mFirstDate.date();
    }

    const ptime& getFirstDateTime() const
    {
      return mFirstDate;
    }

    boost::gregorian::date getLastDate() const
    {
      return mLastDate.date();
    }

    const ptime& getLastDateTime() const
    {
      return mLastDate;
    }

    bool contains(const boost::gregorian::date& d) const
    {
      return (d >= getFirstDate()) && (d <= getLastDate());
    }

    long lengthInDays() const
    {
      return (getLastDate() - getFirstDate()).days() + 1;
    }

  private:
    ptime mFirstDate;
    ptime mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDateTime() == rhs.getFirstDateTime()) &&
	      (lhs.getLastDateTime() == rhs.getLastDateTime()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }

  inline DateRange yearRange(int firstYear, int lastYear)
  {
    return DateRange(firstDayOfYear(firstYear), lastDayOfYear(lastYear));
  }
}

#endif
