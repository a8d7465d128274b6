// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
#ifndef __SEASONALITY_BOOST_DATE_HELPER_H
#define __SEASONALITY_BOOST_DATE_HELPER_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace mkc_seasonality
{
  typedef boost::gregorian::date TimeSeriesDate;
  using boost::gregorian::date_duration;

  //
  // class CalendarException
  //
  // Raised for calendar arithmetic that has no answer, e.g. day 366 of a
  // non leap year or a year outside the range boost::gregorian supports.
  //

  class CalendarException : public std::domain_error
  {
  public:
    CalendarException(const std::string& msg)
      : std::domain_error(msg)
    {}

    ~CalendarException()
    {}
  };

  // Divisible by 4 and not by 100, unless also divisible by 400.
  inline bool isLeapYear (int year)
  {
    return ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
  }

  inline unsigned short daysInYear (int year)
  {
    return isLeapYear (year) ? 366 : 365;
  }

  inline unsigned short dayOfYear (const TimeSeriesDate& aDate)
  {
    return aDate.day_of_year();
  }

  inline bool isValidDayOfYear (int year, unsigned short day)
  {
    return (day >= 1) && (day <= daysInYear (year));
  }

  /**
   * @brief Converts a 1 based day of year to a calendar date.
   * @throws CalendarException if the day does not exist in the year or the
   * year cannot be represented.
   */
  inline TimeSeriesDate dateFromDayOfYear (int year, unsigned short day)
  {
    if (!isValidDayOfYear (year, day))
      throw CalendarException ("dateFromDayOfYear: day " + std::to_string (day) +
			       " does not exist in year " + std::to_string (year));

    try
      {
	TimeSeriesDate firstOfYear (year, boost::gregorian::Jan, 1);
	return firstOfYear + date_duration (day - 1);
      }
    catch (const std::out_of_range& e)
      {
	throw CalendarException (std::string ("dateFromDayOfYear: ") + e.what());
      }
  }

  /**
   * @brief Number of days from a reference date until the next occurrence
   * of a day of year.
   *
   * A day earlier in the year than the reference is taken to fall in the
   * following year; the wrap uses the length of the reference date's year.
   */
  inline unsigned int daysFromReferenceDate (unsigned short day,
					     const TimeSeriesDate& referenceDate)
  {
    unsigned short referenceDay = dayOfYear (referenceDate);

    if (day >= referenceDay)
      return day - referenceDay;

    return (daysInYear (referenceDate.year()) - referenceDay) + day;
  }

  inline TimeSeriesDate firstDayOfYear (int year)
  {
    return TimeSeriesDate (year, boost::gregorian::Jan, 1);
  }

  inline TimeSeriesDate lastDayOfYear (int year)
  {
    return TimeSeriesDate (year, boost::gregorian::Dec, 31);
  }
}

#endif
