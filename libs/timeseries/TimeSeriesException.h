// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_TIMESERIES_EXCEPTION_H
#define __SEASONALITY_TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_seasonality
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  class TimeSeriesDataAccessException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesDataAccessException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  class TimeSeriesDataNotFoundException : public TimeSeriesDataAccessException
  {
  public:
      explicit TimeSeriesDataNotFoundException(const std::string& msg)
        : TimeSeriesDataAccessException(msg) {}
  };

  // Raised while reading a price file: bad header, unparsable date,
  // duplicate date. Carries the offending file line in the message.
  class TimeSeriesFormatException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesFormatException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

} // namespace mkc_seasonality

#endif // __SEASONALITY_TIMESERIES_EXCEPTION_H
