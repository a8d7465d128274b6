// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_TIME_FRAME_H
#define __SEASONALITY_TIME_FRAME_H 1

#include <stdexcept>
#include <string>

namespace mkc_seasonality
{
  //
  // class TimeFrameException
  //

  class TimeFrameException : public std::domain_error
  {
  public:
    TimeFrameException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~TimeFrameException()
    {}

  };

  // Seasonal windows are defined on calendar days, so only end of day
  // bars are meaningful. WEEKLY is kept so a caller handing over
  // resampled data gets a clear rejection instead of silent nonsense.
  class TimeFrame
  {
  public:
    enum Duration {DAILY, WEEKLY} ;
  };

  inline std::string timeFrameToString(TimeFrame::Duration timeFrame)
  {
    switch (timeFrame)
      {
      case TimeFrame::DAILY:
	return "DAILY";
      case TimeFrame::WEEKLY:
	return "WEEKLY";
      }

    throw TimeFrameException("timeFrameToString: unknown time frame");
  }
}

#endif
