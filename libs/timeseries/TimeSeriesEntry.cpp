// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TimeSeriesEntry.h"

namespace mkc_seasonality
{
  // Daily bars are stamped at 5:00 PM New York, the conventional FX
  // end of day. Only the date part is used by the seasonal windows.

  boost::posix_time::time_duration DefaultBarStartTime(boost::posix_time::hours(17));

  time_duration getDefaultBarTime()
  {
    return  DefaultBarStartTime;
  }
}
