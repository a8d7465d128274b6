// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "AnalysisConfiguration.h"

namespace mkc_seasonality
{
  AnalysisConfiguration::AnalysisConfiguration()
    : mMinPhaseLength(kDefaultMinPhaseLength),
      mMaxPhaseLength(kDefaultMaxPhaseLength),
      mMinWinRate(kDefaultMinWinRate),
      mStartYear(kDefaultStartYear),
      mEndYear(kDefaultEndYear),
      mDaysFromToday(kDefaultDaysFromToday),
      mDataDirectory("data/raw"),
      mExportDirectory("exports"),
      mAssetUniverse(getStandardForexPairs())
  {}

  const std::vector<std::string>& AnalysisConfiguration::getStandardForexPairs()
  {
    static const std::vector<std::string> forexPairs = {
      "EURUSD=X", "GBPUSD=X", "USDJPY=X", "USDCHF=X",
      "AUDUSD=X", "USDCAD=X", "NZDUSD=X", "EURGBP=X",
      "EURJPY=X", "GBPJPY=X", "AUDJPY=X", "CHFJPY=X",
      "NZDJPY=X", "CADJPY=X", "EURCHF=X", "GBPCHF=X",
      "AUDCHF=X", "NZDCHF=X", "CADCHF=X", "EURAUD=X",
      "GBPAUD=X", "AUDNZD=X", "EURNZD=X", "GBPNZD=X",
      "EURCAD=X", "GBPCAD=X", "AUDCAD=X", "NZDCAD=X"
    };

    return forexPairs;
  }

  ScanParameters AnalysisConfiguration::createScanParameters(const TimeSeriesDate& referenceDate) const
  {
    return ScanParameters(mMinPhaseLength,
			  mMaxPhaseLength,
			  mMinWinRate,
			  mStartYear,
			  mEndYear,
			  mDaysFromToday,
			  referenceDate);
  }
}
