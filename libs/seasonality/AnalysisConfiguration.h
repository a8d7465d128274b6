// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_ANALYSIS_CONFIGURATION_H
#define __SEASONALITY_ANALYSIS_CONFIGURATION_H 1

#include <string>
#include <vector>
#include "BoostDateHelper.h"
#include "ScanParameters.h"

namespace mkc_seasonality
{
  /**
   * @brief Settings of a seasonal scan run: thresholds, analysis period,
   * directories and the asset universe.
   *
   * A default constructed configuration holds the standard settings. Values
   * are validated when they are turned into ScanParameters.
   */
  class AnalysisConfiguration
  {
  public:
    static constexpr int kDefaultMinPhaseLength = 7;
    static constexpr int kDefaultMaxPhaseLength = 30;
    static constexpr double kDefaultMinWinRate = 0.75;
    static constexpr int kDefaultStartYear = 2000;
    static constexpr int kDefaultEndYear = 2025;
    static constexpr int kDefaultDaysFromToday = 10;

    AnalysisConfiguration();

    AnalysisConfiguration(const AnalysisConfiguration&) = default;
    AnalysisConfiguration& operator=(const AnalysisConfiguration&) = default;
    ~AnalysisConfiguration() = default;

    // The 28 major and cross currency pairs in Yahoo Finance notation.
    static const std::vector<std::string>& getStandardForexPairs();

    int getMinPhaseLength() const
    {
      return mMinPhaseLength;
    }

    void setMinPhaseLength(int minPhaseLength)
    {
      mMinPhaseLength = minPhaseLength;
    }

    int getMaxPhaseLength() const
    {
      return mMaxPhaseLength;
    }

    void setMaxPhaseLength(int maxPhaseLength)
    {
      mMaxPhaseLength = maxPhaseLength;
    }

    double getMinWinRate() const
    {
      return mMinWinRate;
    }

    void setMinWinRate(double minWinRate)
    {
      mMinWinRate = minWinRate;
    }

    int getStartYear() const
    {
      return mStartYear;
    }

    void setStartYear(int startYear)
    {
      mStartYear = startYear;
    }

    int getEndYear() const
    {
      return mEndYear;
    }

    void setEndYear(int endYear)
    {
      mEndYear = endYear;
    }

    int getDaysFromToday() const
    {
      return mDaysFromToday;
    }

    void setDaysFromToday(int daysFromToday)
    {
      mDaysFromToday = daysFromToday;
    }

    const std::string& getDataDirectory() const
    {
      return mDataDirectory;
    }

    void setDataDirectory(const std::string& dataDirectory)
    {
      mDataDirectory = dataDirectory;
    }

    const std::string& getExportDirectory() const
    {
      return mExportDirectory;
    }

    void setExportDirectory(const std::string& exportDirectory)
    {
      mExportDirectory = exportDirectory;
    }

    const std::vector<std::string>& getAssetUniverse() const
    {
      return mAssetUniverse;
    }

    void setAssetUniverse(const std::vector<std::string>& assetUniverse)
    {
      mAssetUniverse = assetUniverse;
    }

    /**
     * @throws ScanParametersException if the settings are out of range.
     */
    ScanParameters createScanParameters(const TimeSeriesDate& referenceDate) const;

  private:
    int mMinPhaseLength;
    int mMaxPhaseLength;
    double mMinWinRate;
    int mStartYear;
    int mEndYear;
    int mDaysFromToday;
    std::string mDataDirectory;
    std::string mExportDirectory;
    std::vector<std::string> mAssetUniverse;
  };
}

#endif
