// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_ANALYSIS_CONFIGURATION_FILE_READER_H
#define __SEASONALITY_ANALYSIS_CONFIGURATION_FILE_READER_H 1

#include <string>
#include "AnalysisConfiguration.h"
#include "SeasonalityException.h"

namespace mkc_seasonality
{
  //
  // class AnalysisConfigurationFileReader
  //
  // Reads a CSV file with a header row and one row of settings:
  //
  //   MinPhaseLength,MaxPhaseLength,MinWinRate,StartYear,EndYear,DaysFromToday,DataDirectory,ExportDirectory
  //
  // Columns may be omitted or left empty; those settings keep their default.
  // Unknown columns are rejected.
  //

  class AnalysisConfigurationFileReader
  {
  public:
    explicit AnalysisConfigurationFileReader(const std::string& configurationFileName);

    /**
     * @throws AnalysisConfigurationException if the file is missing, malformed
     * or holds a value that is not a number where one is expected.
     */
    AnalysisConfiguration readConfigurationFile() const;

  private:
    std::string mConfigurationFileName;
  };
}

#endif
