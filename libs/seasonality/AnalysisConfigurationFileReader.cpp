// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem.hpp>
#include "AnalysisConfigurationFileReader.h"
#include "csv.h"

namespace mkc_seasonality
{
  static int parseIntegerSetting(const std::string& name, const std::string& value);
  static double parseRealSetting(const std::string& name, const std::string& value);

  AnalysisConfigurationFileReader::AnalysisConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  AnalysisConfiguration AnalysisConfigurationFileReader::readConfigurationFile() const
  {
    if (!boost::filesystem::exists(mConfigurationFileName))
      throw AnalysisConfigurationException("AnalysisConfigurationFileReader: configuration file " +
					   mConfigurationFileName + " does not exist");

    AnalysisConfiguration configuration;

    std::string minPhaseLength, maxPhaseLength, minWinRate;
    std::string startYear, endYear, daysFromToday;
    std::string dataDirectory, exportDirectory;

    try
      {
	io::CSVReader<8> csvConfigFile(mConfigurationFileName);
	csvConfigFile.read_header(io::ignore_missing_column,
				  "MinPhaseLength", "MaxPhaseLength", "MinWinRate",
				  "StartYear", "EndYear", "DaysFromToday",
				  "DataDirectory", "ExportDirectory");

	if (!csvConfigFile.read_row(minPhaseLength, maxPhaseLength, minWinRate,
				    startYear, endYear, daysFromToday,
				    dataDirectory, exportDirectory))
	  throw AnalysisConfigurationException("AnalysisConfigurationFileReader: " +
					       mConfigurationFileName + " has no settings row");
      }
    catch (const io::error::base& e)
      {
	throw AnalysisConfigurationException("AnalysisConfigurationFileReader: " +
					     mConfigurationFileName + ": " + e.what());
      }

    if (!minPhaseLength.empty())
      configuration.setMinPhaseLength(parseIntegerSetting("MinPhaseLength", minPhaseLength));

    if (!maxPhaseLength.empty())
      configuration.setMaxPhaseLength(parseIntegerSetting("MaxPhaseLength", maxPhaseLength));

    if (!minWinRate.empty())
      configuration.setMinWinRate(parseRealSetting("MinWinRate", minWinRate));

    if (!startYear.empty())
      configuration.setStartYear(parseIntegerSetting("StartYear", startYear));

    if (!endYear.empty())
      configuration.setEndYear(parseIntegerSetting("EndYear", endYear));

    if (!daysFromToday.empty())
      configuration.setDaysFromToday(parseIntegerSetting("DaysFromToday", daysFromToday));

    if (!dataDirectory.empty())
      configuration.setDataDirectory(dataDirectory);

    if (!exportDirectory.empty())
      configuration.setExportDirectory(exportDirectory);

    return configuration;
  }

  static AnalysisConfigurationException badSetting(const std::string& name,
						   const std::string& value,
						   const std::string& expected)
  {
    return AnalysisConfigurationException("AnalysisConfigurationFileReader: " + name +
					  " must be " + expected + ", got '" + value + "'");
  }

  static int parseIntegerSetting(const std::string& name, const std::string& value)
  {
    try
      {
	return boost::lexical_cast<int>(boost::algorithm::trim_copy(value));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw badSetting(name, value, "an integer");
      }
  }

  static double parseRealSetting(const std::string& name, const std::string& value)
  {
    try
      {
	return boost::lexical_cast<double>(boost::algorithm::trim_copy(value));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw badSetting(name, value, "a number");
      }
  }
}
