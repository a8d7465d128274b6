// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include "ScanCommandLine.h"

namespace po = boost::program_options;

namespace mkc_seasonality
{
  po::options_description createScanCommandLineOptions()
  {
    po::options_description desc("Options");
    desc.add_options()
      ("help,h", "Show help message")
      ("config,c", po::value<std::string>(), "Analysis configuration file (CSV)")
      ("data-dir,d", po::value<std::string>(), "Directory holding <SYMBOL>.csv price files")
      ("assets,a", po::value<std::string>(), "Comma separated symbols (default: configured universe with data)")
      ("min-length", po::value<int>(), "Minimum phase length in days")
      ("max-length", po::value<int>(), "Maximum phase length in days")
      ("min-winrate", po::value<double>(), "Minimum win rate (0-1)")
      ("start-year", po::value<int>(), "First year of the analysis period")
      ("end-year", po::value<int>(), "Last year of the analysis period")
      ("days-from-today", po::value<int>(), "Only patterns starting within this many days")
      ("reference-date", po::value<std::string>(), "Date treated as today (YYYY-MM-DD)")
      ("export", "Export the ranked table to CSV")
      ("export-dir", po::value<std::string>(), "Directory for exported reports")
      ("verbose,v", "Verbose output");

    return desc;
  }

  void applyCommandLineOverrides(AnalysisConfiguration& configuration,
				 const po::variables_map& vm)
  {
    if (vm.count("data-dir"))
      configuration.setDataDirectory(vm["data-dir"].as<std::string>());
    if (vm.count("export-dir"))
      configuration.setExportDirectory(vm["export-dir"].as<std::string>());
    if (vm.count("min-length"))
      configuration.setMinPhaseLength(vm["min-length"].as<int>());
    if (vm.count("max-length"))
      configuration.setMaxPhaseLength(vm["max-length"].as<int>());
    if (vm.count("min-winrate"))
      configuration.setMinWinRate(vm["min-winrate"].as<double>());
    if (vm.count("start-year"))
      configuration.setStartYear(vm["start-year"].as<int>());
    if (vm.count("end-year"))
      configuration.setEndYear(vm["end-year"].as<int>());
    if (vm.count("days-from-today"))
      configuration.setDaysFromToday(vm["days-from-today"].as<int>());
  }

  std::vector<std::string> splitAssetList(const std::string& assetList)
  {
    std::vector<std::string> parts;
    std::vector<std::string> assets;

    boost::split(parts, assetList, boost::is_any_of(","));
    for (auto& part : parts)
      {
	boost::trim(part);
	if (!part.empty())
	  assets.push_back(part);
      }

    return assets;
  }
}
