// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_SCAN_COMMAND_LINE_H
#define __SEASONALITY_SCAN_COMMAND_LINE_H 1

#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "AnalysisConfiguration.h"

namespace mkc_seasonality
{
  /**
   * @brief Options accepted by the seasonalscan program.
   */
  boost::program_options::options_description createScanCommandLineOptions();

  /**
   * @brief Copies every threshold and directory given on the command line over
   * the matching setting of the configuration. Options that were not given
   * leave the configuration unchanged.
   */
  void applyCommandLineOverrides(AnalysisConfiguration& configuration,
				 const boost::program_options::variables_map& vm);

  // Comma separated symbols, trimmed, empty entries skipped.
  std::vector<std::string> splitAssetList(const std::string& assetList);
}

#endif
