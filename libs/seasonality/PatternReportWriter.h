// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PATTERN_REPORT_WRITER_H
#define __SEASONALITY_PATTERN_REPORT_WRITER_H 1

#include <ostream>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "SeasonalPattern.h"

namespace mkc_seasonality
{
  class PatternReportWriter
  {
  public:
    /**
     * @brief Writes the ranked table as CSV.
     *
     * Columns: asset, direction, start_in, length, n_years, winrate, avg_return,
     * sharpe_annualized, cycle_winrate, cycle_supported, longest. Real values are
     * written with four decimals, booleans as True/False.
     */
    static void writeCsv(std::ostream& os, const std::vector<SeasonalPattern>& patterns);

    /**
     * @brief Writes the table to <directory>/<baseName>_<YYYYMMDD_HHMMSS>.csv,
     * creating the directory when needed.
     * @return The path of the file written.
     * @throws std::runtime_error if the file cannot be written.
     */
    static std::string exportToCsv(const std::string& directory,
				   const std::string& baseName,
				   const std::vector<SeasonalPattern>& patterns,
				   const boost::posix_time::ptime& timestamp);

    // YYYYMMDD_HHMMSS
    static std::string formatTimestamp(const boost::posix_time::ptime& timestamp);

    /**
     * @brief Writes an aligned table for the console: win rates as percentages
     * with one decimal, average return as a percentage with two decimals and the
     * sharpe with two decimals.
     */
    static void writeDisplayTable(std::ostream& os, const std::vector<SeasonalPattern>& patterns);
  };
}

#endif
