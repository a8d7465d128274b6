// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/filesystem.hpp>
#include "PatternReportWriter.h"

namespace mkc_seasonality
{
  static std::string fixed(double value, int decimals)
  {
    std::ostringstream os;
    os << std::fixed << std::setprecision(decimals) << value;
    return os.str();
  }

  void PatternReportWriter::writeCsv(std::ostream& os, const std::vector<SeasonalPattern>& patterns)
  {
    os << "asset,direction,start_in,length,n_years,winrate,avg_return,"
       << "sharpe_annualized,cycle_winrate,cycle_supported,longest\n";

    for (const auto& pattern : patterns)
      {
	os << pattern.getAsset() << ","
	   << directionToString(pattern.getDirection()) << ","
	   << pattern.getStartIn() << ","
	   << pattern.getPhaseLength() << ","
	   << pattern.getNumYears() << ","
	   << fixed(pattern.getWinRate(), 4) << ","
	   << fixed(pattern.getAverageReturn(), 4) << ","
	   << fixed(pattern.getSharpeAnnualized(), 4) << ","
	   << fixed(pattern.getCycleWinRate(), 4) << ","
	   << (pattern.isCycleSupported() ? "True" : "False") << ","
	   << pattern.getLongestStreak() << "\n";
      }
  }

  std::string PatternReportWriter::formatTimestamp(const boost::posix_time::ptime& timestamp)
  {
    boost::gregorian::date d = timestamp.date();
    boost::posix_time::time_duration t = timestamp.time_of_day();

    std::ostringstream os;
    os << std::setfill('0')
       << std::setw(4) << static_cast<int>(d.year())
       << std::setw(2) << static_cast<int>(d.month())
       << std::setw(2) << static_cast<int>(d.day())
       << "_"
       << std::setw(2) << t.hours()
       << std::setw(2) << t.minutes()
       << std::setw(2) << t.seconds();
    return os.str();
  }

  std::string PatternReportWriter::exportToCsv(const std::string& directory,
					       const std::string& baseName,
					       const std::vector<SeasonalPattern>& patterns,
					       const boost::posix_time::ptime& timestamp)
  {
    boost::filesystem::path exportDirectory(directory);
    boost::filesystem::create_directories(exportDirectory);

    boost::filesystem::path exportFile = exportDirectory /
      (baseName + "_" + formatTimestamp(timestamp) + ".csv");

    std::ofstream csvFile(exportFile.string());
    if (!csvFile.is_open())
      throw std::runtime_error("PatternReportWriter::exportToCsv: cannot open " + exportFile.string());

    writeCsv(csvFile, patterns);
    csvFile.close();

    if (csvFile.fail())
      throw std::runtime_error("PatternReportWriter::exportToCsv: error writing " + exportFile.string());

    return exportFile.string();
  }

  void PatternReportWriter::writeDisplayTable(std::ostream& os, const std::vector<SeasonalPattern>& patterns)
  {
    os << std::left
       << std::setw(12) << "Asset"
       << std::setw(8) << "Dir"
       << std::right
       << std::setw(9) << "Start In"
       << std::setw(8) << "Length"
       << std::setw(8) << "Years"
       << std::setw(10) << "Win Rate"
       << std::setw(11) << "Avg Ret"
       << std::setw(9) << "Sharpe"
       << std::setw(11) << "Cycle Win"
       << std::setw(8) << "Cycle"
       << std::setw(9) << "Longest"
       << "\n";

    os << std::string(103, '-') << "\n";

    for (const auto& pattern : patterns)
      {
	os << std::left
	   << std::setw(12) << pattern.getAsset()
	   << std::setw(8) << directionToString(pattern.getDirection())
	   << std::right
	   << std::setw(9) << pattern.getStartIn()
	   << std::setw(8) << pattern.getPhaseLength()
	   << std::setw(8) << pattern.getNumYears()
	   << std::setw(10) << (fixed(pattern.getWinRate() * 100.0, 1) + "%")
	   << std::setw(11) << (fixed(pattern.getAverageReturn() * 100.0, 2) + "%")
	   << std::setw(9) << fixed(pattern.getSharpeAnnualized(), 2)
	   << std::setw(11) << (fixed(pattern.getCycleWinRate() * 100.0, 1) + "%")
	   << std::setw(8) << (pattern.isCycleSupported() ? "yes" : "no")
	   << std::setw(9) << pattern.getLongestStreak()
	   << "\n";
      }
  }
}
