// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PRICE_SERIES_SOURCE_H
#define __SEASONALITY_PRICE_SERIES_SOURCE_H 1

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "TimeSeriesCsvReader.h"
#include "PriceSeries.h"
#include "SeasonalityException.h"

namespace mkc_seasonality
{
  namespace fs = boost::filesystem;

  /**
   * @brief Supplies the daily price history of a symbol.
   *
   * A source answers null for a symbol it has no usable data for. It never
   * throws for a single missing or unreadable symbol so one bad file cannot
   * abort a batch.
   */
  template <class Decimal>
  class PriceSeriesSource
  {
  public:
    PriceSeriesSource()
    {}

    virtual ~PriceSeriesSource()
    {}

    virtual std::shared_ptr<const PriceSeries<Decimal>> loadSeries(const std::string& symbol) = 0;

    /**
     * @brief Returns the members of a universe this source has data for, in
     * universe order.
     */
    virtual std::vector<std::string> getAvailableSymbols(const std::vector<std::string>& universe) const = 0;
  };

  //
  // class CsvPriceSeriesSource
  //
  // One file per symbol: <dataDir>/<symbol>.csv, with '=' in the symbol
  // replaced by '_' (EURUSD=X is read from EURUSD_X.csv).
  //

  template <class Decimal>
  class CsvPriceSeriesSource : public PriceSeriesSource<Decimal>
  {
  public:
    /**
     * @throws PriceSeriesSourceException if dataDirectory is not an existing directory.
     */
    explicit CsvPriceSeriesSource(const std::string& dataDirectory,
				  std::ostream* log = nullptr)
      : PriceSeriesSource<Decimal>(),
	mDataDirectory(dataDirectory),
	mLog(log)
    {
      if (!fs::exists(mDataDirectory) || !fs::is_directory(mDataDirectory))
	throw PriceSeriesSourceException("CsvPriceSeriesSource: data directory " +
					 mDataDirectory.string() + " does not exist");
    }

    ~CsvPriceSeriesSource()
    {}

    const fs::path& getDataDirectory() const
    {
      return mDataDirectory;
    }

    static std::string fileNameForSymbol(const std::string& symbol)
    {
      std::string cleanSymbol(symbol);
      std::replace(cleanSymbol.begin(), cleanSymbol.end(), '=', '_');
      return cleanSymbol + ".csv";
    }

    fs::path getFilePath(const std::string& symbol) const
    {
      return mDataDirectory / fileNameForSymbol(symbol);
    }

    bool hasDataFor(const std::string& symbol) const
    {
      fs::path filePath = getFilePath(symbol);
      return fs::exists(filePath) && fs::is_regular_file(filePath);
    }

    std::vector<std::string> getAvailableSymbols(const std::vector<std::string>& universe) const override
    {
      std::vector<std::string> available;

      std::copy_if(universe.begin(), universe.end(), std::back_inserter(available),
		   [this](const std::string& symbol)
		   {
		     return hasDataFor(symbol);
		   });

      return available;
    }

    std::shared_ptr<const PriceSeries<Decimal>> loadSeries(const std::string& symbol) override
    {
      fs::path filePath = getFilePath(symbol);

      if (!hasDataFor(symbol))
	{
	  if (mLog)
	    (*mLog) << "   [PriceSeries] Data file not found for " << symbol << ": "
		    << filePath.string() << std::endl;
	  return nullptr;
	}

      try
	{
	  DailyOhlcCsvReader<Decimal> reader(filePath.string(), mLog);
	  reader.readFile();

	  auto series = std::make_shared<const PriceSeries<Decimal>>(symbol,
								    reader.getTimeSeries(),
								    reader.getGapDates());
	  if (mLog)
	    (*mLog) << "   [PriceSeries] Loaded " << series->getNumEntries() << " rows ("
		    << series->getNumGapDates() << " gaps, "
		    << reader.getDroppedRowCount() << " dropped, "
		    << reader.getAdjustedRowCount() << " adjusted) for " << symbol << std::endl;

	  return series;
	}
      catch (const std::exception& e)
	{
	  if (mLog)
	    (*mLog) << "   [PriceSeries] Error loading data for " << symbol << ": "
		    << e.what() << std::endl;
	  return nullptr;
	}
    }

  private:
    fs::path mDataDirectory;
    std::ostream* mLog;
  };

  //
  // class InMemoryPriceSeriesSource
  //
  // Serves series that were built in memory, e.g. by a test fixture or an
  // application that already holds the prices.
  //

  template <class Decimal>
  class InMemoryPriceSeriesSource : public PriceSeriesSource<Decimal>
  {
  public:
    InMemoryPriceSeriesSource()
      : PriceSeriesSource<Decimal>(),
	mSeries(),
	mLoadCount(0)
    {}

    ~InMemoryPriceSeriesSource()
    {}

    void addSeries(std::shared_ptr<const PriceSeries<Decimal>> series)
    {
      if (!series)
	throw PriceSeriesSourceException("InMemoryPriceSeriesSource::addSeries: null series");

      mSeries[series->getSymbol()] = series;
    }

    std::shared_ptr<const PriceSeries<Decimal>> loadSeries(const std::string& symbol) override
    {
      mLoadCount++;

      auto it = mSeries.find(symbol);
      if (it == mSeries.end())
	return nullptr;

      return it->second;
    }

    std::vector<std::string> getAvailableSymbols(const std::vector<std::string>& universe) const override
    {
      std::vector<std::string> available;

      std::copy_if(universe.begin(), universe.end(), std::back_inserter(available),
		   [this](const std::string& symbol)
		   {
		     return mSeries.find(symbol) != mSeries.end();
		   });

      return available;
    }

    // Number of loadSeries calls, hits and misses alike.
    unsigned long getLoadCount() const
    {
      return mLoadCount;
    }

  private:
    std::map<std::string, std::shared_ptr<const PriceSeries<Decimal>>> mSeries;
    unsigned long mLoadCount;
  };
}

#endif
