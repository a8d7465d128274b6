// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_CSVREADER_H
#define __SEASONALITY_CSVREADER_H 1

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time.hpp>
#include "TimeSeries.h"
#include "TimeSeriesException.h"
#include "DecimalConstants.h"
#include "csv.h"

namespace mkc_seasonality
{
  using boost::posix_time::ptime;

  /**
   * @brief Parses the date column of a daily price file.
   *
   * Accepts ISO dates (`2015-03-02`), ISO dates followed by a time and an
   * optional zone (`2015-03-02 00:00:00+00:00`, `2015-03-02T00:00:00Z`) and
   * undelimited dates (`20150302`). Any time or zone part is dropped.
   *
   * @throws TimeSeriesFormatException if the text is not a date in one of those forms.
   */
  inline boost::gregorian::date parseDailyDateStamp (const std::string& dateStamp)
  {
    std::string stamp = boost::algorithm::trim_copy (dateStamp);

    try
      {
	if (stamp.size() >= 10 && stamp[4] == '-' && stamp[7] == '-')
	  return boost::gregorian::from_simple_string (stamp.substr (0, 10));

	if (stamp.size() == 8 &&
	    std::all_of (stamp.begin(), stamp.end(),
			 [](unsigned char c) { return std::isdigit (c); }))
	  return boost::gregorian::from_undelimited_string (stamp);
      }
    catch (const std::exception& e)
      {
	throw TimeSeriesFormatException ("parseDailyDateStamp: invalid date '" + dateStamp +
					 "': " + e.what());
      }

    throw TimeSeriesFormatException ("parseDailyDateStamp: unrecognized date format '" +
				     dateStamp + "'");
  }

  // Empty, "null", "None" and "NaN" (any case) mean the value was not recorded.
  inline bool isMissingPriceField (const std::string& field)
  {
    std::string value = boost::algorithm::trim_copy (field);

    return value.empty() ||
      boost::algorithm::iequals (value, "null") ||
      boost::algorithm::iequals (value, "nan") ||
      boost::algorithm::iequals (value, "none");
  }

  template <class Decimal>
  class TimeSeriesCsvReader
  {
  public:
    TimeSeriesCsvReader (const std::string& fileName,
			 TimeFrame::Duration timeFrame,
			 std::ostream* log = nullptr)
      : mFileName (fileName),
	mTimeSeries (std::make_shared<OHLCTimeSeries<Decimal>> (timeFrame)),
	mGapDates(),
	mLog (log)
    {
      std::ifstream fin (mFileName);
      if (!fin.is_open())
	throw TimeSeriesException ("Cannot open file: " + mFileName);
    }

    TimeSeriesCsvReader (const TimeSeriesCsvReader& rhs) = default;
    TimeSeriesCsvReader& operator= (const TimeSeriesCsvReader& rhs) = default;

    virtual ~TimeSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeSeries->getTimeFrame();
    }

    std::shared_ptr<OHLCTimeSeries<Decimal>> getTimeSeries()
    {
      return mTimeSeries;
    }

    /**
     * @brief Dates that appeared in the file without a usable close, ascending.
     */
    const std::vector<boost::gregorian::date>& getGapDates() const
    {
      return mGapDates;
    }

    virtual void readFile() = 0;

  protected:
    void addEntry (OHLCTimeSeriesEntry<Decimal>&& entry)
    {
      if (std::binary_search (mGapDates.begin(), mGapDates.end(), entry.getDateValue()))
	throw TimeSeriesFormatException (mFileName + ": duplicate date " +
					 boost::gregorian::to_simple_string (entry.getDateValue()));

      try
	{
	  mTimeSeries->addEntry (std::move (entry));
	}
      catch (const TimeSeriesException& e)
	{
	  throw TimeSeriesFormatException (mFileName + ": " + e.what());
	}
    }

    void addGapDate (const boost::gregorian::date& gapDate)
    {
      auto it = std::lower_bound (mGapDates.begin(), mGapDates.end(), gapDate);

      if ((it != mGapDates.end() && *it == gapDate) || mTimeSeries->isDateFound (gapDate))
	throw TimeSeriesFormatException (mFileName + ": duplicate date " +
					 boost::gregorian::to_simple_string (gapDate));

      mGapDates.insert (it, gapDate);
    }

    void logLine (const std::string& line) const
    {
      if (mLog)
	(*mLog) << "   [PriceSeries] " << line << std::endl;
    }

    bool checkForErrors (boost::gregorian::date entryDate,
			 const Decimal& openPrice, const Decimal& highPrice,
			 const Decimal& lowPrice, const Decimal& closePrice) const
    {
      bool errorFound = false;
      std::string prefix = std::string ("OHLC Error: on - ") + boost::gregorian::to_simple_string (entryDate);

      if (highPrice < openPrice)
	{
	  errorFound = true;
	  logLine (prefix + " high of " + num::toString (highPrice) + " is less than open of " + num::toString (openPrice));
	}

      if (highPrice < lowPrice)
	{
	  errorFound = true;
	  logLine (prefix + " high of " + num::toString (highPrice) + " is less than low of " + num::toString (lowPrice));
	}

      if (highPrice < closePrice)
	{
	  errorFound = true;
	  logLine (prefix + " high of " + num::toString (highPrice) + " is less than close of " + num::toString (closePrice));
	}

      if (lowPrice > openPrice)
	{
	  errorFound = true;
	  logLine (prefix + " low of " + num::toString (lowPrice) + " is greater than open of " + num::toString (openPrice));
	}

      if (lowPrice > closePrice)
	{
	  errorFound = true;
	  logLine (prefix + " low of " + num::toString (lowPrice) + " is greater than close of " + num::toString (closePrice));
	}

      return errorFound;
    }

  private:
    std::string mFileName;
    std::shared_ptr<OHLCTimeSeries<Decimal>> mTimeSeries;
    std::vector<boost::gregorian::date> mGapDates;
    std::ostream* mLog;
  };

  //
  // class DailyOhlcCsvReader
  //
  // Reads end of day files with a header row:
  //
  //   Date,Open,High,Low,Close[,Volume]
  //
  // Columns may appear in any order and extra columns are ignored. A row
  // whose close is missing is recorded as a gap date. A row with a close
  // but a missing open/high/low is dropped and logged. A row whose high or
  // low does not bracket the open and close is logged and its high and low
  // are widened so the close is kept.
  //

  template <class Decimal>
  class DailyOhlcCsvReader : public TimeSeriesCsvReader<Decimal>
  {
  public:
    using CsvFile = io::CSVReader<6,
				  io::trim_chars<' ', '\t'>,
				  io::double_quote_escape<',', '"'>>;

    DailyOhlcCsvReader (const std::string& fileName,
			std::ostream* log = nullptr)
      : TimeSeriesCsvReader<Decimal> (fileName, TimeFrame::DAILY, log),
	mCsvFile (std::make_unique<CsvFile> (fileName))
    {}

    ~DailyOhlcCsvReader()
    {}

    unsigned long getDroppedRowCount() const
    {
      return mDroppedRows;
    }

    unsigned long getAdjustedRowCount() const
    {
      return mAdjustedRows;
    }

    void readFile()
    {
      mCsvFile->read_header (io::ignore_missing_column | io::ignore_extra_column,
			     "Date", "Open", "High", "Low", "Close", "Volume");

      for (const char* required : {"Date", "Open", "High", "Low", "Close"})
	{
	  if (!mCsvFile->has_column (required))
	    throw TimeSeriesFormatException (this->getFileName() +
					     ": missing required column " + required);
	}

      bool hasVolume = mCsvFile->has_column ("Volume");

      std::string dateStamp;
      std::string openString, highString, lowString, closeString, volString;

      while (mCsvFile->read_row (dateStamp, openString, highString, lowString,
				 closeString, volString))
	{
	  boost::gregorian::date entryDate = parseDailyDateStamp (dateStamp);

	  if (isMissingPriceField (closeString))
	    {
	      this->addGapDate (entryDate);
	      continue;
	    }

	  if (isMissingPriceField (openString) || isMissingPriceField (highString) ||
	      isMissingPriceField (lowString))
	    {
	      this->logLine ("Dropping row " + boost::gregorian::to_simple_string (entryDate) +
			     ": missing open/high/low");
	      mDroppedRows++;
	      continue;
	    }

	  Decimal openPrice = num::fromString<Decimal> (openString);
	  Decimal highPrice = num::fromString<Decimal> (highString);
	  Decimal lowPrice = num::fromString<Decimal> (lowString);
	  Decimal closePrice = num::fromString<Decimal> (closeString);
	  Decimal volume = DecimalConstants<Decimal>::DecimalZero;

	  if (hasVolume && !isMissingPriceField (volString))
	    volume = num::fromString<Decimal> (volString);

	  if (this->checkForErrors (entryDate, openPrice, highPrice, lowPrice, closePrice))
	    {
	      highPrice = std::max ({highPrice, lowPrice, openPrice, closePrice});
	      lowPrice = std::min ({lowPrice, openPrice, closePrice});
	      mAdjustedRows++;
	    }

	  this->addEntry (OHLCTimeSeriesEntry<Decimal> (entryDate, openPrice,
							highPrice, lowPrice,
							closePrice, volume,
							this->getTimeFrame()));
	}
    }

  private:
    std::unique_ptr<CsvFile> mCsvFile;
    unsigned long mDroppedRows = 0;
    unsigned long mAdjustedRows = 0;
  };
}

#endif
