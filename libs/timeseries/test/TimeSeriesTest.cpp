#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "TimeSeries.h"
#include "TestUtils.h"

using namespace mkc_seasonality;
using namespace boost::gregorian;

namespace
{
  std::vector<EntryType> makeEntries()
  {
    std::vector<EntryType> entries;
    entries.push_back(*createTimeSeriesEntry("20160106", "1.0760", "1.0780", "1.0720", "1.0775", "0"));
    entries.push_back(*createTimeSeriesEntry("20160104", "1.0860", "1.0940", "1.0800", "1.0830", "0"));
    entries.push_back(*createTimeSeriesEntry("20160105", "1.0830", "1.0840", "1.0730", "1.0750", "0"));
    entries.push_back(*createTimeSeriesEntry("20160108", "1.0920", "1.0950", "1.0870", "1.0930", "0"));
    entries.push_back(*createTimeSeriesEntry("20160107", "1.0780", "1.0940", "1.0770", "1.0920", "0"));
    return entries;
  }
}

TEST_CASE ("OHLCTimeSeries construction and lookup", "[TimeSeries]")
{
  std::vector<EntryType> entries = makeEntries();
  OHLCTimeSeries<DecimalType> series(TimeFrame::DAILY, entries.begin(), entries.end());

  REQUIRE (series.getTimeFrame() == TimeFrame::DAILY);
  REQUIRE (series.getNumEntries() == 5);
  REQUIRE (series.getFirstDate() == date(2016, Jan, 4));
  REQUIRE (series.getLastDate() == date(2016, Jan, 8));

  SECTION ("entries are sorted by date")
    {
      auto sorted = series.getEntriesCopy();
      for (size_t i = 1; i < sorted.size(); i++)
	REQUIRE (sorted[i - 1].getDateValue() < sorted[i].getDateValue());
    }

  SECTION ("lookup by date")
    {
      REQUIRE (series.isDateFound(date(2016, Jan, 6)));
      REQUIRE_FALSE (series.isDateFound(date(2016, Jan, 9)));
      REQUIRE (series.getTimeSeriesEntry(date(2016, Jan, 5)).getCloseValue() == createDecimal("1.0750"));
      REQUIRE_THROWS_AS (series.getTimeSeriesEntry(date(2016, Jan, 2)), TimeSeriesDataNotFoundException);
    }

  SECTION ("entries in range")
    {
      auto inRange = series.getEntriesInRange(DateRange(date(2016, Jan, 5), date(2016, Jan, 7)));
      REQUIRE (inRange.size() == 3);
      REQUIRE (inRange.front().getDateValue() == date(2016, Jan, 5));
      REQUIRE (inRange.back().getDateValue() == date(2016, Jan, 7));

      auto none = series.getEntriesInRange(DateRange(date(2017, Jan, 1), date(2017, Dec, 31)));
      REQUIRE (none.empty());
    }
}

TEST_CASE ("OHLCTimeSeries addEntry keeps order and rejects duplicates", "[TimeSeries]")
{
  OHLCTimeSeries<DecimalType> series(TimeFrame::DAILY);
  REQUIRE (series.getNumEntries() == 0);
  REQUIRE_THROWS_AS (series.getFirstDate(), TimeSeriesException);

  for (const auto& entry : makeEntries())
    series.addEntry(entry);

  REQUIRE (series.getNumEntries() == 5);
  REQUIRE (series.getFirstDate() == date(2016, Jan, 4));

  auto duplicate = createTimeSeriesEntry("20160105", "1.0", "1.0", "1.0", "1.0", "0");
  REQUIRE_THROWS_AS (series.addEntry(*duplicate), TimeSeriesException);

  auto weekly = createTimeSeriesEntry("20160111", "1.0", "1.0", "1.0", "1.0", "0", TimeFrame::WEEKLY);
  REQUIRE_THROWS_AS (series.addEntry(*weekly), TimeSeriesException);
  REQUIRE (series.getNumEntries() == 5);
}

TEST_CASE ("OHLCTimeSeries range constructor rejects bad input", "[TimeSeries]")
{
  std::vector<EntryType> entries = makeEntries();
  entries.push_back(*createTimeSeriesEntry("20160104", "1.0", "1.0", "1.0", "1.0", "0"));

  REQUIRE_THROWS_AS (OHLCTimeSeries<DecimalType>(TimeFrame::DAILY, entries.begin(), entries.end()),
		     TimeSeriesException);
  REQUIRE_THROWS_AS (OHLCTimeSeries<DecimalType>(TimeFrame::WEEKLY, entries.begin(), entries.begin() + 2),
		     TimeSeriesException);
}

TEST_CASE ("OHLCTimeSeries copy, move and equality", "[TimeSeries]")
{
  std::vector<EntryType> entries = makeEntries();
  OHLCTimeSeries<DecimalType> series(TimeFrame::DAILY, entries.begin(), entries.end());

  OHLCTimeSeries<DecimalType> copy(series);
  REQUIRE (copy == series);

  copy.addEntry(*createTimeSeriesEntry("20160111", "1.0", "1.0", "1.0", "1.0", "0"));
  REQUIRE (copy != series);

  OHLCTimeSeries<DecimalType> assigned(TimeFrame::DAILY);
  assigned = series;
  REQUIRE (assigned == series);

  OHLCTimeSeries<DecimalType> moved(std::move(assigned));
  REQUIRE (moved == series);
}

TEST_CASE ("FilterTimeSeries clamps to the available data", "[TimeSeries]")
{
  std::vector<EntryType> entries = makeEntries();
  OHLCTimeSeries<DecimalType> series(TimeFrame::DAILY, entries.begin(), entries.end());

  OHLCTimeSeries<DecimalType> inner = FilterTimeSeries(series, DateRange(date(2016, Jan, 5), date(2016, Jan, 6)));
  REQUIRE (inner.getNumEntries() == 2);
  REQUIRE (inner.getFirstDate() == date(2016, Jan, 5));

  OHLCTimeSeries<DecimalType> wide = FilterTimeSeries(series, yearRange(2000, 2025));
  REQUIRE (wide == series);

  OHLCTimeSeries<DecimalType> empty = FilterTimeSeries(series, yearRange(2017, 2018));
  REQUIRE (empty.getNumEntries() == 0);
}
