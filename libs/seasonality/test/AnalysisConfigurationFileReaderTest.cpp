#include <catch2/catch_test_macros.hpp>
#include "AnalysisConfigurationFileReader.h"
#include "TestUtils.h"

using namespace mkc_seasonality;

TEST_CASE("AnalysisConfigurationFileReader reads every setting", "[AnalysisConfigurationFileReader]")
{
  std::string path = writeTemporaryFile("seasonality.csv",
					"MinPhaseLength,MaxPhaseLength,MinWinRate,StartYear,EndYear,"
					"DaysFromToday,DataDirectory,ExportDirectory\n"
					"5,20,0.8,2005,2020,14,/data/fx,/tmp/out\n");

  AnalysisConfiguration configuration = AnalysisConfigurationFileReader(path).readConfigurationFile();

  REQUIRE(configuration.getMinPhaseLength() == 5);
  REQUIRE(configuration.getMaxPhaseLength() == 20);
  REQUIRE(configuration.getMinWinRate() == 0.8);
  REQUIRE(configuration.getStartYear() == 2005);
  REQUIRE(configuration.getEndYear() == 2020);
  REQUIRE(configuration.getDaysFromToday() == 14);
  REQUIRE(configuration.getDataDirectory() == "/data/fx");
  REQUIRE(configuration.getExportDirectory() == "/tmp/out");
}

TEST_CASE("AnalysisConfigurationFileReader keeps defaults for omitted settings", "[AnalysisConfigurationFileReader]")
{
  SECTION("missing columns")
    {
      std::string path = writeTemporaryFile("partial.csv",
					    "MinWinRate,DataDirectory\n"
					    "0.6,prices\n");

      AnalysisConfiguration configuration = AnalysisConfigurationFileReader(path).readConfigurationFile();
      REQUIRE(configuration.getMinWinRate() == 0.6);
      REQUIRE(configuration.getDataDirectory() == "prices");
      REQUIRE(configuration.getMinPhaseLength() == 7);
      REQUIRE(configuration.getExportDirectory() == "exports");
    }

  SECTION("empty values")
    {
      std::string path = writeTemporaryFile("empty.csv",
					    "MinPhaseLength,MaxPhaseLength,MinWinRate\n"
					    ",12,\n");

      AnalysisConfiguration configuration = AnalysisConfigurationFileReader(path).readConfigurationFile();
      REQUIRE(configuration.getMinPhaseLength() == 7);
      REQUIRE(configuration.getMaxPhaseLength() == 12);
      REQUIRE(configuration.getMinWinRate() == 0.75);
    }
}

TEST_CASE("AnalysisConfigurationFileReader errors", "[AnalysisConfigurationFileReader]")
{
  SECTION("missing file")
    {
      AnalysisConfigurationFileReader reader("/nonexistent/seasonality.csv");
      REQUIRE_THROWS_AS(reader.readConfigurationFile(), AnalysisConfigurationException);
    }

  SECTION("header without a settings row")
    {
      std::string path = writeTemporaryFile("header.csv", "MinPhaseLength\n");
      REQUIRE_THROWS_AS(AnalysisConfigurationFileReader(path).readConfigurationFile(),
			AnalysisConfigurationException);
    }

  SECTION("unknown column")
    {
      std::string path = writeTemporaryFile("unknown.csv", "MinPhaseLength,Colour\n7,blue\n");
      REQUIRE_THROWS_AS(AnalysisConfigurationFileReader(path).readConfigurationFile(),
			AnalysisConfigurationException);
    }

  SECTION("non numeric values")
    {
      std::string path = writeTemporaryFile("bad.csv", "MinPhaseLength,MinWinRate\n7x,0.75\n");
      REQUIRE_THROWS_AS(AnalysisConfigurationFileReader(path).readConfigurationFile(),
			AnalysisConfigurationException);

      std::string realPath = writeTemporaryFile("badreal.csv", "MinWinRate\nhigh\n");
      REQUIRE_THROWS_AS(AnalysisConfigurationFileReader(realPath).readConfigurationFile(),
			AnalysisConfigurationException);
    }

  SECTION("fractional integer settings")
    {
      std::string path = writeTemporaryFile("fraction.csv", "DaysFromToday\n7.5\n");
      REQUIRE_THROWS_AS(AnalysisConfigurationFileReader(path).readConfigurationFile(),
			AnalysisConfigurationException);
    }
}
