// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"
#include "AnalysisConfiguration.h"
#include "AnalysisConfigurationFileReader.h"
#include "PatternReportWriter.h"
#include "PriceSeriesSource.h"
#include "ScanCommandLine.h"
#include "SeasonalityEngine.h"
#include "SeasonalityException.h"

namespace po = boost::program_options;

using namespace mkc_seasonality;
using Num = num::DefaultNumber;

void printUsage(const po::options_description& desc) {
    std::cout << "Seasonal Phase Scanner - find recurring calendar windows in daily prices\n\n";
    std::cout << "Usage: seasonalscan [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Scan every configured FX pair that has a file in data/raw\n";
    std::cout << "  seasonalscan\n\n";
    std::cout << "  # Two pairs, 10-20 day phases, 80% minimum win rate\n";
    std::cout << "  seasonalscan --assets EURUSD=X,USDJPY=X --min-length 10 --max-length 20 --min-winrate 0.8\n\n";
    std::cout << "  # Reproduce a scan as of a fixed date and export the table\n";
    std::cout << "  seasonalscan --reference-date 2025-04-10 --export --export-dir exports\n";
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc = createScanCommandLineOptions();

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        bool verbose = vm.count("verbose") > 0;
        std::ostream* log = verbose ? &std::cout : &std::cerr;

        AnalysisConfiguration configuration;
        if (vm.count("config")) {
            AnalysisConfigurationFileReader reader(vm["config"].as<std::string>());
            configuration = reader.readConfigurationFile();
        }

        applyCommandLineOverrides(configuration, vm);

        boost::gregorian::date referenceDate = boost::gregorian::day_clock::local_day();
        if (vm.count("reference-date")) {
            try {
                referenceDate = boost::gregorian::from_simple_string(vm["reference-date"].as<std::string>());
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid reference date '" << vm["reference-date"].as<std::string>()
                          << "': " << e.what() << std::endl;
                return 1;
            }
        }

        ScanParameters parameters = configuration.createScanParameters(referenceDate);

        auto source = std::make_shared<CsvPriceSeriesSource<Num>>(configuration.getDataDirectory(),
                                                                  verbose ? &std::cout : nullptr);

        std::vector<std::string> symbols;
        if (vm.count("assets")) {
            symbols = splitAssetList(vm["assets"].as<std::string>());
        } else {
            symbols = source->getAvailableSymbols(configuration.getAssetUniverse());
            if (symbols.empty()) {
                std::cout << "No price files found in " << configuration.getDataDirectory()
                          << " for the configured universe." << std::endl;
            }
        }

        if (verbose) {
            std::cout << "Reference date: " << boost::gregorian::to_iso_extended_string(referenceDate) << std::endl;
            std::cout << "Phase lengths: " << parameters.getMinPhaseLength() << "-" << parameters.getMaxPhaseLength()
                      << " days, minimum win rate " << parameters.getMinWinRate()
                      << ", years " << parameters.getStartYear() << "-" << parameters.getEndYear()
                      << ", next " << parameters.getDaysFromToday() << " days" << std::endl;
        }

        SeasonalityEngine<Num> engine(source, log);
        std::vector<AssetScanResult> assetResults;

        std::vector<SeasonalPattern> patterns = engine.analyzeAssets(
            symbols, parameters,
            [](size_t completed, size_t total, const std::string& label) {
                std::cout << "[" << completed << "/" << total << "] " << label << std::endl;
            },
            &assetResults);

        if (verbose) {
            for (const auto& result : assetResults) {
                std::cout << "  " << result.getSymbol() << ": " << assetScanStatusToString(result.getStatus());
                if (!result.getMessage().empty())
                    std::cout << " (" << result.getMessage() << ")";
                std::cout << std::endl;
            }
        }

        std::cout << std::endl;
        if (patterns.empty()) {
            std::cout << "No seasonal patterns found." << std::endl;
        } else {
            std::cout << "Found " << patterns.size() << " seasonal patterns\n\n";
            PatternReportWriter::writeDisplayTable(std::cout, patterns);
        }

        if (vm.count("export")) {
            std::string exportPath = PatternReportWriter::exportToCsv(configuration.getExportDirectory(),
                                                                      "seasonal_patterns",
                                                                      patterns,
                                                                      boost::posix_time::second_clock::local_time());
            std::cout << "\nExported " << patterns.size() << " patterns to " << exportPath << std::endl;
        }

        return 0;
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\nRun 'seasonalscan --help' for usage." << std::endl;
        return 1;
    } catch (const ScanParametersException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
