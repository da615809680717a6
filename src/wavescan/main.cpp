#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include "ElliottWaveException.h"
#include "OutputUtils.h"
#include "ParallelExecutors.h"
#include "PriceSeriesCsvReader.h"
#include "StreamWaveSearchObserver.h"
#include "WavePatternSearchEngine.h"
#include "WavePatternSerializer.h"
#include "WaveSearchConfiguration.h"
#include "WaveSearchConfigurationFileReader.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace utils = wavescan::utils;

using namespace mkc_elliott;

void printUsage(const po::options_description& desc)
{
  std::cout << "wavescan - Elliott Wave candidate scanner\n\n";
  std::cout << "Usage: wavescan --data <prices.csv> [options]\n\n";
  std::cout << desc << std::endl;

  std::cout << "\nExamples:\n";
  std::cout << "  # Search the default archetypes from the lowest low of the series\n";
  std::cout << "  wavescan --data SPY.csv\n\n";
  std::cout << "  # Classic impulse rules over a wider skip range with 8 threads\n";
  std::cout << "  wavescan --data SPY.csv --archetype Impulse --skip-to 8 --threads 8\n\n";
  std::cout << "  # Zig-zag pivots, rejected candidates, JSON export for the chart renderer\n";
  std::cout << "  wavescan --data SPY.csv --zigzag --threshold 0.04 --show-rejected --json SPY.json\n\n";
  std::cout << "  # Run parameters from a configuration file, tee the log to a file\n";
  std::cout << "  wavescan --data SPY.csv --config search.csv --log-file wavescan.log\n";
}

// File options first, explicit command line flags override them
WaveSearchConfiguration buildConfiguration(const po::variables_map& vm)
{
  WaveSearchConfiguration base;
  if (vm.count("config"))
    {
      WaveSearchConfigurationFileReader reader(vm["config"].as<std::string>());
      base = *reader.readConfigurationFile();
    }

  std::vector<WaveArchetype> archetypes = base.getArchetypes();
  if (vm.count("archetype"))
    {
      archetypes.clear();
      for (const auto& list : vm["archetype"].as<std::vector<std::string>>())
	{
	  const auto parsed = parseArchetypeList(list);
	  archetypes.insert(archetypes.end(), parsed.begin(), parsed.end());
	}
    }

  return WaveSearchConfiguration(vm.count("skip-from") ? vm["skip-from"].as<unsigned int>() : base.getSkipFrom(),
				 vm.count("skip-to") ? vm["skip-to"].as<unsigned int>() : base.getSkipTo(),
				 vm.count("xy-ratio") ? vm["xy-ratio"].as<double>() : base.getXYRatio(),
				 vm.count("threshold") ? vm["threshold"].as<double>() : base.getZigZagThreshold(),
				 archetypes,
				 vm.count("zigzag") ? true : base.useZigZag(),
				 vm.count("no-corrections") ? false : base.searchCorrections(),
				 vm.count("show-rejected") ? true : base.collectRejections(),
				 vm.count("timeout-ms") ? vm["timeout-ms"].as<unsigned long>() : base.getMaxSearchMillis());
}

template <class Executor>
WaveSearchResult runSearch(const PriceSeries& series,
			   const WaveSearchConfiguration& config,
			   std::shared_ptr<Executor> executor,
			   std::shared_ptr<IWaveSearchObserver> observer,
			   const po::variables_map& vm)
{
  WavePatternSearchEngine<Executor> engine(series, config, executor, observer);

  if (vm.count("start-index"))
    return engine.run(vm["start-index"].as<std::size_t>());

  return engine.run();
}

int main(int argc, char** argv)
{
  try
    {
      po::options_description desc("Options");
      desc.add_options()
	("help,h", "Show this help message")
	("data,d", po::value<std::string>(), "OHLC price file (CSV with Date,Open,High,Low,Close header)")
	("symbol", po::value<std::string>(), "Symbol reported for the series (default: file name stem)")
	("config,c", po::value<std::string>(), "Search configuration CSV file")
	("archetype,a", po::value<std::vector<std::string>>()->composing(),
	 "Archetype to search, repeatable or ';' separated (Impulse, Correction, TDWave, LeadingDiagonal, "
	 "Impulse1WaveLongest, Impulse3WaveLongest, Impulse5WaveLongest, ExpandingDiagonal, ContractingDiagonal)")
	("skip-from", po::value<unsigned int>(), "Lowest skip count per wave")
	("skip-to", po::value<unsigned int>(), "Highest skip count per wave")
	("xy-ratio", po::value<double>(), "Time to price weighting of the diagonal length")
	("zigzag", "Chain impulses over zig-zag pivots instead of bar extrema")
	("threshold", po::value<double>(), "Zig-zag reversal threshold as a fraction, in (0, 1)")
	("no-corrections", "Search corrections from the start bar instead of after each accepted impulse")
	("show-rejected", "Collect and report rejected candidates with their violation")
	("start-index", po::value<std::size_t>(), "Bar to start the search from (default: lowest low)")
	("threads,t", po::value<std::size_t>()->default_value(1), "Worker threads, 0 for one per core")
	("timeout-ms", po::value<unsigned long>(), "Stop the search after this many milliseconds")
	("json", po::value<std::string>()->implicit_value(""), "Export results as JSON (optional file name)")
	("log-file", po::value<std::string>(), "Also write all output to this file");

      po::variables_map vm;
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);

      if (vm.count("help") || !vm.count("data"))
	{
	  printUsage(desc);
	  return vm.count("help") ? 0 : 1;
	}

      std::ofstream logFile;
      std::unique_ptr<utils::TeeStream> tee;
      if (vm.count("log-file"))
	{
	  logFile.open(vm["log-file"].as<std::string>());
	  if (!logFile.is_open())
	    {
	      std::cerr << "Error: cannot open log file " << vm["log-file"].as<std::string>() << std::endl;
	      return 1;
	    }
	  tee = std::make_unique<utils::TeeStream>(std::cout, logFile);
	}
      std::ostream& out = tee ? static_cast<std::ostream&>(*tee) : std::cout;

      const std::string dataFile = vm["data"].as<std::string>();
      const std::string symbol = vm.count("symbol") ? vm["symbol"].as<std::string>()
						    : fs::path(dataFile).stem().string();

      const WaveSearchConfiguration config = buildConfiguration(vm);

      PriceSeriesCsvReader reader(dataFile, symbol);
      reader.readFile();
      const PriceSeries& series = reader.getPriceSeries();

      if (series.empty())
	{
	  std::cerr << "Error: " << dataFile << " contains no bars" << std::endl;
	  return 1;
	}

      out << "Loaded " << series.size() << " bars of " << series.getSymbol() << " from " << dataFile << std::endl;

      auto observer = std::make_shared<StreamWaveSearchObserver>(out, config.collectRejections());

      const std::size_t threads = vm["threads"].as<std::size_t>();
      const WaveSearchResult result =
	(threads == 1)
	? runSearch(series, config, std::make_shared<concurrency::SingleThreadExecutor>(), observer, vm)
	: runSearch(series, config, std::make_shared<concurrency::ThreadPoolExecutor<>>(threads), observer, vm);

      utils::writeSearchReport(out, series, config, result);

      if (vm.count("json"))
	{
	  std::string jsonFile = vm["json"].as<std::string>();
	  if (jsonFile.empty())
	    jsonFile = utils::createWavePatternsFileName(series.getSymbol());

	  WavePatternSerializer::saveToFile(result, series, jsonFile);
	  out << std::endl << "Wrote " << result.getNumAccepted() << " accepted pattern(s) to " << jsonFile << std::endl;
	}

      out.flush();
    }
  catch (const po::error& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      std::cerr << "Run wavescan --help for usage" << std::endl;
      return 1;
    }
  catch (const ElliottWaveException& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Unexpected error: " << e.what() << std::endl;
      return 1;
    }

  return 0;
}
