#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "application/ports/IDatasetFetcher.hpp"
#include "application/services/Bootstrap.hpp"
#include "application/services/DatasetLoader.hpp"
#include "application/services/GeoLookupService.hpp"
#include "application/services/ResolutionPipeline.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/dns/Resolver_Asio.hpp"
#include "infrastructure/fetch/DatasetFetcher_Beast.hpp"
#include "infrastructure/io/CsvReport.hpp"
#include "infrastructure/io/EndpointList.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"

namespace po = boost::program_options;
namespace app_srv = nostr::relaygeo::application::services;
namespace infra = nostr::relaygeo::infrastructure;
using nostr::relaygeo::application::ports::DatasetError;
using nostr::relaygeo::application::ports::LogLevel;

namespace
{
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

void usage(std::ostream& os, const char* argv0, const po::options_description& opts)
{
  os << "Usage: " << argv0 << " <output.csv> [options]\n"
     << "Resolve relay URLs (one per line, from --input or piped stdin) to coordinates.\n\n"
     << opts << "\n";
}

int finish(infra::logging::Logger_Spdlog& log, int code)
{
  log.flush();
  spdlog::shutdown();
  return code;
}
}  // namespace

int main(int argc, char** argv)
{
  po::options_description opts("Options");
  opts.add_options()
      ("help,h", "show this help")
      ("db", po::value<std::string>(), "path to the DB-IP city CSV (overrides dataset.path)")
      ("input,i", po::value<std::string>(), "file with one relay URL per line (default: stdin)")
      ("config,c", po::value<std::string>()->default_value("relay-geo.toml"), "TOML configuration file");

  po::options_description hidden;
  hidden.add_options()("output", po::value<std::string>(), "output CSV");

  po::options_description all;
  all.add(opts).add(hidden);

  po::positional_options_description pos;
  pos.add("output", 1);

  po::variables_map vm;
  try
  {
    po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
    po::notify(vm);
  }
  catch (const po::error& e)
  {
    std::cerr << "error: " << e.what() << "\n";
    usage(std::cerr, argv[0], opts);
    return kExitUsage;
  }

  if (vm.count("help"))
  {
    usage(std::cout, argv[0], opts);
    return kExitOk;
  }
  if (!vm.count("output"))
  {
    usage(std::cerr, argv[0], opts);
    return kExitUsage;
  }

  const auto outputPath = vm["output"].as<std::string>();
  const auto configPath = vm["config"].as<std::string>();
  std::optional<std::string> dbOverride;
  if (vm.count("db")) dbOverride = vm["db"].as<std::string>();
  std::optional<std::string> inputPath;
  if (vm.count("input")) inputPath = vm["input"].as<std::string>();

  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;

  app_srv::Bootstrap boot{cfg_impl, log_impl};
  nostr::relaygeo::domain::Settings settings;
  try
  {
    settings = boot.run(configPath, dbOverride);
  }
  catch (const std::exception& e)
  {
    std::cerr << "error: startup failed: " << e.what() << "\n";
    return kExitFatal;
  }

  // Dataset: the only fatal stage
  infra::fetch::DatasetFetcher_Beast fetcher{log_impl, settings.dataset.url};
  app_srv::DatasetLoader loader{fetcher, log_impl};

  std::shared_ptr<const nostr::relaygeo::domain::geo::IntervalIndex> index;
  try
  {
    index = loader.load(settings.dataset.path);
  }
  catch (const DatasetError& e)
  {
    log_impl.app(LogLevel::critical, std::string("Error setting up database: ") + e.what());
    return finish(log_impl, kExitFatal);
  }

  const auto endpoints = infra::io::load_endpoints(inputPath, log_impl);
  if (endpoints.empty()) log_impl.app(LogLevel::warn, "No URLs provided via input file or stdin.");

  infra::dns::Resolver_Asio resolver{log_impl, settings};
  app_srv::ResolutionPipeline pipeline{resolver, log_impl, settings.resolver.maxInFlight};
  app_srv::GeoLookupService service{pipeline, log_impl};

  const auto report = service.run(endpoints, *index);
  resolver.stop();

  try
  {
    infra::io::write_report_file(outputPath, report.outcomes);
  }
  catch (const std::exception& e)
  {
    log_impl.app(LogLevel::critical, e.what());
    return finish(log_impl, kExitFatal);
  }

  log_impl.app(LogLevel::info, "Results written to " + outputPath);
  log_impl.app(LogLevel::info, app_srv::GeoLookupService::summary_line(report));
  return finish(log_impl, kExitOk);
}
