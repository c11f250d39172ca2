#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace nostr::relaygeo::domain
{

struct Settings
{
  struct Dataset
  {
    std::string path{"dbip-city-ipv4-num.csv"};
    std::string url{
        "https://raw.githubusercontent.com/sapics/ip-location-db/refs/heads/main/dbip-city/"
        "dbip-city-ipv4-num.csv.gz"};
  } dataset;

  struct Resolver
  {
    int workers{8};
    std::size_t maxInFlight{64};
    int timeoutMs{5000};
  } resolver;

  // Console / Logs
  bool showConsole{true};
  bool saveLog{true};
  bool saveDiagLog{true};
  std::string logsDir{"logs"};
  std::string appLogFilename{"relay_geo_app.log"};
  std::string diagLogFilename{"relay_geo_diag.log"};
  std::string configPath{"relay-geo.toml"};
};

}  // namespace nostr::relaygeo::domain
