#include "application/services/GeoLookupService.hpp"

#include <sstream>

using nostr::relaygeo::application::ports::LogLevel;

namespace nostr::relaygeo::application::services
{

RunReport GeoLookupService::run(const std::vector<std::string>& endpoints,
                                const domain::geo::IntervalIndex& index)
{
  RunReport r;
  r.total = endpoints.size();

  log_.app(LogLevel::info, "Processing " + std::to_string(r.total) + " relays...");
  r.outcomes = pipeline_.run(endpoints, index);

  for (const auto& o : r.outcomes)
  {
    ++r.by_status[static_cast<std::size_t>(o.status)];
    if (!o.located) continue;

    ++r.located;
    log_.app(LogLevel::info, o.located->endpoint + ": latitude=" + o.located->latitude +
                                 ", longitude=" + o.located->longitude);
  }

  std::ostringstream oss;
  oss << "Misses: " << r.count(OutcomeStatus::empty_host) << " empty host, "
      << r.count(OutcomeStatus::resolve_failed) << " resolution failed, "
      << r.count(OutcomeStatus::no_address) << " no IPv4 address, "
      << r.count(OutcomeStatus::invalid_address) << " bad address, "
      << r.count(OutcomeStatus::no_match) << " not in dataset";
  log_.app(LogLevel::debug, oss.str());

  return r;
}

std::string GeoLookupService::summary_line(const RunReport& r)
{
  return "Successfully resolved " + std::to_string(r.located) + "/" + std::to_string(r.total) +
         " relays.";
}

}  // namespace nostr::relaygeo::application::services
