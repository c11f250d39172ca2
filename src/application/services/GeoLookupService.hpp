#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/services/ResolutionPipeline.hpp"
#include "domain/geo/IntervalIndex.hpp"

namespace nostr::relaygeo::application::services
{

struct RunReport
{
  std::vector<ResolutionOutcome> outcomes;  // aligned with the input endpoints
  std::size_t total{0};
  std::size_t located{0};
  std::array<std::size_t, 6> by_status{};

  std::size_t count(OutcomeStatus s) const { return by_status[static_cast<std::size_t>(s)]; }
};

class GeoLookupService
{
 public:
  GeoLookupService(ResolutionPipeline& pipeline, ports::ILogger& log) : pipeline_(pipeline), log_(log) {}

  RunReport run(const std::vector<std::string>& endpoints, const domain::geo::IntervalIndex& index);

  // "Successfully resolved <located>/<total> relays."
  static std::string summary_line(const RunReport& r);

 private:
  ResolutionPipeline& pipeline_;
  ports::ILogger& log_;
};

}  // namespace nostr::relaygeo::application::services
