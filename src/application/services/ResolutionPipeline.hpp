#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IResolver.hpp"
#include "domain/geo/IntervalIndex.hpp"

namespace nostr::relaygeo::application::services
{

enum class OutcomeStatus
{
  located,
  empty_host,
  resolve_failed,
  no_address,
  invalid_address,
  no_match
};

const char* to_string(OutcomeStatus s);

struct Located
{
  std::string endpoint;  // raw input text, not the normalized host
  std::string latitude;
  std::string longitude;

  friend bool operator==(const Located&, const Located&) = default;
};

struct ResolutionOutcome
{
  OutcomeStatus status{OutcomeStatus::resolve_failed};
  std::optional<Located> located;

  bool ok() const { return located.has_value(); }
};

// -----------------------------------------------------------------------------
// ResolutionPipeline
//  - One independent resolve + locate task per endpoint.
//  - At most `max_in_flight` resolutions are outstanding at any time.
//  - run() returns outcomes positionally aligned with its input.
// -----------------------------------------------------------------------------
class ResolutionPipeline
{
 public:
  using Completion = std::function<void(ResolutionOutcome)>;

  ResolutionPipeline(ports::IResolver& resolver, ports::ILogger& log, std::size_t max_in_flight)
      : resolver_(resolver), log_(log), max_in_flight_(max_in_flight ? max_in_flight : 1)
  {
  }

  // Asynchronous single-endpoint form; done runs exactly once.
  void resolve_and_locate(const std::string& raw_endpoint, const domain::geo::IntervalIndex& index,
                          Completion done);

  // Blocks until every endpoint has an outcome.
  std::vector<ResolutionOutcome> run(const std::vector<std::string>& raw_endpoints,
                                     const domain::geo::IntervalIndex& index);

  std::size_t max_in_flight() const { return max_in_flight_; }

 private:
  ResolutionOutcome locate(const std::string& raw_endpoint, const std::string& host,
                           const ports::ResolveResult& res,
                           const domain::geo::IntervalIndex& index);

  ports::IResolver& resolver_;
  ports::ILogger& log_;
  std::size_t max_in_flight_;
};

}  // namespace nostr::relaygeo::application::services
