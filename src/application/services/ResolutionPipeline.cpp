#include "application/services/ResolutionPipeline.hpp"

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

#include "domain/geo/Endpoint.hpp"
#include "domain/geo/Ipv4.hpp"

using nostr::relaygeo::application::ports::LogLevel;
using nostr::relaygeo::application::ports::ResolveError;
using nostr::relaygeo::application::ports::ResolveResult;
using nostr::relaygeo::domain::geo::IntervalIndex;

namespace nostr::relaygeo::application::services
{

namespace geo = nostr::relaygeo::domain::geo;

const char* to_string(OutcomeStatus s)
{
  switch (s)
  {
    case OutcomeStatus::located:         return "located";
    case OutcomeStatus::empty_host:      return "empty_host";
    case OutcomeStatus::resolve_failed:  return "resolve_failed";
    case OutcomeStatus::no_address:      return "no_address";
    case OutcomeStatus::invalid_address: return "invalid_address";
    case OutcomeStatus::no_match:        return "no_match";
  }
  return "unknown";
}

namespace
{
ResolutionOutcome absent(OutcomeStatus s)
{
  ResolutionOutcome o;
  o.status = s;
  return o;
}

// Shared between run() and the completion callbacks of one run.
struct RunState
{
  std::mutex m;
  std::condition_variable cv;
  std::size_t in_flight{0};
  std::size_t done{0};
  std::vector<ResolutionOutcome> outcomes;
};
}  // namespace

// -------------------------------------------------------------------------------------------------
// locate(raw, host, res, index)
//  - First resolved address wins; resolver order is taken as given.
//  - Every failure becomes an absent outcome with a reason for the diag channel.
// -------------------------------------------------------------------------------------------------
ResolutionOutcome ResolutionPipeline::locate(const std::string& raw_endpoint, const std::string& host,
                                             const ResolveResult& res, const IntervalIndex& index)
{
  if (res.error != ResolveError::none && res.error != ResolveError::not_found)
  {
    log_.diag(LogLevel::debug, "Resolution failed for " + host + " (" +
                                   ports::to_string(res.error) + "): " + res.detail);
    return absent(OutcomeStatus::resolve_failed);
  }
  if (res.addresses.empty())
  {
    log_.diag(LogLevel::debug, "No IPv4 address for " + host);
    return absent(OutcomeStatus::no_address);
  }

  const std::string& first = res.addresses.front();
  auto ip = geo::try_parse_ipv4(first);
  if (!ip)
  {
    log_.diag(LogLevel::warn, "Resolver returned malformed address '" + first + "' for " + host);
    return absent(OutcomeStatus::invalid_address);
  }

  auto loc = index.lookup(*ip);
  if (!loc)
  {
    log_.diag(LogLevel::debug, "Geolocation failed for " + host + " (" + first + ")");
    return absent(OutcomeStatus::no_match);
  }

  log_.diag(LogLevel::trace, host + " -> " + first + " -> " + loc->latitude + "," + loc->longitude);

  ResolutionOutcome o;
  o.status = OutcomeStatus::located;
  o.located = Located{raw_endpoint, std::move(loc->latitude), std::move(loc->longitude)};
  return o;
}

void ResolutionPipeline::resolve_and_locate(const std::string& raw_endpoint,
                                            const IntervalIndex& index, Completion done)
{
  std::string host = geo::normalize_endpoint(raw_endpoint);
  if (host.empty())
  {
    log_.diag(LogLevel::debug, "No hostname in endpoint '" + raw_endpoint + "'");
    done(absent(OutcomeStatus::empty_host));
    return;
  }

  resolver_.async_resolve_v4(
      host,
      [this, &index, raw = raw_endpoint, host, done = std::move(done)](ResolveResult res)
      { done(locate(raw, host, res, index)); });
}

// -------------------------------------------------------------------------------------------------
// run(endpoints, index)
//  - The calling thread dispatches; callbacks only store their slot and release a permit.
//  - Slot i always belongs to endpoint i, so completion order never leaks into the output.
// -------------------------------------------------------------------------------------------------
std::vector<ResolutionOutcome> ResolutionPipeline::run(const std::vector<std::string>& raw_endpoints,
                                                       const IntervalIndex& index)
{
  const std::size_t n = raw_endpoints.size();
  auto st = std::make_shared<RunState>();
  st->outcomes.resize(n);

  auto finish = [st](std::size_t i, ResolutionOutcome o)
  {
    std::lock_guard<std::mutex> lk(st->m);
    st->outcomes[i] = std::move(o);
    --st->in_flight;
    ++st->done;
    st->cv.notify_all();
  };

  for (std::size_t i = 0; i < n; ++i)
  {
    {
      std::unique_lock<std::mutex> lk(st->m);
      st->cv.wait(lk, [&] { return st->in_flight < max_in_flight_; });
      ++st->in_flight;
    }

    try
    {
      resolve_and_locate(raw_endpoints[i], index,
                         [finish, i](ResolutionOutcome o) { finish(i, std::move(o)); });
    }
    catch (const std::exception& e)
    {
      log_.diag(LogLevel::err, "Dispatch failed for '" + raw_endpoints[i] + "': " + e.what());
      finish(i, absent(OutcomeStatus::resolve_failed));
    }
  }

  std::unique_lock<std::mutex> lk(st->m);
  st->cv.wait(lk, [&] { return st->done == n; });
  return std::move(st->outcomes);
}

}  // namespace nostr::relaygeo::application::services
