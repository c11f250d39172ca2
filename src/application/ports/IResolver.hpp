#pragma once

#include <functional>
#include <string>
#include <vector>

namespace nostr::relaygeo::application::ports
{

enum class ResolveError
{
  none,
  not_found,  // resolver answered, but with no IPv4 record
  timeout,
  failure     // any other resolver/network error
};

struct ResolveResult
{
  ResolveError error{ResolveError::none};
  std::string detail;                   // human readable reason when error != none
  std::vector<std::string> addresses;  // dotted quads, in resolver order

  bool ok() const { return error == ResolveError::none && !addresses.empty(); }
};

inline const char* to_string(ResolveError e)
{
  switch (e)
  {
    case ResolveError::none:      return "none";
    case ResolveError::not_found: return "not_found";
    case ResolveError::timeout:   return "timeout";
    case ResolveError::failure:   return "failure";
  }
  return "unknown";
}

struct IResolver
{
  using Callback = std::function<void(ResolveResult)>;

  virtual ~IResolver() = default;

  // IPv4 only. cb runs exactly once, possibly on another thread.
  virtual void async_resolve_v4(const std::string& host, Callback cb) = 0;
};

}  // namespace nostr::relaygeo::application::ports
