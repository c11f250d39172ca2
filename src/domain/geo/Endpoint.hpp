#pragma once

#include <string>
#include <string_view>

namespace nostr::relaygeo::domain::geo
{

// Strips a leading ws:// or wss:// (any case), then the path, then the port.
// An empty result means the endpoint cannot be resolved.
std::string normalize_endpoint(std::string_view raw);

}  // namespace nostr::relaygeo::domain::geo
