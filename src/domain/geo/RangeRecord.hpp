#pragma once

#include <cstdint>
#include <string>

namespace nostr::relaygeo::domain::geo
{

// Coordinates are kept as the dataset wrote them.
struct Location
{
  std::string latitude;
  std::string longitude;

  friend bool operator==(const Location&, const Location&) = default;
};

// Inclusive [start, end] range of network-order IPv4 addresses.
struct RangeRecord
{
  uint32_t start{0};
  uint32_t end{0};
  Location location;
};

}  // namespace nostr::relaygeo::domain::geo
