#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nostr::relaygeo::domain::geo
{

// Raised by parse_ipv4() on anything that is not a plain dotted quad.
class InvalidAddress : public std::invalid_argument
{
 public:
  explicit InvalidAddress(std::string_view text)
      : std::invalid_argument("invalid IPv4 address: '" + std::string(text) + "'")
  {
  }
};

// -----------------------------------------------------------------------------
// try_parse_ipv4(text)
//  - Accepts exactly four '.'-separated decimal octets (1..3 digits, <= 255).
//  - Result is in network order: octet 0 ends up in the most significant byte,
//    so "1.0.0.0" -> 16777216.
// -----------------------------------------------------------------------------
std::optional<uint32_t> try_parse_ipv4(std::string_view text) noexcept;

// Same as try_parse_ipv4() but throws InvalidAddress.
uint32_t parse_ipv4(std::string_view text);

// Dotted quad for a network-order value.
std::string to_string(uint32_t ip);

}  // namespace nostr::relaygeo::domain::geo
