#include "domain/geo/Ipv4.hpp"

#include <charconv>

namespace nostr::relaygeo::domain::geo
{

namespace
{
constexpr std::size_t kOctets = 4;
constexpr std::size_t kMaxDigits = 3;

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

std::optional<uint32_t> parse_octet(std::string_view seg) noexcept
{
  if (seg.empty() || seg.size() > kMaxDigits) return std::nullopt;
  for (char c : seg)
  {
    if (!is_digit(c)) return std::nullopt;
  }

  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(seg.data(), seg.data() + seg.size(), value);
  if (ec != std::errc{} || ptr != seg.data() + seg.size()) return std::nullopt;
  if (value > 255) return std::nullopt;
  return static_cast<uint32_t>(value);
}
}  // namespace

std::optional<uint32_t> try_parse_ipv4(std::string_view text) noexcept
{
  uint32_t out = 0;
  std::size_t pos = 0;

  for (std::size_t i = 0; i < kOctets; ++i)
  {
    const std::size_t dot = text.find('.', pos);
    const bool last = (i + 1 == kOctets);

    // the last octet must not be followed by another dot
    if (last != (dot == std::string_view::npos)) return std::nullopt;

    const std::string_view seg =
        last ? text.substr(pos) : text.substr(pos, dot - pos);

    auto octet = parse_octet(seg);
    if (!octet) return std::nullopt;

    out = (out << 8) | *octet;
    pos = last ? text.size() : dot + 1;
  }
  return out;
}

uint32_t parse_ipv4(std::string_view text)
{
  if (auto v = try_parse_ipv4(text)) return *v;
  throw InvalidAddress(text);
}

std::string to_string(uint32_t ip)
{
  std::string s;
  s.reserve(15);
  for (int shift = 24; shift >= 0; shift -= 8)
  {
    s += std::to_string((ip >> shift) & 0xFFu);
    if (shift) s += '.';
  }
  return s;
}

}  // namespace nostr::relaygeo::domain::geo
