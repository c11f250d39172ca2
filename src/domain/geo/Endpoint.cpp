#include "domain/geo/Endpoint.hpp"

#include <array>
#include <cctype>

namespace nostr::relaygeo::domain::geo
{

namespace
{
constexpr std::array<std::string_view, 2> kSchemes = {"wss://", "ws://"};

bool starts_with_icase(std::string_view s, std::string_view prefix) noexcept
{
  if (s.size() < prefix.size()) return false;
  for (std::size_t i = 0; i < prefix.size(); ++i)
  {
    const auto a = std::tolower(static_cast<unsigned char>(s[i]));
    const auto b = std::tolower(static_cast<unsigned char>(prefix[i]));
    if (a != b) return false;
  }
  return true;
}
}  // namespace

std::string normalize_endpoint(std::string_view raw)
{
  std::string_view rest = raw;

  for (auto scheme : kSchemes)
  {
    if (starts_with_icase(rest, scheme))
    {
      rest.remove_prefix(scheme.size());
      break;
    }
  }

  if (auto slash = rest.find('/'); slash != std::string_view::npos) rest = rest.substr(0, slash);
  if (auto colon = rest.find(':'); colon != std::string_view::npos) rest = rest.substr(0, colon);

  return std::string(rest);
}

}  // namespace nostr::relaygeo::domain::geo
