#include "infrastructure/io/EndpointList.hpp"

#include <unistd.h>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fstream>
#include <iostream>
#include <string_view>

using nostr::relaygeo::application::ports::LogLevel;
namespace fs = boost::filesystem;

namespace nostr::relaygeo::infrastructure::io
{

namespace
{
std::string_view trim(std::string_view s)
{
  constexpr std::string_view ws = " \t\r\n\v\f";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}
}  // namespace

std::vector<std::string> read_endpoints(std::istream& in)
{
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line))
  {
    auto t = trim(line);
    if (!t.empty()) out.emplace_back(t);
  }
  return out;
}

std::vector<std::string> load_endpoints(const std::optional<std::string>& input_path,
                                        application::ports::ILogger& log)
{
  if (input_path)
  {
    boost::system::error_code ec;
    if (!fs::exists(fs::path{*input_path}, ec))
    {
      log.app(LogLevel::err, "Input file not found: " + *input_path);
      return {};
    }

    std::ifstream in(*input_path);
    if (!in)
    {
      log.app(LogLevel::err, "Cannot open input file: " + *input_path);
      return {};
    }
    return read_endpoints(in);
  }

  if (::isatty(STDIN_FILENO))
  {
    log.app(LogLevel::debug, "stdin is a terminal; not reading endpoints from it");
    return {};
  }
  return read_endpoints(std::cin);
}

}  // namespace nostr::relaygeo::infrastructure::io
