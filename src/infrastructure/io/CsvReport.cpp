#include "infrastructure/io/CsvReport.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fstream>
#include <ostream>
#include <stdexcept>

using nostr::relaygeo::application::services::ResolutionOutcome;
namespace fs = boost::filesystem;

namespace nostr::relaygeo::infrastructure::io
{

std::string csv_escape(std::string_view field)
{
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(field);

  std::string out;
  out.reserve(field.size() + 2);
  out += '"';
  for (char c : field)
  {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::size_t write_report(std::ostream& out, const std::vector<ResolutionOutcome>& outcomes)
{
  out << kCsvHeader << '\n';

  std::size_t rows = 0;
  for (const auto& o : outcomes)
  {
    if (!o.located) continue;
    out << csv_escape(o.located->endpoint) << ',' << csv_escape(o.located->latitude) << ','
        << csv_escape(o.located->longitude) << '\n';
    ++rows;
  }
  return rows;
}

std::size_t write_report_file(const std::string& path, const std::vector<ResolutionOutcome>& outcomes)
{
  const fs::path p{path};
  if (p.has_parent_path())
  {
    boost::system::error_code ec;
    fs::create_directories(p.parent_path(), ec);
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out) throw std::runtime_error("cannot open output file " + path);

  const auto rows = write_report(out, outcomes);
  out.flush();
  if (!out) throw std::runtime_error("write failed for " + path);
  return rows;
}

}  // namespace nostr::relaygeo::infrastructure::io
