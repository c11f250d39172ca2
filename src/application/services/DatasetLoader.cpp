#include "application/services/DatasetLoader.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <charconv>
#include <fstream>
#include <istream>
#include <sstream>
#include <vector>

using nostr::relaygeo::application::ports::DatasetError;
using nostr::relaygeo::application::ports::LogLevel;
using nostr::relaygeo::domain::geo::IntervalIndex;
using nostr::relaygeo::domain::geo::RangeRecord;
namespace fs = boost::filesystem;

namespace nostr::relaygeo::application::services
{

namespace
{
std::string_view trim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

// Splits one CSV line. Quoted fields may hold commas and "" escapes.
std::vector<std::string> split_fields(std::string_view line)
{
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i)
  {
    const char c = line[i];
    if (quoted)
    {
      if (c == '"')
      {
        if (i + 1 < line.size() && line[i + 1] == '"')
        {
          cur += '"';
          ++i;
        }
        else
        {
          quoted = false;
        }
      }
      else
      {
        cur += c;
      }
    }
    else if (c == '"')
    {
      quoted = true;
    }
    else if (c == ',')
    {
      out.push_back(std::move(cur));
      cur.clear();
    }
    else
    {
      cur += c;
    }
  }
  out.push_back(std::move(cur));
  return out;
}

std::optional<uint32_t> parse_u32(std::string_view s)
{
  s = trim(s);
  if (s.empty()) return std::nullopt;

  uint32_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}
}  // namespace

const char* to_string(RowDecision d)
{
  switch (d)
  {
    case RowDecision::accept:           return "accept";
    case RowDecision::blank:            return "blank";
    case RowDecision::comment:          return "comment";
    case RowDecision::too_few_columns:  return "too_few_columns";
    case RowDecision::bad_range:        return "bad_range";
    case RowDecision::missing_location: return "missing_location";
  }
  return "unknown";
}

// -------------------------------------------------------------------------------------------------
// parse_row(line)
//  - Validates field by field and reports why a row is unusable.
//  - Never throws for malformed data; a bad row only costs coverage.
// -------------------------------------------------------------------------------------------------
RowParse DatasetLoader::parse_row(std::string_view line)
{
  RowParse r;

  const auto body = trim(line);
  if (body.empty())
  {
    r.decision = RowDecision::blank;
    return r;
  }
  if (body.front() == '#')
  {
    r.decision = RowDecision::comment;
    return r;
  }

  auto fields = split_fields(body);
  if (fields.size() < kMinColumns)
  {
    r.decision = RowDecision::too_few_columns;
    return r;
  }

  auto start = parse_u32(fields[kColStart]);
  auto end = parse_u32(fields[kColEnd]);
  if (!start || !end)
  {
    r.decision = RowDecision::bad_range;
    return r;
  }

  if (fields[kColLatitude].empty() || fields[kColLongitude].empty())
  {
    r.decision = RowDecision::missing_location;
    return r;
  }

  r.decision = RowDecision::accept;
  r.record = RangeRecord{*start, *end,
                         {std::move(fields[kColLatitude]), std::move(fields[kColLongitude])}};
  return r;
}

void DatasetLoader::ensure_present(const std::string& path)
{
  boost::system::error_code ec;
  if (fs::exists(fs::path{path}, ec)) return;

  log_.app(LogLevel::warn, "Database not found at " + path + ". Downloading...");
  fetcher_.fetch(path);

  if (!fs::exists(fs::path{path}, ec))
    throw DatasetError("dataset fetch reported success but " + path + " is missing");

  log_.app(LogLevel::info, "Database ready.");
}

std::shared_ptr<const IntervalIndex> DatasetLoader::load(const std::string& path)
{
  ensure_present(path);

  std::ifstream in(path, std::ios::binary);
  if (!in) throw DatasetError("cannot open dataset " + path);

  log_.app(LogLevel::info, "Loading GeoIP database " + path + " into memory...");
  return load(in);
}

std::shared_ptr<const IntervalIndex> DatasetLoader::load(std::istream& in)
{
  stats_ = LoadStats{};
  std::vector<RangeRecord> records;

  std::string line;
  while (std::getline(in, line))
  {
    ++stats_.lines;
    auto row = parse_row(line);
    ++stats_.by_decision[static_cast<std::size_t>(row.decision)];
    if (row.decision == RowDecision::accept) records.push_back(std::move(*row.record));
  }
  if (in.bad()) throw DatasetError("I/O error while reading dataset");

  stats_.accepted = records.size();

  std::ostringstream oss;
  oss << "Loaded " << stats_.accepted << " IP ranges (" << stats_.lines << " lines; skipped "
      << stats_.count(RowDecision::too_few_columns) << " short, "
      << stats_.count(RowDecision::bad_range) << " bad range, "
      << stats_.count(RowDecision::missing_location) << " without location)";
  log_.app(LogLevel::info, oss.str());

  return std::make_shared<const IntervalIndex>(IntervalIndex::build(std::move(records)));
}

}  // namespace nostr::relaygeo::application::services
