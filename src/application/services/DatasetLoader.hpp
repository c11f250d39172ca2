#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "application/ports/IDatasetFetcher.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/geo/IntervalIndex.hpp"
#include "domain/geo/RangeRecord.hpp"

namespace nostr::relaygeo::application::services
{

// Why a dataset row was (or was not) taken into the index.
enum class RowDecision
{
  accept,
  blank,
  comment,
  too_few_columns,
  bad_range,
  missing_location
};

const char* to_string(RowDecision d);

struct RowParse
{
  RowDecision decision{RowDecision::blank};
  std::optional<domain::geo::RangeRecord> record;  // set only on accept
};

struct LoadStats
{
  std::size_t lines{0};
  std::size_t accepted{0};
  std::array<std::size_t, 6> by_decision{};

  std::size_t count(RowDecision d) const { return by_decision[static_cast<std::size_t>(d)]; }
};

class DatasetLoader
{
 public:
  // dbip-city-ipv4-num: start,end,country,state1,state2,city,postcode,lat,lon[,tz]
  static constexpr std::size_t kMinColumns = 9;
  static constexpr std::size_t kColStart = 0;
  static constexpr std::size_t kColEnd = 1;
  static constexpr std::size_t kColLatitude = 7;
  static constexpr std::size_t kColLongitude = 8;

  DatasetLoader(ports::IDatasetFetcher& fetcher, ports::ILogger& log) : fetcher_(fetcher), log_(log) {}

  // Fetches the dataset when `path` does not exist. Throws DatasetError.
  void ensure_present(const std::string& path);

  // ensure_present() + parse. Throws DatasetError when the file cannot be read.
  std::shared_ptr<const domain::geo::IntervalIndex> load(const std::string& path);

  // Parses an already open stream; rows keep their stream order.
  std::shared_ptr<const domain::geo::IntervalIndex> load(std::istream& in);

  static RowParse parse_row(std::string_view line);

  const LoadStats& stats() const { return stats_; }

 private:
  ports::IDatasetFetcher& fetcher_;
  ports::ILogger& log_;
  LoadStats stats_{};
};

}  // namespace nostr::relaygeo::application::services
