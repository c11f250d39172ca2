#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <fstream>
#include <sstream>

#include "TestDoubles.hpp"
#include "application/services/DatasetLoader.hpp"
#include "domain/geo/Ipv4.hpp"

using namespace nostr::relaygeo::application::services;
using nostr::relaygeo::application::ports::DatasetError;
using nostr::relaygeo::application::ports::IDatasetFetcher;
using nostr::relaygeo::domain::geo::Location;
using nostr::relaygeo::domain::geo::parse_ipv4;
namespace fs = boost::filesystem;

namespace
{
fs::path tmp_dir(const std::string& name)
{
  auto dir = fs::temp_directory_path() / ("relay-geo-loader-" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

// Writes a canned dataset where the real fetcher would download one.
struct WritingFetcher : IDatasetFetcher
{
  std::string content;
  int calls{0};
  void fetch(const std::string& dest) override
  {
    ++calls;
    std::ofstream(dest) << content;
  }
};

const char* kTokyo = "16777216,16777471,AS,JP,Tokyo,,Tokyo,35.6895,139.6917,Asia/Tokyo\n";
}  // namespace

TEST(DatasetLoader, RowDecisions)
{
  EXPECT_EQ(DatasetLoader::parse_row("").decision, RowDecision::blank);
  EXPECT_EQ(DatasetLoader::parse_row("   \r").decision, RowDecision::blank);
  EXPECT_EQ(DatasetLoader::parse_row("# header").decision, RowDecision::comment);
  EXPECT_EQ(DatasetLoader::parse_row("1,2,3,4,5,6,7,8").decision, RowDecision::too_few_columns);
  EXPECT_EQ(DatasetLoader::parse_row("x,2,,,,,,1.0,2.0").decision, RowDecision::bad_range);
  EXPECT_EQ(DatasetLoader::parse_row("1,,,,,,,1.0,2.0").decision, RowDecision::bad_range);
  EXPECT_EQ(DatasetLoader::parse_row("1,4294967296,,,,,,1.0,2.0").decision, RowDecision::bad_range);
  EXPECT_EQ(DatasetLoader::parse_row("-1,2,,,,,,1.0,2.0").decision, RowDecision::bad_range);
  EXPECT_EQ(DatasetLoader::parse_row("1,2,,,,,,,2.0").decision, RowDecision::missing_location);
  EXPECT_EQ(DatasetLoader::parse_row("1,2,,,,,,1.0,").decision, RowDecision::missing_location);

  auto ok = DatasetLoader::parse_row(kTokyo);
  ASSERT_EQ(ok.decision, RowDecision::accept);
  ASSERT_TRUE(ok.record.has_value());
  EXPECT_EQ(ok.record->start, 16777216u);
  EXPECT_EQ(ok.record->end, 16777471u);
  EXPECT_EQ(ok.record->location, (Location{"35.6895", "139.6917"}));
}

TEST(DatasetLoader, QuotedFieldsKeepColumnsAligned)
{
  auto r = DatasetLoader::parse_row(
      "100,200,EU,DE,\"Hesse, Region\",,\"Frankfurt \"\"am\"\" Main\",50.1109,8.6821\r");
  ASSERT_EQ(r.decision, RowDecision::accept);
  EXPECT_EQ(r.record->location, (Location{"50.1109", "8.6821"}));
}

TEST(DatasetLoader, CoordinatesAreKeptVerbatim)
{
  auto r = DatasetLoader::parse_row("1,2,,,,,,-33.8600,151.2100000");
  ASSERT_EQ(r.decision, RowDecision::accept);
  EXPECT_EQ(r.record->location.latitude, "-33.8600");
  EXPECT_EQ(r.record->location.longitude, "151.2100000");
}

TEST(DatasetLoader, LoadSkipsBadRowsAndKeepsOrder)
{
  test_doubles::NullLogger log;
  test_doubles::FailingFetcher fetcher;
  DatasetLoader loader{fetcher, log};

  std::istringstream in(std::string("# dbip\n") + kTokyo +
                        "16777472,16777727,AS,CN,,,Fuzhou,,\n"   // no location
                        "garbage\n"
                        "\n"
                        "16778240,16779263,OC,AU,Victoria,,Melbourne,-37.814,144.963\n");

  auto idx = loader.load(in);
  ASSERT_TRUE(idx);
  EXPECT_EQ(idx->size(), 2u);
  EXPECT_EQ(loader.stats().accepted, 2u);
  EXPECT_EQ(loader.stats().count(RowDecision::comment), 1u);
  EXPECT_EQ(loader.stats().count(RowDecision::missing_location), 1u);
  EXPECT_EQ(loader.stats().count(RowDecision::too_few_columns), 1u);
  EXPECT_EQ(loader.stats().count(RowDecision::blank), 1u);

  EXPECT_EQ(idx->lookup(parse_ipv4("1.0.0.5")), (Location{"35.6895", "139.6917"}));
  EXPECT_FALSE(idx->lookup(parse_ipv4("1.0.1.5")).has_value());
  EXPECT_EQ(idx->lookup(parse_ipv4("1.0.4.1")), (Location{"-37.814", "144.963"}));
  EXPECT_EQ(fetcher.calls, 0);
}

TEST(DatasetLoader, FetchesOnlyWhenMissing)
{
  auto dir = tmp_dir("fetch");
  const auto db = (dir / "db.csv").string();

  test_doubles::NullLogger log;
  WritingFetcher fetcher;
  fetcher.content = kTokyo;
  DatasetLoader loader{fetcher, log};

  auto idx = loader.load(db);
  EXPECT_EQ(fetcher.calls, 1);
  EXPECT_EQ(idx->size(), 1u);

  auto again = loader.load(db);
  EXPECT_EQ(fetcher.calls, 1);
  EXPECT_EQ(again->size(), 1u);
}

TEST(DatasetLoader, FetchFailureIsFatal)
{
  auto dir = tmp_dir("fatal");
  test_doubles::NullLogger log;
  test_doubles::FailingFetcher fetcher;
  DatasetLoader loader{fetcher, log};

  EXPECT_THROW(loader.load((dir / "absent.csv").string()), DatasetError);
  EXPECT_EQ(fetcher.calls, 1);
}

TEST(DatasetLoader, FetcherThatWritesNothingIsFatal)
{
  struct SilentFetcher : IDatasetFetcher
  {
    void fetch(const std::string&) override {}
  } fetcher;

  auto dir = tmp_dir("silent");
  test_doubles::NullLogger log;
  DatasetLoader loader{fetcher, log};
  EXPECT_THROW(loader.ensure_present((dir / "db.csv").string()), DatasetError);
}
