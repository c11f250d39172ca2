#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "TestDoubles.hpp"
#include "application/services/ResolutionPipeline.hpp"
#include "domain/geo/IntervalIndex.hpp"

using namespace nostr::relaygeo::application::services;
using nostr::relaygeo::application::ports::ResolveError;
using nostr::relaygeo::domain::geo::IntervalIndex;
using nostr::relaygeo::domain::geo::RangeRecord;
using namespace std::chrono_literals;

namespace
{
// 1.0.0.0 - 1.0.0.255 -> Tokyo, 8.8.8.0 - 8.8.8.255 -> Mountain View
IntervalIndex sample_index()
{
  return IntervalIndex::build({RangeRecord{16777216u, 16777471u, {"35.6895", "139.6917"}},
                               RangeRecord{134744064u, 134744319u, {"37.4056", "-122.0775"}}});
}

std::vector<std::string> located_urls(const std::vector<ResolutionOutcome>& outs)
{
  std::vector<std::string> v;
  for (const auto& o : outs)
    if (o.located) v.push_back(o.located->endpoint);
  return v;
}
}  // namespace

TEST(ResolutionPipeline, LocatesAddressInsideRange)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  dns.ok("inside.example", {"1.0.0.5"});
  dns.ok("outside.example", {"1.0.1.0"});

  ResolutionPipeline p{dns, log, 4};
  auto idx = sample_index();
  auto outs = p.run({"wss://inside.example", "wss://outside.example:443/x"}, idx);

  ASSERT_EQ(outs.size(), 2u);
  ASSERT_TRUE(outs[0].ok());
  EXPECT_EQ(outs[0].status, OutcomeStatus::located);
  EXPECT_EQ(*outs[0].located, (Located{"wss://inside.example", "35.6895", "139.6917"}));
  EXPECT_FALSE(outs[1].ok());
  EXPECT_EQ(outs[1].status, OutcomeStatus::no_match);
}

TEST(ResolutionPipeline, FirstAddressWins)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  dns.ok("multi.example", {"9.9.9.9", "1.0.0.1"});
  dns.ok("multi2.example", {"8.8.8.8", "1.0.0.1"});

  ResolutionPipeline p{dns, log, 2};
  auto idx = sample_index();
  auto outs = p.run({"wss://multi.example", "wss://multi2.example"}, idx);

  EXPECT_EQ(outs[0].status, OutcomeStatus::no_match);
  ASSERT_TRUE(outs[1].ok());
  EXPECT_EQ(outs[1].located->latitude, "37.4056");
}

TEST(ResolutionPipeline, EveryFailureCollapsesToAbsence)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  dns.fail("timeout.example", ResolveError::timeout);
  dns.fail("broken.example", ResolveError::failure);
  dns.ok("empty.example", {});
  dns.ok("weird.example", {"not-an-ip"});

  ResolutionPipeline p{dns, log, 8};
  auto idx = sample_index();
  auto outs = p.run({"wss://", "wss://timeout.example", "wss://broken.example", "wss://unknown.example",
                     "wss://empty.example", "wss://weird.example"},
                    idx);

  ASSERT_EQ(outs.size(), 6u);
  for (const auto& o : outs) EXPECT_FALSE(o.ok());
  EXPECT_EQ(outs[0].status, OutcomeStatus::empty_host);
  EXPECT_EQ(outs[1].status, OutcomeStatus::resolve_failed);
  EXPECT_EQ(outs[2].status, OutcomeStatus::resolve_failed);
  EXPECT_EQ(outs[3].status, OutcomeStatus::no_address);
  EXPECT_EQ(outs[4].status, OutcomeStatus::no_address);
  EXPECT_EQ(outs[5].status, OutcomeStatus::invalid_address);

  // the empty host never reaches the resolver
  EXPECT_EQ(dns.calls().size(), 5u);
}

TEST(ResolutionPipeline, OrderFollowsInputNotCompletion)
{
  auto idx = sample_index();
  const std::vector<std::string> input = {"wss://slow.example", "wss://dead.example",
                                          "wss://fast.example", "wss://medium.example"};

  std::vector<ResolutionOutcome> first;
  for (int round = 0; round < 2; ++round)
  {
    test_doubles::NullLogger log;
    test_doubles::ScriptedResolver dns;
    // delays flip between rounds so completion order differs
    dns.ok("slow.example", {"1.0.0.1"}, round == 0 ? 120ms : 5ms);
    dns.fail("dead.example", ResolveError::failure, 30ms);
    dns.ok("fast.example", {"8.8.8.8"}, round == 0 ? 0ms : 90ms);
    dns.ok("medium.example", {"1.0.0.200"}, 60ms);

    ResolutionPipeline p{dns, log, 16};
    auto outs = p.run(input, idx);

    EXPECT_EQ(located_urls(outs),
              (std::vector<std::string>{"wss://slow.example", "wss://fast.example", "wss://medium.example"}));
    if (round == 0)
    {
      first = outs;
      continue;
    }
    ASSERT_EQ(outs.size(), first.size());
    for (std::size_t i = 0; i < outs.size(); ++i)
    {
      EXPECT_EQ(outs[i].status, first[i].status) << i;
      EXPECT_EQ(outs[i].located, first[i].located) << i;
    }
  }
}

TEST(ResolutionPipeline, FailingEndpointDoesNotAffectOthers)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  dns.ok("a.example", {"1.0.0.9"});
  dns.fail("b.example", ResolveError::timeout, 50ms);
  dns.ok("c.example", {"8.8.8.9"});

  ResolutionPipeline p{dns, log, 3};
  auto idx = sample_index();
  auto outs = p.run({"wss://a.example", "wss://b.example", "wss://c.example"}, idx);

  EXPECT_EQ(located_urls(outs), (std::vector<std::string>{"wss://a.example", "wss://c.example"}));
}

TEST(ResolutionPipeline, CeilingBoundsOutstandingResolutions)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  std::vector<std::string> input;
  for (int i = 0; i < 12; ++i)
  {
    const auto host = "h" + std::to_string(i) + ".example";
    dns.ok(host, {"1.0.0." + std::to_string(i)}, 10ms);
    input.push_back("wss://" + host);
  }

  auto idx = sample_index();

  ResolutionPipeline serial{dns, log, 1};
  auto outs = serial.run(input, idx);
  EXPECT_EQ(dns.peak_in_flight(), 1);
  EXPECT_EQ(located_urls(outs), input);

  test_doubles::ScriptedResolver dns3;
  for (int i = 0; i < 12; ++i) dns3.ok("h" + std::to_string(i) + ".example", {"1.0.0.1"}, 10ms);
  ResolutionPipeline three{dns3, log, 3};
  auto outs3 = three.run(input, idx);
  EXPECT_LE(dns3.peak_in_flight(), 3);
  EXPECT_EQ(located_urls(outs3), input);
}

TEST(ResolutionPipeline, EmptyInputReturnsImmediately)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  ResolutionPipeline p{dns, log, 4};
  auto idx = sample_index();
  EXPECT_TRUE(p.run({}, idx).empty());
}

TEST(ResolutionPipeline, SingleEndpointCallbackForm)
{
  test_doubles::NullLogger log;
  test_doubles::ScriptedResolver dns;
  dns.ok("one.example", {"1.0.0.77"}, 5ms);

  ResolutionPipeline p{dns, log, 1};
  auto idx = sample_index();

  std::mutex m;
  std::condition_variable cv;
  std::optional<ResolutionOutcome> got;
  p.resolve_and_locate("ws://one.example:7447", idx,
                       [&](ResolutionOutcome o)
                       {
                         std::lock_guard<std::mutex> lk(m);
                         got = std::move(o);
                         cv.notify_one();
                       });

  std::unique_lock<std::mutex> lk(m);
  ASSERT_TRUE(cv.wait_for(lk, 2s, [&] { return got.has_value(); }));
  ASSERT_TRUE(got->ok());
  EXPECT_EQ(got->located->endpoint, "ws://one.example:7447");
}
