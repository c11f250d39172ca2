#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "domain/geo/RangeRecord.hpp"

namespace nostr::relaygeo::domain::geo
{

// -----------------------------------------------------------------------------
// IntervalIndex
//  - Immutable table of disjoint ranges sorted ascending by start.
//  - Never mutated after build(), so any number of threads may call lookup()
//    without synchronization.
// -----------------------------------------------------------------------------
class IntervalIndex
{
 public:
  // records must already be sorted by start; neither order nor overlap is checked
  static IntervalIndex build(std::vector<RangeRecord> records);

  // Floor search on start, then containment check on that single candidate.
  std::optional<Location> lookup(uint32_t ip) const;

  std::size_t size() const noexcept { return records_.size(); }
  bool empty() const noexcept { return records_.empty(); }

 private:
  explicit IntervalIndex(std::vector<RangeRecord> records) : records_(std::move(records)) {}

  std::vector<RangeRecord> records_;
};

}  // namespace nostr::relaygeo::domain::geo
