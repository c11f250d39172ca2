#include "domain/geo/IntervalIndex.hpp"

#include <algorithm>
#include <iterator>

namespace nostr::relaygeo::domain::geo
{

IntervalIndex IntervalIndex::build(std::vector<RangeRecord> records)
{
  return IntervalIndex(std::move(records));
}

std::optional<Location> IntervalIndex::lookup(uint32_t ip) const
{
  // first record with start > ip; the one before it is the floor
  auto it = std::ranges::upper_bound(records_, ip, {}, &RangeRecord::start);
  if (it == records_.begin()) return std::nullopt;

  const RangeRecord& cand = *std::prev(it);
  if (ip > cand.end) return std::nullopt;  // gap, or past the last range

  return cand.location;
}

}  // namespace nostr::relaygeo::domain::geo
