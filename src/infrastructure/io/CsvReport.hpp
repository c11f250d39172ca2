#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "application/services/ResolutionPipeline.hpp"

namespace nostr::relaygeo::infrastructure::io
{

inline constexpr const char* kCsvHeader = "Relay URL,Latitude,Longitude";

// Quotes a field only when it holds a comma, a quote or a line break.
std::string csv_escape(std::string_view field);

// Header, then one row per located outcome in order. Returns rows written.
std::size_t write_report(std::ostream& out,
                         const std::vector<nostr::relaygeo::application::services::ResolutionOutcome>& outcomes);

// Throws std::runtime_error when the file cannot be written.
std::size_t write_report_file(const std::string& path,
                              const std::vector<nostr::relaygeo::application::services::ResolutionOutcome>& outcomes);

}  // namespace nostr::relaygeo::infrastructure::io
