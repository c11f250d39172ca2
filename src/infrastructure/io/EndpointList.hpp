#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"

namespace nostr::relaygeo::infrastructure::io
{

// One endpoint per line; lines are trimmed and blank ones dropped.
std::vector<std::string> read_endpoints(std::istream& in);

// -----------------------------------------------------------------------------
// load_endpoints(input_path, log)
//  - With a path: reads that file (a missing or unreadable file logs an error
//    and yields nothing).
//  - Without: reads stdin, but only when it is not an interactive terminal.
// -----------------------------------------------------------------------------
std::vector<std::string> load_endpoints(const std::optional<std::string>& input_path,
                                        nostr::relaygeo::application::ports::ILogger& log);

}  // namespace nostr::relaygeo::infrastructure::io
