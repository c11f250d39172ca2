#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace nostr::relaygeo::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

// "app" carries the run lifecycle; "diag" carries per-endpoint resolution detail.
struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const nostr::relaygeo::domain::Settings& s) = 0;
  virtual void app(LogLevel level, const std::string& msg) = 0;
  virtual void diag(LogLevel level, std::string_view msg) = 0;
};

}  // namespace nostr::relaygeo::application::ports
