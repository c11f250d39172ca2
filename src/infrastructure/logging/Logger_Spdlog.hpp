#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace nostr::relaygeo::infrastructure::logging
{

class Logger_Spdlog final : public nostr::relaygeo::application::ports::ILogger
{
 public:
  void init(const nostr::relaygeo::domain::Settings& s) override;

  void app(nostr::relaygeo::application::ports::LogLevel level, const std::string& msg) override;

  void diag(nostr::relaygeo::application::ports::LogLevel level, std::string_view msg) override;

  // Drains the async queue into the sinks.
  void flush();

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> diag_;

  // Helpers
  static spdlog::level::level_enum map_level(nostr::relaygeo::application::ports::LogLevel l);
};

}  // namespace nostr::relaygeo::infrastructure::logging
