#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <boost/filesystem.hpp>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace fs = boost::filesystem;
using nostr::relaygeo::application::ports::LogLevel;

namespace nostr::relaygeo::infrastructure::logging {

namespace {

constexpr std::size_t kRotateBytes = 5 * 1024 * 1024;
constexpr std::size_t kRotateFiles = 3;
constexpr std::size_t kQueueSize   = 8192;
constexpr const char* kPattern     = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";

using ConsoleSink = spdlog::sinks::ansicolor_stdout_sink_mt;

std::shared_ptr<ConsoleSink> make_console_sink() {
  auto sink = std::make_shared<ConsoleSink>();
  sink->set_color(spdlog::level::trace,    "\x1b[90m");
  sink->set_color(spdlog::level::debug,    "\x1b[36m");
  sink->set_color(spdlog::level::info,     "\x1b[32m");
  sink->set_color(spdlog::level::warn,     "\x1b[33m");
  sink->set_color(spdlog::level::err,      "\x1b[31m");
  sink->set_color(spdlog::level::critical, "\x1b[35m");
  // per-endpoint debug output belongs in the diag file
  sink->set_level(spdlog::level::info);
  return sink;
}

// One channel = one named async logger over its own file sink plus the shared console.
std::shared_ptr<spdlog::logger> make_channel(const std::string& name,
                                             const std::optional<fs::path>& file,
                                             const std::shared_ptr<ConsoleSink>& console) {
  if (spdlog::get(name)) spdlog::drop(name);

  std::vector<spdlog::sink_ptr> sinks;
  if (file) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file->string(), kRotateBytes, kRotateFiles));
  }
  if (console) sinks.push_back(console);

  auto lg = std::make_shared<spdlog::async_logger>(name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
                                                   spdlog::async_overflow_policy::block);
  lg->set_pattern(kPattern);
  lg->set_level(spdlog::level::trace);
  lg->flush_on(spdlog::level::err);
  spdlog::register_logger(lg);
  return lg;
}

} // namespace

spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - "app": run lifecycle, dataset load, summary. "diag": per-endpoint resolution detail.
//  - Each channel gets a rotating file under logsDir when enabled; console is shared.
//  - Calling init again replaces both channels.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const nostr::relaygeo::domain::Settings& s) {
  const fs::path dir = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};

  std::optional<fs::path> appFile;
  std::optional<fs::path> diagFile;
  if (s.saveLog)     appFile  = dir / (s.appLogFilename.empty()  ? "relay_geo_app.log"  : s.appLogFilename);
  if (s.saveDiagLog) diagFile = dir / (s.diagLogFilename.empty() ? "relay_geo_diag.log" : s.diagLogFilename);

  if (appFile || diagFile) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("cannot create log directory " + dir.string() + ": " + ec.message());
  }

  if (!spdlog::thread_pool()) spdlog::init_thread_pool(kQueueSize, 1);

  std::shared_ptr<ConsoleSink> console;
  if (s.showConsole) console = make_console_sink();

  app_  = make_channel("app",  appFile,  console);
  diag_ = make_channel("diag", diagFile, console);

  spdlog::flush_every(std::chrono::seconds(2));
}

void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

void Logger_Spdlog::diag(LogLevel level, std::string_view msg) {
  if (diag_) diag_->log(map_level(level), msg);
}

void Logger_Spdlog::flush() {
  if (app_)  app_->flush();
  if (diag_) diag_->flush();
}

} // namespace nostr::relaygeo::infrastructure::logging
