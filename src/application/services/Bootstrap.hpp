#pragma once
#include <optional>
#include <sstream>
#include <string>
#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"

namespace nostr::relaygeo::application::services {

// Settings + logging; command line overrides win over the config file.
struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  domain::Settings run(const std::string& configPath,
                       const std::optional<std::string>& datasetOverride = std::nullopt) {
    auto s = cfg.load_or_create(configPath);
    if (datasetOverride && !datasetOverride->empty()) s.dataset.path = *datasetOverride;
    log.init(s);

    using ports::LogLevel;

    log.app(LogLevel::info, "relay-geo started");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);
    log.app(LogLevel::info, std::string("Dataset: ") + s.dataset.path);
    log.app(LogLevel::debug, std::string("Dataset URL: ") + s.dataset.url);

    std::ostringstream res;
    res << "Resolver workers: " << s.resolver.workers
        << " | maxInFlight: " << s.resolver.maxInFlight
        << " | timeoutMs: " << s.resolver.timeoutMs;
    log.app(LogLevel::info, res.str());

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveDiagLog: " << b2s(s.saveDiagLog);
    log.app(LogLevel::debug, flags.str());
    return s;
  }
};

} // namespace nostr::relaygeo::application::services
