#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <exception>
#include <fstream>
#include <toml++/toml.hpp>

using nostr::relaygeo::domain::Settings;
namespace fs = boost::filesystem;

namespace nostr::relaygeo::infrastructure::config
{

namespace
{
const Settings kDefaults{};

static const char* b2s(bool b) { return b ? "true" : "false"; }

// positive integers only; anything else keeps the default
template <typename T>
static void read_positive(const toml::table& t, const char* key, T& dst)
{
  if (auto v = t[key].value<int64_t>(); v && *v > 0) dst = static_cast<T>(*v);
}
}  // namespace

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  // Header
  out << "# relay-geo.toml - Auto-generated initial configuration\n"
         "# Edit as needed and run again\n\n";

  // [dataset]
  out << "[dataset]\n";
  out << "path = \"" << kDefaults.dataset.path << "\"\n";
  out << "url  = \"" << kDefaults.dataset.url << "\"\n\n";

  // [resolver]
  out << "[resolver]\n";
  out << "workers     = " << kDefaults.resolver.workers << "\n";
  out << "maxInFlight = " << kDefaults.resolver.maxInFlight << "\n";
  out << "timeoutMs   = " << kDefaults.resolver.timeoutMs << "\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole     = " << b2s(kDefaults.showConsole) << "\n";
  out << "saveLog         = " << b2s(kDefaults.saveLog) << "\n";
  out << "saveDiagLog     = " << b2s(kDefaults.saveDiagLog) << "\n";
  out << "logsDir         = \"" << kDefaults.logsDir << "\"\n";
  out << "appLogFilename  = \"" << kDefaults.appLogFilename << "\"\n";
  out << "diagLogFilename = \"" << kDefaults.diagLogFilename << "\"\n";

  out.close();

  // mirror the written file back to Settings
  const auto configPath = s.configPath;
  s = kDefaults;
  s.configPath = configPath;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const toml::parse_error&)
  {
    // if parsing fails, recreate with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [dataset]
  // ---------------------------
  if (auto ds = tbl["dataset"].as_table())
  {
    if (auto v = (*ds)["path"].value<std::string>(); v && !v->empty()) s.dataset.path = *v;
    if (auto v = (*ds)["url"].value<std::string>(); v && !v->empty()) s.dataset.url = *v;
  }

  // ---------------------------
  // [resolver]
  // ---------------------------
  if (auto r = tbl["resolver"].as_table())
  {
    read_positive(*r, "workers", s.resolver.workers);
    read_positive(*r, "maxInFlight", s.resolver.maxInFlight);
    read_positive(*r, "timeoutMs", s.resolver.timeoutMs);
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["saveDiagLog"].value<bool>()) s.saveDiagLog = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["diagLogFilename"].value<std::string>()) s.diagLogFilename = *v;
  }

  if (s.logsDir.empty()) s.logsDir = kDefaults.logsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaults.appLogFilename;
  if (s.diagLogFilename.empty()) s.diagLogFilename = kDefaults.diagLogFilename;

  return s;
}

}  // namespace nostr::relaygeo::infrastructure::config
