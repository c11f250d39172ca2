#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace nostr::relaygeo::infrastructure::config
{

class Config_Toml : public nostr::relaygeo::application::ports::IConfigProvider
{
 public:
  nostr::relaygeo::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path, nostr::relaygeo::domain::Settings& s);
};

}  // namespace nostr::relaygeo::infrastructure::config
