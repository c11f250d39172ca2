#pragma once

#include <string>
#include <utility>

#include "application/ports/IDatasetFetcher.hpp"
#include "application/ports/ILogger.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace nostr::relaygeo::infrastructure::fetch
{

struct Url
{
  std::string scheme;  // "http" or "https"
  std::string host;
  std::string port;
  std::string target;  // path + query, always starts with '/'
};

// Throws DatasetError on unsupported schemes or a missing host.
Url parse_url(const std::string& url);

// -----------------------------------------------------------------------------
// DatasetFetcher_Beast
//  - GET <url> into "<dest>.gz" (http or https, up to kMaxRedirects hops).
//  - gunzip into "<dest>.part", rename to <dest>, remove the archive.
//  - Any failure leaves <dest> untouched and throws DatasetError.
// -----------------------------------------------------------------------------
class DatasetFetcher_Beast final : public nostr::relaygeo::application::ports::IDatasetFetcher
{
 public:
  static constexpr int kMaxRedirects = 5;

  DatasetFetcher_Beast(nostr::relaygeo::application::ports::ILogger& log, std::string url)
      : log_(log), url_(std::move(url))
  {
  }

  void fetch(const std::string& dest_path) override;

  static void gunzip(const boost::filesystem::path& from, const boost::filesystem::path& to);

 private:
  void download(const boost::filesystem::path& to);

  nostr::relaygeo::application::ports::ILogger& log_;
  std::string url_;
};

}  // namespace nostr::relaygeo::infrastructure::fetch
