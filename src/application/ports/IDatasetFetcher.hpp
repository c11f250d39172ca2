#pragma once

#include <stdexcept>
#include <string>

namespace nostr::relaygeo::application::ports
{

// Fatal for the whole run: without the dataset nothing can be located.
class DatasetError : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

struct IDatasetFetcher
{
  virtual ~IDatasetFetcher() = default;

  // Download + decompress into dest_path. Throws DatasetError on failure.
  virtual void fetch(const std::string& dest_path) = 0;
};

}  // namespace nostr::relaygeo::application::ports
