#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace nostr::relaygeo::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual nostr::relaygeo::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace nostr::relaygeo::application::ports
