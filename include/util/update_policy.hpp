#pragma once

#include "ota/update_descriptor.hpp"

#include <string>

namespace otafetch {

class UpdatePolicy {
  public:
    // True when the descriptor is forced or newer than the installed build.
    static bool IsNewer(const UpdateDescriptor& descriptor, const std::string& current_version);
};

} // namespace otafetch
