#include "util/update_policy.hpp"

#include "util/version_comparator.hpp"

namespace otafetch {

bool UpdatePolicy::IsNewer(const UpdateDescriptor& descriptor, const std::string& current_version) {
    if (descriptor.force) return true;
    return VersionComparator::Compare(descriptor.version, current_version) > 0;
}

} // namespace otafetch
