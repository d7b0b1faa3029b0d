#pragma once

#include <string>

namespace otafetch {

// Orders release versions such as "1.4.2", "v1.4" or "1.4.2-rc1+build7".
// A leading 'v' and anything after '-' or '+' are ignored, missing parts
// count as 0 ("1.2" == "1.2.0") and non-numeric parts count as 0.
class VersionComparator {
public:
    // <0, 0 or >0 like strcmp.
    static int Compare(const std::string& lhs, const std::string& rhs);
};

} // namespace otafetch
