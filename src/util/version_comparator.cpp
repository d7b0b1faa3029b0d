#include "util/version_comparator.hpp"

#include <charconv>
#include <cstdint>
#include <string_view>

namespace otafetch {

namespace {

std::string_view NumericCore(std::string_view v) {
    if (!v.empty() && (v.front() == 'v' || v.front() == 'V')) v.remove_prefix(1);
    const auto cut = v.find_first_of("-+");
    if (cut != std::string_view::npos) v = v.substr(0, cut);
    return v;
}

// Pops the next dot-separated component off `rest`; 0 once exhausted.
std::uint64_t NextPart(std::string_view& rest) {
    if (rest.empty()) return 0;
    const auto dot = rest.find('.');
    const std::string_view part = rest.substr(0, dot);
    rest = dot == std::string_view::npos ? std::string_view{} : rest.substr(dot + 1);

    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), v);
    if (ec != std::errc{} || ptr != part.data() + part.size()) return 0;
    return v;
}

} // namespace

int VersionComparator::Compare(const std::string& lhs, const std::string& rhs) {
    std::string_view a = NumericCore(lhs);
    std::string_view b = NumericCore(rhs);

    while (!a.empty() || !b.empty()) {
        const std::uint64_t x = NextPart(a);
        const std::uint64_t y = NextPart(b);
        if (x != y) return x > y ? 1 : -1;
    }
    return 0;
}

} // namespace otafetch
