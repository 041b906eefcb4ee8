#pragma once

#include "Types.h"

#include <cstdint>
#include <string>

namespace taggraph {
namespace PlatformUtils {

    // Get current time as double seconds (high-resolution monotonic clock).
    double getTime();

    // Format an int64 with comma separators (e.g., 1,234,567).
    std::string formatNumber(int64_t number);

    // Cross-platform wildcard matching (supports * and ?).
    bool wildcardMatch(const std::string& pattern, const std::string& str);

    // True if bytes form well-formed UTF-8 (no overlongs or surrogates).
    bool isValidUtf8(const std::string& bytes);

} // namespace PlatformUtils
} // namespace taggraph
