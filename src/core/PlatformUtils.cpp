#include "PlatformUtils.h"

#include <algorithm>
#include <chrono>
#include <string>

namespace taggraph {
namespace PlatformUtils {

// ============================================================================
// getTime - high-resolution monotonic clock, returns seconds as double
// ============================================================================
double getTime() {
    using Clock = std::chrono::steady_clock;
    static const auto startTime = Clock::now();
    auto now = Clock::now();
    std::chrono::duration<double> elapsed = now - startTime;
    return elapsed.count();
}

// ============================================================================
// formatNumber - format int64 with comma separators
// ============================================================================
std::string formatNumber(int64_t number) {
    if (number == 0) {
        return "0";
    }

    bool negative = (number < 0);
    // Use unsigned to handle INT64_MIN correctly.
    uint64_t n = negative ? static_cast<uint64_t>(-(number + 1)) + 1u
                          : static_cast<uint64_t>(number);

    std::string result;
    int digitCount = 0;
    while (n > 0) {
        if (digitCount > 0 && digitCount % 3 == 0) {
            result += ',';
        }
        result += static_cast<char>('0' + static_cast<int>(n % 10));
        n /= 10;
        digitCount++;
    }

    if (negative) {
        result += '-';
    }

    std::reverse(result.begin(), result.end());
    return result;
}

// ============================================================================
// wildcardMatch - simple glob matching with * and ?
// ============================================================================
bool wildcardMatch(const std::string& pattern, const std::string& str) {
    // Two-pointer technique with star backtracking.
    size_t pLen = pattern.size();
    size_t sLen = str.size();
    size_t pi = 0, si = 0;
    size_t starPi = std::string::npos;
    size_t starSi = 0;

    while (si < sLen) {
        if (pi < pLen && (pattern[pi] == '?' || pattern[pi] == str[si])) {
            pi++;
            si++;
        } else if (pi < pLen && pattern[pi] == '*') {
            // Record star position, try matching zero characters first.
            starPi = pi;
            starSi = si;
            pi++;
        } else if (starPi != std::string::npos) {
            pi = starPi + 1;
            starSi++;
            si = starSi;
        } else {
            return false;
        }
    }

    // Consume trailing '*' in pattern.
    while (pi < pLen && pattern[pi] == '*') {
        pi++;
    }

    return pi == pLen;
}

// ============================================================================
// isValidUtf8 - strict decoder walk over the byte string
// ============================================================================
bool isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t len = bytes.size();

    while (i < len) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t minCp = 0;
        if ((c & 0xE0) == 0xC0) {
            extra = 1; cp = c & 0x1F; minCp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; cp = c & 0x0F; minCp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; cp = c & 0x07; minCp = 0x10000;
        } else {
            return false;
        }

        // Truncated sequence at end of input.
        if (i + extra >= len) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace PlatformUtils
} // namespace taggraph
