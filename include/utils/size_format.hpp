#pragma once

#include <cstdint>
#include <string>

namespace diskprobe {
namespace utils {

// Largest byte count a size expression may produce (2^53 - 1, ~7.99PB)
constexpr uint64_t MAX_SAFE_SIZE = 9007199254740991ULL;

// Parses "<mantissa>[K|M|G|T|P][B]" with binary multipliers, e.g.
// "256M" -> 268435456 and "1.5G" -> 1610612736. Fractional bytes are
// dropped. Throws probe::ConfigError naming the original string.
uint64_t parse_size(const std::string& expression);

// Renders bytes with the largest unit that keeps the value under 1024
// and three significant figures, e.g. 268435456 -> "256MB"
std::string format_size(uint64_t bytes);

// Rounds to three significant figures; zero renders as "0.00"
std::string keep_three_significant_figures(double value);

} // namespace utils
} // namespace diskprobe
