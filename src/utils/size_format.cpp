#include "utils/size_format.hpp"
#include <array>
#include <cmath>
#include <iomanip>
#include <locale>
#include <regex>
#include <sstream>
#include "probe/probe_error.hpp"

namespace diskprobe {
namespace utils {

namespace {

const std::regex SIZE_PATTERN(R"(^(\d*\.?\d+)([KMGTP]?)B?$)");

uint64_t unit_multiplier(const std::string& unit) {
  if (unit.empty()) {
    return 1;
  }
  switch (unit[0]) {
    case 'K': return 1ULL << 10;
    case 'M': return 1ULL << 20;
    case 'G': return 1ULL << 30;
    case 'T': return 1ULL << 40;
    case 'P': return 1ULL << 50;
    default:  return 0;
  }
}

} // namespace

uint64_t parse_size(const std::string& expression) {
  std::smatch match;
  if (!std::regex_match(expression, match, SIZE_PATTERN)) {
    throw probe::ConfigError("Cannot understand file size string: " + expression);
  }

  // Long double keeps every integer up to the safe ceiling exact
  long double mantissa = 0;
  std::istringstream mantissa_stream(match[1].str());
  mantissa_stream.imbue(std::locale::classic());
  // The pattern already matched, so a failed extraction is an overflow
  if (!(mantissa_stream >> mantissa) || !std::isfinite(mantissa)) {
    throw probe::ConfigError(expression + " is too large, please do not exceed 7.99PB");
  }

  long double bytes = std::floor(mantissa * static_cast<long double>(unit_multiplier(match[2].str())));
  if (bytes > static_cast<long double>(MAX_SAFE_SIZE)) {
    throw probe::ConfigError(expression + " is too large, please do not exceed 7.99PB");
  }

  return static_cast<uint64_t>(bytes);
}

std::string keep_three_significant_figures(double value) {
  if (value == 0) {
    return "0.00";
  }

  double magnitude = std::floor(std::log10(std::fabs(value)));
  double factor = std::pow(10.0, 2 - magnitude);
  double rounded = std::round(value * factor) / factor;

  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::setprecision(15) << rounded;
  return ss.str();
}

std::string format_size(uint64_t bytes) {
  static const std::array<const char*, 6> units = {"B", "KB", "MB", "GB", "TB", "PB"};

  double value = static_cast<double>(bytes);
  size_t unit_index = 0;
  while (value >= 1024 && unit_index < units.size() - 1) {
    value /= 1024;
    unit_index++;
  }

  return keep_three_significant_figures(value) + units[unit_index];
}

} // namespace utils
} // namespace diskprobe
