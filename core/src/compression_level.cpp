#include "core/compression_level.h"

#include <algorithm>
#include <cctype>

namespace freya::core {

CompressionLevel increase(CompressionLevel level) {
  switch (level) {
  case CompressionLevel::Fast:
    return CompressionLevel::Normal;
  case CompressionLevel::Normal:
  case CompressionLevel::Best:
    return CompressionLevel::Best;
  }
  return CompressionLevel::Best;
}

CompressionLevel decrease(CompressionLevel level) {
  switch (level) {
  case CompressionLevel::Best:
    return CompressionLevel::Normal;
  case CompressionLevel::Normal:
  case CompressionLevel::Fast:
    return CompressionLevel::Fast;
  }
  return CompressionLevel::Fast;
}

const char *to_string(CompressionLevel level) {
  switch (level) {
  case CompressionLevel::Fast:
    return "Fast";
  case CompressionLevel::Normal:
    return "Normal";
  case CompressionLevel::Best:
    return "Best";
  }
  return "Unknown";
}

std::optional<CompressionLevel> parse_compression_level(const std::string &s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "fast") {
    return CompressionLevel::Fast;
  }
  if (lower == "normal") {
    return CompressionLevel::Normal;
  }
  if (lower == "best") {
    return CompressionLevel::Best;
  }
  return std::nullopt;
}

} // namespace freya::core
