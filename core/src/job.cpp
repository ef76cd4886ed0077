#include "core/job.h"

namespace freya::core {

namespace {

constexpr const char *kUnknownSuffix = ".out";

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char *to_string(Direction direction) {
  switch (direction) {
  case Direction::Compress:
    return "Compress";
  case Direction::Decompress:
    return "Decompress";
  }
  return "Unknown";
}

std::string default_output_path(const std::string &input_path,
                                Direction direction,
                                const std::string &extension) {
  if (direction == Direction::Compress) {
    return input_path + extension;
  }
  // A bare ".zst" (or "dir/.zst") has nothing left once stripped.
  if (!extension.empty() && ends_with(input_path, extension) &&
      input_path.size() > extension.size() &&
      input_path[input_path.size() - extension.size() - 1] != '/') {
    return input_path.substr(0, input_path.size() - extension.size());
  }
  return input_path + kUnknownSuffix;
}

} // namespace freya::core
