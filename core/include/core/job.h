#pragma once

#include "core/compression_level.h"

#include <string>

namespace freya::core {

enum class Direction { Compress, Decompress };

const char *to_string(Direction direction);

/// One user-initiated transform request. Immutable once handed to a runner.
struct Job {
  std::string input_path;
  std::string output_path;
  Direction direction = Direction::Compress;
  CompressionLevel level = CompressionLevel::Normal; // Compress only
};

/// Default output path for `input_path`.
///   Compress:   "a.pdf" -> "a.pdf.zst", "README" -> "README.zst"
///   Decompress: "a.pdf.zst" -> "a.pdf", "blob" -> "blob.out"
/// `extension` is the codec extension including the dot (".zst").
std::string default_output_path(const std::string &input_path,
                                Direction direction,
                                const std::string &extension);

} // namespace freya::core
