#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace freya::core {

/// Cumulative source-side byte count. total_bytes == 0 means "unknown".
struct Progress {
  std::uint64_t bytes_processed = 0;
  std::uint64_t total_bytes = 0;
};

struct CompressedResult {
  std::uint64_t original_size = 0;
  std::uint64_t compressed_size = 0;
  std::string output_path;
};

struct DecompressedResult {
  std::uint64_t compressed_size = 0;
  std::uint64_t decompressed_size = 0;
  std::string output_path;
};

/// Terminal success. The payload says which direction produced it.
struct Finished {
  std::variant<CompressedResult, DecompressedResult> result;
};

/// Terminal failure.
struct Failed {
  std::string message;
};

/// Per-job stream: zero or more Progress, then exactly one Finished or Failed.
using ProgressMessage = std::variant<Progress, Finished, Failed>;

inline bool is_terminal(const ProgressMessage &msg) {
  return !std::holds_alternative<Progress>(msg);
}

/// compressed / original * 100, or 0 when original is 0.
double compression_ratio_percent(std::uint64_t original_size,
                                 std::uint64_t compressed_size);

/// Multi-line human-readable summary for the result panel.
std::string describe(const Finished &finished);

} // namespace freya::core
