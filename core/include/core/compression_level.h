#pragma once

#include <optional>
#include <string>

namespace freya::core {

/// Ordered compression preset: Fast < Normal < Best.
enum class CompressionLevel { Fast, Normal, Best };

/// One step toward Best, saturating at Best.
CompressionLevel increase(CompressionLevel level);

/// One step toward Fast, saturating at Fast.
CompressionLevel decrease(CompressionLevel level);

/// Display label ("Fast", "Normal", "Best").
const char *to_string(CompressionLevel level);

/// Case-insensitive parse of a label. nullopt for anything else.
std::optional<CompressionLevel> parse_compression_level(const std::string &s);

} // namespace freya::core
