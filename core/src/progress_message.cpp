#include "core/progress_message.h"

#include <iomanip>
#include <sstream>

namespace freya::core {

double compression_ratio_percent(std::uint64_t original_size,
                                 std::uint64_t compressed_size) {
  if (original_size == 0) {
    return 0.0;
  }
  return static_cast<double>(compressed_size) /
         static_cast<double>(original_size) * 100.0;
}

std::string describe(const Finished &finished) {
  std::ostringstream out;
  if (const auto *c = std::get_if<CompressedResult>(&finished.result)) {
    out << "✅ Compression successful!\n"
        << "📂 Saved to: " << c->output_path << "\n"
        << "📊 Original: " << c->original_size << " bytes\n"
        << "📉 Compressed: " << c->compressed_size << " bytes (" << std::fixed
        << std::setprecision(2)
        << compression_ratio_percent(c->original_size, c->compressed_size)
        << "% of original)";
  } else {
    const auto &d = std::get<DecompressedResult>(finished.result);
    out << "✅ Decompression successful!\n"
        << "📂 Saved to: " << d.output_path << "\n"
        << "📦 Compressed: " << d.compressed_size << " bytes\n"
        << "📄 Decompressed: " << d.decompressed_size << " bytes";
  }
  return out.str();
}

} // namespace freya::core
