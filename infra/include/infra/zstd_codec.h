#pragma once

#include "core/codec.h"

#include <memory>
#include <string>

namespace freya::infra {

/// ICodec backed by libzstd's streaming API.
///
/// Stateless: every open_* call gets its own ZSTD context, so one instance
/// can serve several jobs at once. Frames carry a content checksum.
class ZstdCodec final : public core::ICodec {
public:
  /// Fast = 1, Normal = 3, Best = 19.
  static int zstd_level(core::CompressionLevel level);

  [[nodiscard]] std::string name() const override { return "zstd"; }
  [[nodiscard]] std::string extension() const override { return ".zst"; }

  core::Result<std::unique_ptr<core::IByteSink>, core::JobError>
  open_encoder(core::IByteSink &sink, core::CompressionLevel level) override;

  core::Result<std::unique_ptr<core::IByteSource>, core::JobError>
  open_decoder(core::IByteSource &source) override;
};

} // namespace freya::infra
