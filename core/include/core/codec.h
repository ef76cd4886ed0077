#pragma once

#include "core/byte_stream.h"
#include "core/compression_level.h"
#include "core/job_error.h"
#include "core/result.h"

#include <memory>
#include <string>

namespace freya::core {

/// Streaming compress/decompress capability.
///
/// The returned streams borrow the stream they wrap; the caller keeps the
/// inner stream alive for as long as the wrapper is used.
class ICodec {
public:
  virtual ~ICodec() = default;

  /// Short name for logging ("zstd").
  [[nodiscard]] virtual std::string name() const = 0;

  /// File extension including the dot (".zst").
  [[nodiscard]] virtual std::string extension() const = 0;

  /// Wrap `sink` so that bytes written are compressed into it.
  /// finish() on the encoder writes the trailer and then finishes `sink`.
  virtual Result<std::unique_ptr<IByteSink>, JobError>
  open_encoder(IByteSink &sink, CompressionLevel level) = 0;

  /// Wrap `source` so that reads yield decompressed bytes.
  /// Rejects a foreign format before returning.
  virtual Result<std::unique_ptr<IByteSource>, JobError>
  open_decoder(IByteSource &source) = 0;
};

} // namespace freya::core
