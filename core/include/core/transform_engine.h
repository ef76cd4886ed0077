#pragma once

#include "core/byte_stream.h"
#include "core/codec.h"
#include "core/compression_level.h"
#include "core/job.h"
#include "core/job_error.h"
#include "core/progress_message.h"
#include "core/result.h"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace freya::core {

/// Byte counts for one completed transform.
struct TransformStats {
  std::uint64_t bytes_consumed = 0; // Raw bytes read from the source
  std::uint64_t bytes_produced = 0; // Bytes handed to the writer
};

/// Chunked copy loop: source -> (codec) -> sink.
///
/// Compress:   source ---------------> encoder(sink)
/// Decompress: counting(source) -> decoder ---------> sink
///
/// Progress is always the cumulative count of raw bytes consumed from
/// `source`, so for decompression it is measured in compressed bytes and
/// `total_bytes` is the compressed size.
class TransformEngine {
public:
  static constexpr std::size_t kChunkSize = 64 * 1024;

  using ProgressFn = std::function<void(const Progress &)>;

  /// Creates the destination on demand. The returned sink stays owned by
  /// the caller.
  using SinkOpener = std::function<Result<IByteSink *, JobError>()>;

  explicit TransformEngine(ICodec &codec, std::size_t chunk_size = kChunkSize);

  /// Runs to end of stream, then finishes the writer. Stops at the first
  /// failure and returns it; nothing is retried.
  Result<TransformStats, JobError> run(Direction direction,
                                       IByteSource &source, IByteSink &sink,
                                       CompressionLevel level,
                                       std::uint64_t total_bytes,
                                       const ProgressFn &emit);

  /// As above, but the sink is only opened once the input has been
  /// accepted: for Decompress the decoder validates the format first, so
  /// a rejected input never creates or truncates the destination.
  Result<TransformStats, JobError> run(Direction direction,
                                       IByteSource &source,
                                       const SinkOpener &open_sink,
                                       CompressionLevel level,
                                       std::uint64_t total_bytes,
                                       const ProgressFn &emit);

private:
  ICodec &codec_;
  std::size_t chunk_size_;
};

} // namespace freya::core
