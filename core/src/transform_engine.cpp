#include "core/transform_engine.h"

#include <memory>
#include <vector>

namespace freya::core {

TransformEngine::TransformEngine(ICodec &codec, std::size_t chunk_size)
    : codec_(codec), chunk_size_(chunk_size == 0 ? kChunkSize : chunk_size) {}

Result<TransformStats, JobError>
TransformEngine::run(Direction direction, IByteSource &source, IByteSink &sink,
                     CompressionLevel level, std::uint64_t total_bytes,
                     const ProgressFn &emit) {
  return run(
      direction, source,
      [&sink]() { return Result<IByteSink *, JobError>::Ok(&sink); }, level,
      total_bytes, emit);
}

Result<TransformStats, JobError>
TransformEngine::run(Direction direction, IByteSource &source,
                     const SinkOpener &open_sink, CompressionLevel level,
                     std::uint64_t total_bytes, const ProgressFn &emit) {
  using R = Result<TransformStats, JobError>;

  CountingSource counted(source);

  // Exactly one side is wrapped by the codec; the other stays raw.
  std::unique_ptr<IByteSource> decoder;
  std::unique_ptr<IByteSink> encoder;
  IByteSource *reader = &counted;
  IByteSink *writer = nullptr;

  if (direction == Direction::Decompress) {
    auto opened = codec_.open_decoder(counted);
    if (opened.is_err()) {
      return R::Err(std::move(opened).error());
    }
    decoder = std::move(opened).value();
    reader = decoder.get();
  }

  auto sink = open_sink();
  if (sink.is_err()) {
    return R::Err(std::move(sink).error());
  }
  writer = sink.value();

  if (direction == Direction::Compress) {
    auto opened = codec_.open_encoder(*writer, level);
    if (opened.is_err()) {
      return R::Err(std::move(opened).error());
    }
    encoder = std::move(opened).value();
    writer = encoder.get();
  }

  std::vector<std::uint8_t> buffer(chunk_size_);
  TransformStats stats;
  std::uint64_t last_reported = 0;

  for (;;) {
    auto n = reader->read(buffer.data(), buffer.size());
    if (n.is_err()) {
      return R::Err(std::move(n).error());
    }
    if (n.value() == 0) {
      break;
    }

    auto written = writer->write(buffer.data(), n.value());
    if (written.is_err()) {
      return R::Err(std::move(written).error());
    }
    stats.bytes_produced += n.value();

    last_reported = counted.count();
    if (emit) {
      emit(Progress{last_reported, total_bytes});
    }
  }

  // A decoder may consume the frame trailer on the read that returns 0.
  if (emit && counted.count() != last_reported) {
    emit(Progress{counted.count(), total_bytes});
  }

  // Trailer first; the caller queries the output size only after this.
  auto finished = writer->finish();
  if (finished.is_err()) {
    return R::Err(std::move(finished).error());
  }

  stats.bytes_consumed = counted.count();
  return R::Ok(stats);
}

} // namespace freya::core
