#include "infra/zstd_codec.h"

#include <zstd.h>
#include <zstd_errors.h>

#include <cstdint>
#include <string>
#include <vector>

namespace freya::infra {

namespace {

using core::ErrorCategory;
using core::IByteSink;
using core::IByteSource;
using core::JobError;
using core::Result;

constexpr std::uint32_t kSkippableMask = 0xFFFFFFF0U;

JobError zstd_error(ErrorCategory cat, const std::string &what,
                    std::size_t rc) {
  return JobError(cat, static_cast<int>(ZSTD_getErrorCode(rc)),
                  what + ": " + ZSTD_getErrorName(rc));
}

bool is_zstd_magic(const std::uint8_t *p) {
  const std::uint32_t magic = static_cast<std::uint32_t>(p[0]) |
                              (static_cast<std::uint32_t>(p[1]) << 8) |
                              (static_cast<std::uint32_t>(p[2]) << 16) |
                              (static_cast<std::uint32_t>(p[3]) << 24);
  return magic == ZSTD_MAGICNUMBER ||
         (magic & kSkippableMask) == ZSTD_MAGIC_SKIPPABLE_START;
}

// ---- Encoder ----

class ZstdEncoder final : public IByteSink {
public:
  ZstdEncoder(ZSTD_CCtx *cctx, IByteSink &sink)
      : cctx_(cctx, &ZSTD_freeCCtx), sink_(sink),
        out_(ZSTD_CStreamOutSize()) {}

  Result<void, JobError> write(const std::uint8_t *buf,
                               std::size_t len) override {
    ZSTD_inBuffer in{buf, len, 0};
    while (in.pos < in.size) {
      auto step = compress(in, ZSTD_e_continue);
      if (step.is_err()) {
        return Result<void, JobError>::Err(std::move(step).error());
      }
    }
    return Result<void, JobError>::Ok();
  }

  Result<void, JobError> finish() override {
    if (finished_) {
      return Result<void, JobError>::Ok();
    }
    finished_ = true;

    ZSTD_inBuffer in{nullptr, 0, 0};
    for (;;) {
      auto remaining = compress(in, ZSTD_e_end);
      if (remaining.is_err()) {
        return Result<void, JobError>::Err(std::move(remaining).error());
      }
      if (remaining.value() == 0) {
        break;
      }
    }
    return sink_.finish();
  }

private:
  // One ZSTD_compressStream2 call; returns zstd's "bytes left to flush".
  Result<std::size_t, JobError> compress(ZSTD_inBuffer &in,
                                         ZSTD_EndDirective mode) {
    using R = Result<std::size_t, JobError>;
    ZSTD_outBuffer out{out_.data(), out_.size(), 0};
    const std::size_t rc = ZSTD_compressStream2(cctx_.get(), &out, &in, mode);
    if (ZSTD_isError(rc)) {
      return R::Err(zstd_error(ErrorCategory::Internal,
                               "zstd compression failed", rc));
    }
    if (out.pos > 0) {
      auto written = sink_.write(out_.data(), out.pos);
      if (written.is_err()) {
        return R::Err(std::move(written).error());
      }
    }
    return R::Ok(rc);
  }

  std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> cctx_;
  IByteSink &sink_;
  std::vector<std::uint8_t> out_;
  bool finished_ = false;
};

// ---- Decoder ----

class ZstdDecoder final : public IByteSource {
public:
  ZstdDecoder(ZSTD_DCtx *dctx, IByteSource &source)
      : dctx_(dctx, &ZSTD_freeDCtx), source_(source),
        in_(ZSTD_DStreamInSize()) {}

  /// Buffer the first bytes and check the frame magic.
  Result<void, JobError> validate() {
    using R = Result<void, JobError>;
    while (in_size_ < 4 && !source_eof_) {
      auto filled = fill();
      if (filled.is_err()) {
        return filled;
      }
    }
    if (in_size_ == 0) {
      return R::Err(JobError::Format("not a zstd stream (input is empty)"));
    }
    if (in_size_ < 4 || !is_zstd_magic(in_.data())) {
      return R::Err(JobError::Format("not a zstd stream (bad magic number)"));
    }
    return R::Ok();
  }

  Result<std::size_t, JobError> read(std::uint8_t *buf,
                                     std::size_t len) override {
    using R = Result<std::size_t, JobError>;
    if (len == 0) {
      return R::Ok(0);
    }

    ZSTD_outBuffer out{buf, len, 0};
    while (out.pos == 0) {
      if (in_pos_ == in_size_ && !source_eof_) {
        in_pos_ = 0;
        in_size_ = 0;
        auto filled = fill();
        if (filled.is_err()) {
          return R::Err(std::move(filled).error());
        }
      }

      const bool drained = in_pos_ == in_size_;
      ZSTD_inBuffer in{in_.data(), in_size_, in_pos_};
      const std::size_t rc = ZSTD_decompressStream(dctx_.get(), &out, &in);
      const bool moved = in.pos != in_pos_ || out.pos > 0;
      in_pos_ = in.pos;
      if (ZSTD_isError(rc)) {
        return R::Err(zstd_error(ErrorCategory::Format,
                                 "corrupt zstd stream", rc));
      }
      // An idle call after a frame ends reports the next header size;
      // only calls that did work say anything about the current frame.
      if (moved) {
        frame_complete_ = rc == 0;
      }

      if (drained && source_eof_ && out.pos == 0) {
        if (!frame_complete_) {
          return R::Err(JobError::Format("truncated zstd stream"));
        }
        return R::Ok(0);
      }
    }
    return R::Ok(out.pos);
  }

private:
  // Append one source read to the input buffer.
  Result<void, JobError> fill() {
    auto n = source_.read(in_.data() + in_size_, in_.size() - in_size_);
    if (n.is_err()) {
      return Result<void, JobError>::Err(std::move(n).error());
    }
    if (n.value() == 0) {
      source_eof_ = true;
    }
    in_size_ += n.value();
    return Result<void, JobError>::Ok();
  }

  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx_;
  IByteSource &source_;
  std::vector<std::uint8_t> in_;
  std::size_t in_pos_ = 0;
  std::size_t in_size_ = 0;
  bool source_eof_ = false;
  bool frame_complete_ = false;
};

} // namespace

int ZstdCodec::zstd_level(core::CompressionLevel level) {
  switch (level) {
  case core::CompressionLevel::Fast:
    return 1;
  case core::CompressionLevel::Normal:
    return 3;
  case core::CompressionLevel::Best:
    return 19;
  }
  return ZSTD_CLEVEL_DEFAULT;
}

Result<std::unique_ptr<IByteSink>, JobError>
ZstdCodec::open_encoder(IByteSink &sink, core::CompressionLevel level) {
  using R = Result<std::unique_ptr<IByteSink>, JobError>;

  ZSTD_CCtx *cctx = ZSTD_createCCtx();
  if (cctx == nullptr) {
    return R::Err(JobError::Internal("cannot allocate zstd compression context"));
  }
  // Owned from here on, so early returns free the context.
  auto encoder = std::make_unique<ZstdEncoder>(cctx, sink);

  std::size_t rc =
      ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, zstd_level(level));
  if (ZSTD_isError(rc)) {
    return R::Err(zstd_error(ErrorCategory::Internal,
                             "cannot set zstd compression level", rc));
  }
  rc = ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, 1);
  if (ZSTD_isError(rc)) {
    return R::Err(zstd_error(ErrorCategory::Internal,
                             "cannot enable zstd checksum", rc));
  }
  return R::Ok(std::move(encoder));
}

Result<std::unique_ptr<IByteSource>, JobError>
ZstdCodec::open_decoder(IByteSource &source) {
  using R = Result<std::unique_ptr<IByteSource>, JobError>;

  ZSTD_DCtx *dctx = ZSTD_createDCtx();
  if (dctx == nullptr) {
    return R::Err(
        JobError::Internal("cannot allocate zstd decompression context"));
  }
  auto decoder = std::make_unique<ZstdDecoder>(dctx, source);

  auto valid = decoder->validate();
  if (valid.is_err()) {
    return R::Err(std::move(valid).error());
  }
  return R::Ok(std::move(decoder));
}

} // namespace freya::infra
