#pragma once

#include "core/job_error.h"
#include "core/result.h"

#include <cstddef>
#include <cstdint>

namespace freya::core {

/// Pull side of a byte pipe.
class IByteSource {
public:
  virtual ~IByteSource() = default;

  /// Read up to `len` bytes into `buf`. Ok(0) means end of stream.
  virtual Result<std::size_t, JobError> read(std::uint8_t *buf,
                                             std::size_t len) = 0;
};

/// Push side of a byte pipe.
class IByteSink {
public:
  virtual ~IByteSink() = default;

  /// Write all `len` bytes or fail.
  virtual Result<void, JobError> write(const std::uint8_t *buf,
                                       std::size_t len) = 0;

  /// Flush any trailing state. Nothing may be written afterwards.
  virtual Result<void, JobError> finish() = 0;
};

/// Forwards to another source and counts the bytes it handed out.
/// Sits under a decoder so progress is measured in compressed bytes.
class CountingSource final : public IByteSource {
public:
  explicit CountingSource(IByteSource &inner) : inner_(inner) {}

  Result<std::size_t, JobError> read(std::uint8_t *buf,
                                     std::size_t len) override {
    auto r = inner_.read(buf, len);
    if (r.is_ok()) {
      count_ += r.value();
    }
    return r;
  }

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

private:
  IByteSource &inner_;
  std::uint64_t count_ = 0;
};

} // namespace freya::core
