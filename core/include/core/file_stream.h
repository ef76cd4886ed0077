#pragma once

#include "core/byte_stream.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

namespace freya::core {

/// Read-only file opened in binary mode.
class FileSource final : public IByteSource {
public:
  /// Fails with ErrorCategory::Input if the path is missing, is a directory
  /// or cannot be opened.
  static Result<std::unique_ptr<FileSource>, JobError>
  open(const std::string &path);

  Result<std::size_t, JobError> read(std::uint8_t *buf,
                                     std::size_t len) override;

  /// Size of the file at open time.
  [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
  [[nodiscard]] const std::string &path() const noexcept { return path_; }

private:
  FileSource(std::string path, std::uint64_t size);

  std::string path_;
  std::uint64_t size_ = 0;
  std::ifstream stream_;
};

/// Write-only file, created or truncated on open.
class FileSink final : public IByteSink {
public:
  static Result<std::unique_ptr<FileSink>, JobError>
  create(const std::string &path);

  Result<void, JobError> write(const std::uint8_t *buf,
                               std::size_t len) override;

  /// Flush and close. The size on disk is final afterwards.
  Result<void, JobError> finish() override;

  [[nodiscard]] std::uint64_t bytes_written() const noexcept {
    return written_;
  }
  [[nodiscard]] const std::string &path() const noexcept { return path_; }

private:
  explicit FileSink(std::string path);

  std::string path_;
  std::uint64_t written_ = 0;
  bool finished_ = false;
  std::ofstream stream_;
};

} // namespace freya::core
