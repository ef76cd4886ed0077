#include "core/file_stream.h"

#include <cerrno>
#include <filesystem>
#include <system_error>

namespace freya::core {

namespace fs = std::filesystem;

// ---- FileSource ----

FileSource::FileSource(std::string path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<FileSource>, JobError>
FileSource::open(const std::string &path) {
  using R = Result<std::unique_ptr<FileSource>, JobError>;

  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    return R::Err(JobError::from_errno(ErrorCategory::Input,
                                       ec ? ec.value() : ENOENT,
                                       "Cannot open input file", path));
  }
  if (fs::is_directory(status)) {
    return R::Err(JobError::from_errno(ErrorCategory::Input, EISDIR,
                                       "Input is a directory", path));
  }

  const auto size = fs::file_size(path, ec);
  if (ec) {
    return R::Err(JobError::from_errno(ErrorCategory::Input, ec.value(),
                                       "Cannot query size of", path));
  }

  std::unique_ptr<FileSource> source(new FileSource(path, size));
  errno = 0;
  source->stream_.open(path, std::ios::in | std::ios::binary);
  if (!source->stream_.is_open()) {
    return R::Err(JobError::from_errno(ErrorCategory::Input,
                                       errno != 0 ? errno : EACCES,
                                       "Cannot open input file", path));
  }
  return R::Ok(std::move(source));
}

Result<std::size_t, JobError> FileSource::read(std::uint8_t *buf,
                                               std::size_t len) {
  using R = Result<std::size_t, JobError>;
  if (len == 0 || stream_.eof()) {
    return R::Ok(0);
  }

  errno = 0;
  stream_.read(reinterpret_cast<char *>(buf),
               static_cast<std::streamsize>(len));
  if (stream_.bad()) {
    return R::Err(JobError::from_errno(ErrorCategory::Io,
                                       errno != 0 ? errno : EIO,
                                       "Read failed on", path_));
  }
  return R::Ok(static_cast<std::size_t>(stream_.gcount()));
}

// ---- FileSink ----

FileSink::FileSink(std::string path) : path_(std::move(path)) {}

Result<std::unique_ptr<FileSink>, JobError>
FileSink::create(const std::string &path) {
  using R = Result<std::unique_ptr<FileSink>, JobError>;

  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return R::Err(JobError::from_errno(ErrorCategory::Input, EISDIR,
                                       "Output is a directory", path));
  }

  std::unique_ptr<FileSink> sink(new FileSink(path));
  errno = 0;
  sink->stream_.open(path,
                     std::ios::out | std::ios::binary | std::ios::trunc);
  if (!sink->stream_.is_open()) {
    return R::Err(JobError::from_errno(ErrorCategory::Input,
                                       errno != 0 ? errno : EACCES,
                                       "Cannot create output file", path));
  }
  return R::Ok(std::move(sink));
}

Result<void, JobError> FileSink::write(const std::uint8_t *buf,
                                       std::size_t len) {
  using R = Result<void, JobError>;
  if (finished_) {
    return R::Err(JobError::Internal("write after finish on " + path_));
  }
  if (len == 0) {
    return R::Ok();
  }

  errno = 0;
  stream_.write(reinterpret_cast<const char *>(buf),
                static_cast<std::streamsize>(len));
  if (!stream_) {
    return R::Err(JobError::from_errno(ErrorCategory::Io,
                                       errno != 0 ? errno : EIO,
                                       "Write failed on", path_));
  }
  written_ += len;
  return R::Ok();
}

Result<void, JobError> FileSink::finish() {
  using R = Result<void, JobError>;
  if (finished_) {
    return R::Ok();
  }
  finished_ = true;

  errno = 0;
  stream_.flush();
  stream_.close();
  if (stream_.fail()) {
    return R::Err(JobError::from_errno(ErrorCategory::Io,
                                       errno != 0 ? errno : EIO,
                                       "Flush failed on", path_));
  }
  return R::Ok();
}

} // namespace freya::core
