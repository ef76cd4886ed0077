#include "core/job_runner.h"

#include "core/file_stream.h"
#include "core/logger.h"
#include "core/transform_engine.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

namespace freya::core {

namespace {

constexpr const char *kComponent = "job_runner";

using Clock = std::chrono::steady_clock;

Result<Finished, JobError> execute(const Job &job, ICodec &codec,
                                   const Sender<ProgressMessage> &tx) {
  using R = Result<Finished, JobError>;

  auto input = FileSource::open(job.input_path);
  if (input.is_err()) {
    return R::Err(std::move(input).error());
  }
  auto source = std::move(input).value();
  const std::uint64_t total_bytes = source->size();

  // Writing over the input would truncate it before it is read.
  std::error_code same_ec;
  if (std::filesystem::equivalent(job.input_path, job.output_path, same_ec) &&
      !same_ec) {
    return R::Err(JobError(ErrorCategory::Input, 0,
                           "Output would overwrite the input file '" +
                               job.output_path + "'",
                           {{"path", job.output_path}}));
  }

  // Created only once the engine has accepted the input.
  std::unique_ptr<FileSink> sink;
  auto open_sink = [&job, &sink]() -> Result<IByteSink *, JobError> {
    auto output = FileSink::create(job.output_path);
    if (output.is_err()) {
      return Result<IByteSink *, JobError>::Err(std::move(output).error());
    }
    sink = std::move(output).value();
    return Result<IByteSink *, JobError>::Ok(sink.get());
  };

  TransformEngine engine(codec);
  auto stats = engine.run(job.direction, *source, open_sink, job.level,
                          total_bytes,
                          [&tx](const Progress &p) { tx.send(p); });
  if (stats.is_err()) {
    return R::Err(std::move(stats).error());
  }

  // The engine has finished the sink, so the size on disk is final.
  std::error_code ec;
  const std::uint64_t output_size =
      std::filesystem::file_size(job.output_path, ec);
  if (ec) {
    return R::Err(JobError::from_errno(ErrorCategory::Io, ec.value(),
                                       "Cannot query size of",
                                       job.output_path));
  }

  Finished finished;
  if (job.direction == Direction::Compress) {
    finished.result =
        CompressedResult{total_bytes, output_size, job.output_path};
  } else {
    finished.result =
        DecompressedResult{total_bytes, output_size, job.output_path};
  }
  return R::Ok(std::move(finished));
}

std::string sizes_of(const Finished &f) {
  if (const auto *c = std::get_if<CompressedResult>(&f.result)) {
    return "original=" + std::to_string(c->original_size) +
           " compressed=" + std::to_string(c->compressed_size);
  }
  const auto &d = std::get<DecompressedResult>(f.result);
  return "compressed=" + std::to_string(d.compressed_size) +
         " decompressed=" + std::to_string(d.decompressed_size);
}

} // namespace

void run_job(const std::string &job_id, const Job &job, ICodec &codec,
             ILogger *logger, const Sender<ProgressMessage> &tx) {
  const auto started = Clock::now();
  if (logger) {
    logger->info(job_id, kComponent, "job_started",
                 std::string(to_string(job.direction)) + " " +
                     job.input_path + " -> " + job.output_path +
                     " codec=" + codec.name() +
                     " level=" + to_string(job.level));
  }

  // Outermost scope of the job: whatever happens becomes one terminal
  // message.
  try {
    auto result = execute(job, codec, tx);
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                              started)
            .count();
    if (result.is_ok()) {
      if (logger) {
        logger->info(job_id, kComponent, "job_finished",
                     sizes_of(result.value()) +
                         " duration_ms=" + std::to_string(elapsed_ms));
      }
      tx.send(std::move(result).value());
    } else {
      const auto &err = result.error();
      if (logger) {
        logger->error(job_id, kComponent, "job_failed",
                      std::string("category=") + to_string(err.category) +
                          " " + err.message);
      }
      tx.send(Failed{err.message});
    }
  } catch (const std::exception &e) {
    if (logger) {
      logger->error(job_id, kComponent, "job_failed",
                    std::string("exception: ") + e.what());
    }
    tx.send(Failed{e.what()});
  } catch (...) {
    if (logger) {
      logger->error(job_id, kComponent, "job_failed", "unknown exception");
    }
    tx.send(Failed{"unknown error"});
  }
}

ThreadJobRunner::ThreadJobRunner(std::shared_ptr<ICodec> codec,
                                 std::shared_ptr<ILogger> logger)
    : codec_(std::move(codec)), logger_(std::move(logger)) {}

ThreadJobRunner::~ThreadJobRunner() { wait_all(); }

Receiver<ProgressMessage> ThreadJobRunner::start(Job job) {
  auto channel = make_channel<ProgressMessage>();

  std::lock_guard<std::mutex> lock(mutex_);
  reap_locked();

  Worker worker;
  worker.job_id = "job-" + std::to_string(next_id_++);
  worker.done = std::make_shared<std::atomic<bool>>(false);

  // The sending half moves into the thread and dies with it.
  worker.thread =
      std::thread([job = std::move(job), job_id = worker.job_id,
                   codec = codec_, logger = logger_,
                   tx = std::move(channel.first), done = worker.done]() {
        run_job(job_id, job, *codec, logger.get(), tx);
        done->store(true, std::memory_order_release);
      });

  workers_.push_back(std::move(worker));
  return std::move(channel.second);
}

std::size_t ThreadJobRunner::active_jobs() {
  std::lock_guard<std::mutex> lock(mutex_);
  reap_locked();
  return workers_.size();
}

void ThreadJobRunner::wait_all() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto &w : workers) {
    if (w.thread.joinable()) {
      w.thread.join();
    }
  }
}

std::size_t ThreadJobRunner::abandon_all() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();
    workers.swap(workers_);
  }
  for (auto &w : workers) {
    if (logger_) {
      logger_->warn(w.job_id, kComponent, "job_abandoned",
                    "still running at exit; output may be incomplete");
    }
    if (w.thread.joinable()) {
      w.thread.detach();
    }
  }
  return workers.size();
}

void ThreadJobRunner::reap_locked() {
  auto it = workers_.begin();
  while (it != workers_.end()) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace freya::core
