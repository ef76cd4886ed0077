#pragma once

#include "core/codec.h"
#include "core/job.h"
#include "core/progress_channel.h"
#include "core/progress_message.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace freya::core {

class ILogger;

/// Runs transform jobs off the caller's thread.
///
/// start() hands back the receiving end of a fresh channel. The job's
/// execution context owns the sending end and sends zero or more Progress
/// messages followed by exactly one Finished or Failed.
class IJobRunner {
public:
  virtual ~IJobRunner() = default;

  /// Launch `job` and return immediately, before any I/O happens.
  virtual Receiver<ProgressMessage> start(Job job) = 0;

  /// Number of executions that have not yet exited.
  [[nodiscard]] virtual std::size_t active_jobs() = 0;
};

/// One std::thread per job.
///
/// Join contract: the runner owns every thread it spawns. Exited threads
/// are joined on the next start()/active_jobs(); wait_all() and the
/// destructor join everything that is left. At process exit the owner may
/// call abandon_all() instead, which detaches jobs still running. A job
/// whose Receiver has been dropped keeps running to completion and its
/// messages are discarded.
/// There is no cancellation.
///
/// The codec is shared by all workers and must be safe to call
/// concurrently.
class ThreadJobRunner final : public IJobRunner {
public:
  ThreadJobRunner(std::shared_ptr<ICodec> codec,
                  std::shared_ptr<ILogger> logger);
  ~ThreadJobRunner() override;

  ThreadJobRunner(const ThreadJobRunner &) = delete;
  ThreadJobRunner &operator=(const ThreadJobRunner &) = delete;

  Receiver<ProgressMessage> start(Job job) override;
  [[nodiscard]] std::size_t active_jobs() override;

  /// Block until every spawned job has exited.
  void wait_all();

  /// Join exited jobs and detach the ones still running, logging
  /// `job_abandoned` for each. Returns the number detached. Only for use
  /// right before the process exits: a detached job keeps writing its
  /// output until the process ends.
  std::size_t abandon_all();

private:
  struct Worker {
    std::string job_id;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_locked();

  std::shared_ptr<ICodec> codec_;
  std::shared_ptr<ILogger> logger_;

  std::mutex mutex_;
  std::vector<Worker> workers_;
  std::uint64_t next_id_ = 1;
};

/// Body of one job: open, transform, size, report. Always sends exactly
/// one terminal message through `tx`. Exposed for tests.
void run_job(const std::string &job_id, const Job &job, ICodec &codec,
             ILogger *logger, const Sender<ProgressMessage> &tx);

} // namespace freya::core
