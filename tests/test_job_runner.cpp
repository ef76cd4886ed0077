#include <gtest/gtest.h>

#include "core/controller.h"
#include "core/job_runner.h"
#include "core/logger.h"
#include "infra/zstd_codec.h"
#include "memory_streams.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace freya::core;
using freya::infra::ZstdCodec;
using freya::test_support::make_payload;

namespace fs = std::filesystem;

namespace {

// ============ Helpers ============

class RecordingLogger : public ILogger {
public:
  void info(const std::string &trace_id, const std::string &,
            const std::string &event, const std::string &) override {
    record(trace_id, event);
  }
  void warn(const std::string &trace_id, const std::string &,
            const std::string &event, const std::string &) override {
    record(trace_id, event);
  }
  void error(const std::string &trace_id, const std::string &,
             const std::string &event, const std::string &) override {
    record(trace_id, event);
  }

  std::vector<std::string> events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

private:
  void record(const std::string &trace_id, const std::string &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(trace_id + ":" + event);
  }

  std::mutex mutex_;
  std::vector<std::string> events_;
};

/// Codec whose encoder blocks until release() is called.
class GatedCodec : public ICodec {
public:
  std::string name() const override { return "gated"; }
  std::string extension() const override { return ".gz"; }

  Result<std::unique_ptr<IByteSink>, JobError>
  open_encoder(IByteSink &sink, CompressionLevel level) override {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      entered_ = true;
      cv_.notify_all();
      cv_.wait(lock, [this]() { return released_; });
    }
    return inner_.open_encoder(sink, level);
  }

  Result<std::unique_ptr<IByteSource>, JobError>
  open_decoder(IByteSource &source) override {
    return inner_.open_decoder(source);
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

  bool wait_entered(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return entered_; });
  }

private:
  ZstdCodec inner_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool entered_ = false;
  bool released_ = false;
};

bool wait_for_event(RecordingLogger &logger, const std::string &event,
                    std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto events = logger.events();
    if (std::find(events.begin(), events.end(), event) != events.end()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return false;
}

/// Poll until the terminal message arrives or the sender disconnects.
std::vector<ProgressMessage>
collect(Receiver<ProgressMessage> &rx,
        std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
  std::vector<ProgressMessage> out;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    while (auto msg = rx.try_receive()) {
      out.push_back(std::move(*msg));
    }
    if (!out.empty() && is_terminal(out.back())) {
      break;
    }
    if (rx.is_disconnected()) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return out;
}

void expect_well_formed(const std::vector<ProgressMessage> &msgs,
                        std::uint64_t total) {
  ASSERT_FALSE(msgs.empty());
  int terminals = 0;
  std::uint64_t prev = 0;
  for (std::size_t i = 0; i < msgs.size(); ++i) {
    if (const auto *p = std::get_if<Progress>(&msgs[i])) {
      EXPECT_EQ(terminals, 0) << "progress after terminal";
      EXPECT_GE(p->bytes_processed, prev);
      EXPECT_EQ(p->total_bytes, total);
      prev = p->bytes_processed;
    } else {
      ++terminals;
    }
  }
  EXPECT_EQ(terminals, 1);
  EXPECT_TRUE(is_terminal(msgs.back()));
}

std::vector<std::uint8_t> read_file(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_file(const fs::path &p, const std::vector<std::uint8_t> &data) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
}

class JobRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() /
           (std::string("freya_runner_") + info->name() + "_" +
            std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir_);
    codec_ = std::make_shared<ZstdCodec>();
    logger_ = std::make_shared<RecordingLogger>();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  std::shared_ptr<ZstdCodec> codec_;
  std::shared_ptr<RecordingLogger> logger_;
};

} // namespace

// ============================================================
// Scenarios
// ============================================================

TEST_F(JobRunnerTest, CompressThenDecompressRestoresContent) {
  const auto payload = make_payload(200000);
  const fs::path input = dir_ / "report.txt";
  const fs::path packed = dir_ / "report.txt.zst";
  const fs::path restored = dir_ / "report.restored.txt";
  write_file(input, payload);

  ThreadJobRunner runner(codec_, logger_);

  auto rx = runner.start(Job{input.string(), packed.string(),
                             Direction::Compress, CompressionLevel::Best});
  const auto compress_msgs = collect(rx);
  expect_well_formed(compress_msgs, 200000);

  const auto *finished = std::get_if<Finished>(&compress_msgs.back());
  ASSERT_NE(finished, nullptr);
  const auto *c = std::get_if<CompressedResult>(&finished->result);
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->original_size, 200000u);
  EXPECT_LT(c->compressed_size, c->original_size);
  EXPECT_EQ(c->compressed_size, fs::file_size(packed));
  EXPECT_EQ(c->output_path, packed.string());
  const auto &last = std::get<Progress>(compress_msgs[compress_msgs.size() - 2]);
  EXPECT_EQ(last.bytes_processed, 200000u);

  auto rx2 = runner.start(Job{packed.string(), restored.string(),
                              Direction::Decompress, CompressionLevel::Fast});
  const auto decompress_msgs = collect(rx2);
  expect_well_formed(decompress_msgs, c->compressed_size);

  const auto *finished2 = std::get_if<Finished>(&decompress_msgs.back());
  ASSERT_NE(finished2, nullptr);
  const auto *d = std::get_if<DecompressedResult>(&finished2->result);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->compressed_size, c->compressed_size);
  EXPECT_EQ(d->decompressed_size, 200000u);
  EXPECT_EQ(read_file(restored), payload);
  const auto &last2 =
      std::get<Progress>(decompress_msgs[decompress_msgs.size() - 2]);
  EXPECT_EQ(last2.bytes_processed, c->compressed_size);

  runner.wait_all();
  const auto events = logger_->events();
  EXPECT_NE(std::find(events.begin(), events.end(), "job-1:job_started"),
            events.end());
  EXPECT_NE(std::find(events.begin(), events.end(), "job-2:job_finished"),
            events.end());
}

TEST_F(JobRunnerTest, EmptyFileCompressesToValidFrame) {
  const fs::path input = dir_ / "empty";
  write_file(input, {});

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{input.string(), (dir_ / "empty.zst").string(),
                             Direction::Compress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u); // No progress for an empty input
  const auto &f = std::get<Finished>(msgs.back());
  const auto &c = std::get<CompressedResult>(f.result);
  EXPECT_EQ(c.original_size, 0u);
  EXPECT_GT(c.compressed_size, 0u);
}

// ============================================================
// Error taxonomy
// ============================================================

TEST_F(JobRunnerTest, MissingInputReportsError) {
  ThreadJobRunner runner(codec_, logger_);
  auto rx = runner.start(Job{(dir_ / "nope.bin").string(),
                             (dir_ / "nope.bin.zst").string(),
                             Direction::Compress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  const auto &failed = std::get<Failed>(msgs[0]);
  EXPECT_NE(failed.message.find("nope.bin"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir_ / "nope.bin.zst"));

  runner.wait_all();
  const auto events = logger_->events();
  EXPECT_NE(std::find(events.begin(), events.end(), "job-1:job_failed"),
            events.end());
}

TEST_F(JobRunnerTest, DirectoryInputReportsError) {
  const fs::path sub = dir_ / "folder";
  fs::create_directories(sub);

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{sub.string(), (dir_ / "folder.zst").string(),
                             Direction::Compress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_NE(std::get<Failed>(msgs[0]).message.find("directory"),
            std::string::npos);
}

TEST_F(JobRunnerTest, UncreatableOutputReportsError) {
  const fs::path input = dir_ / "in.txt";
  write_file(input, make_payload(100));

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{input.string(),
                             (dir_ / "missing_dir" / "out.zst").string(),
                             Direction::Compress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Failed>(msgs[0]));
}

TEST_F(JobRunnerTest, ForeignInputFailsDecompression) {
  const fs::path input = dir_ / "plain.zst";
  write_file(input, make_payload(5000));

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{input.string(), (dir_ / "plain").string(),
                             Direction::Decompress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_EQ(std::get<Failed>(msgs[0]).message,
            "not a zstd stream (bad magic number)");
}

TEST_F(JobRunnerTest, EmptyInputFailsDecompression) {
  const fs::path input = dir_ / "empty.zst";
  write_file(input, {});

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{input.string(), (dir_ / "empty").string(),
                             Direction::Decompress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_EQ(std::get<Failed>(msgs[0]).message,
            "not a zstd stream (input is empty)");
}

TEST_F(JobRunnerTest, RunJobAlwaysSendsOneTerminal) {
  auto channel = make_channel<ProgressMessage>();
  ZstdCodec codec;

  run_job("job-x", Job{(dir_ / "absent").string(), (dir_ / "o").string(),
                       Direction::Compress, CompressionLevel::Normal},
          codec, nullptr, channel.first);

  auto msgs = channel.second.drain();
  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Failed>(msgs[0]));
}

// ============================================================
// Threading contract
// ============================================================

TEST_F(JobRunnerTest, StartReturnsBeforeWorkHappens) {
  const fs::path input = dir_ / "slow.txt";
  write_file(input, make_payload(1000));

  auto gated = std::make_shared<GatedCodec>();
  ThreadJobRunner runner(gated, nullptr);

  auto rx = runner.start(Job{input.string(), (dir_ / "slow.txt.gz").string(),
                             Direction::Compress, CompressionLevel::Normal});

  const bool entered = gated->wait_entered(std::chrono::seconds(10));
  EXPECT_TRUE(entered);
  if (entered) {
    EXPECT_FALSE(rx.try_receive().has_value());
    EXPECT_FALSE(rx.is_disconnected());
    EXPECT_EQ(runner.active_jobs(), 1u);
  }

  gated->release();
  const auto msgs = collect(rx);
  expect_well_formed(msgs, 1000);
  EXPECT_TRUE(std::holds_alternative<Finished>(msgs.back()));

  runner.wait_all();
  EXPECT_EQ(runner.active_jobs(), 0u);
}

TEST_F(JobRunnerTest, DroppedReceiverDoesNotStopJob) {
  const fs::path input = dir_ / "orphan.txt";
  const fs::path output = dir_ / "orphan.txt.zst";
  write_file(input, make_payload(300000));

  ThreadJobRunner runner(codec_, logger_);
  {
    auto rx = runner.start(Job{input.string(), output.string(),
                               Direction::Compress, CompressionLevel::Fast});
  }
  runner.wait_all();

  EXPECT_TRUE(fs::exists(output));
  EXPECT_GT(fs::file_size(output), 0u);
  const auto events = logger_->events();
  EXPECT_NE(std::find(events.begin(), events.end(), "job-1:job_finished"),
            events.end());
}

TEST_F(JobRunnerTest, ConcurrentJobsAreIndependent) {
  std::vector<std::vector<std::uint8_t>> payloads;
  std::vector<Receiver<ProgressMessage>> receivers;

  ThreadJobRunner runner(codec_, nullptr);
  for (int i = 0; i < 4; ++i) {
    payloads.push_back(make_payload(50000 + i * 1000, static_cast<unsigned>(i)));
    const fs::path in = dir_ / ("in" + std::to_string(i));
    write_file(in, payloads.back());
    receivers.push_back(runner.start(Job{in.string(), in.string() + ".zst",
                                         Direction::Compress,
                                         CompressionLevel::Normal}));
  }

  for (int i = 0; i < 4; ++i) {
    const auto msgs = collect(receivers[static_cast<std::size_t>(i)]);
    expect_well_formed(msgs, 50000 + i * 1000);
    const auto &c =
        std::get<CompressedResult>(std::get<Finished>(msgs.back()).result);
    EXPECT_EQ(c.original_size, static_cast<std::uint64_t>(50000 + i * 1000));
  }

  runner.wait_all();
  EXPECT_EQ(runner.active_jobs(), 0u);
}

TEST_F(JobRunnerTest, QuitWhileRunningDoesNotWaitForWorker) {
  const fs::path input = dir_ / "big.txt";
  write_file(input, make_payload(1000));

  auto gated = std::make_shared<GatedCodec>();
  auto runner = std::make_shared<ThreadJobRunner>(gated, logger_);
  Controller controller(runner, nullptr, ".gz");

  ASSERT_TRUE(controller
                  .start(Job{input.string(), (dir_ / "big.txt.gz").string(),
                             Direction::Compress, CompressionLevel::Best})
                  .is_ok());
  if (!gated->wait_entered(std::chrono::seconds(10))) {
    gated->release();
    FAIL() << "worker never reached the codec";
  }

  controller.handle_input(InputEvent::Quit);
  EXPECT_TRUE(controller.exit_requested());
  EXPECT_EQ(controller.state().mode, ControllerMode::Running);

  // The worker is blocked inside the codec; this must return anyway.
  const auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(runner->abandon_all(), 1u);
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds(1));
  EXPECT_EQ(runner->active_jobs(), 0u);
  EXPECT_TRUE(wait_for_event(*logger_, "job-1:job_abandoned",
                             std::chrono::seconds(1)));

  // Let the detached worker run out before the fixture cleans up.
  gated->release();
  EXPECT_TRUE(wait_for_event(*logger_, "job-1:job_finished",
                             std::chrono::seconds(30)));
}

TEST_F(JobRunnerTest, AbandonAllJoinsFinishedJobs) {
  const fs::path input = dir_ / "small.txt";
  write_file(input, make_payload(100));

  ThreadJobRunner runner(codec_, logger_);
  auto rx = runner.start(Job{input.string(), input.string() + ".zst",
                             Direction::Compress, CompressionLevel::Fast});
  const auto msgs = collect(rx);
  ASSERT_TRUE(std::holds_alternative<Finished>(msgs.back()));
  // The terminal message precedes the worker's exit by a hair.
  while (runner.active_jobs() != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  EXPECT_EQ(runner.abandon_all(), 0u);
  const auto events = logger_->events();
  EXPECT_EQ(std::find(events.begin(), events.end(), "job-1:job_abandoned"),
            events.end());
}

// ============================================================
// Output safety
// ============================================================

TEST_F(JobRunnerTest, RejectedArchiveLeavesExistingOutputIntact) {
  const fs::path input = dir_ / "notes.zst";
  const fs::path output = dir_ / "notes.txt";
  write_file(input, make_payload(2000));
  const std::vector<std::uint8_t> keep = {'k', 'e', 'e', 'p'};
  write_file(output, keep);

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{input.string(), output.string(),
                             Direction::Decompress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_EQ(std::get<Failed>(msgs[0]).message,
            "not a zstd stream (bad magic number)");
  EXPECT_EQ(read_file(output), keep);
}

TEST_F(JobRunnerTest, RejectedArchiveCreatesNoOutput) {
  const fs::path input = dir_ / "blob";
  write_file(input, make_payload(2000));

  ThreadJobRunner runner(codec_, nullptr);
  auto rx = runner.start(Job{input.string(), (dir_ / "blob.out").string(),
                             Direction::Decompress, CompressionLevel::Normal});
  const auto msgs = collect(rx);

  ASSERT_EQ(msgs.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Failed>(msgs[0]));
  EXPECT_FALSE(fs::exists(dir_ / "blob.out"));
}

TEST_F(JobRunnerTest, OutputSameAsInputIsRejected) {
  const fs::path input = dir_ / "self.txt";
  const auto payload = make_payload(4000);
  write_file(input, payload);

  ThreadJobRunner runner(codec_, nullptr);
  for (const fs::path &output : {input, dir_ / "." / "self.txt"}) {
    SCOPED_TRACE(output.string());
    auto rx = runner.start(Job{input.string(), output.string(),
                               Direction::Compress, CompressionLevel::Normal});
    const auto msgs = collect(rx);

    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_NE(std::get<Failed>(msgs[0]).message.find("overwrite the input"),
              std::string::npos);
    EXPECT_EQ(read_file(input), payload);
  }
}
