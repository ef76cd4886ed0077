#pragma once

#include "core/compression_level.h"
#include "core/file_picker.h"
#include "core/input.h"
#include "core/job.h"
#include "core/job_error.h"
#include "core/job_runner.h"
#include "core/progress_channel.h"
#include "core/progress_message.h"
#include "core/result.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace freya::core {

class ILogger;

// ---- Controller modes ----

enum class ControllerMode {
  Idle,          // Nothing running, nothing pending
  Running,       // A job's channel is being drained
  ShowingResult, // Finished; auto-dismiss timer pending
  ShowingError   // Failed; waits for the next user action
};

const char *to_string(ControllerMode mode);

/// Legal transitions:
///   Idle          -> Running
///   Running       -> Running (Detach policy), ShowingResult, ShowingError
///   ShowingResult -> Idle, Running
///   ShowingError  -> Running
bool is_legal_transition(ControllerMode from, ControllerMode to);

/// What start() does while a job is Running.
enum class StartPolicy {
  Reject, // Fail fast with ErrorCategory::Busy
  Detach  // Drop the old channel; the old job finishes unobserved
};

const char *to_string(StartPolicy policy);

struct ControllerConfig {
  std::chrono::milliseconds poll_interval{50};
  std::chrono::milliseconds result_dismiss_after{2000};
  CompressionLevel initial_level = CompressionLevel::Normal;
  StartPolicy start_policy = StartPolicy::Reject;
  bool exit_after_result = true; // Raise exit_requested() on dismissal
  bool ask_output_path = false;  // Offer the save dialog after picking input
};

/// Read-only snapshot for the presentation surface.
struct ControllerState {
  using TimePoint = std::chrono::steady_clock::time_point;

  ControllerMode mode = ControllerMode::Idle;
  bool running = false;
  float progress = 0.0f; // [0, 1]
  std::string status_text;
  std::optional<std::string> last_result;
  std::optional<TimePoint> result_shown_at;
  CompressionLevel level = CompressionLevel::Normal;
};

/// Foreground state machine. Single-threaded: every method must be called
/// from the same thread. The only link to running jobs is the Receiver of
/// the current job's channel, which the controller owns exclusively.
class Controller {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using NowFn = std::function<TimePoint()>;

  /// `extension` is the codec's output extension, used for default naming.
  Controller(std::shared_ptr<IJobRunner> runner,
             std::shared_ptr<IFilePicker> picker, std::string extension,
             ControllerConfig config = {},
             std::shared_ptr<ILogger> logger = nullptr,
             NowFn now = &Clock::now);

  /// One iteration of the poll loop:
  ///   (a) wait up to `input_wait` for one input event and dispatch it,
  ///   (b) drain the current channel completely,
  ///   (c) dismiss a result whose timer has elapsed.
  void tick(IInputSource &input, std::chrono::milliseconds input_wait);

  /// tick() with the configured poll interval as the input wait.
  void tick(IInputSource &input);

  /// Key-handling rules. Quit works everywhere; level changes are ignored
  /// while Running; starts go through the file picker and start().
  void handle_input(InputEvent event);

  /// Launch `job`. Under StartPolicy::Reject this fails with Busy while a
  /// job is Running; under Detach the previous channel is dropped.
  Result<void, JobError> start(Job job);

  /// Apply every queued message of the current job.
  void drain();

  [[nodiscard]] const ControllerState &state() const noexcept {
    return state_;
  }
  [[nodiscard]] const ControllerConfig &config() const noexcept {
    return config_;
  }
  [[nodiscard]] bool exit_requested() const noexcept {
    return exit_requested_;
  }
  [[nodiscard]] bool has_channel() const noexcept {
    return receiver_.has_value();
  }

private:
  void request_start(Direction direction);
  void apply(ProgressMessage msg);
  void on_finished(const Finished &finished);
  void on_failed(const std::string &message);
  void check_dismiss();
  bool transition_to(ControllerMode next);
  void log_info(const std::string &event, const std::string &msg);
  void log_warn(const std::string &event, const std::string &msg);

  std::shared_ptr<IJobRunner> runner_;
  std::shared_ptr<IFilePicker> picker_;
  std::string extension_;
  ControllerConfig config_;
  std::shared_ptr<ILogger> logger_;
  NowFn now_;

  ControllerState state_;
  std::optional<Receiver<ProgressMessage>> receiver_;
  bool exit_requested_ = false;
};

} // namespace freya::core
