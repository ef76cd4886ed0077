#include "core/controller.h"

#include "core/logger.h"

#include <algorithm>
#include <filesystem>
#include <utility>
#include <variant>

namespace freya::core {

namespace {

constexpr const char *kTrace = "ui";
constexpr const char *kComponent = "controller";

constexpr const char *kIdleStatus =
    "Press 'o' to compress a file or 'd' to decompress one";

std::vector<FileFilter> input_filters(Direction direction,
                                      const std::string &extension) {
  if (direction == Direction::Compress) {
    return {{"All files", {"*"}}};
  }
  return {{"Zstandard archives", {"*" + extension}}, {"All files", {"*"}}};
}

std::vector<FileFilter> output_filters(Direction direction,
                                       const std::string &extension) {
  if (direction == Direction::Compress) {
    return {{"Zstandard archives", {"*" + extension}}, {"All files", {"*"}}};
  }
  return {{"All files", {"*"}}};
}

std::string file_name_of(const std::string &path) {
  return std::filesystem::path(path).filename().string();
}

} // namespace

const char *to_string(ControllerMode mode) {
  switch (mode) {
  case ControllerMode::Idle:
    return "Idle";
  case ControllerMode::Running:
    return "Running";
  case ControllerMode::ShowingResult:
    return "ShowingResult";
  case ControllerMode::ShowingError:
    return "ShowingError";
  }
  return "Unknown";
}

bool is_legal_transition(ControllerMode from, ControllerMode to) {
  switch (from) {
  case ControllerMode::Idle:
    return to == ControllerMode::Running;
  case ControllerMode::Running:
    return to == ControllerMode::Running ||
           to == ControllerMode::ShowingResult ||
           to == ControllerMode::ShowingError;
  case ControllerMode::ShowingResult:
    return to == ControllerMode::Idle || to == ControllerMode::Running;
  case ControllerMode::ShowingError:
    return to == ControllerMode::Running;
  }
  return false;
}

const char *to_string(StartPolicy policy) {
  switch (policy) {
  case StartPolicy::Reject:
    return "reject";
  case StartPolicy::Detach:
    return "detach";
  }
  return "unknown";
}

Controller::Controller(std::shared_ptr<IJobRunner> runner,
                       std::shared_ptr<IFilePicker> picker,
                       std::string extension, ControllerConfig config,
                       std::shared_ptr<ILogger> logger, NowFn now)
    : runner_(std::move(runner)), picker_(std::move(picker)),
      extension_(std::move(extension)), config_(config),
      logger_(std::move(logger)), now_(std::move(now)) {
  state_.level = config_.initial_level;
  state_.status_text = kIdleStatus;
}

void Controller::tick(IInputSource &input,
                      std::chrono::milliseconds input_wait) {
  if (auto event = input.poll(input_wait)) {
    handle_input(*event);
  }
  drain();
  check_dismiss();
}

void Controller::tick(IInputSource &input) {
  tick(input, config_.poll_interval);
}

void Controller::handle_input(InputEvent event) {
  // Any key after a job hides the stale gauge.
  if (state_.mode != ControllerMode::Running && state_.progress > 0.0f) {
    state_.progress = 0.0f;
  }

  switch (event) {
  case InputEvent::Quit:
    exit_requested_ = true;
    log_info("quit_requested", std::string("mode=") + to_string(state_.mode));
    break;
  case InputEvent::RaiseLevel:
  case InputEvent::LowerLevel: {
    if (state_.mode == ControllerMode::Running) {
      break; // Level is locked while a job runs.
    }
    const CompressionLevel next = event == InputEvent::RaiseLevel
                                      ? increase(state_.level)
                                      : decrease(state_.level);
    if (next != state_.level) {
      log_info("level_changed", std::string(to_string(state_.level)) +
                                    " -> " + to_string(next));
      state_.level = next;
    }
    break;
  }
  case InputEvent::StartCompress:
    request_start(Direction::Compress);
    break;
  case InputEvent::StartDecompress:
    request_start(Direction::Decompress);
    break;
  }
}

void Controller::request_start(Direction direction) {
  if (state_.mode == ControllerMode::Running &&
      config_.start_policy == StartPolicy::Reject) {
    state_.status_text = JobError::Busy().message;
    log_warn("start_rejected", "picker not opened while a job is running");
    return;
  }
  if (!picker_) {
    state_.status_text = "No file picker available";
    log_warn("pick_unavailable", "controller has no file picker");
    return;
  }

  auto input = picker_->pick_existing_file(input_filters(direction, extension_));
  if (!input) {
    state_.status_text = "No file selected";
    log_info("pick_cancelled", "input");
    return;
  }

  std::string output = default_output_path(*input, direction, extension_);
  if (config_.ask_output_path) {
    const std::filesystem::path suggested(output);
    auto chosen = picker_->pick_save_path(
        suggested.filename().string(), suggested.parent_path().string(),
        output_filters(direction, extension_));
    if (!chosen) {
      state_.status_text = "No output file selected";
      log_info("pick_cancelled", "output");
      return;
    }
    output = *chosen;
  }

  auto started =
      start(Job{std::move(*input), std::move(output), direction, state_.level});
  if (started.is_err()) {
    state_.status_text = started.error().message;
  }
}

Result<void, JobError> Controller::start(Job job) {
  using R = Result<void, JobError>;

  if (state_.mode == ControllerMode::Running) {
    if (config_.start_policy == StartPolicy::Reject) {
      log_warn("start_rejected", "a job is already running");
      return R::Err(JobError::Busy());
    }
    log_warn("job_detached",
             "previous job keeps running; its messages are dropped");
  }

  if (!transition_to(ControllerMode::Running)) {
    return R::Err(JobError::Internal(std::string("cannot start from ") +
                                     to_string(state_.mode)));
  }

  // Assigning drops the previous Receiver, if any.
  receiver_ = runner_->start(job);

  state_.running = true;
  state_.progress = 0.0f;
  state_.last_result.reset();
  state_.result_shown_at.reset();
  state_.status_text = std::string(job.direction == Direction::Compress
                                       ? "Compressing \""
                                       : "Decompressing \"") +
                       file_name_of(job.input_path) + "\"";
  return R::Ok();
}

void Controller::drain() {
  while (receiver_) {
    auto msg = receiver_->try_receive();
    if (!msg) {
      break;
    }
    apply(std::move(*msg));
  }

  // The producer exited without a terminal message.
  if (receiver_ && receiver_->is_disconnected()) {
    on_failed("job ended without reporting a result");
  }
}

void Controller::apply(ProgressMessage msg) {
  if (const auto *p = std::get_if<Progress>(&msg)) {
    if (p->total_bytes > 0) {
      const double fraction = static_cast<double>(p->bytes_processed) /
                              static_cast<double>(p->total_bytes);
      state_.progress =
          static_cast<float>(std::clamp(fraction, 0.0, 1.0));
    }
    return;
  }
  if (const auto *f = std::get_if<Finished>(&msg)) {
    on_finished(*f);
    return;
  }
  on_failed(std::get<Failed>(msg).message);
}

void Controller::on_finished(const Finished &finished) {
  receiver_.reset();
  transition_to(ControllerMode::ShowingResult);

  const bool compressed =
      std::holds_alternative<CompressedResult>(finished.result);
  state_.running = false;
  state_.progress = 1.0f;
  state_.status_text =
      compressed ? "Compression complete!" : "Decompression complete!";
  state_.last_result = describe(finished);
  state_.result_shown_at = now_();
}

void Controller::on_failed(const std::string &message) {
  receiver_.reset();
  transition_to(ControllerMode::ShowingError);

  state_.running = false;
  state_.progress = 0.0f;
  state_.status_text = "Error: " + message;
  state_.result_shown_at.reset();
}

void Controller::check_dismiss() {
  if (state_.mode != ControllerMode::ShowingResult ||
      !state_.result_shown_at) {
    return;
  }
  if (now_() - *state_.result_shown_at < config_.result_dismiss_after) {
    return;
  }

  transition_to(ControllerMode::Idle);
  state_.result_shown_at.reset();
  state_.status_text = kIdleStatus;
  if (config_.exit_after_result) {
    exit_requested_ = true;
  }
  log_info("result_dismissed",
           config_.exit_after_result ? "exit requested" : "back to idle");
}

bool Controller::transition_to(ControllerMode next) {
  if (!is_legal_transition(state_.mode, next)) {
    if (logger_) {
      logger_->error(kTrace, kComponent, "illegal_transition",
                     std::string(to_string(state_.mode)) + " -> " +
                         to_string(next));
    }
    return false;
  }
  state_.mode = next;
  return true;
}

void Controller::log_info(const std::string &event, const std::string &msg) {
  if (logger_) {
    logger_->info(kTrace, kComponent, event, msg);
  }
}

void Controller::log_warn(const std::string &event, const std::string &msg) {
  if (logger_) {
    logger_->warn(kTrace, kComponent, event, msg);
  }
}

} // namespace freya::core
