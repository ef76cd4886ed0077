#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace freya::core {

/// Abstract user intents, independent of key bindings.
enum class InputEvent {
  Quit,
  RaiseLevel,
  LowerLevel,
  StartCompress,
  StartDecompress
};

const char *to_string(InputEvent event);

/// Where the controller gets its input from.
class IInputSource {
public:
  virtual ~IInputSource() = default;

  /// Wait at most `max_wait` for one event.
  virtual std::optional<InputEvent> poll(std::chrono::milliseconds max_wait) = 0;
};

/// Thread-safe FIFO of input events. push() may be called from any thread.
class QueuedInputSource final : public IInputSource {
public:
  void push(InputEvent event);

  std::optional<InputEvent> poll(std::chrono::milliseconds max_wait) override;

  [[nodiscard]] bool empty() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<InputEvent> events_;
};

} // namespace freya::core
