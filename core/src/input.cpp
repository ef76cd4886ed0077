#include "core/input.h"

namespace freya::core {

const char *to_string(InputEvent event) {
  switch (event) {
  case InputEvent::Quit:
    return "Quit";
  case InputEvent::RaiseLevel:
    return "RaiseLevel";
  case InputEvent::LowerLevel:
    return "LowerLevel";
  case InputEvent::StartCompress:
    return "StartCompress";
  case InputEvent::StartDecompress:
    return "StartDecompress";
  }
  return "Unknown";
}

void QueuedInputSource::push(InputEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }
  cv_.notify_one();
}

std::optional<InputEvent>
QueuedInputSource::poll(std::chrono::milliseconds max_wait) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (events_.empty() && max_wait.count() > 0) {
    cv_.wait_for(lock, max_wait, [this]() { return !events_.empty(); });
  }
  if (events_.empty()) {
    return std::nullopt;
  }
  InputEvent event = events_.front();
  events_.pop_front();
  return event;
}

bool QueuedInputSource::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.empty();
}

} // namespace freya::core
