#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace freya::core {

namespace detail {

template <typename T> struct ChannelState {
  std::mutex mutex;
  std::deque<T> queue;
  bool receiver_alive = true;
  std::size_t senders = 0;
};

} // namespace detail

/// Sending half of a channel. Move-only; the producer owns exactly one.
///
/// send() never blocks and never fails observably: once the Receiver is gone
/// the message is discarded.
template <typename T> class Sender {
public:
  Sender() = default;
  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  Sender(const Sender &) = delete;
  Sender &operator=(const Sender &) = delete;

  Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}
  Sender &operator=(Sender &&other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Sender() { release(); }

  void send(T value) const {
    if (!state_) {
      return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->receiver_alive) {
      state_->queue.push_back(std::move(value));
    }
  }

  /// True while the Receiver still exists.
  [[nodiscard]] bool is_connected() const {
    if (!state_) {
      return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_alive;
  }

private:
  void release() {
    if (!state_) {
      return;
    }
    auto state = std::move(state_);
    std::lock_guard<std::mutex> lock(state->mutex);
    --state->senders;
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Receiving half of a channel. Move-only; single consumer.
/// Messages come out in the order they were sent.
template <typename T> class Receiver {
public:
  Receiver() = default;
  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  Receiver(const Receiver &) = delete;
  Receiver &operator=(const Receiver &) = delete;

  Receiver(Receiver &&other) noexcept : state_(std::move(other.state_)) {}
  Receiver &operator=(Receiver &&other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Receiver() { close(); }

  /// Non-blocking. Returns at most one message.
  std::optional<T> try_receive() {
    if (!state_) {
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->queue.empty()) {
      return std::nullopt;
    }
    T value = std::move(state_->queue.front());
    state_->queue.pop_front();
    return value;
  }

  /// Non-blocking. Everything queued right now, oldest first.
  std::vector<T> drain() {
    std::vector<T> out;
    if (!state_) {
      return out;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    out.reserve(state_->queue.size());
    for (auto &v : state_->queue) {
      out.push_back(std::move(v));
    }
    state_->queue.clear();
    return out;
  }

  /// True once every Sender is gone and nothing is left to receive.
  [[nodiscard]] bool is_disconnected() const {
    if (!state_) {
      return true;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->senders == 0 && state_->queue.empty();
  }

  [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

private:
  void close() {
    if (!state_) {
      return;
    }
    auto state = std::move(state_);
    std::lock_guard<std::mutex> lock(state->mutex);
    state->receiver_alive = false;
    state->queue.clear();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Create a fresh channel. One channel per job.
template <typename T> std::pair<Sender<T>, Receiver<T>> make_channel() {
  auto state = std::make_shared<detail::ChannelState<T>>();
  return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace freya::core
