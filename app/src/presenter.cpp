#include "app/presenter.h"
#include "core/logger.h"

#include <QCoreApplication>

#include <cmath>

namespace freya::app {

Presenter::Presenter(std::unique_ptr<core::Controller> controller,
                     std::shared_ptr<core::ILogger> logger, QObject *parent)
    : QObject(parent), controller_(std::move(controller)),
      logger_(std::move(logger)) {
  sync();

  // The controller polls its channel from the UI thread; input arrives
  // through the queue, so each tick never blocks.
  tick_timer_ = new QTimer(this);
  tick_timer_->setInterval(
      static_cast<int>(controller_->config().poll_interval.count()));
  connect(tick_timer_, &QTimer::timeout, this, &Presenter::onTick);
  tick_timer_->start();
}

std::optional<std::string> Presenter::lastResult() const {
  return controller_->state().last_result;
}

void Presenter::compressFile() { post(core::InputEvent::StartCompress); }

void Presenter::decompressFile() { post(core::InputEvent::StartDecompress); }

void Presenter::raiseLevel() { post(core::InputEvent::RaiseLevel); }

void Presenter::lowerLevel() { post(core::InputEvent::LowerLevel); }

void Presenter::quit() { post(core::InputEvent::Quit); }

void Presenter::post(core::InputEvent event) {
  if (logger_) {
    logger_->info("ui", "presenter", "input", core::to_string(event));
  }
  input_.push(event);
}

void Presenter::onTick() {
  if (in_tick_) {
    return;
  }
  in_tick_ = true;
  controller_->tick(input_, std::chrono::milliseconds(0));
  in_tick_ = false;

  sync();

  if (controller_->exit_requested()) {
    tick_timer_->stop();
    QCoreApplication::quit();
  }
}

void Presenter::sync() {
  const core::ControllerState &s = controller_->state();

  if (running_ != s.running) {
    running_ = s.running;
    emit runningChanged();
    emit progressChanged(); // gaugeVisible depends on running
  }

  if (std::abs(progress_ - s.progress) > 0.001f ||
      (s.progress == 0.0f && progress_ != 0.0f)) {
    progress_ = s.progress;
    emit progressChanged();
  }

  const QString status = QString::fromStdString(s.status_text);
  if (status_text_ != status) {
    status_text_ = status;
    emit statusTextChanged();
  }

  const QString result =
      s.last_result ? QString::fromStdString(*s.last_result) : QString();
  if (result_text_ != result) {
    result_text_ = result;
    emit resultTextChanged();
  }

  const int index = static_cast<int>(s.level);
  const QString label = QString::fromUtf8(core::to_string(s.level));
  if (level_index_ != index || level_label_ != label) {
    level_index_ = index;
    level_label_ = label;
    emit levelChanged();
  }
}

} // namespace freya::app
