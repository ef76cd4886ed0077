#pragma once

#include "core/controller.h"
#include "core/input.h"

#include <QObject>
#include <QString>
#include <QTimer>

#include <memory>
#include <optional>
#include <string>

namespace freya::core {
class ILogger;
} // namespace freya::core

namespace freya::app {

/// Presenter: thin QObject bridge between the QML window and the core
/// Controller.
///
/// Responsibilities:
///   - Translate QML invocations to abstract input events
///   - Drive Controller::tick via QTimer
///   - Mirror ControllerState into Qt properties
///
/// Does NOT contain business logic; that lives in core.
class Presenter : public QObject {
  Q_OBJECT

  Q_PROPERTY(bool running READ running NOTIFY runningChanged)
  Q_PROPERTY(float progress READ progress NOTIFY progressChanged)
  Q_PROPERTY(bool gaugeVisible READ gaugeVisible NOTIFY progressChanged)
  Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)
  Q_PROPERTY(QString resultText READ resultText NOTIFY resultTextChanged)
  Q_PROPERTY(int levelIndex READ levelIndex NOTIFY levelChanged)
  Q_PROPERTY(QString levelLabel READ levelLabel NOTIFY levelChanged)

public:
  Presenter(std::unique_ptr<core::Controller> controller,
            std::shared_ptr<core::ILogger> logger, QObject *parent = nullptr);

  // ---- Properties ----
  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] float progress() const { return progress_; }
  [[nodiscard]] bool gaugeVisible() const {
    return running_ || progress_ > 0.0f;
  }
  [[nodiscard]] QString statusText() const { return status_text_; }
  [[nodiscard]] QString resultText() const { return result_text_; }
  [[nodiscard]] int levelIndex() const { return level_index_; }
  [[nodiscard]] QString levelLabel() const { return level_label_; }

  /// Result summary of the last finished job, printed by main at exit.
  [[nodiscard]] std::optional<std::string> lastResult() const;

  // ---- QML-invokable methods ----
  Q_INVOKABLE void compressFile();
  Q_INVOKABLE void decompressFile();
  Q_INVOKABLE void raiseLevel();
  Q_INVOKABLE void lowerLevel();
  Q_INVOKABLE void quit();

signals:
  void runningChanged();
  void progressChanged();
  void statusTextChanged();
  void resultTextChanged();
  void levelChanged();

private slots:
  void onTick();

private:
  void post(core::InputEvent event);
  void sync();

  std::unique_ptr<core::Controller> controller_;
  std::shared_ptr<core::ILogger> logger_;
  core::QueuedInputSource input_;

  QTimer *tick_timer_;
  bool in_tick_ = false; // File dialogs spin a nested event loop

  bool running_ = false;
  float progress_ = 0.0f;
  QString status_text_;
  QString result_text_;
  int level_index_ = 1;
  QString level_label_;
};

} // namespace freya::app
