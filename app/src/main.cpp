#include "app/presenter.h"
#include "app/qt_file_picker.h"
#include "core/controller.h"
#include "core/job_runner.h"
#include "core/logger.h"
#include "infra/config.h"
#include "infra/logger.h"
#include "infra/zstd_codec.h"

#include <QApplication>
#include <QCoreApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char *argv[]) {
  // QApplication rather than QGuiApplication: QFileDialog needs widgets.
  QApplication qtapp(argc, argv);
  QQuickStyle::setStyle("Basic");

  auto logger = freya::infra::create_console_logger(
      freya::infra::AppConfig::log_level_from_environment());
  auto logger_ptr = std::shared_ptr<freya::core::ILogger>(logger.release());

  const auto config = freya::infra::AppConfig::from_environment(logger_ptr);
  logger_ptr->info(
      "startup", "app", "config",
      std::string("level=") + freya::core::to_string(config.controller.initial_level) +
          " start_policy=" + freya::core::to_string(config.controller.start_policy) +
          " poll_ms=" + std::to_string(config.controller.poll_interval.count()) +
          " dismiss_ms=" +
          std::to_string(config.controller.result_dismiss_after.count()));

  auto codec = std::make_shared<freya::infra::ZstdCodec>();
  auto runner = std::make_shared<freya::core::ThreadJobRunner>(codec, logger_ptr);
  auto picker = std::make_shared<freya::app::QtFilePicker>();

  auto controller = std::make_unique<freya::core::Controller>(
      runner, picker, codec->extension(), config.controller, logger_ptr);
  auto *presenter = new freya::app::Presenter(std::move(controller), logger_ptr,
                                              &qtapp);

  QQmlApplicationEngine engine;
  engine.rootContext()->setContextProperty("presenter", presenter);

  const QUrl url(QStringLiteral("qrc:/qml/main.qml"));
  QObject::connect(
      &engine, &QQmlApplicationEngine::objectCreated, &qtapp,
      [url](QObject *obj, const QUrl &objUrl) {
        if (!obj && url == objUrl) {
          QCoreApplication::exit(-1);
        }
      },
      Qt::QueuedConnection);
  engine.load(url);

  const int rc = qtapp.exec();

  // Jobs cannot be cancelled. Quitting mid-job leaves them behind instead
  // of blocking here until they finish.
  const std::size_t abandoned = runner->abandon_all();
  if (auto result = presenter->lastResult()) {
    std::cout << *result << std::endl;
  }
  if (abandoned > 0) {
    // Skip static destructors while detached workers may still log.
    std::cout.flush();
    std::quick_exit(rc);
  }
  return rc;
}
