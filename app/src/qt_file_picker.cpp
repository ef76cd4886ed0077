#include "app/qt_file_picker.h"

#include <QDir>
#include <QFileDialog>
#include <QStringList>

namespace freya::app {

namespace {

// "Zstandard archives (*.zst);;All files (*)"
QString to_qt_filter(const std::vector<core::FileFilter> &filters) {
  QStringList parts;
  for (const auto &f : filters) {
    QStringList patterns;
    for (const auto &p : f.patterns) {
      patterns << QString::fromStdString(p);
    }
    parts << QString("%1 (%2)")
                 .arg(QString::fromStdString(f.name))
                 .arg(patterns.join(' '));
  }
  return parts.join(";;");
}

std::optional<std::string> to_result(const QString &path) {
  if (path.isEmpty()) {
    return std::nullopt;
  }
  return QDir::toNativeSeparators(path).toStdString();
}

} // namespace

std::optional<std::string>
QtFilePicker::pick_existing_file(const std::vector<core::FileFilter> &filters) {
  return to_result(QFileDialog::getOpenFileName(
      nullptr, QObject::tr("Select a file"), QString(), to_qt_filter(filters)));
}

std::optional<std::string>
QtFilePicker::pick_save_path(const std::string &suggested_name,
                             const std::string &default_dir,
                             const std::vector<core::FileFilter> &filters) {
  const QString start =
      QDir(QString::fromStdString(default_dir))
          .filePath(QString::fromStdString(suggested_name));
  return to_result(QFileDialog::getSaveFileName(
      nullptr, QObject::tr("Save as"), start, to_qt_filter(filters)));
}

} // namespace freya::app
