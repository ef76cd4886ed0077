#pragma once

#include "core/file_picker.h"

namespace freya::app {

/// IFilePicker over QFileDialog's native static dialogs. Must be called
/// from the GUI thread.
class QtFilePicker final : public core::IFilePicker {
public:
  std::optional<std::string>
  pick_existing_file(const std::vector<core::FileFilter> &filters) override;

  std::optional<std::string>
  pick_save_path(const std::string &suggested_name,
                 const std::string &default_dir,
                 const std::vector<core::FileFilter> &filters) override;
};

} // namespace freya::app
