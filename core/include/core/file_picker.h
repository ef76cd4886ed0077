#pragma once

#include <optional>
#include <string>
#include <vector>

namespace freya::core {

/// Named group of glob patterns, e.g. {"Zstandard archives", {"*.zst"}}.
struct FileFilter {
  std::string name;
  std::vector<std::string> patterns;
};

/// Native file dialogs. nullopt always means the user cancelled; it is never
/// an error.
class IFilePicker {
public:
  virtual ~IFilePicker() = default;

  virtual std::optional<std::string>
  pick_existing_file(const std::vector<FileFilter> &filters) = 0;

  virtual std::optional<std::string>
  pick_save_path(const std::string &suggested_name,
                 const std::string &default_dir,
                 const std::vector<FileFilter> &filters) = 0;
};

} // namespace freya::core
