#include "core/job_error.h"

#include <system_error>

namespace freya::core {

JobError JobError::from_errno(ErrorCategory cat, int err,
                              const std::string &what,
                              const std::string &path) {
  std::string msg = what + " '" + path + "'";
  if (err != 0) {
    msg += ": ";
    msg += std::generic_category().message(err);
  }
  return JobError(cat, err, std::move(msg), {{"path", path}});
}

} // namespace freya::core
