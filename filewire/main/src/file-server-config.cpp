#include "filewire/file-server-config.hpp"

#include <chrono>
#include <limits>
#include <utility>

#include "filewire/invalid_argument_exception.hpp"

namespace filewire {

void FileServerConfig::validate() const {
  if (filePath.empty()) {
    throw invalid_argument("filePath must not be empty");
  }
  if (listenBacklog <= 0) {
    throw invalid_argument("listenBacklog must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw invalid_argument("pollInterval must be > 0");
  }
  // poll(2) takes an int number of milliseconds
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw invalid_argument("Poll interval value is too large");
  }
  transfer.validate();
}

}  // namespace filewire
