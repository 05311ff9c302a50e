#ifndef GENEFLOW_CORE_FILE_UTIL_H_
#define GENEFLOW_CORE_FILE_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace geneflow {

absl::StatusOr<std::string> ReadFileToString(const std::string& path);

// Creates missing parent directories. Returns the number of bytes written.
absl::StatusOr<size_t> WriteStringToFile(const std::string& path, const std::string& content);

}  // namespace geneflow

#endif  // GENEFLOW_CORE_FILE_UTIL_H_
