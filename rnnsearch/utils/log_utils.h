#pragma once
#include <spdlog/spdlog.h>

namespace rnnsearch::utils {

// Initialises the default logger to point to stderr.
void InitLogging();

}  // namespace rnnsearch::utils
