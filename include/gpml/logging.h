#ifndef GPML_LOGGING_H_
#define GPML_LOGGING_H_

#include <memory>

#include <spdlog/spdlog.h>

namespace gpml {

/// Shared "gpml" logger. Created on first use on a colored stderr sink; the
/// level is taken from GPML_LOG_LEVEL when set, info otherwise.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger, e.g. to route diagnostics into a host sink.
/// Passing nullptr restores the lazily created default.
void setLogger(std::shared_ptr<spdlog::logger> logger);

}  // namespace gpml

#endif  // GPML_LOGGING_H_
