#include <gpml/logging.h>

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gpml {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> makeDefaultLogger()
{
  std::shared_ptr<spdlog::logger> log;
  try
  {
    log = spdlog::get("gpml");
    if (!log)
      log = spdlog::stderr_color_mt("gpml");
  }
  catch (const spdlog::spdlog_ex&)
  {
    // A sink could not be created (or raced with another registration).
    log = spdlog::default_logger();
  }

  log->set_level(spdlog::level::info);
  if (const char* env = std::getenv("GPML_LOG_LEVEL"))
    log->set_level(spdlog::level::from_str(env));
  return log;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger()
{
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (!current_logger)
    current_logger = makeDefaultLogger();
  return current_logger;
}

void setLogger(std::shared_ptr<spdlog::logger> logger)
{
  std::lock_guard<std::mutex> lock(logger_mutex);
  current_logger = std::move(logger);
}

}  // namespace gpml
