#include "upgate/util/logging.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace upgate::util {

namespace {

constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

}  // namespace

Result<void> setupLogging(const LogOptions& options) {
  auto level = spdlog::level::from_str(options.level);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  if (options.quiet) {
    console_sink->set_level(spdlog::level::err);
  } else if (options.verbose) {
    console_sink->set_level(spdlog::level::debug);
  } else {
    console_sink->set_level(spdlog::level::warn);
  }

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  Result<void> result;

  if (!options.file.empty()) {
    try {
      std::error_code ec;
      std::filesystem::create_directories(options.file.parent_path(), ec);
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file.string(), kMaxLogFileSize, kMaxLogFiles);
      file_sink->set_level(level);
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
      result = std::unexpected(makeError(ErrorCode::kFileWriteError,
                                         "Failed to open log file: " + std::string(e.what())));
    }
  }

  auto logger = std::make_shared<spdlog::logger>("upgate", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  logger->set_level(options.verbose ? spdlog::level::debug : std::min(level, spdlog::level::info));
  spdlog::set_default_logger(logger);

  if (!result.has_value()) {
    spdlog::warn("{}", result.error().message());
  }
  return result;
}

}  // namespace upgate::util
