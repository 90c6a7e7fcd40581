#include "util/LoggingUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

namespace {

const char* line_pattern(const Logging::Params& params) {
  return params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";
}

std::vector<spdlog::sink_ptr> make_sinks(const Logging::Params& params) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    bool truncate = !params.append_mode;
    sinks.push_back(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, truncate));
  }
  for (auto& sink : sinks) {
    sink->set_pattern(line_pattern(params));
  }
  return sinks;
}

}  // namespace

void Logging::init(const Params& params) {
  std::vector<spdlog::sink_ptr> sinks = make_sinks(params);
  spdlog::set_default_logger(
    std::make_shared<spdlog::logger>("turnarena", sinks.begin(), sinks.end()));

  // Level filtering happens at compile time via SPDLOG_ACTIVE_LEVEL.
  spdlog::set_level(spdlog::level::trace);
  spdlog::flush_on(spdlog::level::debug);
}

}  // namespace util
