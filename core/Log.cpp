#include "Log.hpp"

#include "core/Config.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;
static std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> s_RecentSink;

void Init(const char *logFile) {
  if (s_Logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  // Console sink with color
  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  // File sink
  auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      logFile ? logFile : cfg::kLogFile, true);
  fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
  sinks.push_back(fileSink);

  // Recent messages, readable back by tests and the runner
  s_RecentSink =
      std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(cfg::kLogRingSize);
  s_RecentSink->set_pattern("[%l] %v");
  sinks.push_back(s_RecentSink);

  s_Logger =
      std::make_shared<spdlog::logger>(cfg::kLoggerName, sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logging initialized");
}

void Shutdown() {
  s_RecentSink.reset();
  s_Logger.reset();
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  if (!s_Logger) {
    Init();
  }
  return s_Logger;
}

std::vector<std::string> GetRecentMessages() {
  if (!s_RecentSink) {
    return {};
  }
  return s_RecentSink->last_formatted();
}

int CountRecent(const std::string &needle) {
  int count = 0;
  for (const auto &msg : GetRecentMessages()) {
    if (msg.find(needle) != std::string::npos) {
      ++count;
    }
  }
  return count;
}

void ClearRecent() {
  if (!s_Logger) {
    return;
  }
  // ringbuffer_sink has no clear(); swap in a fresh one.
  auto &sinks = s_Logger->sinks();
  for (auto &sink : sinks) {
    if (sink == s_RecentSink) {
      s_RecentSink =
          std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(cfg::kLogRingSize);
      s_RecentSink->set_pattern("[%l] %v");
      sink = s_RecentSink;
      break;
    }
  }
}

} // namespace Log
