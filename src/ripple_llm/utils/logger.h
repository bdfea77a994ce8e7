/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>

#define LOGURU_USE_FMTLIB 1
#define LOGURU_WITH_STREAMS 1
#include "loguru.hpp"

#include "fmt/core.h"

namespace ripple_llm {

// RLLM_LOG_LEVEL is one of DEBUG, INFO, WARNING, ERROR, FATAL. Anything else means INFO.
inline loguru::Verbosity GetLogVerbosity() {
  static const std::unordered_map<std::string, loguru::Verbosity> name_to_verbosity = {
      {"DEBUG", loguru::Verbosity_MAX},
      {"INFO", loguru::Verbosity_INFO},
      {"WARNING", loguru::Verbosity_WARNING},
      {"ERROR", loguru::Verbosity_ERROR},
      {"FATAL", loguru::Verbosity_FATAL}};

  const char* env_log_level = std::getenv("RLLM_LOG_LEVEL");
  if (env_log_level != nullptr) {
    auto it = name_to_verbosity.find(env_log_level);
    if (it != name_to_verbosity.end()) {
      return it->second;
    }
  }
  return loguru::Verbosity_INFO;
}

inline std::string GetLogFile() {
  const char* env_log_file = std::getenv("RLLM_LOG_FILE");
  return env_log_file != nullptr ? env_log_file : "log/ripple_llm.log";
}

// Send all the logs to the log file only. Calling it more than once has no effect.
inline void InitLoguru() {
  static bool initialized = false;
  if (initialized) {
    return;
  }
  initialized = true;

  loguru::Verbosity verbosity = GetLogVerbosity();
  std::string log_file = GetLogFile();
  loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
  loguru::add_file(log_file.c_str(), loguru::Append, verbosity);
  LOG_S(INFO) << fmt::format("ripple_llm logging to {} with verbosity {}.", log_file, static_cast<int>(verbosity));
}

#define RLLM_LOG_DEBUG LOG_S(1)
#define RLLM_LOG_INFO LOG_S(INFO)
#define RLLM_LOG_WARNING LOG_S(WARNING)
#define RLLM_LOG_ERROR LOG_S(ERROR)
#define RLLM_LOG_FATAL LOG_S(FATAL)

[[noreturn]] inline void ThrowRuntimeError(const char* file, int line, const std::string& info) {
  throw std::runtime_error(fmt::format("[RLLM][ERROR] {} ({}:{})", info, file, line));
}

inline uint64_t GetCurrentTimeInMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

#define RLLM_CHECK_WITH_INFO(val, info)                          \
  do {                                                           \
    if (!(val)) {                                                \
      ripple_llm::ThrowRuntimeError(__FILE__, __LINE__, (info)); \
    }                                                            \
  } while (0)

#define RLLM_THROW(info) ripple_llm::ThrowRuntimeError(__FILE__, __LINE__, (info))

}  // namespace ripple_llm
