/**
 * @file logging.hpp
 * @brief Leveled logging helpers for examples and tests.
 */
#pragma once

#include <atomic>
#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace phaseflow::log {

enum class Level {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

inline std::string_view ToString(Level level) {
  switch (level) {
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
  }
  return "unknown";
}

namespace detail {

inline std::atomic<Level>& threshold() {
  static std::atomic<Level> level{Level::kInfo};
  return level;
}

}  // namespace detail

/** @brief Messages below `level` are dropped. Default is kInfo. */
inline void SetLevel(Level level) {
  detail::threshold().store(level);
}

[[nodiscard]] inline bool Enabled(Level level) {
  return static_cast<int>(level) >= static_cast<int>(detail::threshold().load());
}

template <typename... Args>
inline std::string BuildMessage(Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  return oss.str();
}

inline void Write(Level level, std::string_view message) {
  if (!Enabled(level)) {
    return;
  }
  FILE* stream = (level == Level::kError) ? stderr : stdout;
  std::fprintf(stream, "[%s] %.*s\n",
               ToString(level).data(),
               static_cast<int>(message.size()),
               message.data());
}

template <typename... Args>
inline void Debug(Args&&... args) {
  if (Enabled(Level::kDebug)) {
    Write(Level::kDebug, BuildMessage(std::forward<Args>(args)...));
  }
}

template <typename... Args>
inline void Info(Args&&... args) {
  Write(Level::kInfo, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Warn(Args&&... args) {
  Write(Level::kWarn, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Error(Args&&... args) {
  Write(Level::kError, BuildMessage(std::forward<Args>(args)...));
}

}  // namespace phaseflow::log
