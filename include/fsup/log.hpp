/**
 * @file log.hpp
 * @brief Lightweight synchronous logging with compile-time and runtime filtering.
 *
 * Output format (stderr):
 *   [2024-01-01 12:00:00.123] [WARN] [Supervisor] worker 'rapl' blocked (file.hpp:42)
 *
 * Compile-time gate: FSUP_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF).
 * Runtime gate: log::SetLevel().
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FSUP_LOG_HPP_
#define FSUP_LOG_HPP_

#include "fsup/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(FSUP_PLATFORM_LINUX) || defined(FSUP_PLATFORM_MACOS)
#include <sys/time.h>
#endif

#ifndef FSUP_LOG_MIN_LEVEL
#ifdef NDEBUG
#define FSUP_LOG_MIN_LEVEL 1
#else
#define FSUP_LOG_MIN_LEVEL 0
#endif
#endif

namespace fsup {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      break;
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(FSUP_PLATFORM_LINUX) || defined(FSUP_PLATFORM_MACOS)
  struct timeval tv;
  (void)gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  const time_t sec = tv.tv_sec;
  (void)localtime_r(&sec, &tm_buf);
  const size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld", static_cast<long>(tv.tv_usec / 1000));
#else
  const time_t sec = std::time(nullptr);
  (void)std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", std::localtime(&sec));
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// Parse "debug" / "info" / "warn" / "error" / "fatal" / "off" (case-insensitive).
inline bool ParseLevel(const char* str, Level* out) noexcept {
  if (str == nullptr || out == nullptr) return false;
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  for (const auto& entry : kNames) {
    if (::fsup::detail::CaseEqual(str, entry.name)) {
      *out = entry.level;
      return true;
    }
  }
  return false;
}

inline void Init() noexcept { detail::InitializedRef().store(true, std::memory_order_release); }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts, detail::LevelTag(level), category,
                     msg, detail::Basename(file), line);
#endif

  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);

  if (level == Level::kFatal) {
    std::abort();
  }
}

}  // namespace log
}  // namespace fsup

// ============================================================================
// Macros
// ============================================================================

#define FSUP_LOG_DEBUG(cat, fmt, ...)                                         \
  do {                                                                        \
    if (FSUP_LOG_MIN_LEVEL <= 0) {                                            \
      ::fsup::log::LogWrite(::fsup::log::Level::kDebug, cat, __FILE__,        \
                            __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                         \
  } while (0)

#define FSUP_LOG_INFO(cat, fmt, ...)                                          \
  do {                                                                        \
    if (FSUP_LOG_MIN_LEVEL <= 1) {                                            \
      ::fsup::log::LogWrite(::fsup::log::Level::kInfo, cat, __FILE__,         \
                            __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                         \
  } while (0)

#define FSUP_LOG_WARN(cat, fmt, ...)                                          \
  do {                                                                        \
    if (FSUP_LOG_MIN_LEVEL <= 2) {                                            \
      ::fsup::log::LogWrite(::fsup::log::Level::kWarn, cat, __FILE__,         \
                            __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                         \
  } while (0)

#define FSUP_LOG_ERROR(cat, fmt, ...)                                         \
  do {                                                                        \
    if (FSUP_LOG_MIN_LEVEL <= 3) {                                            \
      ::fsup::log::LogWrite(::fsup::log::Level::kError, cat, __FILE__,        \
                            __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                         \
  } while (0)

#define FSUP_LOG_FATAL(cat, fmt, ...)                                         \
  do {                                                                        \
    ::fsup::log::LogWrite(::fsup::log::Level::kFatal, cat, __FILE__,          \
                          __LINE__, fmt, ##__VA_ARGS__);                      \
  } while (0)

#endif  // FSUP_LOG_HPP_
