/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 日志相关函数
 */

#ifndef EXT4SHIM_SRC_INCLUDE_KERNEL_LOG_HPP_
#define EXT4SHIM_SRC_INCLUDE_KERNEL_LOG_HPP_

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdio>
#include <source_location>
#include <utility>

#include "project_config.h"
#include "spinlock.hpp"

namespace klog {

enum LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kErr,
  kLogLevelMax,
};

/// 日志输出函数，参数为一条完整的、以 '\0' 结尾的日志
using Sink = void (*)(LogLevel level, const char* message);

namespace detail {

// 日志专用的自旋锁实例
inline SpinLock log_lock("klog");

/// 单条日志最大长度
inline constexpr size_t kLogBufferSize = 512;

/// ANSI 转义码，在支持 ANSI 转义码的终端中可以显示颜色
static constexpr const auto kReset = "\033[0m";
static constexpr const auto kRed = "\033[31m";
static constexpr const auto kYellow = "\033[33m";
static constexpr const auto kMagenta = "\033[35m";
static constexpr const auto kCyan = "\033[36m";

constexpr std::array<const char*, kLogLevelMax> kLogColors = {
    // kDebug
    detail::kMagenta,
    // kInfo
    detail::kCyan,
    // kWarn
    detail::kYellow,
    // kErr
    detail::kRed,
};

constexpr std::array<const char*, kLogLevelMax> kLogTags = {
    "DEBUG",
    "INFO",
    "WARN",
    "ERR",
};

inline void StderrSink(LogLevel /*level*/, const char* message) {
  std::fputs(message, stderr);
}

inline std::atomic<Sink> sink{&StderrSink};
inline std::atomic<int> min_level{kDebug};

/// 追加格式化内容，返回新的长度（不超过缓冲区容量）
template <typename... Args>
auto Append(std::array<char, kLogBufferSize>& buf, size_t len, Args&&... args)
    -> size_t {
  if (len >= buf.size() - 1) {
    return len;
  }
/// @todo 解决警告
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-security"
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
  int written = std::snprintf(buf.data() + len, buf.size() - len,
                              std::forward<Args>(args)...);
#pragma GCC diagnostic pop
  if (written < 0) {
    return len;
  }
  len += static_cast<size_t>(written);
  return len < buf.size() - 1 ? len : buf.size() - 1;
}

template <LogLevel Level, typename... Args>
struct LogBase {
  explicit LogBase(Args&&... args,
                   [[maybe_unused]] const std::source_location& location =
                       std::source_location::current()) {
    if constexpr (Level == kDebug && !kExt4ShimDebugLog) {
      return;
    }
    if (Level < min_level.load(std::memory_order_relaxed)) {
      return;
    }
    std::array<char, kLogBufferSize> buf{};
    size_t len = Append(buf, 0, "%s[%s]", kLogColors[Level], kLogTags[Level]);
    if constexpr (Level == kDebug) {
      len = Append(buf, len, "[%s] ", location.function_name());
    }
    len = Append(buf, len, std::forward<Args>(args)...);
    (void)Append(buf, len, "%s", detail::kReset);

    LockGuard<SpinLock> lock_guard(log_lock);
    sink.load(std::memory_order_acquire)(Level, buf.data());
  }
};

}  // namespace detail

template <typename... Args>
struct Debug : public detail::LogBase<kDebug, Args...> {
  explicit Debug(Args&&... args, const std::source_location& location =
                                     std::source_location::current())
      : detail::LogBase<kDebug, Args...>(std::forward<Args>(args)...,
                                         location) {}
};
template <typename... Args>
Debug(Args&&...) -> Debug<Args...>;

template <typename... Args>
struct Info : public detail::LogBase<kInfo, Args...> {
  explicit Info(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<kInfo, Args...>(std::forward<Args>(args)...,
                                        location) {}
};
template <typename... Args>
Info(Args&&...) -> Info<Args...>;

template <typename... Args>
struct Warn : public detail::LogBase<kWarn, Args...> {
  explicit Warn(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<kWarn, Args...>(std::forward<Args>(args)...,
                                        location) {}
};
template <typename... Args>
Warn(Args&&...) -> Warn<Args...>;

template <typename... Args>
struct Err : public detail::LogBase<kErr, Args...> {
  explicit Err(Args&&... args, const std::source_location& location =
                                   std::source_location::current())
      : detail::LogBase<kErr, Args...>(std::forward<Args>(args)..., location) {
  }
};
template <typename... Args>
Err(Args&&...) -> Err<Args...>;

/**
 * @brief 替换日志输出函数
 * @param new_sink 新的输出函数，nullptr 时恢复默认 (stderr)
 * @return Sink 之前的输出函数
 */
inline auto SetSink(Sink new_sink) -> Sink {
  if (new_sink == nullptr) {
    new_sink = &detail::StderrSink;
  }
  return detail::sink.exchange(new_sink, std::memory_order_acq_rel);
}

/**
 * @brief 设置最低输出级别，低于该级别的日志被丢弃
 */
inline void SetLevel(LogLevel level) {
  detail::min_level.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline auto GetLevel() -> LogLevel {
  return static_cast<LogLevel>(
      detail::min_level.load(std::memory_order_relaxed));
}

}  // namespace klog

#endif /* EXT4SHIM_SRC_INCLUDE_KERNEL_LOG_HPP_ */
