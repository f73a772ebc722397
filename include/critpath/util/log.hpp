#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace critpath::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      "",
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return Level::Info;
}

// Synchronous logger. Schedule computations run on caller threads, so every
// line is written under a mutex straight to the sink.
class Logger {
  std::atomic<Level> level_{Level::Warn};
  std::mutex mu_;
  std::FILE* sink_{stderr};
  bool owns_sink_{false};
  bool color_{true};

public:
  Logger() = default;
  ~Logger() { close_sink(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  // Returns false when the file cannot be opened; the current sink is kept.
  [[nodiscard]] auto open_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::lock_guard lock(mu_);
    close_sink();
    sink_ = f;
    owns_sink_ = true;
    color_ = false;
    return true;
  }

  auto use_stderr() -> void {
    std::lock_guard lock(mu_);
    close_sink();
    sink_ = stderr;
    color_ = true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto msg = std::format(fmt, std::forward<Args>(args)...);

    std::lock_guard lock(mu_);
    if (color_) {
      std::println(sink_, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}", time,
                   level_color(level), level_name(level), "\033[0m", tid, msg);
    } else {
      std::println(sink_, "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}", time,
                   level_name(level), tid, msg);
    }
    std::fflush(sink_);
  }

private:
  auto close_sink() -> void {
    if (owns_sink_ && sink_ != nullptr) {
      std::fclose(sink_);
    }
    owns_sink_ = false;
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace critpath::log
