#pragma once

#include "rdaemon/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <pthread.h>
#include <unistd.h>

namespace rdaemon::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn" || name == "warning")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

struct Entry {
  Level level{Level::Info};
  std::string text;
};

// Async logger using project's BoundedMPSCQueue. One writer thread drains
// the queue into stdout or a (rotating) log file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};  // Whether accepting new log messages
  BoundedMPSCQueue<Entry> queue_{QUEUE_CAPACITY};
  std::thread writer_;

  // Guards the sink. Held across fork() so the child never inherits it locked.
  std::mutex sink_mutex_;
  std::FILE* file_{nullptr};
  std::filesystem::path file_path_;
  std::uintmax_t max_bytes_{0};
  int backups_{0};
  std::uintmax_t written_{0};

  static auto prepare_fork() -> void {
    instance_ptr()->sink_mutex_.lock();
  }
  static auto parent_after_fork() -> void {
    instance_ptr()->sink_mutex_.unlock();
  }
  static auto child_after_fork() -> void {
    auto* self = instance_ptr();
    self->sink_mutex_.unlock();
    self->reset_after_fork();
  }

  static auto instance_ptr() -> Logger*& {
    static Logger* instance = nullptr;
    return instance;
  }

  // The writer thread does not exist in a forked child. Forget it without
  // running std::thread's destructor, and drop the parent's pending lines.
  auto reset_after_fork() noexcept -> void {
    accepting_.store(false, std::memory_order_release);
    running_.store(false, std::memory_order_release);
    std::construct_at(&writer_);
    static_cast<void>(queue_.drain());
  }

  auto rotate_locked() -> void {
    std::fclose(file_);
    file_ = nullptr;

    std::error_code ec;
    for (int i = backups_ - 1; i >= 1; --i) {
      auto from = std::filesystem::path(std::format("{}.{}", file_path_.string(), i));
      auto to = std::filesystem::path(std::format("{}.{}", file_path_.string(), i + 1));
      if (std::filesystem::exists(from, ec)) {
        std::filesystem::rename(from, to, ec);
      }
    }
    std::filesystem::rename(file_path_,
                            std::format("{}.1", file_path_.string()), ec);

    file_ = std::fopen(file_path_.c_str(), "w");
    written_ = 0;
  }

  auto write_entry(const Entry& entry) -> void {
    std::lock_guard lock(sink_mutex_);
    if (file_ == nullptr) {
      std::print("{}{}{}", level_color(entry.level), entry.text, "\033[0m");
      std::fflush(stdout);
      return;
    }
    if (max_bytes_ > 0 && backups_ > 0 &&
        written_ + entry.text.size() > max_bytes_) {
      rotate_locked();
      if (file_ == nullptr) {
        return;
      }
    }
    std::fwrite(entry.text.data(), 1, entry.text.size(), file_);
    std::fflush(file_);
    written_ += entry.text.size();
  }

  auto writer_loop() -> void {
    std::vector<Entry> batch;
    batch.reserve(64);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      queue_.pop_batch(batch, 64);

      for (const auto& msg : batch) {
        write_entry(msg);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }

    // accepting_ is already false here, so nothing new can be pushed.
    while (auto msg = queue_.try_pop()) {
      write_entry(*msg);
    }
  }

  template <typename... Args>
  static auto format_line(Level level, std::format_string<Args...> fmt,
                          Args&&... args) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}:{}] {}\n", time,
                       level_name(level), ::getpid(), tid,
                       std::format(fmt, std::forward<Args>(args)...));
  }

public:
  Logger() {
    instance_ptr() = this;
    ::pthread_atfork(&Logger::prepare_fork, &Logger::parent_after_fork,
                     &Logger::child_after_fork);
  }

  ~Logger() {
    stop();
    std::lock_guard lock(sink_mutex_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Redirects output to a file. max_bytes/backups enable rotation; the file
  // grows without bound when either is zero.
  [[nodiscard]] auto set_output_file(const std::filesystem::path& path,
                                     std::uintmax_t max_bytes = 0,
                                     int backups = 0) -> bool {
    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::FILE* file = std::fopen(path.c_str(), "a");
    if (file == nullptr) {
      return false;
    }

    std::lock_guard lock(sink_mutex_);
    if (file_ != nullptr) {
      std::fclose(file_);
    }
    file_ = file;
    file_path_ = path;
    max_bytes_ = max_bytes;
    backups_ = backups;
    written_ = std::filesystem::file_size(path, ec);
    if (ec) {
      written_ = 0;
    }
    return true;
  }

  // Closes the log file and falls back to stdout.
  auto close_output() -> void {
    std::lock_guard lock(sink_mutex_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    file_path_.clear();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto text = format_line(level, fmt, std::forward<Args>(args)...);

    // Synchronous write while stopped (before start, during shutdown, after
    // fork).
    if (!accepting_.load(std::memory_order_acquire)) {
      write_entry(Entry{level, std::move(text)});
      return;
    }

    // Try async queue, fallback to sync if full
    if (!queue_.push(Entry{level, text})) {
      write_entry(Entry{level, std::move(text)});
    }
  }
};

// Global logger instance
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

[[nodiscard]] inline auto set_output_file(const std::filesystem::path& path,
                                          std::uintmax_t max_bytes = 0,
                                          int backups = 0) -> bool {
  return logger().set_output_file(path, max_bytes, backups);
}

inline auto close_output() -> void {
  logger().close_output();
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
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

}  // namespace rdaemon::log
