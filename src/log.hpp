#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Output channel. Log channels carry timestamps, print channels are plain
// user-facing text.
enum class LogChannel { Log, Error, Print, PrintErr };

using LogListenerHandle = std::size_t;

class Logger {
public:
  using Listener = std::function<bool(const std::string& logger_name,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  // Returns a logger named "<name>:<suffix>" sharing this logger's listeners.
  std::shared_ptr<Logger> child(const std::string& suffix) const;

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Log, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Log, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Log, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Error, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

private:
  struct Listeners {
    std::mutex mutex;
    std::unordered_map<LogListenerHandle, Listener> entries;
    std::atomic<LogListenerHandle> next_id{1};
  };

  Logger(std::string name, std::shared_ptr<Listeners> listeners);

  template<typename... Args>
  void log(LogChannel channel,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(level, formatted)) return;
    emit(channel, level, formatted);
  }

  bool dispatch(spdlog::level::level_enum level, const std::string& message);
  void emit(LogChannel channel,
            spdlog::level::level_enum level,
            const std::string& message) const;

  std::string name_;
  std::shared_ptr<Listeners> listeners_;
};

namespace detail {
void emit_to_default(LogChannel channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message);
} // namespace detail

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::Print, "", spdlog::level::info,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
  detail::emit_to_default(LogChannel::PrintErr,
                          logger ? logger->name() : std::string(),
                          spdlog::level::err,
                          formatted);
}
