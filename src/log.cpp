#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_log_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const char* pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers() {
  std::call_once(g_create_once, [](){
    g_log_logger = make_sink_logger("replisync.log",
                                    std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                    kStampedPattern, spdlog::level::warn);
    g_error_logger = make_sink_logger("replisync.error",
                                      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                      kStampedPattern, spdlog::level::err);
    g_print_logger = make_sink_logger("replisync.print",
                                      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                      "%v", spdlog::level::info);
    g_print_err_logger = make_sink_logger("replisync.print_err",
                                          std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                          "%v", spdlog::level::err);
  });
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Error: return g_error_logger.get();
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Log: break;
  }
  return g_log_logger.get();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  create_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_log_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_log_logger);
  spdlog::set_level(level);
}

Logger::Logger() : listeners_(std::make_shared<Listeners>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)),
    listeners_(std::make_shared<Listeners>()) {}

Logger::Logger(std::string name, std::shared_ptr<Listeners> listeners)
  : name_(std::move(name)),
    listeners_(std::move(listeners)) {}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) const {
  std::string child_name = name_.empty() ? suffix : name_ + ":" + suffix;
  return std::shared_ptr<Logger>(new Logger(std::move(child_name), listeners_));
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  const auto id = listeners_->next_id++;
  listeners_->entries.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->entries.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->entries.clear();
}

bool Logger::dispatch(spdlog::level::level_enum level, const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listeners_->mutex);
    snapshot.reserve(listeners_->entries.size());
    for(const auto& entry : listeners_->entries) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(name_, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogChannel channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_default(channel, name_, level, message);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  create_loggers();
  if(!log_passthrough()) return;

  auto* sink = sink_for(channel);
  if(!sink) return;
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !logger_name.empty()) {
    sink->log(level, fmt::format("[{}] {}", logger_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
