#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <exception>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};
std::atomic<int> g_min_level{spdlog::level::info};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("lanshare.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("lanshare.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("lanshare.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("lanshare.print_err", std::move(plain_err_sink));

  for(const auto& logger : {g_info_logger, g_error_logger, g_print_logger, g_print_err_logger}) {
    logger->set_level(spdlog::level::debug);
  }
  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

bool log_level_enabled(spdlog::level::level_enum level) {
  return static_cast<int>(level) >= g_min_level.load(std::memory_order_relaxed);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
  spdlog::set_default_logger(g_info_logger);
}

Logger::Logger() = default;

Logger::Logger(std::string name, std::shared_ptr<Logger> parent)
  : name_(std::move(name)), parent_(std::move(parent)) {}

std::shared_ptr<Logger> Logger::child(const std::string& name) {
  return std::make_shared<Logger>(name, shared_from_this());
}

std::string Logger::name() const {
  return name_;
}

std::string Logger::full_name() const {
  auto own = name();
  if(!parent_) return own;
  auto parent_name = parent_->full_name();
  if(parent_name.empty()) return own;
  if(own.empty()) return parent_name;
  return parent_name + "/" + own;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  if(parent_ && parent_->dispatch(channel, level, message)) {
    handled = true;
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  bool plain = sink == g_print_logger.get() || sink == g_print_err_logger.get();
  if(!plain && !channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
