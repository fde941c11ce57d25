#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::logger> g_file_logger;
std::mutex g_sink_mutex;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kDiagnosticPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, spdlog::sink_ptr sink) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kDiagnosticPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kDiagnosticPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = make_logger("romid.info", std::move(info_sink));
  g_error_logger = make_logger("romid.error", std::move(error_sink));
  g_print_logger = make_logger("romid.print", std::move(plain_out_sink));
  g_print_err_logger = make_logger("romid.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers();
}

spdlog::logger* console_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Warn:
    case LogChannel::Error: return g_error_logger.get();
    case LogChannel::Info:
    case LogChannel::Debug: return g_info_logger.get();
  }
  return g_info_logger.get();
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Print: return spdlog::level::info;
  }
  return spdlog::level::info;
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void flush_logs() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  for(auto* logger : {g_info_logger.get(), g_error_logger.get(), g_print_logger.get(),
                      g_print_err_logger.get(), g_file_logger.get()}) {
    if(logger) logger->flush();
  }
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

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

void Logger::write(LogChannel channel, const std::string& message) {
  std::string label = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  if(dispatch(label, channel_level(channel), message)) return;
  detail::emit_to_default(channel, label, message);
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
      detail::emit_to_default(LogChannel::Error, "log", fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void init(bool verbose, const std::filesystem::path& log_file) {
  ensure_loggers();

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  g_file_logger.reset();
  if(!log_file.empty()) {
    std::error_code ec;
    if(log_file.has_parent_path()) {
      std::filesystem::create_directories(log_file.parent_path(), ec);
    }
    try {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
      file_sink->set_pattern("%Y-%m-%d %H:%M:%S,%e - %n - %l - %v");
      g_file_logger = make_logger("romid", std::move(file_sink));
      g_file_logger->set_level(level);
      g_file_logger->flush_on(spdlog::level::info);
    } catch(const spdlog::spdlog_ex& e) {
      g_error_logger->error("Unable to open log file {}: {}", log_file.string(), e.what());
    }
  }

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_label,
                     const std::string& message) {
  ensure_loggers();

  const bool diagnostic = channel != LogChannel::Print && channel != LogChannel::PrintErr;
  if(diagnostic && g_file_logger) {
    g_file_logger->log(channel_level(channel), fmt::format("[{}] {}", channel_label, message));
  }

  if(!log_passthrough()) return;

  spdlog::logger* sink = console_for(channel);
  if(!sink) return;
  if(!channel_label.empty() && channel_label != channel_name(channel)) {
    sink->log(channel_level(channel), fmt::format("[{}] {}", channel_label, message));
  } else {
    sink->log(channel_level(channel), message);
  }
}

} // namespace detail
