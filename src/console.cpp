#include "console.hpp"

#include <algorithm>

Console::Console(std::ostream& out, bool interactive)
  : out_(out), interactive_(interactive) {}

Console::~Console() {
  detach();
  stop();
}

void Console::start() {
  std::lock_guard lg(m_);
  if(running_) return;
  running_ = true;
  thread_ = std::thread([this](){ run(); });
}

void Console::stop() {
  {
    std::lock_guard lg(m_);
    if(!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if(thread_.joinable()) thread_.join();
  clear_status_line();
  out_.flush();
}

void Console::attach(const std::shared_ptr<Logger>& logger) {
  detach();
  if(!logger) return;
  listener_ = logger->add_listener([this](void*, const std::string& channel,
                                          spdlog::level::level_enum level,
                                          const std::string& message){
    Event event;
    event.kind = Event::Kind::Log;
    event.channel = channel;
    event.level = level;
    event.text = message;
    push(std::move(event));
    return true;
  });
  attached_ = logger;
}

void Console::detach() {
  if(attached_ && listener_ != 0) attached_->remove_listener(listener_);
  attached_.reset();
  listener_ = 0;
}

void Console::show_progress(const FileTransfer::Snapshot& snapshot) {
  if(!interactive_) return;
  Event event;
  event.kind = Event::Kind::Progress;
  event.progress = snapshot;
  push(std::move(event));
}

void Console::show_prompt(std::string prompt) {
  Event event;
  event.kind = Event::Kind::Prompt;
  event.text = std::move(prompt);
  push(std::move(event));
}

std::string Console::render_progress(const FileTransfer::Snapshot& snapshot, std::size_t bar_width) {
  double pct = std::clamp(snapshot.percent(), 0.0, 100.0);
  auto fill = static_cast<std::size_t>(pct / 100.0 * static_cast<double>(bar_width));
  std::string bar = "[";
  for(std::size_t i = 0; i < bar_width; ++i) {
    if(i < fill) bar += '=';
    else if(i == fill) bar += '>';
    else bar += ' ';
  }
  bar += "]";

  const char* arrow = snapshot.direction == TransferDirection::Receive ? "↓" : "↑";
  std::string line = fmt::format("{} {} {} {} {:5.1f}% {:.2f} KB/s ETA {}",
                                 arrow, to_string(snapshot.direction), snapshot.path, bar, pct,
                                 snapshot.speed_kbps, snapshot.eta);
  if(snapshot.status == TransferStatus::Paused) line += " (paused)";
  return line;
}

void Console::push(Event event) {
  {
    std::lock_guard lg(m_);
    if(running_) {
      queue_.push_back(std::move(event));
      cv_.notify_one();
      return;
    }
  }
  // not started (or already stopped): log lines still reach the sinks
  if(event.kind == Event::Kind::Log) {
    auto colon = event.channel.find_last_of(':');
    auto base = colon == std::string::npos ? event.channel : event.channel.substr(colon + 1);
    detail::emit_to_default(base.c_str(), event.channel, event.level, event.text);
  }
}

void Console::run() {
  std::unique_lock lock(m_);
  while(true) {
    cv_.wait(lock, [this]{ return !queue_.empty() || !running_; });
    if(queue_.empty() && !running_) break;
    auto event = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    render(event);
    lock.lock();
  }
}

void Console::render(const Event& event) {
  switch(event.kind) {
    case Event::Kind::Log: {
      clear_status_line();
      auto colon = event.channel.find_last_of(':');
      auto base = colon == std::string::npos ? event.channel : event.channel.substr(colon + 1);
      detail::emit_to_default(base.c_str(), event.channel, event.level, event.text);
      redraw_status_line();
      break;
    }
    case Event::Kind::Progress: {
      const auto& snapshot = *event.progress;
      if(is_terminal(snapshot.status)) {
        active_.erase(snapshot.id);
        if(shown_id_ == snapshot.id) {
          shown_id_ = active_.empty() ? 0 : active_.rbegin()->first;
        }
      } else {
        active_[snapshot.id] = snapshot;
        shown_id_ = snapshot.id;
      }
      clear_status_line();
      redraw_status_line();
      break;
    }
    case Event::Kind::Prompt:
      prompt_ = event.text;
      clear_status_line();
      redraw_status_line();
      break;
  }
}

void Console::clear_status_line() {
  if(!status_visible_) return;
  out_ << "\r\x1b[K";
  out_.flush();
  status_visible_ = false;
}

void Console::redraw_status_line() {
  if(!interactive_) return;
  auto it = active_.find(shown_id_);
  if(it != active_.end()) {
    out_ << "\r" << render_progress(it->second) << "\x1b[K";
  } else if(!prompt_.empty()) {
    out_ << "\r" << prompt_ << "\x1b[K";
  } else {
    return;
  }
  out_.flush();
  status_visible_ = true;
}
