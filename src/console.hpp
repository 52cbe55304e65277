#pragma once

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>

#include "file_transfer.hpp"
#include "log.hpp"

// The only writer of the terminal while a node runs. Log lines claimed from a
// Logger and progress snapshots are queued and rendered by one thread, so a
// progress bar never ends up in the middle of a log line.
class Console {
public:
  explicit Console(std::ostream& out, bool interactive);
  ~Console();

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  void start();
  // Drains the queue, then joins.
  void stop();

  // Claims every message of `logger` and its children.
  void attach(const std::shared_ptr<Logger>& logger);
  void detach();

  void show_progress(const FileTransfer::Snapshot& snapshot);
  void show_prompt(std::string prompt);

  static std::string render_progress(const FileTransfer::Snapshot& snapshot, std::size_t bar_width = 30);

private:
  struct Event {
    enum class Kind { Log, Progress, Prompt };
    Kind kind = Kind::Log;
    std::string channel;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string text;
    std::optional<FileTransfer::Snapshot> progress;
  };

  void push(Event event);
  void run();
  void render(const Event& event);
  void clear_status_line();
  void redraw_status_line();

  std::ostream& out_;
  const bool interactive_;

  std::mutex m_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  bool running_ = false;
  std::thread thread_;

  std::shared_ptr<Logger> attached_;
  LogListenerHandle listener_ = 0;

  // console thread only
  std::map<int, FileTransfer::Snapshot> active_;
  int shown_id_ = 0;
  bool status_visible_ = false;
  std::string prompt_;
};
