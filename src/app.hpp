#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "file_listing.hpp"
#include "file_transfer.hpp"

class CommandDispatcher;
class Connection;
class Logger;
class TransferService;

// Shared state of one node: live connections, transfers and the hooks the
// console and the node attach to. Everything in the registry is guarded by
// one mutex that is never held across I/O or callbacks.
class App : public std::enable_shared_from_this<App> {
public:
  using TransferListener = std::function<void(const FileTransfer::Snapshot&)>;
  using SessionEndHandler = std::function<void()>;

  static std::shared_ptr<App> create(Config config, std::shared_ptr<Logger> logger);
  ~App();

  const Config& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  TransferService& transfers() { return *transfers_; }
  CommandDispatcher& commands() { return *commands_; }

  IgnoreList ignore() const;
  void reload_ignore();

  void add_connection(std::shared_ptr<Connection> connection);
  void remove_connection(const std::string& id);
  std::shared_ptr<Connection> connection(const std::string& id) const;
  std::shared_ptr<Connection> first_connection() const;
  std::size_t connection_count() const;

  // Registers a transfer and returns its new id.
  int add_transfer(const std::shared_ptr<FileTransfer>& transfer);
  // Same, but refuses with ShareError(TooManyTransfers) when max_transfers
  // transfers are already in progress.
  int try_add_transfer(const std::shared_ptr<FileTransfer>& transfer);
  void remove_transfer(int id);
  std::shared_ptr<FileTransfer> transfer(int id) const;
  std::vector<std::shared_ptr<FileTransfer>> transfers_for_connection(const std::string& connection_id) const;
  // Newest matching transfer, or nullptr.
  std::shared_ptr<FileTransfer> find_transfer(const std::string& connection_id,
                                              const std::string& path,
                                              TransferDirection direction) const;
  std::vector<FileTransfer::Snapshot> list_transfers() const;
  bool can_start_transfer() const;
  std::size_t in_progress_count() const;
  bool is_any_transfer_active() const;

  // The last FILESTART of a connection. The mapping outlives the transfer so
  // late FILEDATA can be told apart from data that never had a FILESTART.
  void set_current_receive(const std::string& connection_id, int transfer_id);
  bool has_current_receive(const std::string& connection_id) const;
  std::shared_ptr<FileTransfer> current_receive(const std::string& connection_id) const;

  void set_progress_listener(TransferListener listener);
  void publish_progress(const FileTransfer::Snapshot& snapshot);

  std::size_t add_transfer_listener(TransferListener listener);
  void remove_transfer_listener(std::size_t handle);
  void notify_transfer_finished(const FileTransfer::Snapshot& snapshot);

  void set_session_end_handler(SessionEndHandler handler);
  // Runs the session-end handler once.
  void end_session();
  bool session_ended() const;

  // Closes every connection. New connections are refused afterwards.
  void shutdown();
  bool shutting_down() const;

  // Threads that touch the registry hold one of these until they exit.
  std::shared_ptr<void> track_worker();
  bool wait_for_workers(std::chrono::milliseconds timeout);

private:
  App(Config config, std::shared_ptr<Logger> logger);

  std::size_t in_progress_count_locked() const;
  int register_locked(const std::shared_ptr<FileTransfer>& transfer);

  const Config config_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<TransferService> transfers_;
  std::unique_ptr<CommandDispatcher> commands_;

  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<Connection>> connections_;
  std::map<int, std::shared_ptr<FileTransfer>> transfers_by_id_;
  std::unordered_map<std::string, int> current_receive_;
  int next_transfer_id_ = 1;
  IgnoreList ignore_;
  bool shutting_down_ = false;
  bool session_ended_ = false;
  SessionEndHandler session_end_handler_;
  TransferListener progress_listener_;
  std::map<std::size_t, TransferListener> transfer_listeners_;
  std::size_t next_listener_id_ = 1;

  std::mutex workers_m_;
  std::condition_variable workers_cv_;
  std::size_t workers_ = 0;
};
