#pragma once

#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "protocol.hpp"

class App;
class Connection;
class FileTransfer;
class Logger;

// Moves files over a connection. The send side runs one pump thread per
// GET/PUT (or per batch); the receive side is driven by the connection reader
// through the on_* handlers, which never block.
class TransferService {
public:
  enum class Control { Pause, Resume, Cancel };

  explicit TransferService(App& app);

  // Validates and registers an outbound transfer of a root-relative file.
  // Throws ShareError(AccessDenied | NotFound | ProtocolError |
  // SizeLimitExceeded | TooManyTransfers | IOError). Nothing is registered
  // when it throws.
  std::shared_ptr<FileTransfer> start_send(const std::shared_ptr<Connection>& connection,
                                           const std::string& relative_path);
  // Runs the pump for a transfer returned by start_send on its own thread.
  void spawn_send(const std::shared_ptr<Connection>& connection,
                  std::shared_ptr<FileTransfer> transfer);
  // Blocking pump. Failures end up in the transfer, not in exceptions.
  void run_send(const std::shared_ptr<Connection>& connection,
                const std::shared_ptr<FileTransfer>& transfer);

  // Sends the files one after another on a single background thread, waiting
  // for a free slot before each.
  void start_batch(const std::shared_ptr<Connection>& connection,
                   std::vector<std::string> relative_paths);

  void on_file_start(const std::shared_ptr<Connection>& connection, const Message& msg);
  void on_file_data(const std::shared_ptr<Connection>& connection, const Message& msg);
  void on_file_end(const std::shared_ptr<Connection>& connection, const Message& msg);
  void on_progress(const std::shared_ptr<Connection>& connection, const Message& msg);
  void on_ack(const std::shared_ptr<Connection>& connection, const Message& msg);
  void on_connection_closed(const std::string& connection_id);

  // Local control by transfer id. Returns false when the id is unknown or the
  // transition is not allowed. The peer is told unless notify_peer is false.
  bool pause(int id, bool notify_peer = true);
  bool resume(int id, bool notify_peer = true);
  bool cancel(int id, bool notify_peer = true);

  // PAUSE/RESUME/CANCEL received from the peer, addressed by wire path.
  // Throws ShareError(NotFound) when no live transfer has that path.
  std::string apply_remote_control(const std::string& connection_id,
                                   Control action,
                                   const std::string& path);

private:
  void stream_file(const std::shared_ptr<Connection>& connection,
                   const std::shared_ptr<FileTransfer>& transfer);
  void await_file_end(const std::shared_ptr<Connection>& connection,
                      const std::shared_ptr<FileTransfer>& transfer,
                      const std::string& checksum);
  // False when the transfer had already ended.
  bool fail(const std::shared_ptr<FileTransfer>& transfer, ErrorKind kind, const std::string& reason);
  void finish(const std::shared_ptr<FileTransfer>& transfer);
  void forward_control(const FileTransfer& transfer, Control action);
  void publish(const FileTransfer& transfer);

  App& app_;
  std::shared_ptr<Logger> logger_;
};

const char* to_string(TransferService::Control action);
