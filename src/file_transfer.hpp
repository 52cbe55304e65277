#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "errors.hpp"

class Sha256Stream;

enum class TransferDirection { Send, Receive };
enum class TransferStatus { InProgress, Paused, WaitingAck, Complete, Failed };

const char* to_string(TransferDirection direction);
const char* to_string(TransferStatus status);
bool is_terminal(TransferStatus status);

// Transfer speed in KiB/s. Windows of at least one second are blended as
// 0.3 * sample + 0.7 * previous; before the first window closes the running
// average is reported.
class SpeedEstimator {
public:
  using clock = std::chrono::steady_clock;

  explicit SpeedEstimator(clock::time_point start = clock::now());

  void record(uint64_t total_bytes, clock::time_point now);
  double kbps() const { return speed_; }

private:
  clock::time_point start_;
  clock::time_point window_start_;
  uint64_t window_start_bytes_ = 0;
  double speed_ = 0.0;
};

// Rate limiter for PROGRESS messages: fires after 1 MiB, 2 percentage points
// or one second, whichever comes first, and always on the last byte.
class ProgressGate {
public:
  using clock = std::chrono::steady_clock;

  ProgressGate(uint64_t byte_step = 1024 * 1024,
               double percent_step = 2.0,
               std::chrono::milliseconds interval = std::chrono::seconds(1));

  bool due(uint64_t bytes, uint64_t total, clock::time_point now);

private:
  uint64_t byte_step_;
  double percent_step_;
  std::chrono::milliseconds interval_;
  uint64_t last_bytes_ = 0;
  double last_percent_ = 0.0;
  std::optional<clock::time_point> last_time_;
};

// One file moving in one direction over one connection. Every accessor is
// thread-safe; the pump thread, the connection reader and the shell all touch
// the same instance.
class FileTransfer {
public:
  using clock = std::chrono::steady_clock;

  struct Snapshot {
    int id = 0;
    TransferDirection direction = TransferDirection::Send;
    TransferStatus status = TransferStatus::InProgress;
    std::string path;
    uint64_t total = 0;
    uint64_t bytes = 0;
    double speed_kbps = 0.0;
    std::string eta;
    std::string connection_id;
    std::string failure;

    double percent() const;
  };

  FileTransfer(TransferDirection direction,
               std::string wire_path,
               std::filesystem::path local_path,
               uint64_t total,
               std::string connection_id);
  ~FileTransfer();

  FileTransfer(const FileTransfer&) = delete;
  FileTransfer& operator=(const FileTransfer&) = delete;

  int id() const;
  void set_id(int id);
  TransferDirection direction() const { return direction_; }
  const std::string& path() const { return wire_path_; }
  const std::filesystem::path& local_path() const { return local_path_; }
  const std::string& connection_id() const { return connection_id_; }
  uint64_t total() const { return total_; }

  // Throw ShareError(IOError).
  void open_for_read();
  void open_for_write();

  // Returns 0 once the file was released (cancel/failure) or at EOF.
  std::size_t read_chunk(char* buffer, std::size_t size);
  // Appends and hashes. Throws SizeLimitExceeded past the announced size.
  void write_chunk(const std::string& bytes);
  // Closes the receive file and returns the SHA-256 of what was written.
  std::string finish_receive();
  // Deletes the local file of a receive transfer.
  void discard_file();

  TransferStatus status() const;
  bool terminal() const;

  bool pause();
  bool resume();
  // Idempotent. Returns true only for the call that cancelled.
  bool cancel();
  bool fail(ErrorKind kind, const std::string& reason);
  // Records that the peer acknowledged FILESTART. False when the transfer
  // ended first, in which case the peer has to be told separately.
  bool mark_announced();
  bool announced() const;
  bool mark_waiting_ack();
  bool mark_complete();

  void acknowledge();
  bool wait_for_ack(std::chrono::milliseconds timeout);
  // Blocks while paused. False once the transfer is terminal.
  bool wait_while_paused(std::chrono::milliseconds poll);

  void advance(uint64_t bytes, clock::time_point now = clock::now());
  bool progress_due(clock::time_point now = clock::now());
  uint64_t bytes_transferred() const;
  double speed_kbps() const;
  void set_remote_speed(double kbps);

  void set_expected_checksum(std::string checksum);
  std::string expected_checksum() const;

  std::optional<ErrorKind> failure_kind() const;
  std::string failure_reason() const;

  // Closes the file handle. Only the first call does anything.
  bool release_file();
  // True for the first caller only; the winner removes the registry entry.
  bool mark_finished();

  Snapshot snapshot() const;

private:
  bool release_file_locked();

  const TransferDirection direction_;
  const std::string wire_path_;
  const std::filesystem::path local_path_;
  const uint64_t total_;
  const std::string connection_id_;
  const clock::time_point started_at_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int id_ = 0;
  TransferStatus status_ = TransferStatus::InProgress;
  uint64_t bytes_ = 0;
  uint64_t written_ = 0;
  SpeedEstimator speed_;
  ProgressGate gate_;
  double remote_speed_ = 0.0;
  std::string expected_checksum_;
  std::optional<ErrorKind> failure_kind_;
  std::string failure_reason_;
  bool acked_ = false;
  bool announced_ = false;
  bool file_released_ = false;
  bool finished_ = false;
  std::unique_ptr<std::ifstream> in_;
  std::unique_ptr<std::ofstream> out_;
  std::unique_ptr<Sha256Stream> hasher_;
};
