#include "file_transfer.hpp"

#include "utils.hpp"

const char* to_string(TransferDirection direction) {
  return direction == TransferDirection::Send ? "Sending" : "Receiving";
}

const char* to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::InProgress: return "in progress";
    case TransferStatus::Paused: return "paused";
    case TransferStatus::WaitingAck: return "waiting for ack";
    case TransferStatus::Complete: return "complete";
    case TransferStatus::Failed: return "failed";
  }
  return "unknown";
}

bool is_terminal(TransferStatus status) {
  return status == TransferStatus::Complete || status == TransferStatus::Failed;
}

SpeedEstimator::SpeedEstimator(clock::time_point start)
  : start_(start), window_start_(start) {}

void SpeedEstimator::record(uint64_t total_bytes, clock::time_point now) {
  using seconds = std::chrono::duration<double>;
  auto window = seconds(now - window_start_).count();
  if(window >= 1.0) {
    double sample = static_cast<double>(total_bytes - window_start_bytes_) / 1024.0 / window;
    speed_ = 0.3 * sample + 0.7 * speed_;
    window_start_ = now;
    window_start_bytes_ = total_bytes;
  } else if(window_start_ == start_) {
    auto elapsed = seconds(now - start_).count();
    if(elapsed > 0.0) speed_ = static_cast<double>(total_bytes) / 1024.0 / elapsed;
  }
  if(total_bytes > 0 && speed_ < 0.01) speed_ = 0.01;
}

ProgressGate::ProgressGate(uint64_t byte_step, double percent_step, std::chrono::milliseconds interval)
  : byte_step_(byte_step), percent_step_(percent_step), interval_(interval) {}

bool ProgressGate::due(uint64_t bytes, uint64_t total, clock::time_point now) {
  double percent = total > 0 ? 100.0 * static_cast<double>(bytes) / static_cast<double>(total) : 100.0;
  bool fire = !last_time_ ||
              bytes >= total ||
              bytes - last_bytes_ >= byte_step_ ||
              percent - last_percent_ >= percent_step_ ||
              now - *last_time_ >= interval_;
  if(!fire) return false;
  last_bytes_ = bytes;
  last_percent_ = percent;
  last_time_ = now;
  return true;
}

double FileTransfer::Snapshot::percent() const {
  if(total == 0) return 100.0;
  return 100.0 * static_cast<double>(bytes) / static_cast<double>(total);
}

FileTransfer::FileTransfer(TransferDirection direction,
                           std::string wire_path,
                           std::filesystem::path local_path,
                           uint64_t total,
                           std::string connection_id)
  : direction_(direction),
    wire_path_(std::move(wire_path)),
    local_path_(std::move(local_path)),
    total_(total),
    connection_id_(std::move(connection_id)),
    started_at_(clock::now()),
    speed_(started_at_) {}

FileTransfer::~FileTransfer() {
  std::lock_guard lg(mutex_);
  release_file_locked();
}

int FileTransfer::id() const {
  std::lock_guard lg(mutex_);
  return id_;
}

void FileTransfer::set_id(int id) {
  std::lock_guard lg(mutex_);
  id_ = id;
}

void FileTransfer::open_for_read() {
  std::lock_guard lg(mutex_);
  auto in = std::make_unique<std::ifstream>(local_path_, std::ios::binary);
  if(!*in) {
    throw ShareError(ErrorKind::IOError, "Unable to open " + local_path_.string() + " for reading");
  }
  in_ = std::move(in);
}

void FileTransfer::open_for_write() {
  std::lock_guard lg(mutex_);
  auto out = std::make_unique<std::ofstream>(local_path_, std::ios::binary | std::ios::trunc);
  if(!*out) {
    throw ShareError(ErrorKind::IOError, "Unable to create " + local_path_.string());
  }
  out_ = std::move(out);
  hasher_ = std::make_unique<Sha256Stream>();
}

std::size_t FileTransfer::read_chunk(char* buffer, std::size_t size) {
  std::lock_guard lg(mutex_);
  if(!in_ || file_released_) return 0;
  in_->read(buffer, static_cast<std::streamsize>(size));
  if(in_->bad()) {
    throw ShareError(ErrorKind::IOError, "Read error on " + local_path_.string());
  }
  return static_cast<std::size_t>(in_->gcount());
}

void FileTransfer::write_chunk(const std::string& bytes) {
  std::lock_guard lg(mutex_);
  if(!out_ || file_released_) {
    throw ShareError(ErrorKind::IOError, "File for " + wire_path_ + " is no longer open");
  }
  if(written_ + bytes.size() > total_) {
    throw ShareError(ErrorKind::SizeLimitExceeded,
                     "Received more data than announced for " + wire_path_);
  }
  out_->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if(!*out_) {
    throw ShareError(ErrorKind::IOError, "Write error on " + local_path_.string());
  }
  hasher_->update(bytes.data(), bytes.size());
  written_ += bytes.size();
}

std::string FileTransfer::finish_receive() {
  std::lock_guard lg(mutex_);
  if(!out_ || !hasher_ || file_released_) {
    throw ShareError(ErrorKind::IOError, "File for " + wire_path_ + " is no longer open");
  }
  out_->flush();
  bool ok = static_cast<bool>(*out_);
  release_file_locked();
  if(!ok) {
    throw ShareError(ErrorKind::IOError, "Write error on " + local_path_.string());
  }
  return hasher_->hex_digest();
}

void FileTransfer::discard_file() {
  if(direction_ != TransferDirection::Receive) return;
  {
    std::lock_guard lg(mutex_);
    release_file_locked();
  }
  std::error_code ec;
  std::filesystem::remove(local_path_, ec);
}

TransferStatus FileTransfer::status() const {
  std::lock_guard lg(mutex_);
  return status_;
}

bool FileTransfer::terminal() const {
  return is_terminal(status());
}

bool FileTransfer::pause() {
  std::lock_guard lg(mutex_);
  if(status_ != TransferStatus::InProgress) return false;
  status_ = TransferStatus::Paused;
  return true;
}

bool FileTransfer::resume() {
  {
    std::lock_guard lg(mutex_);
    if(status_ != TransferStatus::Paused) return false;
    status_ = TransferStatus::InProgress;
  }
  cv_.notify_all();
  return true;
}

bool FileTransfer::cancel() {
  {
    std::lock_guard lg(mutex_);
    if(is_terminal(status_)) return false;
    status_ = TransferStatus::Failed;
    failure_kind_ = ErrorKind::Cancelled;
    failure_reason_ = "Cancelled";
    release_file_locked();
  }
  cv_.notify_all();
  return true;
}

bool FileTransfer::fail(ErrorKind kind, const std::string& reason) {
  {
    std::lock_guard lg(mutex_);
    if(is_terminal(status_)) return false;
    status_ = TransferStatus::Failed;
    failure_kind_ = kind;
    failure_reason_ = reason;
    release_file_locked();
  }
  cv_.notify_all();
  return true;
}

bool FileTransfer::mark_announced() {
  std::lock_guard lg(mutex_);
  if(is_terminal(status_)) return false;
  announced_ = true;
  return true;
}

bool FileTransfer::announced() const {
  std::lock_guard lg(mutex_);
  return announced_;
}

bool FileTransfer::mark_waiting_ack() {
  std::lock_guard lg(mutex_);
  if(is_terminal(status_)) return false;
  status_ = TransferStatus::WaitingAck;
  return true;
}

bool FileTransfer::mark_complete() {
  {
    std::lock_guard lg(mutex_);
    if(is_terminal(status_)) return false;
    status_ = TransferStatus::Complete;
    release_file_locked();
  }
  cv_.notify_all();
  return true;
}

void FileTransfer::acknowledge() {
  {
    std::lock_guard lg(mutex_);
    acked_ = true;
  }
  cv_.notify_all();
}

bool FileTransfer::wait_for_ack(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [this]{ return acked_ || status_ == TransferStatus::Failed; });
  return acked_;
}

bool FileTransfer::wait_while_paused(std::chrono::milliseconds poll) {
  std::unique_lock lock(mutex_);
  while(status_ == TransferStatus::Paused) {
    cv_.wait_for(lock, poll);
  }
  return !is_terminal(status_);
}

void FileTransfer::advance(uint64_t bytes, clock::time_point now) {
  std::lock_guard lg(mutex_);
  bytes_ += bytes;
  speed_.record(bytes_, now);
}

bool FileTransfer::progress_due(clock::time_point now) {
  std::lock_guard lg(mutex_);
  return gate_.due(bytes_, total_, now);
}

uint64_t FileTransfer::bytes_transferred() const {
  std::lock_guard lg(mutex_);
  return bytes_;
}

double FileTransfer::speed_kbps() const {
  std::lock_guard lg(mutex_);
  return speed_.kbps();
}

void FileTransfer::set_remote_speed(double kbps) {
  std::lock_guard lg(mutex_);
  remote_speed_ = kbps;
}

void FileTransfer::set_expected_checksum(std::string checksum) {
  std::lock_guard lg(mutex_);
  expected_checksum_ = std::move(checksum);
}

std::string FileTransfer::expected_checksum() const {
  std::lock_guard lg(mutex_);
  return expected_checksum_;
}

std::optional<ErrorKind> FileTransfer::failure_kind() const {
  std::lock_guard lg(mutex_);
  return failure_kind_;
}

std::string FileTransfer::failure_reason() const {
  std::lock_guard lg(mutex_);
  return failure_reason_;
}

bool FileTransfer::release_file() {
  std::lock_guard lg(mutex_);
  return release_file_locked();
}

bool FileTransfer::release_file_locked() {
  if(file_released_) return false;
  file_released_ = true;
  if(in_) in_->close();
  if(out_) out_->close();
  return true;
}

bool FileTransfer::mark_finished() {
  std::lock_guard lg(mutex_);
  if(finished_) return false;
  finished_ = true;
  return true;
}

FileTransfer::Snapshot FileTransfer::snapshot() const {
  std::lock_guard lg(mutex_);
  Snapshot s;
  s.id = id_;
  s.direction = direction_;
  s.status = status_;
  s.path = wire_path_;
  s.total = total_;
  s.bytes = bytes_;
  s.speed_kbps = (direction_ == TransferDirection::Receive && remote_speed_ > 0.0)
    ? remote_speed_
    : speed_.kbps();
  s.eta = format_eta(total_ > bytes_ ? total_ - bytes_ : 0, s.speed_kbps);
  s.connection_id = connection_id_;
  s.failure = failure_reason_;
  return s;
}
