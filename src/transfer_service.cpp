#include "transfer_service.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>
#include <vector>

#include "app.hpp"
#include "connection.hpp"
#include "file_transfer.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
    std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y){
      return std::tolower(x) == std::tolower(y);
    });
}

std::string lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

} // namespace

const char* to_string(TransferService::Control action) {
  switch(action) {
    case TransferService::Control::Pause: return "PAUSE";
    case TransferService::Control::Resume: return "RESUME";
    case TransferService::Control::Cancel: return "CANCEL";
  }
  return "UNKNOWN";
}

TransferService::TransferService(App& app)
  : app_(app),
    logger_(app.logger()->child("transfers")) {}

std::shared_ptr<FileTransfer> TransferService::start_send(const std::shared_ptr<Connection>& connection,
                                                          const std::string& relative_path) {
  const auto& config = app_.config();
  auto wire_path = normalize_relative_path(relative_path);
  auto local = resolve_in_root(config.folder, wire_path);
  if(wire_path.empty() || !is_valid_relative_path(wire_path)) {
    throw ShareError(ErrorKind::AccessDenied, "Access denied: path is outside the shared folder");
  }
  if(config.read_only) {
    throw ShareError(ErrorKind::AccessDenied, "This node is in read-only mode and cannot send files");
  }
  if(app_.ignore().should_ignore(wire_path)) {
    throw ShareError(ErrorKind::AccessDenied, "This file is restricted for transfer");
  }

  std::error_code ec;
  auto status = fs::status(local, ec);
  if(ec || !fs::exists(status)) {
    throw ShareError(ErrorKind::NotFound, "File not found: " + wire_path);
  }
  if(fs::is_directory(status)) {
    throw ShareError(ErrorKind::ProtocolError, "GET cannot transfer directories, use GETDIR instead");
  }
  auto size = fs::file_size(local, ec);
  if(ec) {
    throw ShareError(ErrorKind::IOError, "Unable to stat " + wire_path + ": " + ec.message());
  }
  if(config.max_size_bytes() > 0 && size > config.max_size_bytes()) {
    throw ShareError(ErrorKind::SizeLimitExceeded,
                     fmt::format("File size exceeds maximum allowed size of {} MB", config.max_size_mb));
  }

  auto transfer = std::make_shared<FileTransfer>(TransferDirection::Send, wire_path, local, size,
                                                 connection->id());
  transfer->open_for_read();
  app_.try_add_transfer(transfer);
  logger_->info("Queued {} ({}) for {} as transfer {}", wire_path, format_size(size),
                connection->id(), transfer->id());
  return transfer;
}

void TransferService::spawn_send(const std::shared_ptr<Connection>& connection,
                                 std::shared_ptr<FileTransfer> transfer) {
  auto app = app_.shared_from_this();
  auto worker = app->track_worker();
  std::thread([this, app, worker, connection, transfer](){
    run_send(connection, transfer);
  }).detach();
}

void TransferService::run_send(const std::shared_ptr<Connection>& connection,
                               const std::shared_ptr<FileTransfer>& transfer) {
  bool failed_here = false;
  try {
    stream_file(connection, transfer);
  } catch(const ShareError& e) {
    failed_here = fail(transfer, e.kind(), e.what());
  } catch(const std::exception& e) {
    failed_here = fail(transfer, ErrorKind::IOError, e.what());
  }
  // the receiver still holds an open file for this path
  if(failed_here && transfer->announced()) forward_control(*transfer, Control::Cancel);
  finish(transfer);
}

void TransferService::stream_file(const std::shared_ptr<Connection>& connection,
                                  const std::shared_ptr<FileTransfer>& transfer) {
  const auto& config = app_.config();
  const auto& path = transfer->path();

  std::string checksum;
  if(config.verify) {
    checksum = sha256_file(transfer->local_path());
    transfer->set_expected_checksum(checksum);
  }
  if(transfer->terminal()) return;

  FileStartInfo start{path, transfer->total(), checksum};
  auto answer = connection->send_reliable(make_message(MessageType::FileStart, start.to_data()));
  if(answer.type == MessageType::Error) {
    throw ShareError(ErrorKind::ProtocolError, answer.data);
  }
  if(!transfer->mark_announced()) {
    // cancelled while FILESTART was in flight; the forwarded CANCEL found nothing
    forward_control(*transfer, Control::Cancel);
    return;
  }
  logger_->print("Sending file: {} ({})", path, format_size(transfer->total()));
  publish(*transfer);

  std::vector<char> buffer(config.timing.chunk_size);
  while(true) {
    if(!transfer->wait_while_paused(config.timing.pause_poll)) return;
    auto n = transfer->read_chunk(buffer.data(), buffer.size());
    if(n == 0) break;
    if(transfer->terminal()) return;
    if(!connection->send(make_binary_message(MessageType::FileData, std::string(buffer.data(), n)))) {
      throw ShareError(ErrorKind::IOError, "Connection lost while sending " + path);
    }
    transfer->advance(n);
    if(transfer->progress_due()) {
      ProgressInfo progress{path, transfer->bytes_transferred(), transfer->total(), transfer->speed_kbps()};
      connection->send(make_message(MessageType::Progress, progress.to_data()));
      publish(*transfer);
    }
  }

  if(transfer->terminal()) return;
  if(transfer->bytes_transferred() != transfer->total()) {
    throw ShareError(ErrorKind::IOError,
                     fmt::format("{} changed while sending: sent {} of {} bytes",
                                 path, transfer->bytes_transferred(), transfer->total()));
  }
  if(!transfer->mark_waiting_ack()) return;
  publish(*transfer);
  await_file_end(connection, transfer, checksum);
}

void TransferService::await_file_end(const std::shared_ptr<Connection>& connection,
                                     const std::shared_ptr<FileTransfer>& transfer,
                                     const std::string& checksum) {
  const auto& path = transfer->path();
  FileEndInfo end{path, checksum};
  try {
    auto answer = connection->send_reliable(make_message(MessageType::FileEnd, end.to_data()));
    if(answer.type == MessageType::Error) {
      // the receiver already dropped its side
      auto kind = lower_copy(answer.data).find("checksum") != std::string::npos
        ? ErrorKind::ChecksumMismatch
        : ErrorKind::ProtocolError;
      fail(transfer, kind, answer.data);
      return;
    }
    transfer->acknowledge();
  } catch(const ShareError& e) {
    if(e.kind() != ErrorKind::Timeout) throw;
    logger_->warn("No reply to FILEEND for {}, waiting for the completion ACK", path);
    if(!transfer->wait_for_ack(app_.config().timing.ack_wait)) {
      throw ShareError(ErrorKind::Timeout, "Timed out waiting for the receiver to confirm " + path);
    }
  }

  if(transfer->mark_complete()) {
    logger_->print("File sent successfully: {}", path);
    publish(*transfer);
  }
}

void TransferService::start_batch(const std::shared_ptr<Connection>& connection,
                                  std::vector<std::string> relative_paths) {
  auto app = app_.shared_from_this();
  auto worker = app->track_worker();
  std::thread([this, app, worker, connection, paths = std::move(relative_paths)](){
    const auto poll = app->config().timing.pause_poll;
    std::size_t sent = 0;
    for(std::size_t i = 0; i < paths.size();) {
      const auto& path = paths[i];
      while(connection->is_open() && !app->shutting_down() && !app->can_start_transfer()) {
        std::this_thread::sleep_for(poll);
      }
      if(!connection->is_open() || app->shutting_down()) {
        logger_->warn("Batch stopped after {} of {} files: connection closed", sent, paths.size());
        return;
      }
      std::shared_ptr<FileTransfer> transfer;
      try {
        transfer = start_send(connection, path);
      } catch(const ShareError& e) {
        // lost the slot to another transfer; try the same file again
        if(e.kind() == ErrorKind::TooManyTransfers) continue;
        logger_->error("Skipping {}: {}", path, e.what());
        ++i;
        continue;
      }
      run_send(connection, transfer);
      if(transfer->status() == TransferStatus::Complete) ++sent;
      ++i;
    }
    logger_->print("Batch finished: {} of {} files sent", sent, paths.size());
  }).detach();
}

void TransferService::on_file_start(const std::shared_ptr<Connection>& connection, const Message& msg) {
  const auto& config = app_.config();
  std::shared_ptr<FileTransfer> transfer;
  try {
    auto info = FileStartInfo::parse(msg.data);
    if(config.write_only) {
      throw ShareError(ErrorKind::AccessDenied, "This node is in write-only mode and cannot receive files");
    }
    auto wire_path = normalize_relative_path(info.path);
    if(!is_valid_relative_path(wire_path)) {
      throw ShareError(ErrorKind::AccessDenied, "Access denied: path is outside the shared folder");
    }
    auto destination = resolve_in_root(config.folder, wire_path);
    if(config.max_size_bytes() > 0 && info.size > config.max_size_bytes()) {
      throw ShareError(ErrorKind::SizeLimitExceeded,
                       fmt::format("File size exceeds maximum allowed size of {} MB", config.max_size_mb));
    }
    if(app_.ignore().should_ignore(wire_path)) {
      throw ShareError(ErrorKind::AccessDenied, "This file is restricted for transfer");
    }

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if(ec) {
      throw ShareError(ErrorKind::IOError, "Failed to create directory: " + ec.message());
    }
    destination = unique_path(destination);

    transfer = std::make_shared<FileTransfer>(TransferDirection::Receive, info.path, destination,
                                              info.size, connection->id());
    transfer->set_expected_checksum(info.checksum);
    transfer->open_for_write();
  } catch(const std::exception& e) {
    logger_->warn("Rejected FILESTART from {}: {}", connection->id(), e.what());
    connection->reply(msg, make_error(e.what()));
    return;
  }

  app_.add_transfer(transfer);
  app_.set_current_receive(connection->id(), transfer->id());
  if(transfer->local_path().filename() != fs::path(transfer->path()).filename()) {
    logger_->print("Receiving file: {} ({}) as {}", transfer->path(), format_size(transfer->total()),
                   relative_to_root(config.folder, transfer->local_path()));
  } else {
    logger_->print("Receiving file: {} ({})", transfer->path(), format_size(transfer->total()));
  }
  connection->reply(msg, make_ack(msg.id));
  publish(*transfer);
}

void TransferService::on_file_data(const std::shared_ptr<Connection>& connection, const Message& msg) {
  auto transfer = app_.current_receive(connection->id());
  if(!transfer) {
    if(!app_.has_current_receive(connection->id())) {
      connection->send(make_error("No active file transfer"));
    }
    // chunks still in flight after a cancel or failure
    return;
  }
  if(transfer->terminal()) return;

  try {
    auto bytes = msg.payload_bytes();
    transfer->write_chunk(bytes);
    transfer->advance(bytes.size());
  } catch(const ShareError& e) {
    // lost a race with a local cancel, which already told the peer
    if(!fail(transfer, e.kind(), e.what())) return;
    logger_->error("Receiving {} failed: {}", transfer->path(), e.what());
    connection->send(make_error(e.what()));
    forward_control(*transfer, Control::Cancel);
    transfer->discard_file();
    finish(transfer);
    return;
  }
  if(transfer->progress_due()) publish(*transfer);
}

void TransferService::on_file_end(const std::shared_ptr<Connection>& connection, const Message& msg) {
  const auto& config = app_.config();
  FileEndInfo info;
  try {
    info = FileEndInfo::parse(msg.data);
  } catch(const ShareError& e) {
    connection->reply(msg, make_error(e.what()));
    return;
  }

  auto transfer = app_.find_transfer(connection->id(), info.path, TransferDirection::Receive);
  if(!transfer || transfer->terminal()) {
    connection->reply(msg, make_error("No active file transfer for " + info.path));
    return;
  }

  try {
    auto digest = transfer->finish_receive();
    if(transfer->bytes_transferred() != transfer->total()) {
      throw ShareError(ErrorKind::IOError,
                       fmt::format("Incomplete transfer of {}: received {} of {} bytes",
                                   info.path, transfer->bytes_transferred(), transfer->total()));
    }
    if(config.verify) {
      auto expected = info.checksum.empty() ? transfer->expected_checksum() : info.checksum;
      if(!expected.empty() && !iequals(expected, digest)) {
        logger_->error("Checksum verification failed: expected {}, got {}", expected, digest);
        throw ShareError(ErrorKind::ChecksumMismatch, "Checksum verification failed for " + info.path);
      } else if(!expected.empty()) {
        logger_->info("Checksum verification successful for {}", info.path);
      }
    }
  } catch(const ShareError& e) {
    fail(transfer, e.kind(), e.what());
    transfer->discard_file();
    connection->reply(msg, make_error(e.what()));
    logger_->print_err("Transfer of {} failed: {}", info.path, e.what());
    publish(*transfer);
    finish(transfer);
    return;
  }

  if(transfer->mark_complete()) {
    logger_->print("File received successfully: {}", info.path);
  }
  connection->reply(msg, make_ack(msg.id));
  const auto& timing = config.timing;
  connection->send_repeated(make_ack("", info.path), timing.path_ack_repeats, timing.path_ack_gap);
  publish(*transfer);
  finish(transfer);
}

void TransferService::on_progress(const std::shared_ptr<Connection>& connection, const Message& msg) {
  ProgressInfo info;
  try {
    info = ProgressInfo::parse(msg.data);
  } catch(const ShareError& e) {
    logger_->debug("Ignoring PROGRESS: {}", e.what());
    return;
  }
  auto transfer = app_.find_transfer(connection->id(), info.path, TransferDirection::Receive);
  if(!transfer || transfer->terminal()) return;
  transfer->set_remote_speed(info.speed_kbps);
  publish(*transfer);
}

void TransferService::on_ack(const std::shared_ptr<Connection>& connection, const Message& msg) {
  // only completion ACKs carry a path
  if(msg.data.empty()) return;
  auto transfer = app_.find_transfer(connection->id(), msg.data, TransferDirection::Send);
  if(!transfer) return;
  logger_->debug("Completion ACK for {}", msg.data);
  transfer->acknowledge();
}

void TransferService::on_connection_closed(const std::string& connection_id) {
  for(auto& transfer : app_.transfers_for_connection(connection_id)) {
    fail(transfer, ErrorKind::IOError, "Connection closed");
    // send pumps finish their own transfers
    if(transfer->direction() == TransferDirection::Receive) {
      transfer->discard_file();
      finish(transfer);
    }
  }
}

bool TransferService::pause(int id, bool notify_peer) {
  auto transfer = app_.transfer(id);
  if(!transfer || !transfer->pause()) return false;
  logger_->print("Paused transfer {}: {}", id, transfer->path());
  if(notify_peer) forward_control(*transfer, Control::Pause);
  publish(*transfer);
  return true;
}

bool TransferService::resume(int id, bool notify_peer) {
  auto transfer = app_.transfer(id);
  if(!transfer || !transfer->resume()) return false;
  logger_->print("Resumed transfer {}: {}", id, transfer->path());
  if(notify_peer) forward_control(*transfer, Control::Resume);
  publish(*transfer);
  return true;
}

bool TransferService::cancel(int id, bool notify_peer) {
  auto transfer = app_.transfer(id);
  if(!transfer || !transfer->cancel()) return false;
  logger_->print("Cancelled transfer {}: {}", id, transfer->path());
  // before FILESTART was acknowledged the send pump tells the peer
  bool peer_has_it = transfer->direction() == TransferDirection::Receive || transfer->announced();
  if(notify_peer && peer_has_it) forward_control(*transfer, Control::Cancel);
  transfer->discard_file();
  publish(*transfer);
  // a send pump notices the cancel and finishes the transfer itself
  if(transfer->direction() == TransferDirection::Receive) finish(transfer);
  return true;
}

std::string TransferService::apply_remote_control(const std::string& connection_id,
                                                  Control action,
                                                  const std::string& path) {
  std::shared_ptr<FileTransfer> target;
  for(auto& transfer : app_.transfers_for_connection(connection_id)) {
    if(transfer->path() == path && !transfer->terminal()) target = transfer;
  }
  if(!target) {
    throw ShareError(ErrorKind::NotFound, "No active transfer for " + path);
  }

  bool changed = false;
  switch(action) {
    case Control::Pause:
      changed = pause(target->id(), false);
      break;
    case Control::Resume:
      changed = resume(target->id(), false);
      break;
    case Control::Cancel:
      changed = cancel(target->id(), false);
      break;
  }
  if(!changed) {
    return fmt::format("Transfer of {} is already {}", path, to_string(target->status()));
  }
  switch(action) {
    case Control::Pause: return "Paused transfer of " + path;
    case Control::Resume: return "Resumed transfer of " + path;
    case Control::Cancel: return "Cancelled transfer of " + path;
  }
  return {};
}

bool TransferService::fail(const std::shared_ptr<FileTransfer>& transfer, ErrorKind kind,
                           const std::string& reason) {
  if(!transfer->fail(kind, reason)) return false;
  logger_->error("Transfer {} ({}) failed: {}", transfer->id(), transfer->path(), reason);
  publish(*transfer);
  return true;
}

void TransferService::finish(const std::shared_ptr<FileTransfer>& transfer) {
  if(!transfer->mark_finished()) return;
  transfer->release_file();
  app_.remove_transfer(transfer->id());
  app_.notify_transfer_finished(transfer->snapshot());
}

void TransferService::forward_control(const FileTransfer& transfer, Control action) {
  auto connection = app_.connection(transfer.connection_id());
  if(!connection || !connection->is_open()) return;
  // the COMMANDRESULT comes back unsolicited and is printed by the reader
  connection->send(make_message(MessageType::Command,
                                fmt::format("{} {}", to_string(action), transfer.path())));
}

void TransferService::publish(const FileTransfer& transfer) {
  app_.publish_progress(transfer.snapshot());
}
