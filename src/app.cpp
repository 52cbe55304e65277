#include "app.hpp"

#include <algorithm>

#include "command_dispatcher.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "transfer_service.hpp"

std::shared_ptr<App> App::create(Config config, std::shared_ptr<Logger> logger) {
  return std::shared_ptr<App>(new App(std::move(config), std::move(logger)));
}

App::App(Config config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("node")) {
  ignore_ = IgnoreList::load(config_.folder);
  transfers_ = std::make_unique<TransferService>(*this);
  commands_ = std::make_unique<CommandDispatcher>(*this);
}

App::~App() = default;

IgnoreList App::ignore() const {
  std::lock_guard lg(m_);
  return ignore_;
}

void App::reload_ignore() {
  auto fresh = IgnoreList::load(config_.folder);
  std::lock_guard lg(m_);
  ignore_ = std::move(fresh);
}

void App::add_connection(std::shared_ptr<Connection> connection) {
  if(!connection) return;
  std::lock_guard lg(m_);
  connections_[connection->id()] = std::move(connection);
}

void App::remove_connection(const std::string& id) {
  std::lock_guard lg(m_);
  connections_.erase(id);
  current_receive_.erase(id);
}

std::shared_ptr<Connection> App::connection(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<Connection> App::first_connection() const {
  std::lock_guard lg(m_);
  return connections_.empty() ? nullptr : connections_.begin()->second;
}

std::size_t App::connection_count() const {
  std::lock_guard lg(m_);
  return connections_.size();
}

std::size_t App::in_progress_count_locked() const {
  return static_cast<std::size_t>(std::count_if(transfers_by_id_.begin(), transfers_by_id_.end(),
    [](const auto& entry){ return entry.second->status() == TransferStatus::InProgress; }));
}

int App::register_locked(const std::shared_ptr<FileTransfer>& transfer) {
  int id = next_transfer_id_++;
  transfer->set_id(id);
  transfers_by_id_[id] = transfer;
  return id;
}

int App::add_transfer(const std::shared_ptr<FileTransfer>& transfer) {
  std::lock_guard lg(m_);
  return register_locked(transfer);
}

int App::try_add_transfer(const std::shared_ptr<FileTransfer>& transfer) {
  std::lock_guard lg(m_);
  if(in_progress_count_locked() >= config_.max_transfers) {
    throw ShareError(ErrorKind::TooManyTransfers,
                     "Too many active transfers, please wait for current transfers to complete");
  }
  return register_locked(transfer);
}

void App::remove_transfer(int id) {
  std::lock_guard lg(m_);
  transfers_by_id_.erase(id);
}

std::shared_ptr<FileTransfer> App::transfer(int id) const {
  std::lock_guard lg(m_);
  auto it = transfers_by_id_.find(id);
  return it == transfers_by_id_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<FileTransfer>> App::transfers_for_connection(const std::string& connection_id) const {
  std::lock_guard lg(m_);
  std::vector<std::shared_ptr<FileTransfer>> out;
  for(const auto& [id, transfer] : transfers_by_id_) {
    if(transfer->connection_id() == connection_id) out.push_back(transfer);
  }
  return out;
}

std::shared_ptr<FileTransfer> App::find_transfer(const std::string& connection_id,
                                                 const std::string& path,
                                                 TransferDirection direction) const {
  std::lock_guard lg(m_);
  for(auto it = transfers_by_id_.rbegin(); it != transfers_by_id_.rend(); ++it) {
    const auto& transfer = it->second;
    if(transfer->direction() == direction &&
       transfer->path() == path &&
       (connection_id.empty() || transfer->connection_id() == connection_id)) {
      return transfer;
    }
  }
  return nullptr;
}

std::vector<FileTransfer::Snapshot> App::list_transfers() const {
  std::lock_guard lg(m_);
  std::vector<FileTransfer::Snapshot> out;
  out.reserve(transfers_by_id_.size());
  for(const auto& entry : transfers_by_id_) out.push_back(entry.second->snapshot());
  return out;
}

bool App::can_start_transfer() const {
  std::lock_guard lg(m_);
  return in_progress_count_locked() < config_.max_transfers;
}

std::size_t App::in_progress_count() const {
  std::lock_guard lg(m_);
  return in_progress_count_locked();
}

bool App::is_any_transfer_active() const {
  std::lock_guard lg(m_);
  return std::any_of(transfers_by_id_.begin(), transfers_by_id_.end(),
    [](const auto& entry){ return !entry.second->terminal(); });
}

void App::set_current_receive(const std::string& connection_id, int transfer_id) {
  std::lock_guard lg(m_);
  current_receive_[connection_id] = transfer_id;
}

bool App::has_current_receive(const std::string& connection_id) const {
  std::lock_guard lg(m_);
  return current_receive_.count(connection_id) > 0;
}

std::shared_ptr<FileTransfer> App::current_receive(const std::string& connection_id) const {
  std::lock_guard lg(m_);
  auto it = current_receive_.find(connection_id);
  if(it == current_receive_.end()) return nullptr;
  auto transfer = transfers_by_id_.find(it->second);
  return transfer == transfers_by_id_.end() ? nullptr : transfer->second;
}

void App::set_progress_listener(TransferListener listener) {
  std::lock_guard lg(m_);
  progress_listener_ = std::move(listener);
}

void App::publish_progress(const FileTransfer::Snapshot& snapshot) {
  TransferListener listener;
  {
    std::lock_guard lg(m_);
    listener = progress_listener_;
  }
  if(listener) listener(snapshot);
}

std::size_t App::add_transfer_listener(TransferListener listener) {
  std::lock_guard lg(m_);
  auto id = next_listener_id_++;
  transfer_listeners_[id] = std::move(listener);
  return id;
}

void App::remove_transfer_listener(std::size_t handle) {
  std::lock_guard lg(m_);
  transfer_listeners_.erase(handle);
}

void App::notify_transfer_finished(const FileTransfer::Snapshot& snapshot) {
  std::vector<TransferListener> listeners;
  {
    std::lock_guard lg(m_);
    for(const auto& entry : transfer_listeners_) listeners.push_back(entry.second);
  }
  for(auto& listener : listeners) {
    if(listener) listener(snapshot);
  }
}

void App::set_session_end_handler(SessionEndHandler handler) {
  std::lock_guard lg(m_);
  session_end_handler_ = std::move(handler);
}

void App::end_session() {
  SessionEndHandler handler;
  {
    std::lock_guard lg(m_);
    if(session_ended_) return;
    session_ended_ = true;
    handler = session_end_handler_;
  }
  if(handler) handler();
}

bool App::session_ended() const {
  std::lock_guard lg(m_);
  return session_ended_;
}

void App::shutdown() {
  std::vector<std::shared_ptr<Connection>> open;
  {
    std::lock_guard lg(m_);
    shutting_down_ = true;
    for(const auto& entry : connections_) open.push_back(entry.second);
  }
  for(auto& connection : open) connection->close();
}

bool App::shutting_down() const {
  std::lock_guard lg(m_);
  return shutting_down_;
}

std::shared_ptr<void> App::track_worker() {
  {
    std::lock_guard lg(workers_m_);
    ++workers_;
  }
  auto self = shared_from_this();
  return std::shared_ptr<void>(nullptr, [self](void*){
    {
      std::lock_guard lg(self->workers_m_);
      --self->workers_;
    }
    self->workers_cv_.notify_all();
  });
}

bool App::wait_for_workers(std::chrono::milliseconds timeout) {
  std::unique_lock lock(workers_m_);
  return workers_cv_.wait_for(lock, timeout, [this]{ return workers_ == 0; });
}
