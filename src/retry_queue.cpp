#include "retry_queue.hpp"

RetryQueue::RetryQueue(std::chrono::milliseconds initial_delay, int max_retries)
  : initial_delay_(initial_delay.count() > 0 ? initial_delay : std::chrono::milliseconds(100)),
    max_retries_(max_retries < 0 ? 0 : max_retries) {}

RetryQueue::clock::duration RetryQueue::backoff(int retries) const {
  // cap the shift, 2^20 * initial is already far past any useful deadline
  int shift = retries > 20 ? 20 : retries;
  return initial_delay_ * (1LL << shift);
}

void RetryQueue::schedule(const std::string& id, Entry& entry, clock::time_point from) {
  entry.deadline = from + backoff(entry.retries);
  deadlines_.emplace(entry.deadline, id);
}

void RetryQueue::add(const Message& msg, clock::time_point now) {
  if(msg.id.empty()) return;
  remove(msg.id);
  Entry entry;
  entry.message = msg;
  entry.retries = 0;
  auto& stored = entries_[msg.id] = std::move(entry);
  schedule(msg.id, stored, now);
}

bool RetryQueue::remove(const std::string& id) {
  auto it = entries_.find(id);
  if(it == entries_.end()) return false;
  auto range = deadlines_.equal_range(it->second.deadline);
  for(auto d = range.first; d != range.second; ++d) {
    if(d->second == id) {
      deadlines_.erase(d);
      break;
    }
  }
  entries_.erase(it);
  return true;
}

void RetryQueue::clear() {
  entries_.clear();
  deadlines_.clear();
}

RetryQueue::Due RetryQueue::poll(clock::time_point now) {
  Due due;
  while(!deadlines_.empty() && deadlines_.begin()->first <= now) {
    auto id = deadlines_.begin()->second;
    deadlines_.erase(deadlines_.begin());
    auto it = entries_.find(id);
    if(it == entries_.end()) continue;
    auto& entry = it->second;
    if(entry.retries >= max_retries_) {
      due.exhausted.push_back(std::move(entry.message));
      entries_.erase(it);
      continue;
    }
    ++entry.retries;
    entry.message.retry_count = entry.retries;
    due.resend.push_back(entry.message);
    schedule(id, entry, now);
  }
  return due;
}

