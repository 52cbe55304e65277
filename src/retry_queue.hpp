#pragma once

#include "protocol.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

// Deadline-ordered set of sent ACK-requiring messages. An entry is resent
// with the same id when `initial * 2^retries` passed since its last attempt
// and is given up after `max_retries` resends. Not thread-safe: the owning
// connection only touches it from its io_context thread.
class RetryQueue {
public:
  using clock = std::chrono::steady_clock;

  struct Due {
    std::vector<Message> resend;
    std::vector<Message> exhausted;
  };

  explicit RetryQueue(std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100),
                      int max_retries = 5);

  // Replaces any entry with the same id.
  void add(const Message& msg, clock::time_point now = clock::now());
  bool remove(const std::string& id);
  void clear();

  Due poll(clock::time_point now = clock::now());

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  bool contains(const std::string& id) const { return entries_.count(id) != 0; }

private:
  struct Entry {
    Message message;
    int retries = 0;
    clock::time_point deadline;
  };

  clock::duration backoff(int retries) const;
  void schedule(const std::string& id, Entry& entry, clock::time_point from);

  std::chrono::milliseconds initial_delay_;
  int max_retries_;
  std::unordered_map<std::string, Entry> entries_;
  std::multimap<clock::time_point, std::string> deadlines_;
};
