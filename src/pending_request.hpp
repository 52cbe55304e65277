#pragma once

#include "protocol.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <variant>

// Waiters keyed by correlation id on a Connection.

// Completed by the first message carrying the id (ACK or ERROR).
struct AckWait {
  std::shared_ptr<std::promise<Message>> reply;
};

// Completed by COMMANDRESULT or ERROR. Auto-ACKs for the same id are skipped.
struct CommandReply {
  std::shared_ptr<std::promise<Message>> reply;
};

// Outstanding keep-alive PING, cleared by the matching PONG.
struct PingWait {
  std::chrono::steady_clock::time_point sent_at;
};

using PendingRequest = std::variant<AckWait, CommandReply, PingWait>;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
