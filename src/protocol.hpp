#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

using json = nlohmann::json;

// protocol.hpp
// One message per line: {"type","data","binary"?,"id"?,"timestamp","retry_count"?}\n

enum class MessageType {
  Handshake,
  Command,
  CommandResult,
  FileStart,
  FileData,
  FileEnd,
  Progress,
  Ack,
  Error,
  Chat,
  Ping,
  Pong
};

const char* to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& name);

// FILESTART, FILEEND, COMMAND and COMMANDRESULT are acknowledged and retried.
bool requires_ack(MessageType type);

struct Message {
  MessageType type = MessageType::Chat;
  std::string data;
  bool binary = false;
  std::string id;
  int64_t timestamp = 0;
  int retry_count = 0;

  // Raw payload bytes. Decodes base64 unless `binary` is still set.
  std::string payload_bytes() const;
};

Message make_message(MessageType type, std::string data, std::string id = {});
Message make_binary_message(MessageType type, std::string bytes);
Message make_ack(std::string id, std::string data = {});
Message make_error(std::string text, std::string id = {});

// Throws ShareError(FormatError).
std::string encode(const Message& msg);
Message decode(const std::string& line);

// Best-effort id extraction from a line that failed to decode.
std::string peek_message_id(const std::string& line) noexcept;

std::string new_message_id(const std::string& prefix);

// path|size[|sha256]
struct FileStartInfo {
  std::string path;
  uint64_t size = 0;
  std::string checksum;

  static FileStartInfo parse(const std::string& data);
  std::string to_data() const;
};

// path[|sha256]
struct FileEndInfo {
  std::string path;
  std::string checksum;

  static FileEndInfo parse(const std::string& data);
  std::string to_data() const;
};

// path|sent|total|kbps
struct ProgressInfo {
  std::string path;
  uint64_t sent = 0;
  uint64_t total = 0;
  double speed_kbps = 0.0;

  static ProgressInfo parse(const std::string& data);
  std::string to_data() const;
};
