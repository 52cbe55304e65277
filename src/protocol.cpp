#include "protocol.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <random>

namespace {

struct TypeName {
    MessageType type;
    const char* name;
};

constexpr TypeName kTypeNames[] = {
    {MessageType::Handshake, "HANDSHAKE"},
    {MessageType::Command, "COMMAND"},
    {MessageType::CommandResult, "COMMANDRESULT"},
    {MessageType::FileStart, "FILESTART"},
    {MessageType::FileData, "FILEDATA"},
    {MessageType::FileEnd, "FILEEND"},
    {MessageType::Progress, "PROGRESS"},
    {MessageType::Ack, "ACK"},
    {MessageType::Error, "ERROR"},
    {MessageType::Chat, "MESSAGE"},
    {MessageType::Ping, "PING"},
    {MessageType::Pong, "PONG"},
};

[[noreturn]] void format_error(const std::string& what) {
    throw ShareError(ErrorKind::FormatError, what);
}

bool is_sha256_hex(const std::string& value) {
    if(value.size() != 64) return false;
    return std::all_of(value.begin(), value.end(), [](unsigned char ch){
        return std::isxdigit(ch) != 0;
    });
}

uint64_t parse_count(const std::string& text, const char* field) {
    auto clean = trim_copy(text);
    if(clean.empty() || !std::all_of(clean.begin(), clean.end(),
                                     [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
        format_error(fmt::format("Invalid {} '{}'", field, text));
    }
    try {
        return std::stoull(clean);
    } catch(const std::exception&) {
        format_error(fmt::format("Invalid {} '{}'", field, text));
    }
}

// Rejoins parts [0, count) so paths containing '|' survive.
std::string join_head(const std::vector<std::string>& parts, std::size_t count) {
    std::string out;
    for(std::size_t i = 0; i < count; ++i) {
        if(i > 0) out.push_back('|');
        out += parts[i];
    }
    return out;
}

} // namespace

const char* to_string(MessageType type) {
    for(const auto& entry : kTypeNames) {
        if(entry.type == type) return entry.name;
    }
    return "UNKNOWN";
}

std::optional<MessageType> message_type_from_string(const std::string& name) {
    for(const auto& entry : kTypeNames) {
        if(name == entry.name) return entry.type;
    }
    return std::nullopt;
}

bool requires_ack(MessageType type) {
    switch(type) {
        case MessageType::FileStart:
        case MessageType::FileEnd:
        case MessageType::Command:
        case MessageType::CommandResult:
            return true;
        default:
            return false;
    }
}

std::string Message::payload_bytes() const {
    if(binary) return data;
    return base64_decode(data);
}

Message make_message(MessageType type, std::string data, std::string id) {
    Message msg;
    msg.type = type;
    msg.data = std::move(data);
    msg.id = std::move(id);
    msg.timestamp = unix_millis_now();
    return msg;
}

Message make_binary_message(MessageType type, std::string bytes) {
    Message msg = make_message(type, std::move(bytes));
    msg.binary = true;
    return msg;
}

Message make_ack(std::string id, std::string data) {
    return make_message(MessageType::Ack, std::move(data), std::move(id));
}

Message make_error(std::string text, std::string id) {
    return make_message(MessageType::Error, std::move(text), std::move(id));
}

std::string encode(const Message& msg) {
    json j;
    j["type"] = to_string(msg.type);
    j["data"] = msg.binary ? base64_encode(msg.data) : msg.data;
    if(!msg.id.empty()) j["id"] = msg.id;
    j["timestamp"] = msg.timestamp;
    if(msg.retry_count > 0) j["retry_count"] = msg.retry_count;
    try {
        return j.dump() + "\n";
    } catch(const json::type_error& e) {
        format_error(fmt::format("Unable to encode {} message: {}", to_string(msg.type), e.what()));
    }
}

Message decode(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch(const json::parse_error& e) {
        format_error(fmt::format("Invalid JSON: {}", e.what()));
    }
    if(!j.is_object()) format_error("Message is not a JSON object");

    auto type_it = j.find("type");
    if(type_it == j.end() || !type_it->is_string()) format_error("Message has no type");
    auto type = message_type_from_string(type_it->get<std::string>());
    if(!type) format_error("Unknown message type '" + type_it->get<std::string>() + "'");

    Message msg;
    msg.type = *type;

    auto data_it = j.find("data");
    if(data_it != j.end() && !data_it->is_null()) {
        if(!data_it->is_string()) format_error("Field 'data' must be a string");
        msg.data = data_it->get<std::string>();
    }

    auto binary_it = j.find("binary");
    if(binary_it != j.end() && !binary_it->is_null()) {
        if(!binary_it->is_boolean()) format_error("Field 'binary' must be a boolean");
        msg.binary = binary_it->get<bool>();
    }

    auto id_it = j.find("id");
    if(id_it != j.end() && !id_it->is_null()) {
        if(!id_it->is_string()) format_error("Field 'id' must be a string");
        msg.id = id_it->get<std::string>();
    }

    auto ts_it = j.find("timestamp");
    if(ts_it != j.end()) {
        if(ts_it->is_number_integer()) {
            msg.timestamp = ts_it->get<int64_t>();
        } else if(ts_it->is_number_float()) {
            msg.timestamp = static_cast<int64_t>(std::llround(ts_it->get<double>() * 1000.0));
        }
    }

    auto retry_it = j.find("retry_count");
    if(retry_it != j.end() && !retry_it->is_null()) {
        if(!retry_it->is_number_integer()) format_error("Field 'retry_count' must be an integer");
        msg.retry_count = retry_it->get<int>();
    }
    return msg;
}

std::string peek_message_id(const std::string& line) noexcept {
    try {
        auto j = json::parse(line, nullptr, false);
        if(!j.is_object()) return {};
        auto it = j.find("id");
        if(it == j.end() || !it->is_string()) return {};
        return it->get<std::string>();
    } catch(const std::exception&) {
        return {};
    }
}

std::string new_message_id(const std::string& prefix) {
    // the nonce keeps ids from two processes apart
    static const uint32_t nonce = std::random_device{}();
    static std::atomic<uint64_t> counter{1};
    return fmt::format("{}-{:08x}-{}-{}", prefix, nonce, unix_millis_now(), counter.fetch_add(1));
}

FileStartInfo FileStartInfo::parse(const std::string& data) {
    auto parts = split(data, '|');
    if(parts.size() < 2) format_error("FILESTART payload must be path|size[|sha256]");
    FileStartInfo info;
    std::size_t size_index = parts.size() - 1;
    if(parts.size() >= 3 && is_sha256_hex(parts.back())) {
        info.checksum = parts.back();
        size_index = parts.size() - 2;
    }
    info.size = parse_count(parts[size_index], "file size");
    info.path = join_head(parts, size_index);
    if(info.path.empty()) format_error("FILESTART payload has an empty path");
    return info;
}

std::string FileStartInfo::to_data() const {
    if(checksum.empty()) return fmt::format("{}|{}", path, size);
    return fmt::format("{}|{}|{}", path, size, checksum);
}

FileEndInfo FileEndInfo::parse(const std::string& data) {
    auto parts = split(data, '|');
    FileEndInfo info;
    if(parts.size() >= 2 && is_sha256_hex(parts.back())) {
        info.checksum = parts.back();
        info.path = join_head(parts, parts.size() - 1);
    } else {
        info.path = data;
    }
    if(info.path.empty()) format_error("FILEEND payload has an empty path");
    return info;
}

std::string FileEndInfo::to_data() const {
    if(checksum.empty()) return path;
    return path + "|" + checksum;
}

ProgressInfo ProgressInfo::parse(const std::string& data) {
    auto parts = split(data, '|');
    if(parts.size() < 4) format_error("PROGRESS payload must be path|sent|total|kbps");
    const auto n = parts.size();
    ProgressInfo info;
    info.path = join_head(parts, n - 3);
    info.sent = parse_count(parts[n - 3], "sent bytes");
    info.total = parse_count(parts[n - 2], "total bytes");
    try {
        std::size_t consumed = 0;
        auto text = trim_copy(parts[n - 1]);
        info.speed_kbps = std::stod(text, &consumed);
        if(consumed != text.size() || !std::isfinite(info.speed_kbps)) {
            format_error("Invalid speed '" + parts[n - 1] + "'");
        }
    } catch(const std::logic_error&) {
        format_error("Invalid speed '" + parts[n - 1] + "'");
    }
    return info;
}

std::string ProgressInfo::to_data() const {
    return fmt::format("{}|{}|{}|{:.2f}", path, sent, total, speed_kbps);
}
