#include "utils.hpp"
#include "errors.hpp"

#include <openssl/sha.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  std::ostringstream oss;
  for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
  return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256((const unsigned char*)data.data(), data.size(), out.data());
  return out;
}

std::string sha256_hex(const std::string &data){
  return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw ShareError(ErrorKind::IOError, "Failed to open " + path.string() + " for checksum");
  }
  Sha256Stream hasher;
  std::vector<char> buffer(64 * 1024);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0) hasher.update(buffer.data(), static_cast<std::size_t>(got));
  }
  if(in.bad()) {
    throw ShareError(ErrorKind::IOError, "Failed to read " + path.string() + " for checksum");
  }
  return hasher.hex_digest();
}

Sha256Stream::Sha256Stream()
  : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
  if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw ShareError(ErrorKind::IOError, "Unable to initialise SHA-256 context");
  }
}

void Sha256Stream::update(const char* data, std::size_t size) {
  if(!digest_.empty() || size == 0) return;
  EVP_DigestUpdate(ctx_.get(), data, size);
}

std::string Sha256Stream::hex_digest() {
  if(!digest_.empty()) return digest_;
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx_.get(), out.data(), &length) != 1) {
    throw ShareError(ErrorKind::IOError, "Unable to finalise SHA-256 digest");
  }
  out.resize(length);
  digest_ = hex_from_bytes(out);
  return digest_;
}

std::string base64_encode(const std::string& bytes) {
  if(bytes.empty()) return {};
  // EVP_EncodeBlock writes a trailing NUL
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string base64_decode(const std::string& text) {
  if(text.empty()) return {};
  if(text.size() % 4 != 0) {
    throw ShareError(ErrorKind::FormatError, "Invalid base64 payload length");
  }
  std::string out(text.size() / 4 * 3 + 1, '\0');
  int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if(written < 0) {
    throw ShareError(ErrorKind::FormatError, "Invalid base64 payload");
  }
  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t padding = 0;
  if(text[text.size() - 1] == '=') ++padding;
  if(text[text.size() - 2] == '=') ++padding;
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

std::string trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return value;
}

std::vector<std::string> split(const std::string& value, char delimiter) {
  std::vector<std::string> parts;
  std::string current;
  for(char ch : value) {
    if(ch == delimiter) {
      parts.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  parts.push_back(std::move(current));
  return parts;
}

std::vector<std::string> split_whitespace(const std::string& value) {
  std::vector<std::string> parts;
  std::istringstream iss(value);
  std::string token;
  while(iss >> token) parts.push_back(token);
  return parts;
}

std::string normalize_relative_path(const std::string& input) {
  std::string out = trim_copy(input);
  std::replace(out.begin(), out.end(), '\\', '/');
  while(!out.empty() && out.front() == '/') out.erase(out.begin());
  while(out.rfind("./", 0) == 0) out.erase(0, 2);
  while(!out.empty() && out.back() == '/') out.pop_back();
  if(out == ".") return "";
  return out;
}

bool is_valid_relative_path(const std::string& path) {
  std::string normalized = normalize_relative_path(path);
  if(normalized.empty()) return false;
  if(normalized.find(':') != std::string::npos) return false;
  if(std::filesystem::path(normalized).is_absolute()) return false;
  for(const auto& segment : split(normalized, '/')) {
    if(segment == "..") return false;
  }
  return true;
}

std::string combine_path(const std::string& base, const std::string& relative) {
  std::string trimmed = trim_copy(relative);
  if(trimmed.empty()) return normalize_relative_path(base);
  if(trimmed.front() == '/' || base.empty()) return normalize_relative_path(trimmed);
  auto joined = (std::filesystem::path(base) / trimmed).lexically_normal();
  return normalize_relative_path(joined.generic_string());
}

namespace {

std::filesystem::path absolute_root(const std::filesystem::path& root) {
  auto abs = std::filesystem::weakly_canonical(std::filesystem::absolute(root));
  if(!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
    abs = abs.parent_path();
  }
  return abs;
}

} // namespace

std::filesystem::path resolve_in_root(const std::filesystem::path& root,
                                      const std::string& relative) {
  auto base = absolute_root(root);
  auto normalized = normalize_relative_path(relative);
  auto target = normalized.empty() ? base : (base / normalized).lexically_normal();
  if(!target.has_filename() && target != target.root_path()) {
    target = target.parent_path();
  }
  auto mismatch = std::mismatch(base.begin(), base.end(), target.begin(), target.end());
  if(mismatch.first != base.end()) {
    throw ShareError(ErrorKind::AccessDenied, "Access denied: path is outside the shared folder");
  }
  return target;
}

std::string relative_to_root(const std::filesystem::path& root,
                             const std::filesystem::path& absolute) {
  auto rel = absolute.lexically_relative(absolute_root(root));
  return normalize_relative_path(rel.generic_string());
}

std::filesystem::path unique_path(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return path;
  auto stem = path.stem().string();
  auto ext = path.extension().string();
  auto dir = path.parent_path();
  for(int i = 1; ; ++i) {
    auto candidate = dir / fmt::format("{} ({}){}", stem, i, ext);
    if(!std::filesystem::exists(candidate, ec)) return candidate;
  }
}

std::string format_duration(uint64_t seconds) {
  if(seconds < 60) return fmt::format("{}s", seconds);
  if(seconds < 3600) return fmt::format("{}m {}s", seconds / 60, seconds % 60);
  return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}

std::string format_eta(uint64_t remaining_bytes, double speed_kbps) {
  if(speed_kbps <= 0.0) return "calculating...";
  auto seconds = static_cast<uint64_t>(static_cast<double>(remaining_bytes) / (speed_kbps * 1024.0));
  return format_duration(seconds);
}

std::string format_size(uint64_t bytes) {
  if(bytes < 1024) return fmt::format("{} B", bytes);
  if(bytes < 1024ull * 1024) return fmt::format("{:.2f} KB", bytes / 1024.0);
  if(bytes < 1024ull * 1024 * 1024) return fmt::format("{:.2f} MB", bytes / (1024.0 * 1024.0));
  return fmt::format("{:.2f} GB", bytes / (1024.0 * 1024.0 * 1024.0));
}

int64_t unix_millis_now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}
