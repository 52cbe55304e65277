#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Whole-file SHA-256 as lowercase hex. Throws ShareError(IOError).
std::string sha256_file(const std::filesystem::path& path);

// Incremental SHA-256 used while bytes are appended to a received file.
class Sha256Stream {
public:
  Sha256Stream();

  void update(const char* data, std::size_t size);
  // Finalizes on first call; later calls return the same digest.
  std::string hex_digest();

private:
  std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> ctx_;
  std::string digest_;
};

std::string base64_encode(const std::string& bytes);
// Throws ShareError(FormatError) on malformed input.
std::string base64_decode(const std::string& text);

std::string trim_copy(std::string value);
std::string to_upper(std::string value);
std::vector<std::string> split(const std::string& value, char delimiter);
std::vector<std::string> split_whitespace(const std::string& value);

// Forward slashes, no leading "/" or "./", no trailing "/". "." becomes "".
std::string normalize_relative_path(const std::string& input);
bool is_valid_relative_path(const std::string& path);
// Joins a working directory and a user supplied path. A leading "/" means
// "relative to the shared root".
std::string combine_path(const std::string& base, const std::string& relative);
// Absolute location of `relative` under `root`. Throws ShareError(AccessDenied)
// when the lexically normalized result escapes the root.
std::filesystem::path resolve_in_root(const std::filesystem::path& root,
                                      const std::string& relative);
std::string relative_to_root(const std::filesystem::path& root,
                             const std::filesystem::path& absolute);
// "name.ext" -> "name (1).ext", "name (2).ext", ... until unused.
std::filesystem::path unique_path(const std::filesystem::path& path);

std::string format_duration(uint64_t seconds);
std::string format_eta(uint64_t remaining_bytes, double speed_kbps);
std::string format_size(uint64_t bytes);
int64_t unix_millis_now();
