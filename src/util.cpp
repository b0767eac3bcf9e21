#include "util.h"

#include "platform.h"

#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace strata {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

std::vector<unsigned char> util_hex_to_bytes(std::string const &hex) {
  if (hex.size() % 2 != 0) {
    throw std::runtime_error("util_hex_to_bytes: hex string must have even length, got " +
                             std::to_string(hex.size()));
  }

  std::vector<unsigned char> result;
  result.reserve(hex.size() / 2);

  for (size_t i{}; i < hex.size(); i += 2) {
    int const hi{ util_hex_char_to_int(hex[i]) };
    int const lo{ util_hex_char_to_int(hex[i + 1]) };

    if (hi < 0 || lo < 0) {
      throw std::runtime_error("util_hex_to_bytes: invalid character at position " +
                               std::to_string(hi < 0 ? i : i + 1));
    }

    result.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

void util_write_file_atomic(std::filesystem::path const &path,
                            void const *data,
                            size_t length) {
  auto tmp_path{ path };
  tmp_path += ".tmp";
  scoped_path_cleanup tmp_cleanup{ tmp_path };

  {
    auto file{ util_open_file(tmp_path, "wb") };
    if (!file) {
      throw std::runtime_error("util_write_file_atomic: failed to open " +
                               tmp_path.string());
    }
    if (length > 0 && std::fwrite(data, 1, length, file.get()) != length) {
      throw std::runtime_error("util_write_file_atomic: short write to " +
                               tmp_path.string());
    }
    if (std::fflush(file.get()) != 0) {
      throw std::runtime_error("util_write_file_atomic: flush failed for " +
                               tmp_path.string());
    }
  }

  platform::atomic_rename(tmp_path, path);
  tmp_cleanup.reset();
}

std::string_view util_trim(std::string_view s) {
  auto const first{ s.find_first_not_of(" \t\r\n") };
  if (first == std::string_view::npos) { return {}; }
  auto const last{ s.find_last_not_of(" \t\r\n") };
  return s.substr(first, last - first + 1);
}

std::vector<std::string_view> util_split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    auto const pos{ text.find('\n') };
    auto line{ text.substr(0, pos) };
    if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
    lines.push_back(line);
    text = (pos == std::string_view::npos) ? std::string_view{} : text.substr(pos + 1);
  }
  return lines;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace strata
