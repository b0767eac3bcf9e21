#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <string_view>

namespace strata::platform {

// Exclusive advisory lock on a file, held for the lifetime of the object.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Create a file readable only by the owner. Fails if the file already exists.
void create_private_file(std::filesystem::path const &path,
                         void const *data,
                         std::size_t length);

// Expand ~ and $VAR references. Command substitution is rejected.
std::filesystem::path expand_path(std::string_view p);

bool is_tty();
bool stdin_is_tty();

}  // namespace strata::platform
