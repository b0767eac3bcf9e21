#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wordexp.h>

#include <cerrno>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

namespace strata::platform {

struct file_lock::impl {
  int fd;
  std::mutex *path_mutex;  // owned by the s_lock_mutexes map

  // POSIX record locks are per-process, so threads of this process are serialized
  // through an in-process mutex per canonical path.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex> > s_lock_mutexes;
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::file_lock(std::filesystem::path const &path) {
  std::string const canonical_key{
    std::filesystem::absolute(path).lexically_normal().string()
  };

  std::unique_lock<std::mutex> path_lock{ [&]() {
    std::lock_guard<std::mutex> lock(impl::s_lock_map_mutex);
    auto &mutex_ptr{ impl::s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::mutex>(); }
    return std::unique_lock<std::mutex>{ *mutex_ptr };
  }() };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{};
  fl.l_type = F_WRLCK;
  fl.l_whence = SEEK_SET;

  if (::fcntl(fd, F_SETLKW, &fl) == -1) {
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->path_mutex = path_lock.release();  // stays locked until destruction
}

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->path_mutex) { impl_->path_mutex->unlock(); }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void create_private_file(std::filesystem::path const &path,
                         void const *data,
                         std::size_t length) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, S_IRUSR | S_IWUSR) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to create " + path.string());
  }

  auto const *cursor{ static_cast<unsigned char const *>(data) };
  std::size_t remaining{ length };
  while (remaining > 0) {
    ssize_t const n{ ::write(fd, cursor, remaining) };
    if (n < 0) {
      if (errno == EINTR) { continue; }
      int const err{ errno };
      ::close(fd);
      std::error_code ec;
      std::filesystem::remove(path, ec);
      throw std::system_error(err, std::system_category(), "Failed to write " + path.string());
    }
    cursor += n;
    remaining -= static_cast<std::size_t>(n);
  }

  if (::close(fd) != 0) {
    throw std::system_error(errno, std::system_category(), "Failed to close " + path.string());
  }
}

std::filesystem::path expand_path(std::string_view p) {
  if (p.empty()) { return {}; }

  wordexp_t we{};
  std::string const path_str{ p };
  int const flags{ WRDE_NOCMD | WRDE_UNDEF };  // no $(cmd), fail on undefined $VAR

  int const rc{ wordexp(path_str.c_str(), &we, flags) };

  if (rc == 0) {
    if (we.we_wordc == 0) {
      wordfree(&we);
      throw std::runtime_error("path expansion produced no results: " + path_str);
    }
    std::filesystem::path result{ we.we_wordv[0] };
    wordfree(&we);
    return result;
  }

  // wordfree() must only be called after successful wordexp()
  if (rc == WRDE_BADVAL) {
    throw std::runtime_error("undefined variable in path: " + path_str);
  }
  throw std::runtime_error("path expansion failed: " + path_str);
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

bool stdin_is_tty() { return ::isatty(::fileno(stdin)) != 0; }

}  // namespace strata::platform
