/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

namespace espflasher {

struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  bool valid() const noexcept { return fd >= 0; }

  // ENOENT/EACCES are expected user errors; the caller reports them.
  static int open(const char* path, int flags, const char* flags_desc) noexcept {
    const int rc = ::open(path, flags);
    if (rc < 0) {
      const int e = errno;
      spdlog::debug("open({}, {}): {}", path, flags_desc, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  static int socket(int domain, int type, int protocol,
                    const char* domain_name, const char* type_name, const char* proto_name) noexcept
  {
    const int rc = ::socket(domain, type, protocol);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("socket(domain={}, type={}, proto={}): {}", domain_name, type_name, proto_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int bind(const struct sockaddr* addr, socklen_t addrlen) const noexcept {
    const int rc = ::bind(fd, addr, addrlen);
    if (rc != 0) {
      const int e = errno;
      // EADDRINUSE is how the instance lock reports "taken".
      if (e != EADDRINUSE) spdlog::error("bind(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int ioctl(unsigned long request, void* arg, const char* req_name) const noexcept {
    const int rc = ::ioctl(fd, request, arg);
    if (rc < 0) { // some ioctls return positive values on success
      const int e = errno;
      spdlog::error("ioctl(fd={}, req={}): {}", fd, req_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int tcgetattr(struct termios* tio) const noexcept {
    const int rc = ::tcgetattr(fd, tio);
    if (rc != 0) {
      const int e = errno;
      spdlog::error("tcgetattr(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int tcsetattr(int when, const struct termios* tio, const char* when_desc) const noexcept {
    const int rc = ::tcsetattr(fd, when, tio);
    if (rc != 0) {
      const int e = errno;
      spdlog::error("tcsetattr(fd={}, {}): {}", fd, when_desc, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  ssize_t read(void* buf, size_t count) const noexcept {
    const ssize_t rc = ::read(fd, buf, count);
    if (rc < 0) {
      const int e = errno;
      if (e != EAGAIN && e != EWOULDBLOCK && e != EINTR)
        spdlog::error("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  ssize_t write(const void* buf, size_t count) const noexcept {
    const ssize_t rc = ::write(fd, buf, count);
    if (rc < 0) {
      const int e = errno;
      if (e != EAGAIN && e != EWOULDBLOCK && e != EINTR)
        spdlog::error("write(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return rc;
  }
};

} // namespace espflasher

#define do_open(path, flags) (FileHandle::open(path, flags, #flags))
#define do_socket(domain, type, protocol) (FileHandle::socket(domain, type, protocol, #domain, #type, #protocol))
#define do_bind(fd, addr, addrlen) ((fd).valid() ? (fd).bind(addr, addrlen) : -1)
#define do_ioctl(fd, request, arg) ((fd).valid() ? (fd).ioctl(request, arg, #request) : -1)
#define do_tcgetattr(fd, tio) ((fd).valid() ? (fd).tcgetattr(tio) : -1)
#define do_tcsetattr(fd, when, tio) ((fd).valid() ? (fd).tcsetattr(when, tio, #when) : -1)
#define do_read(fd, buf, count) ((fd).valid() ? (fd).read(buf, count) : -1)
#define do_write(fd, buf, count) ((fd).valid() ? (fd).write(buf, count) : -1)
