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

#include "single_instance.hpp"

#include <cstddef>
#include <cstring>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace espflasher::posix_common {

// Apple has no SOCK_CLOEXEC; the lock socket is never inherited across exec there anyway.
#ifndef SOCK_CLOEXEC
  #define SOCK_CLOEXEC 0
#endif

namespace {

#if defined(__APPLE__)
std::string lock_path(const std::string& name) { return "/tmp/" + name + ".lock"; }
#endif

} // namespace

SingleInstanceLock::~SingleInstanceLock() {
#if defined(__APPLE__)
  if (fd_.valid() && !name_.empty()) ::unlink(lock_path(name_).c_str());
#endif
}

SingleInstanceLock::SingleInstanceLock(SingleInstanceLock&& o) noexcept { *this = std::move(o); }

SingleInstanceLock& SingleInstanceLock::operator=(SingleInstanceLock&& o) noexcept {
  if (this == &o) return *this;
  fd_ = std::move(o.fd_);
  name_ = std::move(o.name_);
  return *this;
}

std::string SingleInstanceLock::name_for_port(const std::string& port) {
  std::string out = "espflasher-";
  for (char c : port) out.push_back(c == '/' || c == '\\' || c == ':' ? '_' : c);
  return out;
}

std::optional<SingleInstanceLock> SingleInstanceLock::try_acquire(std::string name) {
  FileHandle fd{do_socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0)};
  if (!fd.valid()) return std::nullopt;

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  socklen_t len = 0;

#if defined(__linux__)
  // Abstract namespace: leading NUL, nothing on disk, released with the fd.
  if (name.size() + 1 > sizeof(addr.sun_path)) {
    spdlog::warn("SingleInstanceLock: name too long: {}", name);
    return std::nullopt;
  }
  addr.sun_path[0] = '\0';
  std::memcpy(addr.sun_path + 1, name.data(), name.size());
  len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name.size());
#elif defined(__APPLE__)
  const std::string path = lock_path(name);
  if (path.size() >= sizeof(addr.sun_path)) {
    spdlog::warn("SingleInstanceLock: path too long: {}", path);
    return std::nullopt;
  }
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() + 1);
#else
  #error "Unsupported POSIX platform for SingleInstanceLock"
#endif

  if (do_bind(fd, reinterpret_cast<const sockaddr*>(&addr), len) != 0) return std::nullopt;

  spdlog::debug("SingleInstanceLock: acquired {}", name);
  return SingleInstanceLock{std::move(fd), std::move(name)};
}

} // namespace espflasher::posix_common
