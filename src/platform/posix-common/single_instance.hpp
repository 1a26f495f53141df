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

#include "platform/posix-common/filehandle.hpp"

#include <optional>
#include <string>

namespace espflasher::posix_common {

// Held for as long as this process owns a serial port. A second flasher
// pointed at the same port fails to acquire it.
class SingleInstanceLock {
public:
  SingleInstanceLock() = default;
  ~SingleInstanceLock();

  SingleInstanceLock(const SingleInstanceLock&) = delete;
  SingleInstanceLock& operator=(const SingleInstanceLock&) = delete;

  SingleInstanceLock(SingleInstanceLock&& o) noexcept;
  SingleInstanceLock& operator=(SingleInstanceLock&& o) noexcept;

  static std::optional<SingleInstanceLock> try_acquire(std::string name);

  // "espflasher-" plus the port path with separators flattened.
  static std::string name_for_port(const std::string& port);

  const std::string& name() const noexcept { return name_; }

private:
  SingleInstanceLock(FileHandle fd, std::string name) : fd_(std::move(fd)), name_(std::move(name)) {}

  FileHandle fd_;
  std::string name_;
};

} // namespace espflasher::posix_common
