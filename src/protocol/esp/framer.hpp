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

#include "core/byte_transport.hpp"
#include "core/status.hpp"
#include "protocol/esp/esp_wire.hpp"
#include "protocol/esp/slip.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace espflasher::esp {

class Framer {
public:
  explicit Framer(espflasher::core::IByteTransport& io, unsigned rereads = 1, int write_timeout_ms = 3000) noexcept
    : io_(io), rereads_(rereads), write_timeout_ms_(write_timeout_ms) {}

  // Each send gets write_timeout_ms plus the frame's time on the wire at the
  // current baud, whatever the last recv left in the receive window.
  espflasher::core::Status send(const Request& rq) noexcept;

  // Waits up to timeout_ms for one response frame. A corrupt frame is followed
  // by up to `rereads` further reads within the same timeout_ms; corruption
  // after that is fatal.
  espflasher::core::Result<Response> recv(int timeout_ms) noexcept;

  void set_status_bytes(std::size_t n) noexcept { status_bytes_ = n; }
  std::size_t status_bytes() const noexcept { return status_bytes_; }

  // Drops buffered bytes and any half-read frame.
  void flush() noexcept;

  espflasher::core::IByteTransport& transport() noexcept { return io_; }

private:
  espflasher::core::Result<Response> read_one_(int timeout_ms) noexcept;

  espflasher::core::IByteTransport& io_;
  unsigned rereads_;
  int write_timeout_ms_;
  std::size_t status_bytes_ = ROM_STATUS_BYTES;

  slip::Reader reader_;
  std::array<std::uint8_t, 512> rx_{};
  std::size_t rx_pos_ = 0;
  std::size_t rx_len_ = 0;
};

} // namespace espflasher::esp
