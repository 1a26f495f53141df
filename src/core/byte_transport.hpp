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

#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace espflasher::core {

// How the chip is pulled into (and out of) the ROM loader.
enum class ResetMode : std::uint8_t {
  DefaultReset, // DTR/RTS wired to EN/IO0 through the usual transistor pair
  UsbJtagReset, // built-in USB-Serial/JTAG peripheral (C3/S3/C6/H2)
  NoReset,      // user holds BOOT and taps EN
};

class IByteTransport {
 public:
  enum class Kind { Serial, Simulated };

  virtual ~IByteTransport() = default;

  virtual Kind kind() const noexcept = 0;
  virtual std::string name() const = 0;

  virtual Status open() noexcept = 0;
  virtual void close() noexcept = 0;
  virtual bool connected() const noexcept = 0;

  // Receive window for the next recv().
  virtual void set_timeout_ms(int ms) noexcept = 0;
  virtual int timeout_ms() const noexcept = 0;

  // Deadline for one send(), including the drain. Independent of the receive window.
  virtual void set_write_timeout_ms(int ms) noexcept = 0;
  virtual int write_timeout_ms() const noexcept = 0;

  // Writes everything and waits until it has left the host, or fails with
  // Errc::Timeout once write_timeout_ms() has passed.
  virtual Status send(std::span<const std::uint8_t> data) noexcept = 0;

  // Returns as soon as at least one byte is available. Fails with Errc::Timeout
  // when nothing arrives within timeout_ms().
  virtual Result<std::size_t> recv(std::span<std::uint8_t> data) noexcept = 0;

  virtual Status set_baud(std::uint32_t baud) noexcept = 0;
  virtual std::uint32_t baud() const noexcept = 0;

  virtual Status set_lines(bool dtr, bool rts) noexcept = 0;
  virtual void discard_input() noexcept = 0;

  // into_bootloader=false is the hard reset that starts user firmware.
  virtual Status reset(ResetMode mode, bool into_bootloader) noexcept = 0;
};

} // namespace espflasher::core
