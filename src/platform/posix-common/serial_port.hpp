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
#include "filehandle.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>

namespace espflasher::posix_common {

class SerialPort final : public espflasher::core::IByteTransport {
public:
  Kind kind() const noexcept override { return Kind::Serial; }

  SerialPort() = default;
  explicit SerialPort(std::string path, std::uint32_t baud = 115200);

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  SerialPort(SerialPort&&) noexcept;
  SerialPort& operator=(SerialPort&&) noexcept;

  ~SerialPort();

  std::string name() const override { return path_; }

  espflasher::core::Status open() noexcept override;
  void close() noexcept override;
  bool connected() const noexcept override { return fd_.valid(); }

  void set_timeout_ms(int ms) noexcept override { timeout_ms_ = (ms <= 0) ? 1 : ms; }
  int timeout_ms() const noexcept override { return timeout_ms_; }

  void set_write_timeout_ms(int ms) noexcept override { write_timeout_ms_ = (ms <= 0) ? 1 : ms; }
  int write_timeout_ms() const noexcept override { return write_timeout_ms_; }

  espflasher::core::Status send(std::span<const std::uint8_t> data) noexcept override;
  espflasher::core::Result<std::size_t> recv(std::span<std::uint8_t> data) noexcept override;

  espflasher::core::Status set_baud(std::uint32_t baud) noexcept override;
  std::uint32_t baud() const noexcept override { return baud_; }

  espflasher::core::Status set_lines(bool dtr, bool rts) noexcept override;
  void discard_input() noexcept override;

  espflasher::core::Status reset(espflasher::core::ResetMode mode, bool into_bootloader) noexcept override;

private:
  espflasher::core::Status apply_baud_() noexcept;
  espflasher::core::Status set_line_(int bit, bool on, const char* what) noexcept;
  espflasher::core::Status drain_(std::chrono::steady_clock::time_point deadline) noexcept;

private:
  espflasher::FileHandle fd_;
  std::string path_;
  std::uint32_t baud_ = 115200;
  int timeout_ms_ = 3000;
  int write_timeout_ms_ = 3000;
};

} // namespace espflasher::posix_common
