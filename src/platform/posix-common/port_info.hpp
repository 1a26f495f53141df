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

#include <cstdint>
#include <string>
#include <string_view>

namespace espflasher::posix_common {

struct SerialPortInfo {
  std::string path;
  bool usb = false;
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::string manufacturer;
  std::string description;
  std::string_view bridge; // empty unless a USB-UART commonly found on ESP boards

  std::string describe() const;
};

// CP210x, CH34x, FTDI and the built-in Espressif USB-Serial/JTAG.
std::string_view known_bridge(std::uint16_t vendor, std::uint16_t product) noexcept;

} // namespace espflasher::posix_common
