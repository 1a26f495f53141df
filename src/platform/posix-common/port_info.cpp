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

#include "platform/posix-common/port_info.hpp"

#include <array>

#include <fmt/format.h>

namespace espflasher::posix_common {

namespace {

struct Bridge {
  std::uint16_t vendor;
  std::uint16_t product;
  std::string_view name;
};

constexpr std::array<Bridge, 9> kBridges{{
  {0x10C4, 0xEA60, "CP210x"},
  {0x1A86, 0x7523, "CH340"},
  {0x1A86, 0x55D4, "CH9102"},
  {0x0403, 0x6001, "FT232R"},
  {0x0403, 0x6010, "FT2232"},
  {0x0403, 0x6014, "FT232H"},
  {0x0403, 0x6015, "FT231X"},
  {0x303A, 0x1001, "ESP USB-Serial/JTAG"},
  {0x303A, 0x0002, "ESP32-S2 USB-CDC"},
}};

} // namespace

std::string_view known_bridge(std::uint16_t vendor, std::uint16_t product) noexcept {
  for (const auto& b : kBridges) {
    if (b.vendor == vendor && b.product == product) return b.name;
  }
  return {};
}

std::string SerialPortInfo::describe() const {
  if (!usb || (vendor == 0 && product == 0)) return path;
  std::string s = fmt::format("{}  [{:04x}:{:04x}]", path, vendor, product);
  if (!manufacturer.empty() || !description.empty()) s += fmt::format(" {} {}", manufacturer, description);
  if (!bridge.empty()) s += fmt::format(" ({})", bridge);
  return s;
}

} // namespace espflasher::posix_common
