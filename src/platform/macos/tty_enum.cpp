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

#include "platform/macos/tty_enum.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace espflasher::macos {

namespace fs = std::filesystem;
using espflasher::posix_common::SerialPortInfo;

std::vector<SerialPortInfo> list_serial_ports() {
  std::vector<SerialPortInfo> out;

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/dev", ec)) {
    const auto name = entry.path().filename().string();
    if (!name.starts_with("cu.")) continue;
    // Bluetooth and debug consoles are never an ESP.
    if (name == "cu.Bluetooth-Incoming-Port" || name.starts_with("cu.debug-console")) continue;

    SerialPortInfo info;
    info.path = entry.path().string();
    info.usb = name.starts_with("cu.usbserial") || name.starts_with("cu.usbmodem") || name.starts_with("cu.wchusbserial") ||
               name.starts_with("cu.SLAB_USBtoUART");
    spdlog::debug("Found serial port: {}", info.path);
    out.push_back(std::move(info));
  }
  if (ec) spdlog::warn("Cannot list /dev: {}", ec.message());

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.usb != b.usb) return a.usb;
    return a.path < b.path;
  });
  return out;
}

} // namespace espflasher::macos
