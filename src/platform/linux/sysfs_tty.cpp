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

#include "platform/linux/sysfs_tty.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

namespace espflasher::linux {

namespace fs = std::filesystem;
using espflasher::posix_common::SerialPortInfo;

namespace {

constexpr std::string_view kSysClassTty = "/sys/class/tty";

std::string read_text_file(const fs::path& p) {
  std::ifstream in(p);
  if (!in.is_open()) return {};
  std::string s;
  std::getline(in, s);
  return std::string(espflasher::core::trim(s));
}

std::optional<std::uint16_t> parse_u16_hex(std::string_view s) {
  s = espflasher::core::trim(s);
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 16);
  if (ec != std::errc{} || ptr != s.data() + s.size() || v > 0xFFFFu) return std::nullopt;
  return static_cast<std::uint16_t>(v);
}

// Walks up from the tty's device node to the USB device that owns it.
std::optional<fs::path> usb_parent(fs::path dev) {
  for (int depth = 0; depth < 4 && !dev.empty() && dev != dev.root_path(); ++depth) {
    std::error_code ec;
    if (fs::exists(dev / "idVendor", ec)) return dev;
    dev = dev.parent_path();
  }
  return std::nullopt;
}

std::optional<SerialPortInfo> load_one(const fs::path& tty_dir, const std::string& name) {
  std::error_code ec;
  const fs::path dev_link = tty_dir / "device";
  if (!fs::exists(dev_link, ec)) return std::nullopt;

  const fs::path dev = fs::canonical(dev_link, ec);
  if (ec) return std::nullopt;

  // Legacy 8250 UARTs without hardware behind them.
  const auto subsystem = fs::read_symlink(dev / "subsystem", ec).filename().string();
  if (!ec && subsystem == "platform") return std::nullopt;

  SerialPortInfo info;
  info.path = "/dev/" + name;

  if (auto usb = usb_parent(dev)) {
    const auto vend = parse_u16_hex(read_text_file(*usb / "idVendor"));
    const auto prod = parse_u16_hex(read_text_file(*usb / "idProduct"));
    if (vend && prod) {
      info.usb = true;
      info.vendor = *vend;
      info.product = *prod;
      info.manufacturer = read_text_file(*usb / "manufacturer");
      info.description = read_text_file(*usb / "product");
      info.bridge = espflasher::posix_common::known_bridge(info.vendor, info.product);
    }
  }
  return info;
}

} // namespace

std::vector<SerialPortInfo> list_serial_ports() {
  std::vector<SerialPortInfo> out;

  std::error_code ec;
  const fs::path base{kSysClassTty};
  if (!fs::is_directory(base, ec)) return out;

  for (const auto& entry : fs::directory_iterator(base, ec)) {
    const auto name = entry.path().filename().string();
    auto info = load_one(entry.path(), name);
    if (!info) continue;

    spdlog::debug("Found serial port: {}", info->describe());
    out.push_back(std::move(*info));
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.usb != b.usb) return a.usb;
    return a.path < b.path;
  });
  return out;
}

} // namespace espflasher::linux
