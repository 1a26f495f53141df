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

#include "protocol/esp/chip.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <array>

namespace espflasher::esp {

namespace {

constexpr std::array<std::uint32_t, 1> kEsp32Magic{0x00F01D83};
constexpr std::array<std::uint32_t, 1> kEsp32S2Magic{0x000007C6};
constexpr std::array<std::uint32_t, 1> kEsp32S3Magic{0x00000009};
constexpr std::array<std::uint32_t, 2> kEsp32C2Magic{0x6F51306F, 0x7C41A06F};
constexpr std::array<std::uint32_t, 4> kEsp32C3Magic{0x6921506F, 0x1B31506F, 0x4881606F, 0x4361606F};
constexpr std::array<std::uint32_t, 1> kEsp32C6Magic{0x2CE0806F};
constexpr std::array<std::uint32_t, 1> kEsp32H2Magic{0xD7B73E80};

const std::array<ChipInfo, 7> kChips{{
  {ChipId::ESP32,   "ESP32",    kEsp32Magic,   0x1000, false, true,  false},
  {ChipId::ESP32S2, "ESP32-S2", kEsp32S2Magic, 0x1000, true,  false, false},
  {ChipId::ESP32S3, "ESP32-S3", kEsp32S3Magic, 0x0,    true,  false, true},
  {ChipId::ESP32C2, "ESP32-C2", kEsp32C2Magic, 0x0,    true,  false, false},
  {ChipId::ESP32C3, "ESP32-C3", kEsp32C3Magic, 0x0,    true,  false, true},
  {ChipId::ESP32C6, "ESP32-C6", kEsp32C6Magic, 0x0,    true,  false, true},
  {ChipId::ESP32H2, "ESP32-H2", kEsp32H2Magic, 0x0,    true,  false, true},
}};

// "ESP32-C3" -> "esp32c3"
bool same_name(std::string_view chip, std::string_view user) noexcept {
  std::size_t i = 0, j = 0;
  while (i < chip.size() || j < user.size()) {
    if (i < chip.size() && chip[i] == '-') { ++i; continue; }
    if (j < user.size() && (user[j] == '-' || user[j] == '_')) { ++j; continue; }
    if (i >= chip.size() || j >= user.size()) return false;
    if (espflasher::core::ascii_lower(static_cast<unsigned char>(chip[i])) !=
        espflasher::core::ascii_lower(static_cast<unsigned char>(user[j])))
      return false;
    ++i;
    ++j;
  }
  return true;
}

} // namespace

std::span<const ChipInfo> chip_table() noexcept { return kChips; }

const ChipInfo* chip_by_magic(std::uint32_t magic) noexcept {
  for (const auto& c : kChips) {
    if (std::ranges::find(c.magic, magic) != c.magic.end()) return &c;
  }
  return nullptr;
}

const ChipInfo* chip_by_name(std::string_view name) noexcept {
  for (const auto& c : kChips) {
    if (same_name(c.name, name)) return &c;
  }
  return nullptr;
}

} // namespace espflasher::esp
