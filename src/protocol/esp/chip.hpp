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
#include <span>
#include <string_view>

namespace espflasher::esp {

enum class ChipId : std::uint8_t { ESP32, ESP32S2, ESP32S3, ESP32C2, ESP32C3, ESP32C6, ESP32H2 };

struct ChipInfo {
  ChipId id;
  std::string_view name;
  std::span<const std::uint32_t> magic;
  std::uint32_t bootloader_offset;
  bool flash_begin_encrypt_word; // FLASH_BEGIN takes a 5th word on everything newer than ESP32
  bool rom_read_flash_slow;      // only the original ESP32 ROM implements READ_FLASH_SLOW
  bool usb_jtag_capable;
};

std::span<const ChipInfo> chip_table() noexcept;

const ChipInfo* chip_by_magic(std::uint32_t magic) noexcept;
const ChipInfo* chip_by_name(std::string_view name) noexcept; // "esp32", "esp32-c3", "esp32c3"

// ESP8266 answers SYNC too; recognise it to give a precise error.
inline constexpr std::uint32_t ESP8266_MAGIC = 0xFFF0C101;

} // namespace espflasher::esp
