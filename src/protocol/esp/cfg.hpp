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
#include "protocol/esp/esp_wire.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace espflasher::esp {

struct Cfg {
  std::uint32_t baud = 921600;
  std::uint32_t rom_baud = 115200;

  espflasher::core::ResetMode reset_mode = espflasher::core::ResetMode::DefaultReset;
  bool hard_reset_after = true;

  // "auto" accepts whatever answers; anything else must match the detected chip.
  std::string chip = "esp32";

  unsigned sync_attempts = 7;
  int sync_timeout_ms = 100;
  int sync_backoff_ms = 50; // halved after every failed attempt, never below 10

  int command_timeout_ms = 3000;
  int erase_timeout_per_mib_ms = 30'000;
  int write_timeout_per_mib_ms = 40'000;
  int md5_timeout_per_mib_ms = 8'000;
  int max_timeout_ms = 240'000;

  std::uint32_t chunk_size = ROM_WRITE_BLOCK;
  unsigned write_retries = 3;
  unsigned frame_rereads = 1;

  std::uint32_t flash_size = 4u * 1024u * 1024u;

  bool verify = true;
  bool erase_all = false;

  // Long operations scale with the amount of flash they touch.
  int scaled_timeout_ms(int per_mib_ms, std::uint64_t bytes) const noexcept {
    const std::uint64_t t = static_cast<std::uint64_t>(per_mib_ms) * bytes / (1024u * 1024u);
    const std::uint64_t lo = static_cast<std::uint64_t>(command_timeout_ms);
    const std::uint64_t hi = static_cast<std::uint64_t>(std::max(max_timeout_ms, command_timeout_ms));
    return static_cast<int>(std::clamp(t, lo, hi));
  }
};

} // namespace espflasher::esp
