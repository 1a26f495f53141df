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
#include "io/esp_image.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace espflasher::app {

struct Options {
  enum class Command { None, WriteFlash, EraseFlash, ListPorts };

  Command command = Command::None;
  bool help = false;
  bool version = false;

  std::vector<std::string> ports;
  std::uint32_t baud = 921600;
  std::string chip = "esp32";

  espflasher::core::ResetMode before = espflasher::core::ResetMode::DefaultReset;
  bool hard_reset_after = true;

  espflasher::io::FlashParams flash_params{};
  std::uint32_t flash_size = 4u * 1024u * 1024u;

  bool erase_all = false;
  bool verify = true;
  std::uint32_t chunk_size = 0x400;
  unsigned sync_attempts = 7;

  bool yes = false;
  bool force = false;
  bool json = false;
  bool verbose = false;
  bool quiet = false;

  std::uint32_t offset = 0;
  std::optional<std::filesystem::path> file;
};

espflasher::core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace espflasher::app
