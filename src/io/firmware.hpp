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

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace espflasher::io {

inline constexpr std::uint64_t MAX_IMAGE_BYTES = 16ull * 1024 * 1024;

struct FirmwareImage {
  std::string name;
  std::uint32_t offset = 0;
  std::vector<std::uint8_t> bytes;

  std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(bytes.size()); }
};

// Reads a local image fully into memory. Anything but *.bin is refused unless
// `force` is set.
espflasher::core::Result<FirmwareImage> load_image(const std::filesystem::path& path, std::uint32_t offset,
                                                   bool force) noexcept;

// Size must not exceed flash capacity minus offset.
espflasher::core::Status check_fits(const FirmwareImage& img, std::uint32_t flash_size) noexcept;

} // namespace espflasher::io
