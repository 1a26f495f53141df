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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace espflasher::io {

inline constexpr std::uint8_t ESP_IMAGE_MAGIC = 0xE9;
inline constexpr std::size_t ESP_IMAGE_HEADER_SIZE = 24;
inline constexpr std::size_t ESP_IMAGE_HASH_FLAG_OFFSET = 23;
inline constexpr std::size_t ESP_IMAGE_SHA256_SIZE = 32;

// Encoded header codes; nullopt leaves the image's own value.
struct FlashParams {
  std::optional<std::uint8_t> mode;
  std::optional<std::uint8_t> freq;
  std::optional<std::uint8_t> size;

  bool any() const noexcept { return mode || freq || size; }
};

// "qio" "qout" "dio" "dout"; "keep" yields nullopt.
espflasher::core::Result<std::optional<std::uint8_t>> parse_flash_mode(std::string_view s) noexcept;
// "80m" "40m" "26m" "20m"
espflasher::core::Result<std::optional<std::uint8_t>> parse_flash_freq(std::string_view s) noexcept;
// "1MB" .. "16MB"
espflasher::core::Result<std::optional<std::uint8_t>> parse_flash_size(std::string_view s) noexcept;

std::uint32_t flash_size_bytes(std::uint8_t size_code) noexcept;

struct PatchResult {
  bool patched = false;
  bool sha256_updated = false;
};

// Rewrites bytes 2 and 3 of an ESP app/bootloader header. An appended SHA-256
// is recomputed only when it was valid before the patch.
espflasher::core::Result<PatchResult> patch_header(std::vector<std::uint8_t>& image, const FlashParams& p) noexcept;

} // namespace espflasher::io
