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
#include <span>
#include <vector>

namespace espflasher::esp::slip {

inline constexpr std::uint8_t END = 0xC0;
inline constexpr std::uint8_t ESC = 0xDB;
inline constexpr std::uint8_t ESC_END = 0xDC;
inline constexpr std::uint8_t ESC_ESC = 0xDD;

// END + escaped payload + END.
std::vector<std::uint8_t> encode(std::span<const std::uint8_t> payload);

// Decodes one complete frame including both delimiters.
espflasher::core::Result<std::vector<std::uint8_t>> decode(std::span<const std::uint8_t> frame) noexcept;

// Incremental decoder. Bytes outside a frame (boot banner, line noise) are dropped.
class Reader {
public:
  explicit Reader(std::size_t max_frame = 0x5000) : max_frame_(max_frame) {}

  // Feeds bytes until one frame completes. Returns the number of bytes consumed;
  // anything after a completed frame is left for the next call.
  std::size_t feed(std::span<const std::uint8_t> in) noexcept;

  bool has_frame() const noexcept { return ready_.has_value(); }

  // Pops the completed frame: payload on success, FrameCorrupt on a bad escape
  // or oversized frame.
  espflasher::core::Result<std::vector<std::uint8_t>> take() noexcept;

  // True while inside a frame that has not been terminated yet.
  bool in_frame() const noexcept { return in_frame_; }

  void reset() noexcept;

private:
  void finish_(bool corrupt) noexcept;

  std::size_t max_frame_;
  std::vector<std::uint8_t> buf_;
  bool in_frame_ = false;
  bool escaped_ = false;
  bool corrupt_ = false;

  struct Done {
    std::vector<std::uint8_t> payload;
    bool corrupt = false;
  };
  std::optional<Done> ready_;
};

} // namespace espflasher::esp::slip
