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
#include "io/digest.hpp"
#include "protocol/esp/loader_session.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace espflasher::esp {

struct Region {
  std::uint32_t offset = 0;
  std::uint32_t length = 0;
};

// (bytes done, bytes total, phase)
using ProgressFn = std::function<void(std::uint64_t, std::uint64_t, std::string_view)>;

namespace detail {

constexpr std::uint64_t round_up64(std::uint64_t n, std::uint64_t base) noexcept {
  if (base == 0) return n;
  const auto r = n % base;
  return r ? (n + (base - r)) : n;
}

} // namespace detail

class FlashOps {
public:
  explicit FlashOps(LoaderSession& s) noexcept : s_(s) {}

  // Offset and length must both be sector aligned.
  espflasher::core::Status erase(Region r) noexcept;
  espflasher::core::Status erase_all() noexcept;

  // Writes `image` at `offset` in cfg.chunk_size blocks, ascending.
  espflasher::core::Status write(std::uint32_t offset, std::span<const std::uint8_t> image,
                                 const ProgressFn& progress = {}) noexcept;

  // One FLASH_DATA block, retried on CommandTimeout with the same seq and bytes.
  espflasher::core::Status write_chunk(std::uint32_t seq, std::uint32_t offset,
                                       std::span<const std::uint8_t> block) noexcept;

  // On mismatch fails with Errc::VerifyFailed and detail = first divergent
  // byte relative to the image start (chunk granularity without READ_FLASH_SLOW).
  espflasher::core::Status verify(std::uint32_t offset, std::span<const std::uint8_t> image,
                                  const ProgressFn& progress = {}) noexcept;

  espflasher::core::Result<espflasher::io::Md5> flash_md5(std::uint32_t addr, std::uint32_t size) noexcept;
  espflasher::core::Result<std::vector<std::uint8_t>> read_slow(std::uint32_t addr, std::uint32_t size) noexcept;

private:
  bool encrypt_word_() const noexcept {
    return s_.info().chip && s_.info().chip->flash_begin_encrypt_word;
  }

  espflasher::core::Status locate_divergence_(std::uint32_t offset, std::span<const std::uint8_t> image) noexcept;

  LoaderSession& s_;
};

} // namespace espflasher::esp
