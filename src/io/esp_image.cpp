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

#include "io/esp_image.hpp"

#include "core/str.hpp"
#include "io/digest.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <utility>

#include <spdlog/spdlog.h>

namespace espflasher::io {

using espflasher::core::Errc;
using espflasher::core::Result;

namespace {

struct Named {
  std::string_view name;
  std::uint8_t code;
};

constexpr std::array<Named, 4> kModes{{{"qio", 0}, {"qout", 1}, {"dio", 2}, {"dout", 3}}};
constexpr std::array<Named, 4> kFreqs{{{"40m", 0x0}, {"26m", 0x1}, {"20m", 0x2}, {"80m", 0xF}}};
constexpr std::array<Named, 5> kSizes{{{"1MB", 0}, {"2MB", 1}, {"4MB", 2}, {"8MB", 3}, {"16MB", 4}}};

template <std::size_t N>
Result<std::optional<std::uint8_t>> lookup(const std::array<Named, N>& tbl, std::string_view s,
                                           std::string_view what) noexcept {
  using R = Result<std::optional<std::uint8_t>>;
  s = espflasher::core::trim(s);
  if (espflasher::core::equals_ci(s, "keep")) return R::Ok(std::nullopt);
  for (const auto& e : tbl) {
    if (espflasher::core::equals_ci(s, e.name)) return R::Ok(e.code);
  }
  return R::Failf(Errc::InvalidArgument, "unknown {} '{}'", what, s);
}

bool sha256_matches(std::span<const std::uint8_t> img) noexcept {
  const auto body = img.first(img.size() - ESP_IMAGE_SHA256_SIZE);
  const auto tail = img.last(ESP_IMAGE_SHA256_SIZE);
  const auto d = sha256(body);
  return std::equal(d.begin(), d.end(), tail.begin());
}

} // namespace

Result<std::optional<std::uint8_t>> parse_flash_mode(std::string_view s) noexcept { return lookup(kModes, s, "flash mode"); }
Result<std::optional<std::uint8_t>> parse_flash_freq(std::string_view s) noexcept { return lookup(kFreqs, s, "flash frequency"); }
Result<std::optional<std::uint8_t>> parse_flash_size(std::string_view s) noexcept { return lookup(kSizes, s, "flash size"); }

std::uint32_t flash_size_bytes(std::uint8_t size_code) noexcept {
  if (size_code > 4) return 0;
  return (1024u * 1024u) << size_code;
}

Result<PatchResult> patch_header(std::vector<std::uint8_t>& image, const FlashParams& p) noexcept {
  using R = Result<PatchResult>;
  PatchResult out{};

  if (!p.any()) return R::Ok(out);
  if (image.size() < ESP_IMAGE_HEADER_SIZE || image[0] != ESP_IMAGE_MAGIC) {
    spdlog::warn("Image has no ESP header (magic 0x{:02X}), flash parameters left unchanged",
                 image.empty() ? 0 : image[0]);
    return R::Ok(out);
  }

  const bool has_hash = image[ESP_IMAGE_HASH_FLAG_OFFSET] == 1 &&
                        image.size() >= ESP_IMAGE_HEADER_SIZE + ESP_IMAGE_SHA256_SIZE;
  const bool hash_valid = has_hash && sha256_matches(image);
  if (has_hash && !hash_valid) spdlog::warn("Appended SHA-256 does not match the image, leaving it alone");

  const std::uint8_t before2 = image[2];
  const std::uint8_t before3 = image[3];

  if (p.mode) image[2] = *p.mode;
  std::uint8_t freq = image[3] & 0x0F;
  std::uint8_t size = static_cast<std::uint8_t>(image[3] >> 4);
  if (p.freq) freq = *p.freq;
  if (p.size) size = *p.size;
  image[3] = static_cast<std::uint8_t>((size << 4) | (freq & 0x0F));

  out.patched = image[2] != before2 || image[3] != before3;
  if (!out.patched) return R::Ok(out);

  spdlog::info("Flash params set to 0x{:02X}{:02X}", image[2], image[3]);

  if (hash_valid) {
    const auto body = std::span<const std::uint8_t>(image).first(image.size() - ESP_IMAGE_SHA256_SIZE);
    const auto d = sha256(body);
    std::copy(d.begin(), d.end(), image.end() - static_cast<std::ptrdiff_t>(ESP_IMAGE_SHA256_SIZE));
    out.sha256_updated = true;
  }
  return R::Ok(out);
}

} // namespace espflasher::io
