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

#include "io/digest.hpp"

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

namespace espflasher::io {

namespace {

template <std::size_t N>
std::array<std::uint8_t, N> evp_digest(const EVP_MD* md, std::span<const std::uint8_t> data) noexcept {
  std::array<std::uint8_t, N> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, md, nullptr) != 1 || len != N) {
    spdlog::error("EVP_Digest({}) failed", EVP_MD_get0_name(md));
    out.fill(0);
  }
  return out;
}

int hex_nibble(unsigned char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

Md5 md5(std::span<const std::uint8_t> data) noexcept { return evp_digest<16>(EVP_md5(), data); }

Sha256 sha256(std::span<const std::uint8_t> data) noexcept { return evp_digest<32>(EVP_sha256(), data); }

std::string to_hex(std::span<const std::uint8_t> d) {
  static constexpr char hex[] = "0123456789abcdef";
  std::string out(d.size() * 2, '0');
  for (std::size_t i = 0; i < d.size(); ++i) {
    out[2 * i + 0] = hex[(d[i] >> 4) & 0x0F];
    out[2 * i + 1] = hex[d[i] & 0x0F];
  }
  return out;
}

std::optional<Md5> parse_md5_hex(std::string_view hex32) noexcept {
  if (hex32.size() != 32) return std::nullopt;
  Md5 out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = hex_nibble(static_cast<unsigned char>(hex32[2 * i + 0]));
    const int lo = hex_nibble(static_cast<unsigned char>(hex32[2 * i + 1]));
    if (hi < 0 || lo < 0) return std::nullopt;
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

} // namespace espflasher::io
