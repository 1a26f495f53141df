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

#include "core/endian.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void test_host_to_le_bytes_u32() {
  constexpr std::uint32_t v = 0x04030201;
  auto le = espflasher::core::host_to_le(v);

  unsigned char bytes[4];
  std::memcpy(bytes, &le, 4);

  // Wire order is 01 02 03 04 whatever the host is.
  bool ok = bytes[0] == 0x01 && bytes[1] == 0x02 && bytes[2] == 0x03 && bytes[3] == 0x04;
  check_eq("host_to_le_bytes_u32", ok, true);
}

static void test_load_le() {
  const std::uint8_t bytes[] = {0x83, 0x1D, 0xF0, 0x00, 0x34, 0x12};
  check_eq("load_le_u32", espflasher::core::load_le<std::uint32_t>(bytes), std::uint32_t{0x00F01D83});
  check_eq("load_le_u16_offset",
           espflasher::core::load_le<std::uint16_t>(std::span<const std::uint8_t>(bytes).subspan(4)),
           std::uint16_t{0x1234});
}

static void test_store_le() {
  std::uint8_t buf[4] = {};
  espflasher::core::store_le<std::uint32_t>(buf, 0x40001000u);
  bool ok = buf[0] == 0x00 && buf[1] == 0x10 && buf[2] == 0x00 && buf[3] == 0x40;
  check_eq("store_le_u32", ok, true);
}

static void test_append_le() {
  std::vector<std::uint8_t> out{0xAA};
  espflasher::core::append_le<std::uint16_t>(out, 0x0524);
  bool ok = out.size() == 3 && out[1] == 0x24 && out[2] == 0x05;
  check_eq("append_le_u16", ok, true);
}

static void test_constexpr() {
  constexpr auto v = espflasher::core::le_to_host(std::uint32_t{0x12345678});
  static_assert(v == 0x12345678 || v == 0x78563412);
  check_eq("constexpr_le_to_host", espflasher::core::host_to_le(v), std::uint32_t{0x12345678});
}

int main() {
  test_host_to_le_bytes_u32();
  test_load_le();
  test_store_le();
  test_append_le();
  test_constexpr();

  std::fprintf(stdout, "endian: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
