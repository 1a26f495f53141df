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

#include "protocol/esp/chip.hpp"
#include "protocol/esp/esp_wire.hpp"
#include "protocol/esp/slip.hpp"

#include <cstdio>
#include <vector>

using espflasher::core::Errc;
using namespace espflasher::esp;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void test_checksum() {
  check("checksum_empty", checksum({}) == 0xEF);
  const std::uint8_t d[] = {0x01, 0x02, 0x04};
  check("checksum_xor", checksum(d) == (0xEFu ^ 0x07u));
}

static void test_sync_request_layout() {
  const auto pkt = encode_request(make_request(Op::SYNC, sync_payload()));
  check("sync_size", pkt.size() == HEADER_SIZE + 36);
  check("sync_dir_op", pkt[0] == DIR_REQUEST && pkt[1] == 0x08);
  check("sync_len", pkt[2] == 36 && pkt[3] == 0);
  check("sync_magic", pkt[8] == 0x07 && pkt[9] == 0x07 && pkt[10] == 0x12 && pkt[11] == 0x20);
  check("sync_fill", pkt[12] == 0x55 && pkt.back() == 0x55);
}

static void test_flash_data_checksum() {
  const std::vector<std::uint8_t> block{0x10, 0x20, 0x30, 0x40};
  const auto rq = make_request(Op::FLASH_DATA, flash_data_payload(3, block));
  check("data_checksum", rq.checksum == checksum(block));
  check("data_header_len", rq.data.size() == 16 + block.size());

  auto back = decode_request(encode_request(rq));
  check("data_decodes", back.has_value && back.value.op == Op::FLASH_DATA);

  auto tampered = encode_request(rq);
  tampered.back() ^= 0x01;
  check("data_bad_checksum", decode_request(tampered).st.is(Errc::FrameCorrupt));
}

static bool same_request(const Request& a, const Request& b) {
  return a.op == b.op && a.checksum == b.checksum && a.data == b.data;
}

// Payloads that put every byte value, and both SLIP specials, inside the data.
static std::vector<std::vector<std::uint8_t>> sweep_blocks() {
  std::vector<std::vector<std::uint8_t>> out;
  std::vector<std::uint8_t> all(256);
  for (unsigned i = 0; i < 256; ++i) all[i] = static_cast<std::uint8_t>(i);
  out.push_back(all);
  for (unsigned b = 0; b < 256; ++b) {
    const auto v = static_cast<std::uint8_t>(b);
    out.push_back({v, slip::END, v, slip::ESC, v});
  }
  out.push_back(std::vector<std::uint8_t>(64, slip::END));
  out.push_back(std::vector<std::uint8_t>(64, slip::ESC));
  return out;
}

static void test_framed_requests_survive_the_wire() {
  int bad_frames = 0, bad_requests = 0, total = 0;

  auto round = [&](const Request& rq) {
    ++total;
    const auto pkt = encode_request(rq);
    auto unframed = slip::decode(slip::encode(pkt));
    if (!unframed.has_value || unframed.value != pkt) ++bad_frames;
    auto back = decode_request(pkt);
    if (!back.has_value || !same_request(back.value, rq)) ++bad_requests;
  };

  for (const auto& block : sweep_blocks()) {
    round(make_request(Op::FLASH_DATA, flash_data_payload(7, block)));
    round(make_request(Op::MEM_DATA, flash_data_payload(0, block)));
  }
  for (unsigned b = 0; b < 256; ++b) {
    const auto v = static_cast<std::uint8_t>(b);
    const std::uint32_t word = 0xC0DB0000u | (static_cast<std::uint32_t>(v) << 8) | v;
    round(make_request(Op::READ_REG, read_reg_payload(word)));
    round(make_request(Op::FLASH_BEGIN, flash_begin_payload(word, 1, 0x400, word, true)));
  }
  round(make_request(Op::SYNC, sync_payload()));

  check("sweep_ran", total > 1000);
  check("sweep_frames_byte_equal", bad_frames == 0);
  check("sweep_requests_equal", bad_requests == 0);
}

static void test_every_damaged_checksum_is_rejected() {
  int accepted = 0, flips = 0;

  for (Op op : {Op::FLASH_DATA, Op::MEM_DATA}) {
    std::vector<std::uint8_t> block(32);
    for (std::size_t i = 0; i < block.size(); ++i) block[i] = static_cast<std::uint8_t>(i * 37u + 0xC0u);
    const auto pkt = encode_request(make_request(op, flash_data_payload(1, block)));

    // Checksum field (bytes 4..7), then every checksummed data byte.
    std::vector<std::size_t> targets{4, 5, 6, 7};
    for (std::size_t i = HEADER_SIZE + 16; i < pkt.size(); ++i) targets.push_back(i);

    for (const auto at : targets) {
      for (unsigned bit = 0; bit < 8; ++bit) {
        auto damaged = pkt;
        damaged[at] ^= static_cast<std::uint8_t>(1u << bit);
        ++flips;
        if (!decode_request(damaged).st.is(Errc::FrameCorrupt)) ++accepted;
      }
    }
  }

  check("damage_flips", flips == 2 * (4 + 32) * 8);
  check("damage_all_corrupt", accepted == 0);
}

static void test_plain_commands_carry_zero_checksum() {
  const auto rq = make_request(Op::FLASH_BEGIN, flash_begin_payload(0x2000, 2, 0x1000, 0x10000, false));
  check("begin_zero_checksum", rq.checksum == 0);
  check("begin_four_words", rq.data.size() == 16);
  check("begin_five_words", flash_begin_payload(0, 0, 0x400, 0, true).size() == 20);
  check("end_stay_in_loader", flash_end_payload(false) == std::vector<std::uint8_t>{1, 0, 0, 0});
}

static void test_response_status() {
  Response ok;
  ok.op = Op::READ_REG;
  ok.value = 0x00F01D83;
  auto r = decode_response(encode_response(ok));
  check("resp_ok", r.has_value && !r.value.failed() && r.value.value == 0x00F01D83);
  check("resp_no_data", r.has_value && r.value.data.empty());

  Response bad;
  bad.op = Op::FLASH_BEGIN;
  bad.status = 1;
  bad.error = 0x05;
  auto b = decode_response(encode_response(bad));
  check("resp_failed", b.has_value && b.value.failed() && b.value.error == 0x05);

  Response stub;
  stub.op = Op::SPI_FLASH_MD5;
  stub.data.assign(16, 0xAB);
  auto s = decode_response(encode_response(stub, STUB_STATUS_BYTES), STUB_STATUS_BYTES);
  check("resp_stub_data", s.has_value && s.value.data.size() == 16);

  const std::vector<std::uint8_t> runt{0x01, 0x08, 0x00};
  check("resp_short", decode_response(runt).st.is(Errc::FrameCorrupt));
  auto wrong_dir = encode_response(ok);
  wrong_dir[0] = 0x00;
  check("resp_direction", decode_response(wrong_dir).st.is(Errc::FrameCorrupt));
  auto wrong_len = encode_response(ok);
  wrong_len.push_back(0);
  check("resp_length", decode_response(wrong_len).st.is(Errc::FrameCorrupt));
}

static void test_names() {
  check("op_name", op_name(Op::SPI_FLASH_MD5) == "SPI_FLASH_MD5");
  check("rom_error_name", rom_error_name(0x05) == "invalid message");
}

static void test_chip_table() {
  const auto* esp32 = chip_by_magic(0x00F01D83);
  check("chip_esp32", esp32 && esp32->name == "ESP32" && esp32->bootloader_offset == 0x1000);
  check("chip_c3_second_magic", chip_by_magic(0x1B31506F) && chip_by_magic(0x1B31506F)->name == "ESP32-C3");
  check("chip_by_name_dash", chip_by_name("esp32-c3") == chip_by_name("ESP32C3"));
  check("chip_unknown", !chip_by_magic(0x12345678) && !chip_by_name("esp8266"));
}

int main() {
  test_checksum();
  test_sync_request_layout();
  test_flash_data_checksum();
  test_framed_requests_survive_the_wire();
  test_every_damaged_checksum_is_rejected();
  test_plain_commands_carry_zero_checksum();
  test_response_status();
  test_names();
  test_chip_table();

  std::fprintf(stdout, "wire: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
