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

#include "protocol/esp/esp_wire.hpp"

#include "core/endian.hpp"

#include <initializer_list>
#include <utility>

namespace espflasher::esp {

using espflasher::core::Errc;
using espflasher::core::Result;
using espflasher::core::append_le;
using espflasher::core::load_le;

namespace {

constexpr std::size_t DATA_BLOCK_HEADER = 16;

std::vector<std::uint8_t> words(std::initializer_list<std::uint32_t> ws) {
  std::vector<std::uint8_t> out;
  out.reserve(ws.size() * 4);
  for (const auto w : ws) append_le<std::uint32_t>(out, w);
  return out;
}

} // namespace

std::string_view op_name(Op op) noexcept {
  switch (op) {
    case Op::FLASH_BEGIN: return "FLASH_BEGIN";
    case Op::FLASH_DATA: return "FLASH_DATA";
    case Op::FLASH_END: return "FLASH_END";
    case Op::MEM_BEGIN: return "MEM_BEGIN";
    case Op::MEM_END: return "MEM_END";
    case Op::MEM_DATA: return "MEM_DATA";
    case Op::SYNC: return "SYNC";
    case Op::WRITE_REG: return "WRITE_REG";
    case Op::READ_REG: return "READ_REG";
    case Op::SPI_SET_PARAMS: return "SPI_SET_PARAMS";
    case Op::SPI_ATTACH: return "SPI_ATTACH";
    case Op::READ_FLASH_SLOW: return "READ_FLASH_SLOW";
    case Op::CHANGE_BAUDRATE: return "CHANGE_BAUDRATE";
    case Op::SPI_FLASH_MD5: return "SPI_FLASH_MD5";
    case Op::GET_SECURITY_INFO: return "GET_SECURITY_INFO";
    case Op::ERASE_FLASH: return "ERASE_FLASH";
    case Op::ERASE_REGION: return "ERASE_REGION";
  }
  return "UNKNOWN";
}

std::string_view rom_error_name(std::uint8_t code) noexcept {
  switch (static_cast<RomError>(code)) {
    case RomError::INVALID_MESSAGE: return "invalid message";
    case RomError::FAILED_TO_ACT: return "failed to act";
    case RomError::INVALID_CRC: return "invalid CRC";
    case RomError::FLASH_WRITE_ERROR: return "flash write error";
    case RomError::FLASH_READ_ERROR: return "flash read error";
    case RomError::READ_LENGTH_ERROR: return "read length error";
    case RomError::DEFLATE_ERROR: return "deflate error";
  }
  return "unknown error";
}

std::uint32_t checksum(std::span<const std::uint8_t> data, std::uint8_t seed) noexcept {
  std::uint8_t c = seed;
  for (const auto b : data) c ^= b;
  return c;
}

Request make_request(Op op, std::vector<std::uint8_t> data) {
  Request rq;
  rq.op = op;
  if (carries_checksum(op) && data.size() >= DATA_BLOCK_HEADER) {
    rq.checksum = checksum(std::span<const std::uint8_t>(data).subspan(DATA_BLOCK_HEADER));
  }
  rq.data = std::move(data);
  return rq;
}

std::vector<std::uint8_t> encode_request(const Request& rq) {
  std::vector<std::uint8_t> out;
  out.reserve(HEADER_SIZE + rq.data.size());
  out.push_back(DIR_REQUEST);
  out.push_back(static_cast<std::uint8_t>(rq.op));
  append_le<std::uint16_t>(out, static_cast<std::uint16_t>(rq.data.size()));
  append_le<std::uint32_t>(out, rq.checksum);
  out.insert(out.end(), rq.data.begin(), rq.data.end());
  return out;
}

std::vector<std::uint8_t> encode_response(const Response& rs, std::size_t status_bytes) {
  std::vector<std::uint8_t> out;
  const std::size_t body = rs.data.size() + status_bytes;
  out.reserve(HEADER_SIZE + body);
  out.push_back(DIR_RESPONSE);
  out.push_back(static_cast<std::uint8_t>(rs.op));
  append_le<std::uint16_t>(out, static_cast<std::uint16_t>(body));
  append_le<std::uint32_t>(out, rs.value);
  out.insert(out.end(), rs.data.begin(), rs.data.end());
  if (status_bytes >= 2) {
    out.push_back(rs.status);
    out.push_back(rs.error);
    for (std::size_t i = 2; i < status_bytes; ++i) out.push_back(0);
  }
  return out;
}

Result<Request> decode_request(std::span<const std::uint8_t> pkt) noexcept {
  if (pkt.size() < HEADER_SIZE) return Result<Request>::Failf(Errc::FrameCorrupt, "request too short ({} bytes)", pkt.size());
  if (pkt[0] != DIR_REQUEST) return Result<Request>::Failf(Errc::FrameCorrupt, "bad request direction 0x{:02x}", pkt[0]);

  const auto size = load_le<std::uint16_t>(pkt.subspan(2));
  if (pkt.size() - HEADER_SIZE != size) {
    return Result<Request>::Failf(Errc::FrameCorrupt, "request length mismatch: header {} vs {}", size, pkt.size() - HEADER_SIZE);
  }

  Request rq;
  rq.op = static_cast<Op>(pkt[1]);
  rq.checksum = load_le<std::uint32_t>(pkt.subspan(4));
  rq.data.assign(pkt.begin() + HEADER_SIZE, pkt.end());

  if (carries_checksum(rq.op)) {
    if (rq.data.size() < DATA_BLOCK_HEADER) return Result<Request>::Fail(Errc::FrameCorrupt, "data command without block header");
    const auto want = checksum(std::span<const std::uint8_t>(rq.data).subspan(DATA_BLOCK_HEADER));
    if (want != rq.checksum) {
      return Result<Request>::Failf(Errc::FrameCorrupt, "checksum mismatch: got 0x{:02x}, computed 0x{:02x}", rq.checksum, want);
    }
  } else if (rq.checksum != 0) {
    return Result<Request>::Failf(Errc::FrameCorrupt, "unexpected checksum 0x{:08x} on {}", rq.checksum, op_name(rq.op));
  }

  return Result<Request>::Ok(std::move(rq));
}

Result<Response> decode_response(std::span<const std::uint8_t> pkt, std::size_t status_bytes) noexcept {
  if (pkt.size() < HEADER_SIZE) return Result<Response>::Failf(Errc::FrameCorrupt, "response too short ({} bytes)", pkt.size());
  if (pkt[0] != DIR_RESPONSE) return Result<Response>::Failf(Errc::FrameCorrupt, "bad response direction 0x{:02x}", pkt[0]);

  const auto size = load_le<std::uint16_t>(pkt.subspan(2));
  if (pkt.size() - HEADER_SIZE != size) {
    return Result<Response>::Failf(Errc::FrameCorrupt, "response length mismatch: header {} vs {}", size, pkt.size() - HEADER_SIZE);
  }
  if (size < status_bytes) return Result<Response>::Failf(Errc::FrameCorrupt, "response without status ({} bytes)", size);

  Response rs;
  rs.op = static_cast<Op>(pkt[1]);
  rs.value = load_le<std::uint32_t>(pkt.subspan(4));

  const auto body = pkt.subspan(HEADER_SIZE);
  const auto st = body.subspan(body.size() - status_bytes);
  rs.data.assign(body.begin(), body.end() - static_cast<std::ptrdiff_t>(status_bytes));
  if (status_bytes >= 2) {
    rs.status = st[0];
    rs.error = st[1];
  }
  return Result<Response>::Ok(std::move(rs));
}

std::vector<std::uint8_t> sync_payload() {
  std::vector<std::uint8_t> out{0x07, 0x07, 0x12, 0x20};
  out.insert(out.end(), 32, 0x55);
  return out;
}

std::vector<std::uint8_t> read_reg_payload(std::uint32_t addr) { return words({addr}); }

// The ROM takes an extra "is legacy" word the stub does not.
std::vector<std::uint8_t> spi_attach_payload(bool rom) { return rom ? words({0, 0}) : words({0}); }

std::vector<std::uint8_t> spi_set_params_payload(std::uint32_t total_size) {
  return words({0, total_size, FLASH_BLOCK_SIZE, FLASH_SECTOR_SIZE, FLASH_PAGE_SIZE, 0xFFFF});
}

std::vector<std::uint8_t> change_baud_payload(std::uint32_t new_baud, std::uint32_t old_baud) {
  return words({new_baud, old_baud});
}

std::vector<std::uint8_t> flash_begin_payload(std::uint32_t erase_size, std::uint32_t num_blocks,
                                              std::uint32_t block_size, std::uint32_t offset,
                                              bool with_encrypt_word) {
  return with_encrypt_word ? words({erase_size, num_blocks, block_size, offset, 0})
                           : words({erase_size, num_blocks, block_size, offset});
}

std::vector<std::uint8_t> flash_data_payload(std::uint32_t seq, std::span<const std::uint8_t> block) {
  auto out = words({static_cast<std::uint32_t>(block.size()), seq, 0, 0});
  out.insert(out.end(), block.begin(), block.end());
  return out;
}

// The flag is "stay in loader", hence the inversion.
std::vector<std::uint8_t> flash_end_payload(bool reboot) { return words({reboot ? 0u : 1u}); }

std::vector<std::uint8_t> md5_payload(std::uint32_t addr, std::uint32_t size) { return words({addr, size, 0, 0}); }

std::vector<std::uint8_t> read_slow_payload(std::uint32_t addr, std::uint32_t size) { return words({addr, size}); }

} // namespace espflasher::esp
