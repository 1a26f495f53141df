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
#include <span>
#include <string_view>
#include <vector>

namespace espflasher::esp {

enum class Op : std::uint8_t {
  FLASH_BEGIN       = 0x02,
  FLASH_DATA        = 0x03,
  FLASH_END         = 0x04,
  MEM_BEGIN         = 0x05,
  MEM_END           = 0x06,
  MEM_DATA          = 0x07,
  SYNC              = 0x08,
  WRITE_REG         = 0x09,
  READ_REG          = 0x0A,
  SPI_SET_PARAMS    = 0x0B,
  SPI_ATTACH        = 0x0D,
  READ_FLASH_SLOW   = 0x0E,
  CHANGE_BAUDRATE   = 0x0F,
  SPI_FLASH_MD5     = 0x13,
  GET_SECURITY_INFO = 0x14,

  // Stub loader only; the ROM answers these with INVALID_MESSAGE.
  ERASE_FLASH       = 0xD0,
  ERASE_REGION      = 0xD1,
};

std::string_view op_name(Op op) noexcept;

// Second status byte of a failed response.
enum class RomError : std::uint8_t {
  INVALID_MESSAGE   = 0x05,
  FAILED_TO_ACT     = 0x06,
  INVALID_CRC       = 0x07,
  FLASH_WRITE_ERROR = 0x08,
  FLASH_READ_ERROR  = 0x09,
  READ_LENGTH_ERROR = 0x0A,
  DEFLATE_ERROR     = 0x0B,
};

std::string_view rom_error_name(std::uint8_t code) noexcept;

inline constexpr std::uint8_t DIR_REQUEST  = 0x00;
inline constexpr std::uint8_t DIR_RESPONSE = 0x01;

inline constexpr std::uint8_t CHECKSUM_SEED = 0xEF;

inline constexpr std::size_t HEADER_SIZE = 8;
inline constexpr std::size_t ROM_STATUS_BYTES = 4;
inline constexpr std::size_t STUB_STATUS_BYTES = 2;

inline constexpr std::uint32_t FLASH_SECTOR_SIZE = 0x1000;
inline constexpr std::uint32_t FLASH_BLOCK_SIZE  = 0x10000;
inline constexpr std::uint32_t FLASH_PAGE_SIZE   = 0x100;
inline constexpr std::uint32_t ROM_WRITE_BLOCK   = 0x400;
inline constexpr std::uint32_t STUB_WRITE_BLOCK  = 0x4000;
inline constexpr std::uint32_t READ_SLOW_BLOCK   = 64;

inline constexpr std::uint32_t CHIP_MAGIC_REG = 0x40001000;

// True for the commands whose checksum field covers the payload.
constexpr bool carries_checksum(Op op) noexcept {
  return op == Op::FLASH_DATA || op == Op::MEM_DATA;
}

std::uint32_t checksum(std::span<const std::uint8_t> data, std::uint8_t seed = CHECKSUM_SEED) noexcept;

struct Request {
  Op op = Op::SYNC;
  std::uint32_t checksum = 0;
  std::vector<std::uint8_t> data;
};

struct Response {
  Op op = Op::SYNC;
  std::uint32_t value = 0;
  std::vector<std::uint8_t> data; // payload without the status bytes
  std::uint8_t status = 0;
  std::uint8_t error = 0;

  bool failed() const noexcept { return status != 0; }
};

// For FLASH_DATA/MEM_DATA the checksum covers `data` past its 16-byte block
// header. Every other command carries 0.
Request make_request(Op op, std::vector<std::uint8_t> data);

// Unframed packet bytes (header + data). SLIP is applied by the framer.
std::vector<std::uint8_t> encode_request(const Request& rq);
std::vector<std::uint8_t> encode_response(const Response& rs, std::size_t status_bytes = ROM_STATUS_BYTES);

espflasher::core::Result<Request> decode_request(std::span<const std::uint8_t> pkt) noexcept;
espflasher::core::Result<Response> decode_response(std::span<const std::uint8_t> pkt,
                                                   std::size_t status_bytes = ROM_STATUS_BYTES) noexcept;

// Command payload builders.
std::vector<std::uint8_t> sync_payload();
std::vector<std::uint8_t> read_reg_payload(std::uint32_t addr);
std::vector<std::uint8_t> spi_attach_payload(bool rom);
std::vector<std::uint8_t> spi_set_params_payload(std::uint32_t total_size);
std::vector<std::uint8_t> change_baud_payload(std::uint32_t new_baud, std::uint32_t old_baud);
std::vector<std::uint8_t> flash_begin_payload(std::uint32_t erase_size, std::uint32_t num_blocks,
                                              std::uint32_t block_size, std::uint32_t offset,
                                              bool with_encrypt_word);
std::vector<std::uint8_t> flash_data_payload(std::uint32_t seq, std::span<const std::uint8_t> block);
std::vector<std::uint8_t> flash_end_payload(bool reboot);
std::vector<std::uint8_t> md5_payload(std::uint32_t addr, std::uint32_t size);
std::vector<std::uint8_t> read_slow_payload(std::uint32_t addr, std::uint32_t size);

} // namespace espflasher::esp
