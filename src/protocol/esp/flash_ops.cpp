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

#include "protocol/esp/flash_ops.hpp"

#include <algorithm>
#include <cstring>
#include <string>

#include <spdlog/spdlog.h>

namespace espflasher::esp {

using espflasher::core::Errc;
using espflasher::core::Result;
using espflasher::core::Status;

namespace {

Status check_chunk_size(std::uint32_t n) noexcept {
  if (n == 0 || n > STUB_WRITE_BLOCK || (n % 4) != 0)
    return Status::Failf(Errc::InvalidArgument, "chunk size {} must be a multiple of 4 in 4..{}", n, STUB_WRITE_BLOCK);
  return Status::Ok();
}

Status check_range(std::uint32_t offset, std::uint64_t size) noexcept {
  if (static_cast<std::uint64_t>(offset) + size > 0x1'0000'0000ull)
    return Status::Failf(Errc::InvalidArgument, "range 0x{:X}+{} exceeds the 32-bit address space", offset, size);
  return Status::Ok();
}

} // namespace

Status FlashOps::erase(Region r) noexcept {
  if (r.length == 0) return Status::Fail(Errc::InvalidArgument, "erase: empty region");
  if ((r.offset % FLASH_SECTOR_SIZE) != 0 || (r.length % FLASH_SECTOR_SIZE) != 0)
    return Status::Failf(Errc::InvalidArgument, "erase: region 0x{:X}+0x{:X} is not {}-byte aligned",
                         r.offset, r.length, FLASH_SECTOR_SIZE);
  ESPF_TRY(check_range(r.offset, r.length));

  const auto& cfg = s_.cfg();
  spdlog::info("Erasing 0x{:08X}..0x{:08X}", r.offset, r.offset + r.length);

  // FLASH_BEGIN with zero blocks erases the range and writes nothing.
  auto rs = s_.command(Op::FLASH_BEGIN,
                       flash_begin_payload(r.length, 0, cfg.chunk_size, r.offset, encrypt_word_()),
                       cfg.scaled_timeout_ms(cfg.erase_timeout_per_mib_ms, r.length));
  if (!rs) return std::move(rs.st);
  return Status::Ok();
}

Status FlashOps::erase_all() noexcept {
  const auto& cfg = s_.cfg();
  const int timeout = cfg.scaled_timeout_ms(cfg.erase_timeout_per_mib_ms, cfg.flash_size);

  spdlog::info("Erasing entire flash ({} KiB, timeout {} s)", cfg.flash_size / 1024, timeout / 1000);
  auto rs = s_.command(Op::ERASE_FLASH, {}, timeout);
  if (rs) return Status::Ok();

  if (rs.st.is(Errc::CommandError) && rs.st.detail == static_cast<std::uint64_t>(RomError::INVALID_MESSAGE)) {
    spdlog::debug("ERASE_FLASH not understood by this loader, erasing through FLASH_BEGIN");
    return erase(Region{0, cfg.flash_size});
  }
  return std::move(rs.st);
}

Status FlashOps::write_chunk(std::uint32_t seq, std::uint32_t offset, std::span<const std::uint8_t> block) noexcept {
  const auto& cfg = s_.cfg();
  const int timeout = cfg.scaled_timeout_ms(cfg.write_timeout_per_mib_ms, block.size());

  Status last;
  for (unsigned attempt = 0; attempt <= cfg.write_retries; ++attempt) {
    if (attempt) spdlog::warn("Chunk {} @0x{:08X}: retry {}/{} ({})", seq, offset, attempt, cfg.write_retries, last.msg);

    auto rs = s_.command(Op::FLASH_DATA, flash_data_payload(seq, block), timeout);
    if (rs) return Status::Ok();
    if (!rs.st.is(Errc::CommandTimeout)) return std::move(rs.st);
    last = std::move(rs.st);
  }
  return Status::Failf(Errc::CommandTimeout, "chunk {} @0x{:08X}: no acknowledgement after {} attempts",
                       seq, offset, cfg.write_retries + 1);
}

Status FlashOps::write(std::uint32_t offset, std::span<const std::uint8_t> image, const ProgressFn& progress) noexcept {
  const auto& cfg = s_.cfg();
  if (image.empty()) return Status::Fail(Errc::InvalidArgument, "write: empty image");
  ESPF_TRY(check_chunk_size(cfg.chunk_size));
  ESPF_TRY(check_range(offset, image.size()));

  const std::uint32_t block = cfg.chunk_size;
  const auto padded = detail::round_up64(image.size(), block);
  const auto num_blocks = static_cast<std::uint32_t>(padded / block);

  spdlog::info("Writing {} bytes at 0x{:08X} in {} chunks of {}", image.size(), offset, num_blocks, block);

  // The ROM erases the covered sectors while handling FLASH_BEGIN.
  {
    auto rs = s_.command(Op::FLASH_BEGIN,
                         flash_begin_payload(static_cast<std::uint32_t>(padded), num_blocks, block, offset,
                                             encrypt_word_()),
                         cfg.scaled_timeout_ms(cfg.erase_timeout_per_mib_ms, padded));
    if (!rs) return std::move(rs.st);
  }

  std::vector<std::uint8_t> buf(block);
  const std::uint64_t total = image.size();
  std::uint64_t done = 0;

  for (std::uint32_t seq = 0; seq < num_blocks; ++seq) {
    if (s_.cancelled()) {
      spdlog::warn("Write cancelled before chunk {} of {}", seq, num_blocks);
      return Status::Failf(Errc::Cancelled, "cancelled before chunk {} of {}", seq, num_blocks);
    }

    const std::size_t pos = static_cast<std::size_t>(seq) * block;
    const std::size_t n = std::min<std::size_t>(block, image.size() - pos);
    std::memcpy(buf.data(), image.data() + pos, n);
    if (n < block) std::fill(buf.begin() + static_cast<std::ptrdiff_t>(n), buf.end(), std::uint8_t{0xFF});

    ESPF_TRY(write_chunk(seq, offset + static_cast<std::uint32_t>(pos), buf));

    done += n;
    if (progress) progress(done, total, "write");
  }

  auto rs = s_.command(Op::FLASH_END, flash_end_payload(false));
  if (!rs) return std::move(rs.st);
  return Status::Ok();
}

Result<espflasher::io::Md5> FlashOps::flash_md5(std::uint32_t addr, std::uint32_t size) noexcept {
  using R = Result<espflasher::io::Md5>;
  const auto& cfg = s_.cfg();

  auto rs = s_.command(Op::SPI_FLASH_MD5, md5_payload(addr, size),
                       cfg.scaled_timeout_ms(cfg.md5_timeout_per_mib_ms, size));
  if (!rs) return R::Fail(std::move(rs.st));

  const auto& d = rs.value.data;
  if (d.size() == 16) {
    espflasher::io::Md5 out{};
    std::copy(d.begin(), d.end(), out.begin());
    return R::Ok(out);
  }
  if (d.size() == 32) {
    const std::string hex(d.begin(), d.end());
    if (auto m = espflasher::io::parse_md5_hex(hex)) return R::Ok(*m);
  }
  return R::Failf(Errc::FrameCorrupt, "SPI_FLASH_MD5: unexpected {}-byte digest", d.size());
}

Result<std::vector<std::uint8_t>> FlashOps::read_slow(std::uint32_t addr, std::uint32_t size) noexcept {
  using R = Result<std::vector<std::uint8_t>>;
  if (size == 0 || size > READ_SLOW_BLOCK)
    return R::Failf(Errc::InvalidArgument, "READ_FLASH_SLOW: size {} not in 1..{}", size, READ_SLOW_BLOCK);

  auto rs = s_.command(Op::READ_FLASH_SLOW, read_slow_payload(addr, size));
  if (!rs) return R::Fail(std::move(rs.st));
  if (rs.value.data.size() < size)
    return R::Failf(Errc::FrameCorrupt, "READ_FLASH_SLOW: got {} of {} bytes", rs.value.data.size(), size);

  rs.value.data.resize(size);
  return R::Ok(std::move(rs.value.data));
}

Status FlashOps::locate_divergence_(std::uint32_t offset, std::span<const std::uint8_t> image) noexcept {
  const std::uint32_t chunk = s_.cfg().chunk_size;
  const auto* chip = s_.info().chip;

  for (std::size_t pos = 0; pos < image.size(); pos += chunk) {
    const auto n = static_cast<std::uint32_t>(std::min<std::size_t>(chunk, image.size() - pos));
    const auto addr = offset + static_cast<std::uint32_t>(pos);
    const auto part = image.subspan(pos, n);

    auto remote = flash_md5(addr, n);
    if (!remote) return std::move(remote.st);
    if (remote.value == espflasher::io::md5(part)) continue;

    if (!chip || !chip->rom_read_flash_slow) {
      return Status::Fail(Errc::VerifyFailed,
                          fmt::format("verify failed in chunk at 0x{:08X} (image offset {})", addr, pos), pos);
    }

    for (std::uint32_t sub = 0; sub < n; sub += READ_SLOW_BLOCK) {
      const auto m = std::min<std::uint32_t>(READ_SLOW_BLOCK, n - sub);
      auto got = read_slow(addr + sub, m);
      if (!got) return std::move(got.st);

      const auto want = part.subspan(sub, m);
      const auto [a, b] = std::mismatch(want.begin(), want.end(), got.value.begin());
      if (a != want.end()) {
        const std::uint64_t at = pos + sub + static_cast<std::uint64_t>(a - want.begin());
        return Status::Fail(Errc::VerifyFailed,
                            fmt::format("verify failed at 0x{:08X} (image offset {}): expected 0x{:02X}, read 0x{:02X}",
                                        offset + at, at, *a, *b),
                            at);
      }
    }
    // MD5 says the chunk differs but every byte read back matches.
    return Status::Fail(Errc::VerifyFailed,
                        fmt::format("verify failed in chunk at 0x{:08X} (image offset {})", addr, pos), pos);
  }

  return Status::Fail(Errc::VerifyFailed, "whole-region digest differs but every chunk matches", 0);
}

Status FlashOps::verify(std::uint32_t offset, std::span<const std::uint8_t> image, const ProgressFn& progress) noexcept {
  if (image.empty()) return Status::Fail(Errc::InvalidArgument, "verify: empty image");
  ESPF_TRY(check_range(offset, image.size()));
  if (s_.cancelled()) return Status::Fail(Errc::Cancelled, "cancelled before verify");

  const auto size = static_cast<std::uint32_t>(image.size());
  auto remote = flash_md5(offset, size);
  if (!remote) return std::move(remote.st);

  const auto local = espflasher::io::md5(image);
  if (remote.value == local) {
    spdlog::info("Verify OK: md5 {}", espflasher::io::to_hex(local));
    if (progress) progress(image.size(), image.size(), "verify");
    return Status::Ok();
  }

  spdlog::warn("Digest mismatch (flash {}, image {}), locating", espflasher::io::to_hex(remote.value),
               espflasher::io::to_hex(local));
  return locate_divergence_(offset, image);
}

} // namespace espflasher::esp
