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

#include "core/byte_transport.hpp"
#include "core/endian.hpp"
#include "io/digest.hpp"
#include "protocol/esp/chip.hpp"
#include "protocol/esp/esp_wire.hpp"
#include "protocol/esp/slip.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace espflasher::test {

// In-memory ESP32 ROM loader behind an IByteTransport. Replies are queued as
// soon as a request is sent; recv() on an empty queue times out at once, so
// every timeout in a test costs no wall-clock time unless recv_latency_ms is set.
class SimDevice final : public espflasher::core::IByteTransport {
public:
  struct Faults {
    std::optional<espflasher::core::Errc> open_error;
    unsigned ignore_syncs = 0;          // SYNC requests left unanswered
    unsigned sync_echoes = 3;           // replies per answered SYNC
    bool silent_erase = false;          // FLASH_BEGIN and ERASE_FLASH never answer
    bool stub_erase = false;            // ERASE_FLASH understood (otherwise INVALID_MESSAGE)
    std::uint32_t drop_ack_seq = std::numeric_limits<std::uint32_t>::max();
    unsigned drop_ack_times = 0;        // FLASH_DATA written but not acknowledged
    std::optional<std::uint32_t> corrupt_addr; // byte flipped when FLASH_END arrives
    unsigned corrupt_replies = 0;       // replies preceded by damaged copies of themselves
    unsigned corrupt_copies = 1;        // damaged copies per affected reply
    int min_write_window_ms = 0;        // sends given a shorter deadline time out
    unsigned send_timeouts = 0;         // next sends time out before any byte leaves
    int recv_latency_ms = 0;            // wall-clock delay before each recv answers
    std::function<void(std::uint32_t seq)> on_flash_data;
  };

  struct ResetEvent {
    espflasher::core::ResetMode mode;
    bool into_bootloader;
  };

  explicit SimDevice(std::string name = "sim0", std::uint32_t magic = 0x00F01D83,
                     std::uint32_t flash_size = 4u * 1024u * 1024u)
    : name_(std::move(name)), magic_(magic), flash_(flash_size, 0xFF) {}

  Kind kind() const noexcept override { return Kind::Simulated; }
  std::string name() const override { return name_; }

  espflasher::core::Status open() noexcept override {
    ++opens;
    if (faults.open_error) return espflasher::core::Status::Failf(*faults.open_error, "cannot open {}", name_);
    open_ = true;
    return espflasher::core::Status::Ok();
  }
  void close() noexcept override {
    if (open_) ++closes;
    open_ = false;
    rx_.clear();
  }
  bool connected() const noexcept override { return open_; }

  void set_timeout_ms(int ms) noexcept override { timeout_ms_ = ms; }
  int timeout_ms() const noexcept override { return timeout_ms_; }

  void set_write_timeout_ms(int ms) noexcept override { write_timeout_ms_ = ms; }
  int write_timeout_ms() const noexcept override { return write_timeout_ms_; }

  espflasher::core::Status send(std::span<const std::uint8_t> data) noexcept override {
    using espflasher::core::Errc;
    if (!open_) return espflasher::core::Status::Fail(Errc::Io, "sim: not open");

    write_windows.push_back(write_timeout_ms_);
    if (write_timeout_ms_ < faults.min_write_window_ms)
      return espflasher::core::Status::Failf(Errc::Timeout, "sim: {} ms is too short to send", write_timeout_ms_);
    if (faults.send_timeouts) {
      --faults.send_timeouts;
      return espflasher::core::Status::Fail(Errc::Timeout, "sim: write stalled");
    }

    while (!data.empty()) {
      const auto used = reader_.feed(data);
      data = data.subspan(used);
      if (!reader_.has_frame()) continue;

      auto fr = reader_.take();
      if (!fr) continue;
      handle_(fr.value);
    }
    return espflasher::core::Status::Ok();
  }

  espflasher::core::Result<std::size_t> recv(std::span<std::uint8_t> data) noexcept override {
    using R = espflasher::core::Result<std::size_t>;
    if (!open_) return R::Fail(espflasher::core::Errc::Io, "sim: not open");

    recv_windows.push_back(timeout_ms_);
    if (faults.recv_latency_ms > 0) {
      const bool late = rx_.empty() || faults.recv_latency_ms > timeout_ms_;
      std::this_thread::sleep_for(std::chrono::milliseconds(late ? std::max(timeout_ms_, 0) : faults.recv_latency_ms));
      if (late) return R::Fail(espflasher::core::Errc::Timeout, "sim: nothing to read");
    }
    if (rx_.empty()) return R::Fail(espflasher::core::Errc::Timeout, "sim: nothing to read");

    const auto n = std::min(data.size(), rx_.size());
    std::copy_n(rx_.begin(), n, data.begin());
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(n));
    return R::Ok(n);
  }

  espflasher::core::Status set_baud(std::uint32_t baud) noexcept override {
    baud_ = baud;
    bauds.push_back(baud);
    return espflasher::core::Status::Ok();
  }
  std::uint32_t baud() const noexcept override { return baud_; }

  espflasher::core::Status set_lines(bool, bool) noexcept override { return espflasher::core::Status::Ok(); }
  void discard_input() noexcept override { rx_.clear(); }

  espflasher::core::Status reset(espflasher::core::ResetMode mode, bool into_bootloader) noexcept override {
    resets.push_back(ResetEvent{mode, into_bootloader});
    rx_.clear();
    reader_.reset();
    return espflasher::core::Status::Ok();
  }

  // Queues raw bytes as if the chip had sent them.
  void inject(std::span<const std::uint8_t> bytes) { rx_.insert(rx_.end(), bytes.begin(), bytes.end()); }

  std::vector<std::uint8_t>& flash() noexcept { return flash_; }

  std::size_t count(espflasher::esp::Op op) const {
    return static_cast<std::size_t>(std::count(requests.begin(), requests.end(), op));
  }

  Faults faults;

  std::vector<espflasher::esp::Op> requests;
  std::vector<std::uint32_t> data_seqs;
  std::vector<std::uint32_t> data_addrs;
  std::vector<ResetEvent> resets;
  std::vector<std::uint32_t> bauds;
  std::vector<int> write_windows;
  std::vector<int> recv_windows;
  unsigned opens = 0;
  unsigned closes = 0;

private:
  using Op = espflasher::esp::Op;

  static std::uint32_t word_(const std::vector<std::uint8_t>& d, std::size_t i) {
    std::uint32_t v = 0;
    if (d.size() >= (i + 1) * 4) std::memcpy(&v, d.data() + i * 4, 4);
    return espflasher::core::le_to_host(v);
  }

  void reply_(Op op, std::uint32_t value = 0, std::vector<std::uint8_t> data = {}, std::uint8_t error = 0) {
    espflasher::esp::Response rs;
    rs.op = op;
    rs.value = value;
    rs.data = std::move(data);
    rs.status = error ? 1 : 0;
    rs.error = error;
    const auto frame = espflasher::esp::slip::encode(espflasher::esp::encode_response(rs));
    if (faults.corrupt_replies) {
      --faults.corrupt_replies;
      // An escape byte followed by a non-escape code is an invalid SLIP sequence.
      auto bad = frame;
      bad.insert(bad.begin() + 2, {espflasher::esp::slip::ESC, 0x55});
      for (unsigned i = 0; i < faults.corrupt_copies; ++i) rx_.insert(rx_.end(), bad.begin(), bad.end());
    }
    rx_.insert(rx_.end(), frame.begin(), frame.end());
  }

  void erase_(std::uint32_t addr, std::uint32_t size) {
    const auto lo = std::min<std::size_t>(addr, flash_.size());
    const auto hi = std::min<std::size_t>(static_cast<std::size_t>(addr) + size, flash_.size());
    std::fill(flash_.begin() + static_cast<std::ptrdiff_t>(lo), flash_.begin() + static_cast<std::ptrdiff_t>(hi),
              std::uint8_t{0xFF});
  }

  void handle_(std::span<const std::uint8_t> pkt) {
    auto rq = espflasher::esp::decode_request(pkt);
    if (!rq) {
      if (pkt.size() > 1) reply_(static_cast<Op>(pkt[1]), 0, {}, 0x07);
      return;
    }
    const auto& d = rq.value.data;
    requests.push_back(rq.value.op);

    switch (rq.value.op) {
      case Op::SYNC:
        if (faults.ignore_syncs) {
          --faults.ignore_syncs;
          return;
        }
        for (unsigned i = 0; i < faults.sync_echoes; ++i) reply_(Op::SYNC);
        return;

      case Op::READ_REG:
        reply_(Op::READ_REG, word_(d, 0) == espflasher::esp::CHIP_MAGIC_REG ? magic_ : 0);
        return;

      case Op::SPI_ATTACH:
      case Op::SPI_SET_PARAMS:
      case Op::CHANGE_BAUDRATE:
        reply_(rq.value.op);
        return;

      case Op::FLASH_BEGIN: {
        if (faults.silent_erase) return;
        const auto size = word_(d, 0), offset = word_(d, 3);
        block_size_ = word_(d, 2);
        write_offset_ = offset;
        const auto sector = espflasher::esp::FLASH_SECTOR_SIZE;
        erase_(offset - offset % sector, ((offset % sector) + size + sector - 1) / sector * sector);
        reply_(Op::FLASH_BEGIN);
        return;
      }

      case Op::FLASH_DATA: {
        const auto size = word_(d, 0), seq = word_(d, 1);
        const std::size_t addr = write_offset_ + static_cast<std::size_t>(seq) * block_size_;
        data_seqs.push_back(seq);
        data_addrs.push_back(static_cast<std::uint32_t>(addr));
        if (addr + size <= flash_.size() && d.size() >= 16 + size) {
          // NOR flash only clears bits.
          for (std::uint32_t i = 0; i < size; ++i) flash_[addr + i] &= d[16 + i];
        }
        if (faults.on_flash_data) faults.on_flash_data(seq);
        if (seq == faults.drop_ack_seq && faults.drop_ack_times) {
          --faults.drop_ack_times;
          return;
        }
        reply_(Op::FLASH_DATA);
        return;
      }

      case Op::FLASH_END:
        if (faults.corrupt_addr && *faults.corrupt_addr < flash_.size()) flash_[*faults.corrupt_addr] ^= 0x5A;
        reply_(Op::FLASH_END);
        return;

      case Op::SPI_FLASH_MD5: {
        const auto addr = word_(d, 0), size = word_(d, 1);
        if (static_cast<std::size_t>(addr) + size > flash_.size()) {
          reply_(Op::SPI_FLASH_MD5, 0, {}, 0x09);
          return;
        }
        const auto digest = espflasher::io::md5(std::span<const std::uint8_t>(flash_).subspan(addr, size));
        const auto hex = espflasher::io::to_hex(digest);
        reply_(Op::SPI_FLASH_MD5, 0, std::vector<std::uint8_t>(hex.begin(), hex.end()));
        return;
      }

      case Op::READ_FLASH_SLOW: {
        const auto addr = word_(d, 0);
        std::vector<std::uint8_t> out(espflasher::esp::READ_SLOW_BLOCK, 0xFF);
        for (std::size_t i = 0; i < out.size() && addr + i < flash_.size(); ++i) out[i] = flash_[addr + i];
        reply_(Op::READ_FLASH_SLOW, 0, std::move(out));
        return;
      }

      case Op::ERASE_FLASH:
        if (faults.silent_erase) return;
        if (!faults.stub_erase) {
          reply_(Op::ERASE_FLASH, 0, {}, 0x05);
          return;
        }
        erase_(0, static_cast<std::uint32_t>(flash_.size()));
        reply_(Op::ERASE_FLASH);
        return;

      default:
        reply_(rq.value.op, 0, {}, 0x05);
        return;
    }
  }

  std::string name_;
  std::uint32_t magic_;
  std::vector<std::uint8_t> flash_;

  bool open_ = false;
  int timeout_ms_ = 3000;
  int write_timeout_ms_ = 3000;
  std::uint32_t baud_ = 115200;

  std::uint32_t write_offset_ = 0;
  std::uint32_t block_size_ = 0;

  espflasher::esp::slip::Reader reader_;
  std::deque<std::uint8_t> rx_;
};

} // namespace espflasher::test
