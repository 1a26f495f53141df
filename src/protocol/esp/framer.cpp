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

#include "protocol/esp/framer.hpp"

#include <algorithm>
#include <chrono>
#include <span>
#include <utility>

#include <spdlog/spdlog.h>

namespace espflasher::esp {

using espflasher::core::Errc;
using espflasher::core::Result;
using espflasher::core::Status;

Status Framer::send(const Request& rq) noexcept {
  if (!io_.connected()) return Status::Fail(Errc::Io, "Framer::send: transport not connected");

  const auto frame = slip::encode(encode_request(rq));
  spdlog::debug("=> {} ({} data bytes, {} on wire)", op_name(rq.op), rq.data.size(), frame.size());

  // 10 bits per byte on an 8N1 line.
  const std::uint64_t baud = std::max<std::uint32_t>(io_.baud(), 1);
  const auto wire_ms = static_cast<int>((frame.size() * 10u * 1000u + baud - 1) / baud);
  io_.set_write_timeout_ms(write_timeout_ms_ + wire_ms);
  return io_.send(frame);
}

void Framer::flush() noexcept {
  reader_.reset();
  rx_pos_ = rx_len_ = 0;
  io_.discard_input();
}

Result<Response> Framer::read_one_(int timeout_ms) noexcept {
  using R = Result<Response>;
  using clock = std::chrono::steady_clock;

  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

  for (;;) {
    if (rx_pos_ < rx_len_) {
      const auto used = reader_.feed(std::span<const std::uint8_t>(rx_.data() + rx_pos_, rx_len_ - rx_pos_));
      rx_pos_ += used;
      if (reader_.has_frame()) {
        auto fr = reader_.take();
        if (!fr) return R::Fail(std::move(fr.st));
        auto rs = decode_response(fr.value, status_bytes_);
        if (rs) spdlog::debug("<= {} (status {}, {} data bytes)", op_name(rs.value.op), rs.value.status, rs.value.data.size());
        return rs;
      }
      continue;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0) {
      if (reader_.in_frame()) return R::Fail(Errc::FrameCorrupt, "unterminated frame (timed out mid-frame)");
      return R::Fail(Errc::Timeout, "no response");
    }

    io_.set_timeout_ms(static_cast<int>(left));
    auto rr = io_.recv(rx_);
    if (!rr) {
      if (rr.st.is(Errc::Timeout)) {
        if (reader_.in_frame()) return R::Fail(Errc::FrameCorrupt, "unterminated frame (timed out mid-frame)");
        return R::Fail(Errc::Timeout, "no response");
      }
      return R::Fail(std::move(rr.st));
    }
    rx_pos_ = 0;
    rx_len_ = rr.value;
  }
}

Result<Response> Framer::recv(int timeout_ms) noexcept {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

  unsigned rereads = rereads_;
  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    auto r = read_one_(static_cast<int>(std::max<long long>(left, 0)));
    if (r || !r.st.is(Errc::FrameCorrupt)) return r;

    // Half a frame may still be buffered; start clean.
    reader_.reset();
    if (rereads == 0) {
      spdlog::debug("Framer: giving up after repeated corruption: {}", r.st.msg);
      return r;
    }
    --rereads;
    spdlog::warn("Framer: corrupt frame ({}), reading again", r.st.msg);
  }
}

} // namespace espflasher::esp
