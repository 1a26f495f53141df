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

#include "protocol/esp/slip.hpp"

#include <utility>

namespace espflasher::esp::slip {

using espflasher::core::Errc;
using espflasher::core::Result;

std::vector<std::uint8_t> encode(std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> out;
  out.reserve(payload.size() + payload.size() / 8 + 2);

  out.push_back(END);
  for (const auto b : payload) {
    if (b == END) {
      out.push_back(ESC);
      out.push_back(ESC_END);
    } else if (b == ESC) {
      out.push_back(ESC);
      out.push_back(ESC_ESC);
    } else {
      out.push_back(b);
    }
  }
  out.push_back(END);
  return out;
}

Result<std::vector<std::uint8_t>> decode(std::span<const std::uint8_t> frame) noexcept {
  using R = Result<std::vector<std::uint8_t>>;
  if (frame.size() < 2 || frame.front() != END) return R::Fail(Errc::FrameCorrupt, "SLIP: missing start delimiter");
  if (frame.back() != END) return R::Fail(Errc::FrameCorrupt, "SLIP: unterminated frame");

  Reader rd(frame.size());
  const std::size_t used = rd.feed(frame);
  if (!rd.has_frame()) return R::Fail(Errc::FrameCorrupt, "SLIP: unterminated frame");
  if (used != frame.size()) return R::Fail(Errc::FrameCorrupt, "SLIP: trailing bytes after frame");
  return rd.take();
}

void Reader::reset() noexcept {
  buf_.clear();
  in_frame_ = escaped_ = corrupt_ = false;
  ready_.reset();
}

void Reader::finish_(bool corrupt) noexcept {
  ready_ = Done{std::move(buf_), corrupt};
  buf_.clear();
  in_frame_ = escaped_ = corrupt_ = false;
}

std::size_t Reader::feed(std::span<const std::uint8_t> in) noexcept {
  std::size_t i = 0;
  while (i < in.size() && !ready_) {
    const std::uint8_t b = in[i++];

    if (!in_frame_) {
      // Consecutive END bytes are idle fill; the next one opens a frame.
      if (b == END) in_frame_ = true;
      continue;
    }

    if (b == END) {
      if (buf_.empty() && !escaped_ && !corrupt_) continue;
      finish_(corrupt_ || escaped_);
      break;
    }

    if (escaped_) {
      escaped_ = false;
      if (b == ESC_END) buf_.push_back(END);
      else if (b == ESC_ESC) buf_.push_back(ESC);
      else corrupt_ = true;
      continue;
    }

    if (b == ESC) {
      escaped_ = true;
      continue;
    }

    if (buf_.size() >= max_frame_) {
      corrupt_ = true;
      continue;
    }
    buf_.push_back(b);
  }
  return i;
}

Result<std::vector<std::uint8_t>> Reader::take() noexcept {
  using R = Result<std::vector<std::uint8_t>>;
  if (!ready_) return R::Fail(Errc::FrameCorrupt, "SLIP: no complete frame");

  Done d = std::move(*ready_);
  ready_.reset();
  if (d.corrupt) return R::Fail(Errc::FrameCorrupt, "SLIP: invalid escape sequence in frame");
  return R::Ok(std::move(d.payload));
}

} // namespace espflasher::esp::slip
