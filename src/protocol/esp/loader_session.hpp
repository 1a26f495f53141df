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
#include "core/status.hpp"
#include "protocol/esp/cfg.hpp"
#include "protocol/esp/chip.hpp"
#include "protocol/esp/esp_wire.hpp"
#include "protocol/esp/framer.hpp"

#include <cstdint>
#include <stop_token>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace espflasher::esp {

namespace state {
struct Disconnected {};
struct Resetting {};
struct Syncing { unsigned attempt = 0; };
struct Ready {};
struct Busy { Op op = Op::SYNC; };
} // namespace state

using SessionState = std::variant<state::Disconnected, state::Resetting, state::Syncing, state::Ready, state::Busy>;

std::string_view state_name(const SessionState& s) noexcept;

struct SessionInfo {
  const ChipInfo* chip = nullptr;
  std::uint32_t magic = 0;
  std::uint32_t baud = 0;
  bool flash_attached = false;
};

// One conversation with a chip's ROM loader. At most one command is in
// flight at a time; the session owns nothing but borrows the transport.
class LoaderSession {
public:
  LoaderSession(espflasher::core::IByteTransport& io, const Cfg& cfg, std::stop_token stop = {}) noexcept
    : io_(io), framer_(io, cfg.frame_rereads, cfg.command_timeout_ms), cfg_(cfg), stop_(std::move(stop)) {}

  LoaderSession(const LoaderSession&) = delete;
  LoaderSession& operator=(const LoaderSession&) = delete;

  // Opens the transport if needed, resets into the loader and syncs.
  espflasher::core::Status connect() noexcept;

  // Up to cfg.sync_attempts SYNC exchanges without touching the reset lines.
  espflasher::core::Status sync() noexcept;

  espflasher::core::Result<const ChipInfo*> detect_chip() noexcept;
  espflasher::core::Status change_baud(std::uint32_t baud) noexcept;
  espflasher::core::Status attach_flash(std::uint32_t flash_size) noexcept;

  espflasher::core::Result<std::uint32_t> read_reg(std::uint32_t addr) noexcept;

  // Sends one request and waits for the matching response. A response whose
  // status byte is non-zero becomes Errc::CommandError with the ROM code in
  // Status::detail; no response becomes Errc::CommandTimeout.
  espflasher::core::Result<Response> command(Op op, std::vector<std::uint8_t> data, int timeout_ms) noexcept;
  espflasher::core::Result<Response> command(Op op, std::vector<std::uint8_t> data) noexcept {
    return command(op, std::move(data), cfg_.command_timeout_ms);
  }

  // Leaves the loader and boots user firmware (or just lets go of the lines).
  espflasher::core::Status hard_reset() noexcept;
  void disconnect() noexcept;

  const SessionState& state() const noexcept { return state_; }
  bool ready() const noexcept { return std::holds_alternative<state::Ready>(state_); }
  const SessionInfo& info() const noexcept { return info_; }
  const Cfg& cfg() const noexcept { return cfg_; }

  bool cancelled() const noexcept { return stop_.stop_requested(); }
  const std::stop_token& stop_token() const noexcept { return stop_; }

  espflasher::core::IByteTransport& transport() noexcept { return io_; }

private:
  espflasher::core::Result<Response> round_trip_(Op op, std::vector<std::uint8_t> data, int timeout_ms) noexcept;
  void drain_sync_replies_() noexcept;
  void set_state_(SessionState next) noexcept;

  espflasher::core::IByteTransport& io_;
  Framer framer_;
  Cfg cfg_;
  std::stop_token stop_;

  SessionState state_ = state::Disconnected{};
  SessionInfo info_{};
};

} // namespace espflasher::esp
