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

#include "protocol/esp/loader_session.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

namespace espflasher::esp {

using espflasher::core::Errc;
using espflasher::core::Result;
using espflasher::core::Status;

namespace {

constexpr int BAUD_SETTLE_MS = 50;
constexpr int MIN_SYNC_BACKOFF_MS = 10;
constexpr unsigned MAX_SYNC_ECHOES = 16;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

std::string_view state_name(const SessionState& s) noexcept {
  return std::visit(overloaded{
    [](const state::Disconnected&) -> std::string_view { return "disconnected"; },
    [](const state::Resetting&) -> std::string_view { return "resetting"; },
    [](const state::Syncing&) -> std::string_view { return "syncing"; },
    [](const state::Ready&) -> std::string_view { return "ready"; },
    [](const state::Busy&) -> std::string_view { return "busy"; },
  }, s);
}

void LoaderSession::set_state_(SessionState next) noexcept {
  if (next.index() != state_.index()) {
    spdlog::debug("{}: {} -> {}", io_.name(), state_name(state_), state_name(next));
  } else if (const auto* s = std::get_if<state::Syncing>(&next)) {
    spdlog::debug("{}: syncing, attempt {}", io_.name(), s->attempt);
  }
  state_ = std::move(next);
}

Result<Response> LoaderSession::round_trip_(Op op, std::vector<std::uint8_t> data, int timeout_ms) noexcept {
  using R = Result<Response>;
  using clock = std::chrono::steady_clock;

  if (auto st = framer_.send(make_request(op, std::move(data))); !st) {
    if (st.is(Errc::Timeout)) return R::Failf(Errc::CommandTimeout, "{}: request not sent: {}", op_name(op), st.msg);
    return R::Fail(std::move(st));
  }

  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    auto r = framer_.recv(static_cast<int>(std::max<long long>(left, 0)));
    if (!r) {
      if (r.st.is(Errc::Timeout))
        return R::Failf(Errc::CommandTimeout, "{}: no response within {} ms", op_name(op), timeout_ms);
      return R::Fail(std::move(r.st));
    }

    // Late replies to an earlier command (typically extra SYNC echoes) are skipped.
    if (r.value.op != op) {
      spdlog::debug("LoaderSession: ignoring {} response while waiting for {}", op_name(r.value.op), op_name(op));
      if (left <= 0) return R::Failf(Errc::CommandTimeout, "{}: no response within {} ms", op_name(op), timeout_ms);
      continue;
    }

    if (r.value.failed()) {
      const auto code = r.value.error;
      return R::Fail(Errc::CommandError,
                     fmt::format("{} failed: {} (0x{:02X})", op_name(op), rom_error_name(code), code),
                     code);
    }
    return r;
  }
}

Result<Response> LoaderSession::command(Op op, std::vector<std::uint8_t> data, int timeout_ms) noexcept {
  using R = Result<Response>;

  if (std::holds_alternative<state::Busy>(state_))
    return R::Failf(Errc::Busy, "{}: another command is in flight", op_name(op));
  if (!ready())
    return R::Failf(Errc::Busy, "{}: session is {}", op_name(op), state_name(state_));
  if (cancelled()) return R::Fail(Errc::Cancelled, "cancelled");

  set_state_(state::Busy{op});
  auto r = round_trip_(op, std::move(data), timeout_ms);
  if (std::holds_alternative<state::Busy>(state_)) set_state_(state::Ready{});
  return r;
}

void LoaderSession::drain_sync_replies_() noexcept {
  // The ROM answers one SYNC with a burst of identical replies.
  for (unsigned i = 0; i < MAX_SYNC_ECHOES; ++i) {
    auto r = framer_.recv(cfg_.sync_timeout_ms);
    if (!r) break;
  }
  framer_.flush();
}

Status LoaderSession::sync() noexcept {
  if (!io_.connected()) return Status::Fail(Errc::Io, "sync: transport not open");

  int backoff = cfg_.sync_backoff_ms;
  Status last = Status::Fail(Errc::SyncTimeout, "no attempts made");

  for (unsigned attempt = 1; attempt <= cfg_.sync_attempts; ++attempt) {
    if (cancelled()) {
      set_state_(state::Disconnected{});
      return Status::Fail(Errc::Cancelled, "cancelled while syncing");
    }

    set_state_(state::Syncing{attempt});
    framer_.flush();

    auto r = round_trip_(Op::SYNC, sync_payload(), cfg_.sync_timeout_ms);
    if (r) {
      drain_sync_replies_();
      set_state_(state::Ready{});
      info_.baud = io_.baud();
      spdlog::info("{}: synced after {} attempt(s)", io_.name(), attempt);
      return Status::Ok();
    }
    if (r.st.is(Errc::Io) || r.st.is(Errc::Cancelled)) {
      set_state_(state::Disconnected{});
      return std::move(r.st);
    }

    last = std::move(r.st);
    spdlog::debug("{}: sync attempt {}/{} failed: {}", io_.name(), attempt, cfg_.sync_attempts, last.msg);

    if (attempt < cfg_.sync_attempts && backoff > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
      backoff = std::max(backoff / 2, MIN_SYNC_BACKOFF_MS);
    }
  }

  set_state_(state::Disconnected{});
  spdlog::warn("{}: no SYNC reply after {} attempts", io_.name(), cfg_.sync_attempts);
  return Status::Failf(Errc::SyncTimeout, "no SYNC reply after {} attempts ({})", cfg_.sync_attempts, last.msg);
}

Status LoaderSession::connect() noexcept {
  if (!io_.connected()) ESPF_TRY(io_.open());

  info_ = SessionInfo{};
  framer_.set_status_bytes(ROM_STATUS_BYTES);

  if (io_.baud() != cfg_.rom_baud) ESPF_TRY(io_.set_baud(cfg_.rom_baud));

  set_state_(state::Resetting{});
  if (auto st = io_.reset(cfg_.reset_mode, true); !st) {
    set_state_(state::Disconnected{});
    return st;
  }
  framer_.flush();

  return sync();
}

Result<std::uint32_t> LoaderSession::read_reg(std::uint32_t addr) noexcept {
  using R = Result<std::uint32_t>;
  auto r = command(Op::READ_REG, read_reg_payload(addr));
  if (!r) return R::Fail(std::move(r.st));
  return R::Ok(r.value.value);
}

Result<const ChipInfo*> LoaderSession::detect_chip() noexcept {
  using R = Result<const ChipInfo*>;

  auto magic = read_reg(CHIP_MAGIC_REG);
  if (!magic) return R::Fail(std::move(magic.st));
  info_.magic = magic.value;

  if (magic.value == ESP8266_MAGIC) return R::Fail(Errc::Unsupported, "ESP8266 is not supported");

  const ChipInfo* chip = chip_by_magic(magic.value);
  if (!chip) return R::Failf(Errc::Unsupported, "unknown chip (magic 0x{:08X})", magic.value);

  if (!espflasher::core::equals_ci(cfg_.chip, "auto")) {
    const ChipInfo* want = chip_by_name(cfg_.chip);
    if (!want) return R::Failf(Errc::InvalidArgument, "unknown chip name '{}'", cfg_.chip);
    if (want != chip)
      return R::Failf(Errc::InvalidArgument, "expected {} but found {}", want->name, chip->name);
  }

  info_.chip = chip;
  spdlog::info("{}: detected {} (magic 0x{:08X})", io_.name(), chip->name, magic.value);
  return R::Ok(chip);
}

Status LoaderSession::change_baud(std::uint32_t baud) noexcept {
  if (baud == io_.baud()) return Status::Ok();

  // The ROM acknowledges at the old rate, then switches.
  auto r = command(Op::CHANGE_BAUDRATE, change_baud_payload(baud, 0));
  if (!r) return std::move(r.st);

  ESPF_TRY(io_.set_baud(baud));
  std::this_thread::sleep_for(std::chrono::milliseconds(BAUD_SETTLE_MS));
  framer_.flush();

  auto st = sync();
  if (!st) return Status::Failf(st.code, "no reply at {} baud: {}", baud, st.msg);
  spdlog::debug("{}: running at {} baud", io_.name(), baud);
  return st;
}

Status LoaderSession::attach_flash(std::uint32_t flash_size) noexcept {
  auto r = command(Op::SPI_ATTACH, spi_attach_payload(true));
  if (!r) return std::move(r.st);

  r = command(Op::SPI_SET_PARAMS, spi_set_params_payload(flash_size));
  if (!r) return std::move(r.st);

  info_.flash_attached = true;
  return Status::Ok();
}

Status LoaderSession::hard_reset() noexcept {
  if (!io_.connected()) {
    set_state_(state::Disconnected{});
    return Status::Ok();
  }

  const auto mode = cfg_.hard_reset_after ? cfg_.reset_mode : espflasher::core::ResetMode::NoReset;
  set_state_(state::Resetting{});
  auto st = io_.reset(mode, false);
  set_state_(state::Disconnected{});
  info_.flash_attached = false;
  if (!st) spdlog::warn("{}: hard reset failed: {}", io_.name(), st.msg);
  return st;
}

void LoaderSession::disconnect() noexcept {
  set_state_(state::Disconnected{});
  info_.flash_attached = false;
  io_.close();
}

} // namespace espflasher::esp
