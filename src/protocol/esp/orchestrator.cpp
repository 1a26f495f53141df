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

#include "protocol/esp/orchestrator.hpp"

#include "core/thread_pool.hpp"
#include "protocol/esp/flash_ops.hpp"
#include "protocol/esp/loader_session.hpp"

#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace espflasher::esp {

using espflasher::core::Errc;
using espflasher::core::IByteTransport;
using espflasher::core::Status;

namespace {

// Leaves the device running user firmware and releases the port, whatever
// happened before.
struct SessionGuard {
  LoaderSession& s;
  IByteTransport& io;
  bool reset_done = false;

  ~SessionGuard() {
    if (!reset_done && io.connected()) {
      if (auto st = s.hard_reset(); !st) spdlog::warn("{}: reset after failure: {}", io.name(), st.msg);
    }
    io.close();
  }
};

Outcome failed(const std::string& port, Stage stage, Status st) {
  spdlog::error("{}: {} failed: {} ({})", port, stage_name(stage), st.msg, errc_name(st.code));
  return Outcome{stage, std::move(st)};
}

} // namespace

std::string_view stage_name(Stage s) noexcept {
  switch (s) {
    case Stage::Connect: return "connect";
    case Stage::Sync: return "sync";
    case Stage::Identify: return "identify";
    case Stage::Erase: return "erase";
    case Stage::Write: return "write";
    case Stage::Verify: return "verify";
    case Stage::Reset: return "reset";
  }
  return "unknown";
}

Outcome run(IByteTransport& io, const Job& job, const Cfg& cfg, const Ui& ui, std::stop_token stop) noexcept {
  const std::string port = io.name();

  if (job.kind == Job::Kind::Write && (!job.image || job.image->bytes.empty()))
    return Outcome{Stage::Connect, Status::Fail(Errc::InvalidArgument, "no image to write")};

  LoaderSession session(io, cfg, stop);
  SessionGuard guard{session, io};

  auto enter = [&](Stage s) -> bool {
    spdlog::info("{}: {}", port, stage_name(s));
    if (ui.on_stage) ui.on_stage(port, s);
    return !stop.stop_requested();
  };
  auto cancelled = [&](Stage s) { return Outcome{s, Status::Fail(Errc::Cancelled, "cancelled")}; };

  if (!enter(Stage::Connect)) return cancelled(Stage::Connect);
  if (!io.connected()) {
    if (auto st = io.open(); !st) return failed(port, Stage::Connect, std::move(st));
  }

  if (!enter(Stage::Sync)) return cancelled(Stage::Sync);
  if (auto st = session.connect(); !st) return failed(port, Stage::Sync, std::move(st));

  if (!enter(Stage::Identify)) return cancelled(Stage::Identify);
  auto chip = session.detect_chip();
  if (!chip) return failed(port, Stage::Identify, std::move(chip.st));
  if (ui.on_chip) ui.on_chip(port, *chip.value);

  if (cfg.baud != io.baud()) {
    if (auto st = session.change_baud(cfg.baud); !st) return failed(port, Stage::Identify, std::move(st));
  }
  if (auto st = session.attach_flash(cfg.flash_size); !st) return failed(port, Stage::Identify, std::move(st));

  // A per-port copy only when the header needs patching; the caller's image is shared.
  std::optional<std::vector<std::uint8_t>> patched;
  std::span<const std::uint8_t> bytes;
  std::uint32_t offset = 0;

  if (job.kind == Job::Kind::Write) {
    if (auto st = espflasher::io::check_fits(*job.image, cfg.flash_size); !st) return failed(port, Stage::Identify, std::move(st));
    offset = job.image->offset;
    bytes = job.image->bytes;

    if (job.params.any() && offset == chip.value->bootloader_offset) {
      patched.emplace(job.image->bytes);
      auto pr = espflasher::io::patch_header(*patched, job.params);
      if (!pr) return failed(port, Stage::Identify, std::move(pr.st));
      if (pr.value.patched && ui.on_notice)
        ui.on_notice(fmt::format("{}: flash parameters patched{}", port, pr.value.sha256_updated ? " (SHA-256 updated)" : ""));
      bytes = *patched;
    }
  }

  FlashOps ops(session);

  if (cfg.erase_all || job.kind == Job::Kind::EraseAll) {
    if (!enter(Stage::Erase)) return cancelled(Stage::Erase);
    if (ui.on_progress) ui.on_progress(0, cfg.flash_size, "erase");
    if (auto st = ops.erase_all(); !st) return failed(port, Stage::Erase, std::move(st));
    if (ui.on_progress) ui.on_progress(cfg.flash_size, cfg.flash_size, "erase");
  }

  if (job.kind == Job::Kind::Write) {
    if (!enter(Stage::Write)) return cancelled(Stage::Write);
    if (auto st = ops.write(offset, bytes, ui.on_progress); !st) return failed(port, Stage::Write, std::move(st));

    if (cfg.verify) {
      if (!enter(Stage::Verify)) return cancelled(Stage::Verify);
      if (auto st = ops.verify(offset, bytes, ui.on_progress); !st) return failed(port, Stage::Verify, std::move(st));
    }
  }

  enter(Stage::Reset);
  guard.reset_done = true;
  if (auto st = session.hard_reset(); !st) return failed(port, Stage::Reset, std::move(st));

  spdlog::info("{}: done", port);
  return Outcome{Stage::Reset, Status::Ok()};
}

Outcome run_all(std::span<IByteTransport* const> ports, const Job& job, const Cfg& cfg, const Ui& ui,
                std::stop_token stop) noexcept {
  if (ports.empty()) return Outcome{Stage::Connect, Status::Fail(Errc::DeviceNotFound, "no serial port given")};

  // Progress of all ports folded into one (done, total) pair.
  std::mutex pm;
  std::vector<std::pair<std::uint64_t, std::uint64_t>> per(ports.size());

  std::vector<Outcome> outcomes(ports.size());
  espflasher::core::ThreadPool pool(ports.size(), false);

  for (std::size_t i = 0; i < ports.size(); ++i) {
    auto st = pool.submit([&, i]() -> Status {
      Ui local = ui;
      local.on_progress = [&, i](std::uint64_t done, std::uint64_t total, std::string_view phase) {
        if (!ui.on_progress) return;
        std::uint64_t d = 0, t = 0;
        {
          std::lock_guard lk(pm);
          per[i] = {done, total};
          for (const auto& [pd, pt] : per) { d += pd; t += pt; }
        }
        ui.on_progress(d, t, phase);
      };

      outcomes[i] = run(*ports[i], job, cfg, local, stop);
      return outcomes[i].st;
    });
    if (!st) return Outcome{Stage::Connect, std::move(st)};
  }
  if (auto st = pool.wait(); !st) spdlog::debug("run_all: first failure: {}", st.msg);

  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i].ok()) continue;
    if (ui.on_error)
      ui.on_error(fmt::format("{}: {} failed: {}", ports[i]->name(), stage_name(outcomes[i].stage), outcomes[i].st.msg));
    return std::move(outcomes[i]);
  }

  if (ui.on_done) ui.on_done();
  return Outcome{Stage::Reset, Status::Ok()};
}

} // namespace espflasher::esp
