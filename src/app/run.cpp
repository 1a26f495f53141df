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

#include "app/run.hpp"

#include "app/interface.hpp"

#include "core/str.hpp"

#include "io/firmware.hpp"
#include "platform/platform_all.hpp"
#include "protocol/esp/orchestrator.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace espflasher::app {

using espflasher::core::Errc;
using espflasher::platform::SerialPort;
using espflasher::platform::SingleInstanceLock;

RunResult result_for(Errc code) noexcept {
  switch (code) {
    case Errc::None: return RunResult::Success;
    case Errc::DeviceNotFound: return RunResult::DeviceNotFound;
    case Errc::PermissionDenied: return RunResult::PermissionDenied;
    case Errc::SyncTimeout: return RunResult::SyncTimeout;
    case Errc::CommandError: return RunResult::CommandError;
    case Errc::Timeout:
    case Errc::CommandTimeout: return RunResult::CommandTimeout;
    case Errc::VerifyFailed: return RunResult::VerifyFailed;
    case Errc::InvalidArgument: return RunResult::InvalidUsage;
    case Errc::Cancelled: return RunResult::Cancelled;
    case Errc::Busy: return RunResult::PortBusy;
    case Errc::Unsupported: return RunResult::Unsupported;
    case Errc::FrameCorrupt:
    case Errc::Io: break;
  }
  return RunResult::IoFail;
}

RunResult list_ports(const std::vector<espflasher::posix_common::SerialPortInfo>& ports, std::ostream& out) {
  if (ports.empty()) {
    spdlog::error("No serial ports found");
    return RunResult::DeviceNotFound;
  }
  for (const auto& p : ports) out << p.describe() << "\n";
  out << std::flush;
  return RunResult::Success;
}

espflasher::core::Result<std::string> default_port(const std::vector<espflasher::posix_common::SerialPortInfo>& ports) {
  using R = espflasher::core::Result<std::string>;
  const espflasher::posix_common::SerialPortInfo* found = nullptr;
  std::size_t bridges = 0;
  for (const auto& p : ports) {
    if (p.bridge.empty()) continue;
    ++bridges;
    found = &p;
  }
  if (bridges == 0) return R::Fail(Errc::DeviceNotFound, "No serial port given and no ESP USB bridge found (use --port)");
  if (bridges > 1) return R::Failf(Errc::InvalidArgument, "{} ESP USB bridges found, pick one with --port", bridges);
  return R::Ok(found->path);
}

static bool confirm_erase(const Options& opt) {
  if (opt.yes) return true;

  std::cout << fmt::format("This erases the entire flash on {} port(s). Continue? [y/N] ", opt.ports.size())
            << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) return false;
  const auto a = espflasher::core::trim(answer);
  return espflasher::core::equals_ci(a, "y") || espflasher::core::equals_ci(a, "yes");
}

static espflasher::esp::Cfg make_cfg(const Options& opt) {
  espflasher::esp::Cfg cfg;
  cfg.baud = opt.baud;
  cfg.chip = opt.chip;
  cfg.reset_mode = opt.before;
  cfg.hard_reset_after = opt.hard_reset_after;
  cfg.sync_attempts = opt.sync_attempts;
  cfg.chunk_size = opt.chunk_size;
  cfg.flash_size = opt.flash_size;
  cfg.verify = opt.verify;
  cfg.erase_all = opt.erase_all;
  return cfg;
}

RunResult run(const Options& opt) {
  if (opt.command == Options::Command::ListPorts) return list_ports(espflasher::platform::list_serial_ports(), std::cout);

  if (opt.ports.empty()) {
    auto port = default_port(espflasher::platform::list_serial_ports());
    if (!port) {
      spdlog::error("{}", port.st.msg);
      return result_for(port.st.code);
    }
    spdlog::info("Using {}", port.value);
    Options with_port = opt;
    with_port.ports.push_back(std::move(port.value));
    return run(with_port);
  }

  espflasher::esp::Job job;
  std::optional<espflasher::io::FirmwareImage> image;

  if (opt.command == Options::Command::EraseFlash) {
    if (!confirm_erase(opt)) {
      spdlog::info("Erase aborted");
      return RunResult::Cancelled;
    }
    job.kind = espflasher::esp::Job::Kind::EraseAll;
  } else {
    if (!opt.file) {
      std::cerr << usage_text();
      return RunResult::InvalidUsage;
    }
    auto ir = espflasher::io::load_image(*opt.file, opt.offset, opt.force);
    if (!ir) {
      spdlog::error("{}", ir.st.msg);
      return result_for(ir.st.code);
    }
    image = std::move(ir.value);
    job.kind = espflasher::esp::Job::Kind::Write;
    job.image = &*image;
    job.params = opt.flash_params;
  }

  std::vector<SingleInstanceLock> locks;
  locks.reserve(opt.ports.size());
  for (const auto& p : opt.ports) {
    auto lock = SingleInstanceLock::try_acquire(SingleInstanceLock::name_for_port(p));
    if (!lock) {
      spdlog::error("{} is already being flashed by another instance", p);
      return RunResult::PortBusy;
    }
    locks.push_back(std::move(*lock));
  }

  std::vector<std::unique_ptr<SerialPort>> storage;
  storage.reserve(opt.ports.size());
  std::vector<espflasher::core::IByteTransport*> links;
  links.reserve(opt.ports.size());
  for (const auto& p : opt.ports) {
    auto port = std::make_unique<SerialPort>(p);
    links.push_back(port.get());
    storage.push_back(std::move(port));
  }

  FlashInterface ui(!opt.json && !opt.quiet, opt.json);
  ui.ports(opt.ports);

  std::stop_source stop;
  auto shield = espflasher::platform::SignalShield::enable([&](const char* sig_desc, int count) {
    if (count == 1) {
      stop.request_stop();
      ui.notice(fmt::format("{} received, stopping after the current block", sig_desc));
      return;
    }
    ui.notice(fmt::format("{} ignored ({} times), waiting for the device reset", sig_desc, count));
  });
  if (!shield) spdlog::warn("Signal handling unavailable, interrupting may leave the chip in the loader");

  espflasher::esp::Ui hooks;
  hooks.on_stage = [&](const std::string& port, espflasher::esp::Stage s) {
    ui.stage(port, std::string(espflasher::esp::stage_name(s)));
  };
  hooks.on_chip = [&](const std::string& port, const espflasher::esp::ChipInfo& chip) {
    ui.chip(port, std::string(chip.name));
  };
  hooks.on_progress = [&](std::uint64_t done, std::uint64_t total, std::string_view phase) {
    ui.progress(done, total, phase);
  };
  hooks.on_notice = [&](const std::string& msg) { ui.notice(msg); };
  hooks.on_error = [&](const std::string& msg) { ui.fail(msg); };
  hooks.on_done = [&] { ui.done("DONE"); };

  const auto out = espflasher::esp::run_all(links, job, make_cfg(opt), hooks, stop.get_token());
  if (out.ok()) return RunResult::Success;
  return result_for(out.st.code);
}

} // namespace espflasher::app
