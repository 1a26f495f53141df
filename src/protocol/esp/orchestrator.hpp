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
#include "io/esp_image.hpp"
#include "io/firmware.hpp"
#include "protocol/esp/cfg.hpp"
#include "protocol/esp/chip.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace espflasher::esp {

enum class Stage : std::uint8_t { Connect, Sync, Identify, Erase, Write, Verify, Reset };

std::string_view stage_name(Stage s) noexcept;

// Single terminal result of a run: Success when st.ok, else Failed(stage, st).
struct Outcome {
  Stage stage = Stage::Reset;
  espflasher::core::Status st{};

  bool ok() const noexcept { return st.ok; }
};

// Callbacks may fire from several worker threads when more than one port is driven.
struct Ui {
  std::function<void(const std::string&, Stage)> on_stage;
  std::function<void(const std::string&, const ChipInfo&)> on_chip;
  std::function<void(std::uint64_t, std::uint64_t, std::string_view)> on_progress;
  std::function<void(const std::string&)> on_notice;
  std::function<void(const std::string&)> on_error;
  std::function<void()> on_done;
};

struct Job {
  enum class Kind { Write, EraseAll };

  Kind kind = Kind::Write;
  const espflasher::io::FirmwareImage* image = nullptr;

  // Applied only when the image lands on the chip's bootloader offset.
  espflasher::io::FlashParams params{};
};

// connect -> sync -> identify -> [erase] -> [write] -> [verify] -> reset.
// The device reset and transport close run on every exit path.
Outcome run(espflasher::core::IByteTransport& io, const Job& job, const Cfg& cfg, const Ui& ui,
            std::stop_token stop = {}) noexcept;

// One independent session per port, in parallel. Returns the first failure in
// port order, or success when every port succeeded.
Outcome run_all(std::span<espflasher::core::IByteTransport* const> ports, const Job& job, const Cfg& cfg,
                const Ui& ui, std::stop_token stop = {}) noexcept;

} // namespace espflasher::esp
