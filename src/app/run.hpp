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

#include "app/cli.hpp"
#include "core/status.hpp"
#include "platform/posix-common/port_info.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace espflasher::app {

enum class RunResult : int {
  Success = 0,
  InvalidUsage = 2,
  DeviceNotFound = 3,
  PermissionDenied = 4,
  SyncTimeout = 5,
  CommandError = 6,
  CommandTimeout = 7,
  VerifyFailed = 8,
  IoFail = 9,
  Cancelled = 10,
  PortBusy = 11,
  Unsupported = 12,
};

RunResult result_for(espflasher::core::Errc code) noexcept;

// One line per port; DeviceNotFound when there is nothing to list.
RunResult list_ports(const std::vector<espflasher::posix_common::SerialPortInfo>& ports, std::ostream& out);

// The port to use when none was given: the one known ESP bridge attached.
espflasher::core::Result<std::string> default_port(const std::vector<espflasher::posix_common::SerialPortInfo>& ports);

RunResult run(const Options& opt);

} // namespace espflasher::app
