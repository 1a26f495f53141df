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

#include "app/cli.hpp"
#include "app/version.hpp"

#include "core/str.hpp"
#include "protocol/esp/chip.hpp"

#include <string_view>
#include <utility>

namespace espflasher::app {

using espflasher::core::Errc;
using R = espflasher::core::Result<Options>;

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static espflasher::core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                                    std::string_view a, std::string_view opt) noexcept
{
  using SV = espflasher::core::Result<std::string_view>;
  if (auto ov = opt_value(a, opt)) return SV::Ok(*ov);
  if (i + 1 >= argc) return SV::Failf(Errc::InvalidArgument, "{} requires a value", opt);
  return SV::Ok(std::string_view(argv[++i]));
}

static espflasher::core::Result<std::uint32_t> read_u32_value(int& i, int argc, char** argv,
                                                              std::string_view a, std::string_view opt) noexcept
{
  using U = espflasher::core::Result<std::uint32_t>;
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return U::Fail(std::move(vr.st));
  auto v = espflasher::core::parse_u32(vr.value);
  if (!v) return U::Failf(Errc::InvalidArgument, "{}: '{}' is not a number", opt, vr.value);
  return U::Ok(*v);
}

std::string usage_text() {
  std::string out;
  out.reserve(2048);

  out += "espflasher v";
  out += espflasher::app::version_string();
  out += "\n\n";

  out += R"(Usage:
  espflasher [options] write-flash <offset> <file.bin>
  espflasher [options] erase-flash
  espflasher --list-ports

Options:
  --help, -h
  --version
  --list-ports                 list serial ports and exit
  -p, --port <dev>             serial port, repeat to flash several boards at once
                               (default: the only ESP USB bridge attached)
  -b, --baud <rate>            transfer baud rate after sync (default 921600)
  --chip <name|auto>           expected chip: esp32, esp32s2, esp32s3, esp32c2, esp32c3, esp32c6, esp32h2 (default esp32)
  --before <mode>              default-reset | usb-reset | no-reset
  --after <mode>               hard-reset | no-reset
  --flash-mode <m>             keep | qio | qout | dio | dout
  --flash-freq <f>             keep | 80m | 40m | 26m | 20m
  --flash-size <s>             keep | 1MB | 2MB | 4MB | 8MB | 16MB
  --erase-all                  erase the entire flash before writing
  --no-verify                  skip the MD5 read-back
  --chunk-size <n>             bytes per FLASH_DATA block (default 1024)
  --sync-attempts <n>          SYNC attempts before giving up (default 7)
  --yes, -y                    do not ask before erase-flash
  --force                      accept images without a .bin extension
  --json                       machine readable progress lines
  --verbose, -v                enable verbose logging
  --quiet, -q                  only warnings and errors
)";
  return out;
}

R parse_cli(int argc, char** argv) noexcept {
  Options o;
  std::vector<std::string_view> positional;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--list-ports") { o.command = Options::Command::ListPorts; continue; }

    if (a == "--erase-all") { o.erase_all = true; continue; }
    if (a == "--no-verify") { o.verify = false; continue; }
    if (a == "--yes" || a == "-y") { o.yes = true; continue; }
    if (a == "--force") { o.force = true; continue; }
    if (a == "--json") { o.json = true; continue; }
    if (a == "--verbose" || a == "-v") { o.verbose = true; continue; }
    if (a == "--quiet" || a == "-q") { o.quiet = true; continue; }

    if (a == "-p" || is_opt(a, "--port")) {
      auto vr = read_string_value(i, argc, argv, a, a == "-p" ? "-p" : "--port");
      if (!vr) return R::Fail(std::move(vr.st));
      o.ports.emplace_back(vr.value);
      continue;
    }

    if (a == "-b" || is_opt(a, "--baud")) {
      auto vr = read_u32_value(i, argc, argv, a, a == "-b" ? "-b" : "--baud");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value < 9600) return R::Failf(Errc::InvalidArgument, "--baud: {} is too low", vr.value);
      o.baud = vr.value;
      continue;
    }

    if (is_opt(a, "--chip")) {
      auto vr = read_string_value(i, argc, argv, a, "--chip");
      if (!vr) return R::Fail(std::move(vr.st));
      if (!espflasher::core::equals_ci(vr.value, "auto") && !espflasher::esp::chip_by_name(vr.value))
        return R::Failf(Errc::InvalidArgument, "--chip: unknown chip '{}'", vr.value);
      o.chip = std::string(vr.value);
      continue;
    }

    if (is_opt(a, "--before")) {
      auto vr = read_string_value(i, argc, argv, a, "--before");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value == "default-reset") o.before = espflasher::core::ResetMode::DefaultReset;
      else if (vr.value == "usb-reset") o.before = espflasher::core::ResetMode::UsbJtagReset;
      else if (vr.value == "no-reset") o.before = espflasher::core::ResetMode::NoReset;
      else return R::Failf(Errc::InvalidArgument, "--before: unknown mode '{}'", vr.value);
      continue;
    }

    if (is_opt(a, "--after")) {
      auto vr = read_string_value(i, argc, argv, a, "--after");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value == "hard-reset") o.hard_reset_after = true;
      else if (vr.value == "no-reset") o.hard_reset_after = false;
      else return R::Failf(Errc::InvalidArgument, "--after: unknown mode '{}'", vr.value);
      continue;
    }

    if (is_opt(a, "--flash-mode")) {
      auto vr = read_string_value(i, argc, argv, a, "--flash-mode");
      if (!vr) return R::Fail(std::move(vr.st));
      auto m = espflasher::io::parse_flash_mode(vr.value);
      if (!m) return R::Fail(std::move(m.st));
      o.flash_params.mode = m.value;
      continue;
    }

    if (is_opt(a, "--flash-freq")) {
      auto vr = read_string_value(i, argc, argv, a, "--flash-freq");
      if (!vr) return R::Fail(std::move(vr.st));
      auto f = espflasher::io::parse_flash_freq(vr.value);
      if (!f) return R::Fail(std::move(f.st));
      o.flash_params.freq = f.value;
      continue;
    }

    if (is_opt(a, "--flash-size")) {
      auto vr = read_string_value(i, argc, argv, a, "--flash-size");
      if (!vr) return R::Fail(std::move(vr.st));
      auto s = espflasher::io::parse_flash_size(vr.value);
      if (!s) return R::Fail(std::move(s.st));
      o.flash_params.size = s.value;
      if (s.value) o.flash_size = espflasher::io::flash_size_bytes(*s.value);
      continue;
    }

    if (is_opt(a, "--chunk-size")) {
      auto vr = read_u32_value(i, argc, argv, a, "--chunk-size");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value == 0 || vr.value > 0x4000 || (vr.value % 4) != 0)
        return R::Failf(Errc::InvalidArgument, "--chunk-size: {} must be a multiple of 4 up to 16384", vr.value);
      o.chunk_size = vr.value;
      continue;
    }

    if (is_opt(a, "--sync-attempts")) {
      auto vr = read_u32_value(i, argc, argv, a, "--sync-attempts");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value == 0 || vr.value > 100) return R::Failf(Errc::InvalidArgument, "--sync-attempts: {} not in 1..100", vr.value);
      o.sync_attempts = vr.value;
      continue;
    }

    if (a.starts_with("-")) return R::Failf(Errc::InvalidArgument, "Unknown option: {}", a);
    positional.push_back(a);
  }

  if (o.help || o.version) return R::Ok(std::move(o));

  if (o.command == Options::Command::ListPorts) {
    if (!positional.empty()) return R::Fail(Errc::InvalidArgument, "--list-ports takes no command");
    return R::Ok(std::move(o));
  }

  if (positional.empty()) return R::Fail(Errc::InvalidArgument, "No command given. Use --help to see usage.");

  const auto cmd = positional.front();
  if (cmd == "write-flash" || cmd == "write_flash") {
    if (positional.size() != 3) return R::Fail(Errc::InvalidArgument, "write-flash needs <offset> <file>");
    auto off = espflasher::core::parse_u32(positional[1]);
    if (!off) return R::Failf(Errc::InvalidArgument, "write-flash: bad offset '{}'", positional[1]);
    o.command = Options::Command::WriteFlash;
    o.offset = *off;
    o.file = std::filesystem::path(std::string(positional[2]));
  } else if (cmd == "erase-flash" || cmd == "erase_flash") {
    if (positional.size() != 1) return R::Fail(Errc::InvalidArgument, "erase-flash takes no arguments");
    if (o.erase_all) return R::Fail(Errc::InvalidArgument, "--erase-all only applies to write-flash");
    o.command = Options::Command::EraseFlash;
  } else {
    return R::Failf(Errc::InvalidArgument, "Unknown command: {}", cmd);
  }

  if (o.verbose && o.quiet) return R::Fail(Errc::InvalidArgument, "--verbose and --quiet are mutually exclusive");

  return R::Ok(std::move(o));
}

} // namespace espflasher::app
