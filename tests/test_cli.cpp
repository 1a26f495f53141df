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
#include "app/run.hpp"

#include <cstdio>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using espflasher::app::Options;
using espflasher::core::Errc;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static espflasher::core::Result<Options> parse(std::initializer_list<const char*> args) {
  std::vector<std::string> store{"espflasher"};
  for (const char* a : args) store.emplace_back(a);
  std::vector<char*> argv;
  for (auto& s : store) argv.push_back(s.data());
  argv.push_back(nullptr);
  return espflasher::app::parse_cli(static_cast<int>(store.size()), argv.data());
}

static void test_write_flash_defaults() {
  auto r = parse({"-p", "/dev/ttyUSB0", "write-flash", "0x10000", "app.bin"});
  check("write_ok", r.has_value);
  if (!r.has_value) return;
  const auto& o = r.value;
  check("write_cmd", o.command == Options::Command::WriteFlash);
  check("write_offset", o.offset == 0x10000);
  check("write_file", o.file && o.file->string() == "app.bin");
  check("write_port", o.ports.size() == 1 && o.ports[0] == "/dev/ttyUSB0");
  check("write_baud", o.baud == 921600);
  check("write_chip", o.chip == "esp32");
  check("write_verify", o.verify);
  check("write_reset", o.hard_reset_after && o.before == espflasher::core::ResetMode::DefaultReset);
  check("write_keep_params", !o.flash_params.any());
  check("write_flash_size", o.flash_size == 4u * 1024u * 1024u);
}

static void test_options() {
  auto r = parse({"--port=/dev/ttyUSB0", "-p", "/dev/ttyUSB1", "--baud", "460800", "--chip", "auto",
                  "--before", "no-reset", "--after", "no-reset", "--flash-mode", "dio", "--flash-freq=80m",
                  "--flash-size", "8MB", "--erase-all", "--no-verify", "--chunk-size", "4096",
                  "--sync-attempts", "3", "--json", "-v", "write_flash", "4096", "boot.bin"});
  check("opts_ok", r.has_value);
  if (!r.has_value) return;
  const auto& o = r.value;
  check("opts_ports", o.ports.size() == 2);
  check("opts_baud", o.baud == 460800);
  check("opts_chip", o.chip == "auto");
  check("opts_before", o.before == espflasher::core::ResetMode::NoReset);
  check("opts_after", !o.hard_reset_after);
  check("opts_mode", o.flash_params.mode && *o.flash_params.mode == 2);
  check("opts_freq", o.flash_params.freq && *o.flash_params.freq == 0x0F);
  check("opts_size", o.flash_params.size && *o.flash_params.size == 3 && o.flash_size == 8u * 1024u * 1024u);
  check("opts_erase_all", o.erase_all);
  check("opts_no_verify", !o.verify);
  check("opts_chunk", o.chunk_size == 4096);
  check("opts_sync", o.sync_attempts == 3);
  check("opts_json_verbose", o.json && o.verbose);
  check("opts_offset", o.offset == 4096);
}

static void test_erase_and_list() {
  auto e = parse({"-p", "/dev/ttyACM0", "erase-flash", "--yes"});
  check("erase_ok", e.has_value && e.value.command == Options::Command::EraseFlash && e.value.yes);

  auto l = parse({"--list-ports"});
  check("list_ok", l.has_value && l.value.command == Options::Command::ListPorts);

  auto h = parse({"--help"});
  check("help_ok", h.has_value && h.value.help);
}

static void test_rejections() {
  check("no_command", parse({"-p", "/dev/ttyUSB0"}).st.is(Errc::InvalidArgument));
  check("bad_offset", parse({"-p", "x", "write-flash", "zz", "a.bin"}).st.is(Errc::InvalidArgument));
  check("missing_file", parse({"-p", "x", "write-flash", "0x0"}).st.is(Errc::InvalidArgument));
  check("bad_chunk", parse({"-p", "x", "--chunk-size", "1023", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("big_chunk", parse({"-p", "x", "--chunk-size", "32768", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("bad_chip", parse({"-p", "x", "--chip", "esp8266", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("bad_before", parse({"-p", "x", "--before", "sometimes", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("bad_mode", parse({"-p", "x", "--flash-mode", "fast", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("unknown_opt", parse({"-p", "x", "--frobnicate", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("missing_value", parse({"erase-flash", "-p"}).st.is(Errc::InvalidArgument));
  check("verbose_quiet", parse({"-p", "x", "-v", "-q", "erase-flash"}).st.is(Errc::InvalidArgument));
  check("erase_all_on_erase", parse({"-p", "x", "--erase-all", "erase-flash"}).st.is(Errc::InvalidArgument));
}

static espflasher::posix_common::SerialPortInfo port(const char* path, std::string_view bridge) {
  espflasher::posix_common::SerialPortInfo p;
  p.path = path;
  p.usb = !bridge.empty();
  p.bridge = bridge;
  return p;
}

static void test_port_defaults_to_single_bridge() {
  using espflasher::app::default_port;

  auto r = parse({"write-flash", "0", "a.bin"});
  check("noport_parses", r.has_value && r.value.ports.empty());

  auto one = default_port({port("/dev/ttyS0", ""), port("/dev/ttyUSB0", "CP210x")});
  check("noport_picks_bridge", one.has_value && one.value == "/dev/ttyUSB0");

  auto none = default_port({port("/dev/ttyS0", "")});
  check("noport_none", none.st.is(Errc::DeviceNotFound));

  auto two = default_port({port("/dev/ttyUSB0", "CP210x"), port("/dev/ttyACM0", "Espressif USB-JTAG")});
  check("noport_ambiguous", two.st.is(Errc::InvalidArgument));
}

static void test_list_ports_exit_status() {
  using espflasher::app::RunResult;
  std::ostringstream out;
  check("list_empty_fails", espflasher::app::list_ports({}, out) == RunResult::DeviceNotFound);
  check("list_empty_prints_nothing", out.str().empty());

  check("list_one_ok", espflasher::app::list_ports({port("/dev/ttyUSB0", "CP210x")}, out) == RunResult::Success);
  check("list_one_line", out.str().find("/dev/ttyUSB0") != std::string::npos);
}

static void test_exit_codes() {
  using espflasher::app::RunResult;
  using espflasher::app::result_for;
  check("exit_sync", result_for(Errc::SyncTimeout) == RunResult::SyncTimeout);
  check("exit_cmd", result_for(Errc::CommandError) == RunResult::CommandError);
  check("exit_verify", result_for(Errc::VerifyFailed) == RunResult::VerifyFailed);
  check("exit_frame", result_for(Errc::FrameCorrupt) == RunResult::IoFail);
  check("exit_cancel", result_for(Errc::Cancelled) == RunResult::Cancelled);
  check("exit_busy", static_cast<int>(result_for(Errc::Busy)) == 11);
}

int main() {
  test_write_flash_defaults();
  test_options();
  test_erase_and_list();
  test_rejections();
  test_port_defaults_to_single_bridge();
  test_list_ports_exit_status();
  test_exit_codes();

  std::fprintf(stdout, "cli: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
