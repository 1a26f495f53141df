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

#include "io/esp_image.hpp"
#include "io/firmware.hpp"
#include "protocol/esp/orchestrator.hpp"
#include "sim_device.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

using espflasher::core::Errc;
using espflasher::core::IByteTransport;
using espflasher::esp::Cfg;
using espflasher::esp::Job;
using espflasher::esp::Op;
using espflasher::esp::Stage;
using espflasher::esp::Ui;
using espflasher::io::FirmwareImage;
using espflasher::test::SimDevice;

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

static Cfg fast_cfg() {
  Cfg c;
  c.sync_backoff_ms = 0;
  return c;
}

static FirmwareImage make_image(std::uint32_t offset, std::size_t n) {
  FirmwareImage img;
  img.name = "app.bin";
  img.offset = offset;
  img.bytes.resize(n);
  for (std::size_t i = 0; i < n; ++i) img.bytes[i] = static_cast<std::uint8_t>(i * 7u + 3u);
  return img;
}

struct Recorder {
  std::mutex m;
  std::vector<Stage> stages;
  std::vector<std::string> errors;
  int done = 0;

  Ui hooks() {
    Ui ui;
    ui.on_stage = [this](const std::string&, Stage s) {
      std::lock_guard lk(m);
      stages.push_back(s);
    };
    ui.on_error = [this](const std::string& e) {
      std::lock_guard lk(m);
      errors.push_back(e);
    };
    ui.on_done = [this] { ++done; };
    return ui;
  }
};

static void test_write_job_runs_every_stage() {
  SimDevice sim;
  const auto img = make_image(0x10000, 10 * 1024);
  Recorder rec;

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, fast_cfg(), rec.hooks());

  check("full_ok", out.ok());
  const std::vector<Stage> want{Stage::Connect, Stage::Sync, Stage::Identify, Stage::Write, Stage::Verify, Stage::Reset};
  check("full_stage_order", rec.stages == want);
  check("full_baud_raised", sim.baud() == 921600);
  check("full_reset_to_firmware", sim.resets.size() == 2 && !sim.resets.back().into_bootloader);
  check("full_closed", !sim.connected() && sim.closes == 1);
  check("full_contents", std::equal(img.bytes.begin(), img.bytes.end(), sim.flash().begin() + 0x10000));
}

static void test_no_verify_skips_md5() {
  SimDevice sim;
  const auto img = make_image(0x10000, 4096);
  auto cfg = fast_cfg();
  cfg.verify = false;

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, cfg, Ui{});
  check("noverify_ok", out.ok());
  check("noverify_no_md5", sim.count(Op::SPI_FLASH_MD5) == 0);
}

static void test_erase_timeout_fails_and_closes() {
  SimDevice sim;
  sim.faults.silent_erase = true;
  const auto img = make_image(0x10000, 4096);
  auto cfg = fast_cfg();
  cfg.erase_all = true;

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, cfg, Ui{});

  check("erase_timeout_stage", out.stage == Stage::Erase);
  check("erase_timeout_code", out.st.is(Errc::CommandTimeout));
  check("erase_timeout_no_write", sim.count(Op::FLASH_DATA) == 0);
  check("erase_timeout_reset_attempted", sim.resets.size() == 2 && !sim.resets.back().into_bootloader);
  check("erase_timeout_closed", !sim.connected() && sim.closes == 1);
}

static void test_cancel_between_chunks() {
  SimDevice sim;
  std::stop_source stop;
  sim.faults.on_flash_data = [&](std::uint32_t seq) {
    if (seq == 10) stop.request_stop();
  };
  const auto img = make_image(0x10000, 256 * 1024);

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, fast_cfg(), Ui{}, stop.get_token());

  check("cancel_stage", out.stage == Stage::Write);
  check("cancel_code", out.st.is(Errc::Cancelled));
  check("cancel_chunk_11_not_sent", !sim.data_seqs.empty() && sim.data_seqs.back() == 10);
  check("cancel_reset_attempted", sim.resets.size() == 2 && !sim.resets.back().into_bootloader);
  check("cancel_closed", !sim.connected());
}

static void test_sync_failure() {
  SimDevice sim;
  sim.faults.ignore_syncs = 1000;
  const auto img = make_image(0x10000, 4096);

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, fast_cfg(), Ui{});
  check("syncfail_stage", out.stage == Stage::Sync);
  check("syncfail_code", out.st.is(Errc::SyncTimeout));
  check("syncfail_closed", !sim.connected());
}

static void test_open_failure() {
  SimDevice sim;
  sim.faults.open_error = Errc::DeviceNotFound;
  const auto img = make_image(0x10000, 4096);

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, fast_cfg(), Ui{});
  check("openfail_stage", out.stage == Stage::Connect);
  check("openfail_code", out.st.is(Errc::DeviceNotFound));
  check("openfail_no_reset", sim.resets.empty());
}

static void test_image_too_big_for_flash() {
  SimDevice sim;
  const auto img = make_image(0x3F0000, 0x20000);

  Job job;
  job.image = &img;
  auto out = espflasher::esp::run(sim, job, fast_cfg(), Ui{});
  check("toobig_stage", out.stage == Stage::Identify);
  check("toobig_code", out.st.is(Errc::InvalidArgument));
  check("toobig_nothing_written", sim.count(Op::FLASH_BEGIN) == 0);
}

static void test_header_patched_only_at_bootloader_offset() {
  auto img = make_image(0x1000, 4096);
  img.bytes[0] = espflasher::io::ESP_IMAGE_MAGIC;
  img.bytes[2] = 0x00;
  img.bytes[3] = 0x20;
  img.bytes[espflasher::io::ESP_IMAGE_HASH_FLAG_OFFSET] = 0;

  Job job;
  job.image = &img;
  job.params.mode = 0x02;
  job.params.freq = 0x0F;

  {
    SimDevice sim;
    std::vector<std::string> notices;
    Ui ui;
    ui.on_notice = [&](const std::string& n) { notices.push_back(n); };
    auto out = espflasher::esp::run(sim, job, fast_cfg(), ui);
    check("patch_ok", out.ok());
    check("patch_mode", sim.flash()[0x1002] == 0x02);
    check("patch_freq_keeps_size", sim.flash()[0x1003] == 0x2F);
    check("patch_notice", notices.size() == 1);
    check("patch_source_untouched", img.bytes[2] == 0x00);
  }
  {
    auto moved = img;
    moved.offset = 0x10000;
    job.image = &moved;
    SimDevice sim;
    auto out = espflasher::esp::run(sim, job, fast_cfg(), Ui{});
    check("nopatch_ok", out.ok());
    check("nopatch_mode", sim.flash()[0x10002] == 0x00);
  }
}

static void test_erase_job() {
  SimDevice sim;
  sim.faults.stub_erase = true;
  sim.flash()[0x200000] = 0x00;

  Job job;
  job.kind = Job::Kind::EraseAll;
  auto out = espflasher::esp::run(sim, job, fast_cfg(), Ui{});
  check("erasejob_ok", out.ok());
  check("erasejob_erased", sim.flash()[0x200000] == 0xFF);
  check("erasejob_no_write", sim.count(Op::FLASH_DATA) == 0);
}

static void test_run_all_reports_first_failure() {
  SimDevice good("ttyUSB0");
  SimDevice bad("ttyUSB1");
  bad.faults.ignore_syncs = 1000;
  const auto img = make_image(0x10000, 8192);

  Recorder rec;
  Job job;
  job.image = &img;
  IByteTransport* ports[] = {&good, &bad};
  auto out = espflasher::esp::run_all(ports, job, fast_cfg(), rec.hooks());

  check("multi_failed", !out.ok());
  check("multi_failed_stage", out.stage == Stage::Sync && out.st.is(Errc::SyncTimeout));
  check("multi_good_finished", std::equal(img.bytes.begin(), img.bytes.end(), good.flash().begin() + 0x10000));
  check("multi_both_closed", !good.connected() && !bad.connected());
  check("multi_error_reported", rec.errors.size() == 1 && rec.errors[0].find("ttyUSB1") != std::string::npos);
  check("multi_no_done", rec.done == 0);
}

static void test_run_all_success() {
  SimDevice a("a"), b("b"), c("c");
  const auto img = make_image(0x10000, 8192);

  std::mutex m;
  std::uint64_t last_total = 0;
  Recorder rec;
  Ui ui = rec.hooks();
  ui.on_progress = [&](std::uint64_t, std::uint64_t total, std::string_view) {
    std::lock_guard lk(m);
    last_total = std::max(last_total, total);
  };

  Job job;
  job.image = &img;
  IByteTransport* ports[] = {&a, &b, &c};
  auto out = espflasher::esp::run_all(ports, job, fast_cfg(), ui);
  check("multi_ok", out.ok());
  check("multi_done_once", rec.done == 1);
  check("multi_progress_aggregated", last_total == 3 * img.bytes.size());
}

int main() {
  test_write_job_runs_every_stage();
  test_no_verify_skips_md5();
  test_erase_timeout_fails_and_closes();
  test_cancel_between_chunks();
  test_sync_failure();
  test_open_failure();
  test_image_too_big_for_flash();
  test_header_patched_only_at_bootloader_offset();
  test_erase_job();
  test_run_all_reports_first_failure();
  test_run_all_success();

  std::fprintf(stdout, "orchestrator: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
