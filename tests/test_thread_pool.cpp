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

#include "core/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <thread>

using espflasher::core::Errc;
using espflasher::core::Status;
using espflasher::core::ThreadPool;

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

static void test_all_tasks_run() {
  std::atomic_int n{0};
  ThreadPool pool(4);
  for (int i = 0; i < 32; ++i) {
    check("submit_ok", pool.submit([&] {
      n.fetch_add(1);
      return Status::Ok();
    }).ok);
  }
  check("all_ok", pool.wait().ok);
  check("all_ran", n.load() == 32);
}

static void test_first_error_without_stop() {
  std::atomic_int n{0};
  ThreadPool pool(1, false);
  (void)pool.submit([&] {
    n.fetch_add(1);
    return Status::Fail(Errc::SyncTimeout, "first");
  });
  (void)pool.submit([&] {
    n.fetch_add(1);
    return Status::Fail(Errc::VerifyFailed, "second");
  });
  (void)pool.submit([&] {
    n.fetch_add(1);
    return Status::Ok();
  });

  auto st = pool.wait();
  check("nostop_first_error", st.is(Errc::SyncTimeout) && st.msg == "first");
  check("nostop_all_ran", n.load() == 3);
  check("nostop_not_cancelled", !pool.cancelled());
}

static void test_stop_on_error_skips_queued() {
  std::atomic_int n{0};
  ThreadPool pool(1, true);
  (void)pool.submit([&] {
    n.fetch_add(1);
    return Status::Fail(Errc::Io, "boom");
  });
  for (int i = 0; i < 5; ++i) {
    (void)pool.submit([&] {
      n.fetch_add(1);
      return Status::Ok();
    });
  }

  check("stop_error", pool.wait().is(Errc::Io));
  check("stop_skipped", n.load() == 1);
  check("stop_cancelled", pool.cancelled());
}

static void test_exception_becomes_status() {
  ThreadPool pool(2);
  (void)pool.submit([]() -> Status { throw std::runtime_error("bad"); });
  auto st = pool.wait();
  check("throw_io", st.is(Errc::Io) && st.msg == "bad");
}

static void test_submit_after_stop() {
  ThreadPool pool(1);
  pool.stop();
  check("stopped_busy", pool.submit([] { return Status::Ok(); }).is(Errc::Busy));
}

int main() {
  test_all_tasks_run();
  test_first_error_without_stop();
  test_stop_on_error_skips_queued();
  test_exception_becomes_status();
  test_submit_after_stop();

  std::fprintf(stdout, "thread_pool: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
