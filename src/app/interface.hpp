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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace espflasher::app {

// Renders progress either as a full-screen TTY view, JSON PROGRESSUPDATE
// lines, or plain log lines. Safe to call from several worker threads.
class FlashInterface {
public:
  FlashInterface(bool is_tty_enabled, bool output_in_json);
  ~FlashInterface();

  FlashInterface(const FlashInterface&) = delete;
  FlashInterface& operator=(const FlashInterface&) = delete;

  void ports(std::vector<std::string> ports);
  void chip(const std::string& port, std::string name);
  void stage(const std::string& port, std::string stage);

  void progress(std::uint64_t done, std::uint64_t total, std::string_view phase);

  void notice(std::string msg);
  void fail(std::string msg);
  void done(std::string msg);

private:
  struct TermSize {
    int rows = 0;
    int cols = 0;
  };
  struct Clip {
    std::string s;
    std::size_t w = 0;
  };
  struct PortRow {
    std::string port;
    std::string chip;
    std::string stage;
  };

  PortRow& row_(const std::string& port);
  void redraw_(bool force);
  TermSize term_size_() const;

  static bool is_tty_();
  static bool colors_enabled_();
  static bool utf8_enabled_();

  static std::string bytes_h_(std::uint64_t b);
  static std::string rate_h_(double bytes_per_sec);
  static std::string eta_h_(std::optional<std::chrono::seconds> eta);

  char spinner_() const;

  Clip clip_(std::string_view s, std::size_t max_cols) const;
  std::string pad_(std::string_view s, std::size_t cols) const;
  std::string bar_(double frac, std::size_t width_cols) const;

  bool tty_ = false, color_ = false, utf8_ = false, output_json_ = false;

  mutable std::mutex mtx_;

  std::vector<PortRow> rows_;
  std::string phase_;

  std::uint64_t done_ = 0, total_ = 0;

  std::string notice_line_, status_line_;
  bool fatal_ = false;

  std::chrono::steady_clock::time_point start_{}, last_rate_ts_{}, last_redraw_{};
  std::uint64_t last_rate_bytes_ = 0;
  double ema_rate_bps_ = 0.0;
};

} // namespace espflasher::app
