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

#include "app/interface.hpp"
#include "app/version.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace espflasher::app {

namespace {

std::size_t u8_advance(std::string_view s, std::size_t i) {
  if (i >= s.size()) return s.size();
  const auto c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) return i + 1;
  if ((c & 0xE0) == 0xC0) return std::min(i + 2, s.size());
  if ((c & 0xF0) == 0xE0) return std::min(i + 3, s.size());
  if ((c & 0xF8) == 0xF0) return std::min(i + 4, s.size());
  return i + 1;
}

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) out += fmt::format("\\u{:04x}", c);
        else out.push_back(static_cast<char>(c));
        break;
    }
  }
  return out;
}

bool env_has_utf8() {
  auto has = [](const char* v) {
    if (!v || !*v) return false;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
  };
  return has(std::getenv("LC_ALL")) || has(std::getenv("LC_CTYPE")) || has(std::getenv("LANG"));
}

constexpr const char* kAltOn = "\x1b[?1049h";
constexpr const char* kAltOff = "\x1b[?1049l";
constexpr const char* kHideCursor = "\x1b[?25l";
constexpr const char* kShowCursor = "\x1b[?25h";

constexpr const char* kReset = "\x1b[0m";
constexpr const char* kBold = "\x1b[1m";

constexpr const char* kRed = "\x1b[31m";
constexpr const char* kGreen = "\x1b[32m";
constexpr const char* kYellow = "\x1b[33m";
constexpr const char* kBlue = "\x1b[34m";
constexpr const char* kCyan = "\x1b[36m";
constexpr const char* kGray = "\x1b[90m";

} // namespace

bool FlashInterface::is_tty_() { return ::isatty(1) == 1; }

bool FlashInterface::colors_enabled_() {
  if (!is_tty_()) return false;
  const char* no = std::getenv("NO_COLOR");
  return !(no && *no);
}

bool FlashInterface::utf8_enabled_() { return is_tty_() && env_has_utf8(); }

FlashInterface::FlashInterface(bool is_tty_enabled, bool output_in_json) : output_json_(output_in_json) {
  if (is_tty_enabled && !output_in_json) {
    tty_ = is_tty_();
    color_ = colors_enabled_();
    utf8_ = utf8_enabled_();
  }
  start_ = last_rate_ts_ = last_redraw_ = std::chrono::steady_clock::now();

  if (tty_) std::cout << kAltOn << kHideCursor << std::flush;
}

FlashInterface::~FlashInterface() {
  std::string final;
  bool fatal = false;
  {
    std::lock_guard lk(mtx_);
    final = status_line_;
    fatal = fatal_;
  }

  if (tty_) std::cout << kShowCursor << kAltOff << std::flush;

  if (!final.empty() && !output_json_) (fatal ? std::cerr : std::cout) << final << "\n" << std::flush;
}

FlashInterface::PortRow& FlashInterface::row_(const std::string& port) {
  for (auto& r : rows_) {
    if (r.port == port) return r;
  }
  rows_.push_back(PortRow{port, {}, {}});
  return rows_.back();
}

void FlashInterface::ports(std::vector<std::string> ports) {
  std::lock_guard lk(mtx_);
  rows_.clear();
  for (auto& p : ports) rows_.push_back(PortRow{std::move(p), {}, {}});
  redraw_(true);
}

void FlashInterface::chip(const std::string& port, std::string name) {
  std::lock_guard lk(mtx_);
  row_(port).chip = std::move(name);
  redraw_(true);
}

void FlashInterface::stage(const std::string& port, std::string stage) {
  std::lock_guard lk(mtx_);
  row_(port).stage = std::move(stage);
  redraw_(true);
}

void FlashInterface::progress(std::uint64_t done, std::uint64_t total, std::string_view phase) {
  std::lock_guard lk(mtx_);
  const auto now = std::chrono::steady_clock::now();

  if (phase != phase_ || done < last_rate_bytes_) {
    phase_ = std::string(phase);
    last_rate_ts_ = now;
    last_rate_bytes_ = done;
    ema_rate_bps_ = 0.0;
  }
  done_ = done;
  total_ = total;

  const auto dt = std::chrono::duration_cast<std::chrono::duration<double>>(now - last_rate_ts_).count();
  if (dt >= 0.2) {
    const double inst = static_cast<double>(done_ - last_rate_bytes_) / dt;
    ema_rate_bps_ = (ema_rate_bps_ <= 1e-9) ? inst : (ema_rate_bps_ * 0.90 + inst * 0.10);
    last_rate_ts_ = now;
    last_rate_bytes_ = done_;
    redraw_(false);
  } else if (done_ == total_ && total_ > 0) {
    redraw_(true);
  }
}

void FlashInterface::notice(std::string msg) {
  std::lock_guard lk(mtx_);
  notice_line_ = std::move(msg);
  redraw_(true);
}

void FlashInterface::fail(std::string msg) {
  std::lock_guard lk(mtx_);
  fatal_ = true;
  status_line_ = std::move(msg);
  redraw_(true);
}

void FlashInterface::done(std::string msg) {
  std::lock_guard lk(mtx_);
  fatal_ = false;
  status_line_ = std::move(msg);
  redraw_(true);
}

FlashInterface::TermSize FlashInterface::term_size_() const {
  winsize ws{};
  if (::ioctl(1, TIOCGWINSZ, &ws) == 0) return {static_cast<int>(ws.ws_row), static_cast<int>(ws.ws_col)};
  return {24, 80};
}

std::string FlashInterface::bytes_h_(std::uint64_t b) {
  const char* u[] = {"B", "KB", "MB", "GB"};
  int i = 0;
  double v = static_cast<double>(b);
  while (v >= 1024.0 && i < 3) {
    v /= 1024.0;
    ++i;
  }
  std::ostringstream oss;
  if (!i) oss << static_cast<std::uint64_t>(v) << u[i];
  else oss << std::fixed << std::setprecision(v >= 10 ? 1 : 2) << v << u[i];
  return oss.str();
}

std::string FlashInterface::rate_h_(double bps) {
  if (bps <= 1e-9) return "0B/s";
  return bytes_h_(static_cast<std::uint64_t>(bps)) + "/s";
}

std::string FlashInterface::eta_h_(std::optional<std::chrono::seconds> eta) {
  if (!eta) return "--:--";
  auto s = eta->count();
  const auto m = s / 60;
  s %= 60;
  std::ostringstream oss;
  oss << std::setw(2) << std::setfill('0') << m << "m" << std::setw(2) << s << "s";
  return oss.str();
}

char FlashInterface::spinner_() const {
  static constexpr char sp[] = {'|', '/', '-', '\\'};
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_).count();
  return sp[(ms / 120) % 4];
}

FlashInterface::Clip FlashInterface::clip_(std::string_view s, std::size_t max_cols) const {
  if (!max_cols) return {};

  if (!utf8_) {
    if (s.size() <= max_cols) return {std::string(s), s.size()};
    if (max_cols <= 3) return {std::string(s.substr(0, max_cols)), max_cols};
    return {std::string(s.substr(0, max_cols - 3)) + "...", max_cols};
  }

  std::size_t cols = 0, bytes = 0;
  for (std::size_t i = 0; i < s.size() && cols < max_cols; ++cols) bytes = i = u8_advance(s, i);
  if (bytes >= s.size()) return {std::string(s), cols};

  // Make room for the ellipsis.
  std::size_t keep_cols = 0, keep_bytes = 0;
  for (std::size_t i = 0; i < s.size() && keep_cols + 1 < max_cols; ++keep_cols) keep_bytes = i = u8_advance(s, i);
  return {std::string(s.substr(0, keep_bytes)) + "…", keep_cols + 1};
}

std::string FlashInterface::pad_(std::string_view s, std::size_t cols) const {
  auto c = clip_(s, cols);
  if (c.w >= cols) return std::move(c.s);
  return c.s + std::string(cols - c.w, ' ');
}

std::string FlashInterface::bar_(double frac, std::size_t w) const {
  frac = std::clamp(frac, 0.0, 1.0);
  const auto filled = static_cast<std::size_t>(std::llround(frac * static_cast<double>(w)));

  std::string s;
  if (utf8_) {
    s.reserve(w * 3);
    for (std::size_t i = 0; i < w; ++i) s.append(i < filled ? "█" : "░");
    return s;
  }
  s.reserve(w);
  for (std::size_t i = 0; i < w; ++i) s.push_back(i < filled ? '=' : '-');
  return s;
}

void FlashInterface::redraw_(bool force) {
  const auto now = std::chrono::steady_clock::now();
  if (!force && (now - last_redraw_) < std::chrono::milliseconds(33)) return;
  last_redraw_ = now;

  if (!tty_) {
    if (output_json_) {
      std::string ports;
      for (const auto& r : rows_) {
        if (!ports.empty()) ports += ',';
        ports += fmt::format(R"({{"port":"{}","chip":"{}","stage":"{}"}})", json_escape(r.port),
                             json_escape(r.chip.empty() ? "-" : r.chip), json_escape(r.stage.empty() ? "-" : r.stage));
      }
      fmt::print(R"(PROGRESSUPDATE{{"ports":[{}],"phase":"{}","done":{},"total":{},"notice":"{}","status":"{}","failed":{}}}
)",
                 ports, json_escape(phase_.empty() ? "-" : phase_), done_, total_, json_escape(notice_line_),
                 json_escape(status_line_), fatal_ ? "true" : "false");
      std::fflush(stdout);
    } else if (force) {
      for (const auto& r : rows_) {
        if (!r.stage.empty()) spdlog::debug("{}: chip={} stage={}", r.port, r.chip.empty() ? "-" : r.chip, r.stage);
      }
      if (total_) spdlog::info("{} {}/{}", phase_.empty() ? "-" : phase_, bytes_h_(done_), bytes_h_(total_));
      if (!notice_line_.empty()) spdlog::info("{}", notice_line_);
    } else if (total_) {
      spdlog::info("{} {}/{} {}", phase_.empty() ? "-" : phase_, bytes_h_(done_), bytes_h_(total_), rate_h_(ema_rate_bps_));
    }
    return;
  }

  const auto ts = term_size_();
  const int rows = std::max(10, ts.rows), cols = std::max(60, ts.cols);
  const auto C = static_cast<std::size_t>(cols);

  std::optional<std::chrono::seconds> eta;
  if (total_ && ema_rate_bps_ > 1.0 && done_ <= total_)
    eta = std::chrono::seconds(static_cast<long long>(static_cast<double>(total_ - done_) / ema_rate_bps_));

  std::ostringstream out;
  out << "\x1b[H\x1b[J";

  auto emit = [&](const char* c, std::string_view plain) {
    const auto clipped = clip_(plain, C).s;
    if (color_) out << c;
    out << clipped;
    if (color_) out << kReset;
    out << "\n";
  };

  if (color_) out << kBold;
  emit(kGray, "espflasher v" + espflasher::app::version_string());

  emit(kBlue, fmt::format("Ports: {}  Phase: {} {}", rows_.size(), phase_.empty() ? "-" : phase_,
                          (!total_ && !fatal_) ? std::string(1, spinner_()) : std::string{}));

  {
    const int pct = total_ ? static_cast<int>((std::min(done_, total_) * 100) / total_) : 0;
    const std::string prefix = fmt::format("{:>7}: {:3}% ", phase_.empty() ? "-" : phase_, pct);
    std::string suffix = fmt::format("  {}/{}  {}  ETA {}", bytes_h_(done_), bytes_h_(total_), rate_h_(ema_rate_bps_), eta_h_(eta));
    if (prefix.size() + suffix.size() + 10 > C) suffix = fmt::format("  {}/{}", bytes_h_(done_), bytes_h_(total_));

    const std::size_t bar_w = C > prefix.size() + suffix.size() + 10 ? C - prefix.size() - suffix.size() : 10;
    const double frac = total_ ? static_cast<double>(done_) / static_cast<double>(total_) : 0.0;

    if (color_) out << kBold;
    emit(fatal_ ? kRed : (!total_ ? kGray : kGreen), prefix + bar_(frac, bar_w) + suffix);
  }

  if (!notice_line_.empty()) emit(kGray, notice_line_);
  if (!status_line_.empty()) emit(fatal_ ? kRed : kGreen, status_line_);

  const int header = 3 + (!notice_line_.empty() ? 1 : 0) + (!status_line_.empty() ? 1 : 0) + 1;
  const int remaining = rows - header;
  if (remaining <= 1) {
    std::cout << out.str() << std::flush;
    return;
  }

  const std::size_t port_w = std::min<std::size_t>(C / 2, 32);
  emit(kCyan, pad_("PORT", port_w) + " " + pad_("CHIP", 10) + " STAGE");

  const auto max_lines = static_cast<std::size_t>(remaining - 1);
  for (std::size_t i = 0; i < rows_.size() && i < max_lines; ++i) {
    const auto& r = rows_[i];
    const char* col = r.stage == "reset" ? kGreen : (r.stage.empty() ? kGray : kYellow);
    emit(col, pad_(r.port, port_w) + " " + pad_(r.chip.empty() ? "-" : r.chip, 10) + " " + (r.stage.empty() ? "-" : r.stage));
  }
  if (rows_.size() > max_lines) emit(kGray, fmt::format("... {} more", rows_.size() - max_lines));

  std::cout << out.str() << std::flush;
}

} // namespace espflasher::app
