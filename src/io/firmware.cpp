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

#include "io/firmware.hpp"

#include "core/str.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace espflasher::io {

using espflasher::core::Errc;
using espflasher::core::Result;
using espflasher::core::Status;

Result<FirmwareImage> load_image(const std::filesystem::path& path, std::uint32_t offset, bool force) noexcept {
  using R = Result<FirmwareImage>;
  const auto name = path.string();

  if (!force && !espflasher::core::ends_with_ci(name, ".bin"))
    return R::Failf(Errc::InvalidArgument, "{}: not a .bin image (use --force to write it anyway)", name);

  std::error_code ec;
  const auto sz = std::filesystem::file_size(path, ec);
  if (ec) return R::Failf(Errc::InvalidArgument, "{}: {}", name, ec.message());
  if (sz == 0) return R::Failf(Errc::InvalidArgument, "{}: image is empty", name);
  if (sz > MAX_IMAGE_BYTES)
    return R::Failf(Errc::InvalidArgument, "{}: {} bytes exceeds the {} MiB limit", name, sz, MAX_IMAGE_BYTES >> 20);

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return R::Failf(Errc::Io, "{}: cannot open", name);

  FirmwareImage img;
  img.name = path.filename().string();
  img.offset = offset;
  img.bytes.resize(static_cast<std::size_t>(sz));
  in.read(reinterpret_cast<char*>(img.bytes.data()), static_cast<std::streamsize>(img.bytes.size()));
  if (in.gcount() != static_cast<std::streamsize>(img.bytes.size()))
    return R::Failf(Errc::Io, "{}: short read ({} of {} bytes)", name, in.gcount(), sz);

  spdlog::debug("Loaded {} ({} bytes) for 0x{:08X}", name, sz, offset);
  return R::Ok(std::move(img));
}

Status check_fits(const FirmwareImage& img, std::uint32_t flash_size) noexcept {
  if (img.bytes.empty()) return Status::Failf(Errc::InvalidArgument, "{}: image is empty", img.name);
  if (img.offset >= flash_size || img.bytes.size() > static_cast<std::uint64_t>(flash_size - img.offset))
    return Status::Failf(Errc::InvalidArgument, "{}: {} bytes at 0x{:X} do not fit in {} KiB of flash",
                         img.name, img.bytes.size(), img.offset, flash_size / 1024);
  return Status::Ok();
}

} // namespace espflasher::io
