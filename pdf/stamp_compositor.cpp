/* File: stamp_compositor.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/


#include "stamp_compositor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "sign_error.hpp"

namespace dtrsign::pdf {

namespace {

constexpr int kMaxQuality = 100;

bool IsFinite(const BBox &rect) noexcept {
  return std::isfinite(rect.left_bottom.x) &&
         std::isfinite(rect.left_bottom.y) && std::isfinite(rect.right_top.x) &&
         std::isfinite(rect.right_top.y);
}

uint32_t ScaledDimension(uint32_t val, double scale_factor) noexcept {
  const long res = std::lround(static_cast<double>(val) * scale_factor);
  return res < 1 ? 1 : static_cast<uint32_t>(res);
}

} // namespace

std::vector<AppearanceStream>
StampCompositor::Compose(const RasterImage &image, const StampSpec &spec,
                         const std::vector<BBox> &media_boxes) {
  const std::string func_name = "[StampCompositor::Compose] ";
  auto logger = logger::InitLog();
  const auto start = std::chrono::steady_clock::now();
  ValidateSpec(image, spec, media_boxes);
  std::vector<BBox> cells;
  if (spec.whole_month) {
    cells = GridCells(spec.rect, spec.whole_month.value());
  } else {
    cells.push_back(spec.rect);
  }
  const RasterImage rgba = ToRgba(image);
  auto encoded = EncodeImage(rgba, ScaledDimension(rgba.width, spec.scale_factor),
                             ScaledDimension(rgba.height, spec.scale_factor),
                             spec.quality);
  std::vector<AppearanceStream> res;
  res.reserve(cells.size());
  const double img_w = rgba.width;
  const double img_h = rgba.height;
  for (const auto &cell : cells) {
    // fit into the scaled cell keeping the aspect ratio, center
    const double avail_w = cell.Width() * spec.scale_factor;
    const double avail_h = cell.Height() * spec.scale_factor;
    const double fit = std::min(avail_w / img_w, avail_h / img_h);
    AppearanceStream appearance;
    appearance.page_index = spec.page_index;
    appearance.rect = cell;
    appearance.image_size = XYReal{img_w * fit, img_h * fit};
    appearance.image_offset =
      XYReal{(cell.Width() - appearance.image_size.x) / 2,
             (cell.Height() - appearance.image_size.y) / 2};
    appearance.image = encoded;
    res.push_back(std::move(appearance));
  }
  if (logger) {
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    logger->debug("{}{} appearance(s), image {}x{}, duration:{} ms", func_name,
                  res.size(), encoded->image.width, encoded->image.height,
                  duration.count());
  }
  return res;
}

std::shared_ptr<const StampImage>
StampCompositor::EncodeImage(const RasterImage &rgba, uint32_t pixel_width,
                             uint32_t pixel_height, int quality) {
  const RasterImage resized =
    ResampleAreaAverage(rgba, pixel_width, pixel_height);
  auto res = std::make_shared<StampImage>();
  ImageObj &img = res->image;
  img.width = resized.width;
  img.height = resized.height;
  img.colorspace = kDeviceRgb;
  img.bits_per_component = 8;
  if (quality >= kMaxQuality) {
    img.filter = kFlateDecode;
    img.data = FlateCompress(ExtractRgb(resized));
  } else {
    img.filter = kDCTDecode;
    img.data = JpegCompress(ExtractRgb(resized), resized.width, resized.height,
                            3, quality);
  }
  // the mask is always lossless
  ImageObj mask = CloneExceptData(img);
  mask.colorspace = kDeviceGray;
  mask.filter = kFlateDecode;
  mask.data = FlateCompress(ExtractAlpha(resized));
  res->smask = std::move(mask);
  return res;
}

std::vector<BBox> StampCompositor::GridCells(const BBox &rect,
                                             const GridSpec &grid) {
  const std::string func_name = "[StampCompositor::GridCells] ";
  if (grid.rows_per_page == 0 || grid.cells_per_row == 0) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "empty grid layout");
  }
  if (grid.day_count <= 0) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "day count must be positive");
  }
  const uint64_t capacity =
    static_cast<uint64_t>(grid.rows_per_page) * grid.cells_per_row;
  if (static_cast<uint64_t>(grid.day_count) > capacity) {
    throw SignError(ErrorKind::kGridCapacityExceeded,
                    func_name + std::to_string(grid.day_count) +
                      " days do not fit " + std::to_string(capacity) +
                      " cells");
  }
  const double cell_w = rect.Width() / grid.cells_per_row;
  const double cell_h = rect.Height() / grid.rows_per_page;
  std::vector<BBox> res;
  res.reserve(static_cast<size_t>(grid.day_count));
  for (int day = 0; day < grid.day_count; ++day) {
    const unsigned int row = static_cast<unsigned int>(day) / grid.cells_per_row;
    const unsigned int col = static_cast<unsigned int>(day) % grid.cells_per_row;
    BBox cell;
    cell.left_bottom.x = rect.left_bottom.x + col * cell_w;
    cell.right_top.x = cell.left_bottom.x + cell_w;
    cell.right_top.y = rect.right_top.y - row * cell_h;
    cell.left_bottom.y = cell.right_top.y - cell_h;
    res.push_back(cell);
  }
  return res;
}

void StampCompositor::ValidateSpec(const RasterImage &image,
                                   const StampSpec &spec,
                                   const std::vector<BBox> &media_boxes) {
  const std::string func_name = "[StampCompositor::ValidateSpec] ";
  if (image.Empty()) {
    throw SignError(ErrorKind::kInvalidParameter, func_name + "empty image");
  }
  if (!std::isfinite(spec.scale_factor) || spec.scale_factor <= 0 ||
      spec.scale_factor > 1) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "scale factor must be in (0,1]");
  }
  if (spec.quality < 0 || spec.quality > kMaxQuality) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "quality must be in [0,100]");
  }
  if (!IsFinite(spec.rect) || spec.rect.Width() <= 0 ||
      spec.rect.Height() <= 0) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "degenerate rect " + spec.rect.ToString());
  }
  if (spec.page_index < 0 ||
      static_cast<size_t>(spec.page_index) >= media_boxes.size()) {
    throw SignError(ErrorKind::kPlacementOutOfBounds,
                    func_name + "no page with index " +
                      std::to_string(spec.page_index));
  }
  const BBox &media_box = media_boxes[static_cast<size_t>(spec.page_index)];
  if (!media_box.Contains(spec.rect)) {
    throw SignError(ErrorKind::kPlacementOutOfBounds,
                    func_name + "rect " + spec.rect.ToString() +
                      " is outside the page " + media_box.ToString());
  }
}

} // namespace dtrsign::pdf
