/* File: stamp_compositor.hpp
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


#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "image_obj.hpp"
#include "pdf_structs.hpp"
#include "raster_image.hpp"

namespace dtrsign::pdf {

/// @brief encoded stamp picture, ids are assigned by the writer
struct StampImage {
  ImageObj image;  // RGB samples
  ImageObj smask;  // alpha as /DeviceGray
};

/**
 * @brief One visible appearance of a signature
 * @details image_offset and image_size are relative to the rect left bottom
 * corner
 */
struct AppearanceStream {
  int page_index = 0;
  BBox rect;
  XYReal image_offset;
  XYReal image_size;
  std::shared_ptr<const StampImage> image;

  /// @brief maps the image unit square into the form space
  [[nodiscard]] Matrix ImageMatrix() const noexcept {
    return Matrix{image_size.x, 0, 0, image_size.y, image_offset.x,
                  image_offset.y};
  }
};

/// @brief whole month mode, one cell per day
struct GridSpec {
  unsigned int rows_per_page = 31;
  unsigned int cells_per_row = 1;
  int day_count = 31;
};

struct StampSpec {
  int page_index = 0;
  BBox rect;  // pdf user space
  double scale_factor = 0.9;
  int quality = 100;
  std::optional<GridSpec> whole_month;
};

/**
 * @brief Turns a decoded picture and a placement into appearance streams
 */
class StampCompositor {
public:
  /**
   * @brief Build the appearances for one signature
   * @param image decoded picture, 1-4 channels
   * @param spec placement
   * @param media_boxes MediaBox of every page of the target document
   * @return std::vector<AppearanceStream> one item, or one per day in whole
   * month mode, all sharing one encoded image
   * @throws SignError kInvalidParameter - empty image, bad scale or quality,
   * degenerate rect
   * @throws SignError kPlacementOutOfBounds - no such page, rect not inside
   * the MediaBox
   * @throws SignError kGridCapacityExceeded - more days than cells
   */
  [[nodiscard]] static std::vector<AppearanceStream>
  Compose(const RasterImage &image, const StampSpec &spec,
          const std::vector<BBox> &media_boxes);

  /**
   * @brief Resample and encode the picture
   * @param pixel_width,pixel_height target raster size
   */
  [[nodiscard]] static std::shared_ptr<const StampImage>
  EncodeImage(const RasterImage &rgba, uint32_t pixel_width,
              uint32_t pixel_height, int quality);

  /**
   * @brief Split the rect into cells
   * @return rects for the first day_count cells, row by row from the top
   * left
   */
  [[nodiscard]] static std::vector<BBox> GridCells(const BBox &rect,
                                                   const GridSpec &grid);

private:
  static void ValidateSpec(const RasterImage &image, const StampSpec &spec,
                           const std::vector<BBox> &media_boxes);
};

} // namespace dtrsign::pdf
