/* File: raster_image.hpp
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

#include <cstdint>

#include "common_defs.hpp"

namespace dtrsign::pdf {

/**
 * @brief Decoded 8-bit raster, rows top to bottom, channels interleaved
 * @details channels: 1 - gray, 2 - gray+alpha, 3 - RGB, 4 - RGBA
 */
struct RasterImage {
  uint32_t width = 0;
  uint32_t height = 0;
  int channels = 4;
  BytesVector pixels;

  [[nodiscard]] bool Empty() const noexcept {
    return width == 0 || height == 0 || pixels.empty();
  }
};

/**
 * @brief Convert any supported layout to RGBA
 * @details an opaque alpha channel is added when the source has none
 * @throws SignError(kInvalidParameter) if the pixel buffer does not match the
 * dimensions
 */
[[nodiscard]] RasterImage ToRgba(const RasterImage &src);

/**
 * @brief Area-averaging rescale of an RGBA image
 * @details every destination pixel is the coverage-weighted mean of the
 * source pixels it overlaps, colours are weighted by alpha
 * @throws SignError(kInvalidParameter)
 */
[[nodiscard]] RasterImage ResampleAreaAverage(const RasterImage &rgba,
                                              uint32_t dst_width,
                                              uint32_t dst_height);

/// @brief RGB samples of an RGBA image
[[nodiscard]] BytesVector ExtractRgb(const RasterImage &rgba);

/// @brief alpha samples of an RGBA image
[[nodiscard]] BytesVector ExtractAlpha(const RasterImage &rgba);

/// @brief zlib stream for /FlateDecode
[[nodiscard]] BytesVector FlateCompress(const BytesVector &data);

/**
 * @brief Baseline JPEG for /DCTDecode
 * @param samples interleaved samples, 3 or 1 per pixel
 * @param components 3 - RGB, 1 - gray
 * @param quality 0-100
 * @throws SignError(kInvalidParameter) on libjpeg failure
 */
[[nodiscard]] BytesVector JpegCompress(const BytesVector &samples,
                                       uint32_t width, uint32_t height,
                                       int components, int quality);

} // namespace dtrsign::pdf
