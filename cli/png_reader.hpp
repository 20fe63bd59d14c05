/* File: png_reader.hpp
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

#include <string>

#include "common_defs.hpp"
#include "raster_image.hpp"

namespace dtrsign::cli {

/**
 * @brief Decode a PNG picture to 8-bit RGBA
 * @details palette, gray and 16-bit images are converted by libpng
 * @throws SignError(kInvalidParameter) if the data is not a readable PNG
 */
[[nodiscard]] pdf::RasterImage DecodePng(const BytesVector& data);

/// @throws SignError(kInvalidParameter)
[[nodiscard]] pdf::RasterImage ReadPngFile(const std::string& path);

}  // namespace dtrsign::cli
