/* File: image_obj.hpp
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
#include <optional>
#include <string>
#include <vector>

#include "pdf_structs.hpp"

namespace dtrsign::pdf {

// Image XObject ISO32000 [8.9.5]
struct ImageObj {
  ObjRawId id;
  std::string type = kTagXObject;
  std::string subtype = kTagImage;
  uint32_t width = 0;
  uint32_t height = 0;
  std::string colorspace = kDeviceRgb;
  int32_t bits_per_component = 8;
  std::optional<std::string> filter;  // /FlateDecode or /DCTDecode
  std::optional<ObjRawId> smask_id;   // soft mask image
  std::vector<unsigned char> data;    // encoded stream data

  [[nodiscard]] BytesVector ToRawData() const;
  [[nodiscard]] std::string ToString() const;
};

/// @brief copy everything except the data and the id
ImageObj CloneExceptData(const ImageObj &other);

}  // namespace dtrsign::pdf
