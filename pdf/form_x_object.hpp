/* File: form_x_object.hpp
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
#include <vector>

#include "pdf_structs.hpp"

namespace dtrsign::pdf {

// Form XObject ISO32000 [8.10] used as a widget appearance
struct FormXObject {
  ObjRawId id;
  std::string type = kTagXObject;
  std::string subtype = kTagForm;
  BBox bbox; // [0 0 width height] of the widget rectangle
  int form_type = 1;
  std::string resources_img_tag_name = kStampImgTagName;
  ObjRawId resources_img_ref;
  // maps the unit square of the image to its place inside the bbox
  Matrix matrix;
  // UTF-8, drawn in the bottom left corner over the image
  std::vector<std::string> text_lines;

  /**
   * @brief the content stream "q w 0 0 h x y cm /Img Do Q" followed by a text
   * object when there are text lines
   */
  [[nodiscard]] std::string ContentStream() const;

  /// @brief fits all text lines into the bbox height, 10 at most
  [[nodiscard]] double FontSize() const;

  [[nodiscard]] std::string ToString() const;
};

} // namespace dtrsign::pdf
