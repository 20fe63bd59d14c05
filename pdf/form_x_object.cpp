/* File: form_x_object.cpp
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


#include "form_x_object.hpp"

#include <algorithm>
#include <sstream>

#include "pdf_utils.hpp"

namespace dtrsign::pdf {

namespace {

constexpr double kTextMargin = 2;
constexpr double kLeadingFactor = 1.2;

} // namespace

std::string FormXObject::ContentStream() const {
  std::ostringstream stream_builder;
  stream_builder << "q\n"
                 << matrix.toString() << " cm\n"
                 << resources_img_tag_name << " Do\n"
                 << "Q";
  if (text_lines.empty()) {
    return stream_builder.str();
  }
  const double font_size = FontSize();
  const double leading = font_size * kLeadingFactor;
  // the last baseline stays above the descenders
  const double first_baseline =
    kTextMargin + font_size * 0.3 +
    leading * static_cast<double>(text_lines.size() - 1);
  stream_builder << "\nBT\n"
                 << kStampFontTagName << " " << font_size << " Tf\n"
                 << leading << " TL\n"
                 << kTextMargin << " " << first_baseline << " Td\n";
  for (size_t i = 0; i < text_lines.size(); ++i) {
    if (i > 0) {
      stream_builder << "T*\n";
    }
    stream_builder << ToWinAnsiString(text_lines[i]) << " Tj\n";
  }
  stream_builder << "ET";
  return stream_builder.str();
}

double FormXObject::FontSize() const {
  if (text_lines.empty()) {
    return kStampMaxFontSize;
  }
  const double height = bbox.Height() - 2 * kTextMargin;
  const double fit =
    height / (kLeadingFactor * static_cast<double>(text_lines.size()));
  return std::max(1.0, std::min(kStampMaxFontSize, fit));
}

std::string FormXObject::ToString() const {
  const std::string xstream = ContentStream();
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagLength << " " << xstream.size() << "\n" // stream size
          << kTagType << " " << type << "\n"
          << kTagSubType << " " << subtype << "\n"
          << kTagBBox << " " << bbox.ToString() << "\n"
          << kTagFormType << " " << form_type << "\n"
          << kTagResources << " " << kDictStart << "\n"
          << kTagXObject << " " << kDictStart << "\n"
          << resources_img_tag_name << " " << resources_img_ref.ToStringRef()
          << "\n"
          << kDictEnd << "\n"; // end xobject dict
  if (!text_lines.empty()) {
    builder << kTagFont << " " << kDictStart << "\n"
            << kStampFontTagName << " " << kDictStart << " " << kTagType << " "
            << kTagFont << " " << kTagSubType << " " << kTagType1 << " "
            << kTagBaseFont << " " << kStampBaseFont << " " << kTagEncoding
            << " " << kWinAnsiEncoding << " " << kDictEnd << "\n"
            << kDictEnd << "\n"; // end font dict
  }
  builder << kDictEnd << "\n"  // end resources dict
          << kDictEnd << "\n"; // end this object dict
  builder << kStreamStart << xstream << "\n" << kStreamEnd;
  builder << kObjEnd;
  return builder.str();
}

} // namespace dtrsign::pdf
