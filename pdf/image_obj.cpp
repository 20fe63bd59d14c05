/* File: image_obj.cpp
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


#include "image_obj.hpp"

#include <iterator>
#include <sstream>

#include "pdf_structs.hpp"

namespace dtrsign::pdf {

std::string ImageObj::ToString() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagType << " " << type << "\n"
          << kTagSubType << " " << subtype << "\n"
          << kTagWidth << " " << width << "\n"
          << kTagHeight << " " << height << "\n"
          << kTagColorSpace << " " << colorspace << "\n"
          << kTagBitsPerComponent << " " << bits_per_component << "\n";
  if (filter.has_value()) {
    builder << kTagFilter << " " << filter.value() << "\n";
  }
  if (smask_id.has_value()) {
    builder << kTagSMask << " " << smask_id->ToStringRef() << "\n";
  }
  builder << kTagLength << " " << data.size() << "\n" << kDictEnd << "\n";
  return builder.str();
}

BytesVector ImageObj::ToRawData() const {
  BytesVector res;
  std::string strdata = ToString();
  strdata += kStreamStart;
  res.reserve(data.size() + strdata.size() + 30);
  std::copy(strdata.cbegin(), strdata.cend(), std::back_inserter(res));
  std::copy(data.cbegin(), data.cend(), std::back_inserter(res));
  strdata = "\n";
  strdata += kStreamEnd;
  strdata += kObjEnd;
  std::copy(strdata.cbegin(), strdata.cend(), std::back_inserter(res));
  return res;
}

ImageObj CloneExceptData(const ImageObj &other) {
  ImageObj res;
  res.type = other.type;
  res.subtype = other.subtype;
  res.width = other.width;
  res.height = other.height;
  res.colorspace = other.colorspace;
  res.bits_per_component = other.bits_per_component;
  res.filter = other.filter;
  return res;
}

}  // namespace dtrsign::pdf
