/* File: cross_ref_stream.cpp  
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


#include "cross_ref_stream.hpp"
#include "pdf_defs.hpp"
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>

#include "sign_error.hpp"

namespace dtrsign::pdf {

namespace {

/// write val as a big-endian field of the given width
void PushField(BytesVector &dest, uint64_t val, int width) {
  if (width < 8 && val >= (uint64_t{1} << (8 * width))) {
    throw SignError(
      ErrorKind::kDocumentStructure,
      "[CrossRefStream::ToRawData] value does not fit the field width");
  }
  for (int i = width - 1; i >= 0; --i) {
    dest.push_back(static_cast<unsigned char>((val >> (8 * i)) & 0xFF));
  }
}

} // namespace

BytesVector CrossRefStream::ToRawData() const {
  BytesVector res;
  // dictionary
  {
    std::ostringstream builder;
    builder << id.ToString() << "\n"
            << kDictStart << "\n"
            << kTagType << " " << type << "\n"
            << kTagSize << " " << size_val << "\n";
    if (!index_vec.empty()) {
      builder << kTagIndex << " [ ";
      for (const auto &ind_pair : index_vec) {
        builder << ind_pair.first << " " << ind_pair.second << " ";
      }
      builder << "]\n";
    }
    builder << kTagW << " [ " << w_field_0_size << " " << w_field_1_size << " "
            << w_field_2_size << " ]\n";
    builder << kTagPrev << " " << prev_val << "\n";
    builder << kTagRoot << " " << root_id << "\n";
    builder << kTagLength << " " << length << "\n";
    if (info_id.has_value()) {
      builder << kTagInfo << " " << info_id.value() << "\n";
    }
    if (id_val.has_value()) {
      builder << kTagID << " " << id_val.value() << "\n";
    }
    if (enctypt.has_value()) {
      builder << kTagEncrypt << " " << enctypt.value() << "\n";
    }
    builder << kDictEnd << "\n";
    builder << kStreamStart;
    const std::string tmp = builder.str();
    std::copy(tmp.cbegin(), tmp.cend(), std::back_inserter(res));
  }
  // stream data, not compressed
  {
    BytesVector stream_data;
    stream_data.reserve(static_cast<size_t>(length));
    for (const auto &entry : entries) {
      PushField(stream_data, 1, w_field_0_size);
      PushField(stream_data, entry.offset, w_field_1_size);
      PushField(stream_data, entry.gen, w_field_2_size);
    }
    std::copy(stream_data.cbegin(), stream_data.cend(),
              std::back_inserter(res));
  }
  // finish object
  {
    std::string obj_end = "\n";
    obj_end += kStreamEnd;
    obj_end += kObjEnd;
    std::copy(obj_end.cbegin(), obj_end.cend(), std::back_inserter(res));
  }
  return res;
}

} // namespace dtrsign::pdf
