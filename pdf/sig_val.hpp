/* File: sig_val.hpp
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
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace dtrsign::pdf {

// Signature dictionary ISO32000 [12.8.1] table 252
struct SigVal {
  ObjRawId id;
  std::string type = kTagSig;
  std::string filter = kAdobePPKLite;
  std::string subfilter = kAdbePkcs7detached;
  BytesVector contents_raw;         // zeros, written as hex placeholder
  std::optional<std::string> date;  // 20241015123037Z
  std::optional<std::string> name;  // signer name, UTF-8
  std::optional<std::string> reason;
  std::optional<std::string> app_name;

  size_t hex_str_offset = 0;  // offset of '<'
  size_t hex_str_length = 0;  // number of hex digits between <>
  size_t byteranges_str_offset = 0;

  ///@brief calculate offsets of the placeholders relative to object start
  void CalcOffsets();

  [[nodiscard]] std::string ToString() const;
};

} // namespace dtrsign::pdf
