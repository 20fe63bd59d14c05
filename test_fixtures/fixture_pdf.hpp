/* File: fixture_pdf.hpp
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

namespace dtrsign::test {

struct PdfOptions {
  int page_count = 1;
  double width = 612;
  double height = 792;
  // cross-reference stream instead of the classic table
  bool xref_stream = false;
  // empty /AcroForm in the catalog, as an indirect object
  bool with_acroform = false;
  // put the MediaBox to /Pages, pages inherit it
  bool inherited_media_box = false;
  // name of a signature field without /V on the first page, adds an AcroForm
  std::string unsigned_field;
};

/// @brief a small valid PDF document with correct xref offsets
BytesVector MakePdf(const PdfOptions &opts = {});

/// @brief count occurrences of the substring
size_t CountOccurrences(const BytesVector &data, const std::string &needle);

/// @brief true if data starts with prefix
bool StartsWith(const BytesVector &data, const BytesVector &prefix);

} // namespace dtrsign::test
