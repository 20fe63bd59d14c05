/* File: fixture_pdf.cpp
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


#include "fixture_pdf.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <vector>

namespace dtrsign::test {

namespace {

void Append(BytesVector &buf, const std::string &str) {
  std::copy(str.cbegin(), str.cend(), std::back_inserter(buf));
}

void AppendBigEndian(BytesVector &buf, uint64_t val, int size) {
  for (int i = size - 1; i >= 0; --i) {
    buf.push_back(static_cast<unsigned char>((val >> (8 * i)) & 0xFF));
  }
}

std::string MediaBox(const PdfOptions &opts) {
  std::ostringstream builder;
  builder << "/MediaBox [0 0 " << opts.width << " " << opts.height << "]";
  return builder.str();
}

} // namespace

BytesVector MakePdf(const PdfOptions &opts) {
  // 1 catalog, 2 pages, 3 content, [4 acroform, [5 field]], pages after
  std::vector<std::string> objects;
  const bool with_field = !opts.unsigned_field.empty();
  const bool with_acroform = opts.with_acroform || with_field;
  const int first_page_id = 4 + (with_acroform ? 1 : 0) + (with_field ? 1 : 0);
  {
    std::ostringstream catalog;
    catalog << "<< /Type /Catalog /Pages 2 0 R";
    if (with_acroform) {
      catalog << " /AcroForm 4 0 R";
    }
    catalog << " >>";
    objects.push_back(catalog.str());
  }
  {
    std::ostringstream pages;
    pages << "<< /Type /Pages /Kids [";
    for (int i = 0; i < opts.page_count; ++i) {
      pages << " " << first_page_id + i << " 0 R";
    }
    pages << " ] /Count " << opts.page_count;
    if (opts.inherited_media_box) {
      pages << " " << MediaBox(opts);
    }
    pages << " >>";
    objects.push_back(pages.str());
  }
  {
    const std::string content = "BT /F1 12 Tf 72 720 Td (Daily Time Record) Tj ET";
    objects.push_back("<< /Length " + std::to_string(content.size()) +
                      " >>\nstream\n" + content + "\nendstream");
  }
  if (with_acroform) {
    objects.emplace_back(with_field
                           ? "<< /Fields [ 5 0 R ] /DA (/Helv 0 Tf 0 g) >>"
                           : "<< /Fields [ ] /DA (/Helv 0 Tf 0 g) >>");
  }
  if (with_field) {
    // merged field and widget
    objects.push_back("<< /FT /Sig /T (" + opts.unsigned_field +
                      ") /Type /Annot /Subtype /Widget /F 4 /Rect [ 400 50 550 "
                      "100 ] /P " +
                      std::to_string(first_page_id) + " 0 R >>");
  }
  for (int i = 0; i < opts.page_count; ++i) {
    std::ostringstream page;
    page << "<< /Type /Page /Parent 2 0 R";
    if (!opts.inherited_media_box) {
      page << " " << MediaBox(opts);
    }
    if (with_field && i == 0) {
      page << " /Annots [ 5 0 R ]";
    }
    page << " /Contents 3 0 R /Resources << /Font << /F1 << /Type /Font "
            "/Subtype /Type1 /BaseFont /Helvetica >> >> >> >>";
    objects.push_back(page.str());
  }

  BytesVector res;
  Append(res, "%PDF-1.7\n%\xE2\xE3\xCF\xD3\n");
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(res.size());
    Append(res, std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n");
  }
  const size_t size_val = objects.size() + 1;
  if (!opts.xref_stream) {
    const size_t xref_offset = res.size();
    std::ostringstream xref;
    xref << "xref\n0 " << size_val << "\n0000000000 65535 f \n";
    for (const size_t offset : offsets) {
      xref << std::setw(10) << std::setfill('0') << offset << " 00000 n \n";
    }
    xref << "trailer\n<< /Size " << size_val
         << " /Root 1 0 R /ID [<0123456789abcdef0123456789abcdef> "
            "<0123456789abcdef0123456789abcdef>] >>\n"
         << "startxref\n"
         << xref_offset << "\n%%EOF\n";
    Append(res, xref.str());
    return res;
  }
  // the xref stream is an object itself
  const size_t xref_id = size_val;
  const size_t xref_offset = res.size();
  BytesVector stream_data;
  stream_data.push_back(0x00);
  AppendBigEndian(stream_data, 0, 4);
  AppendBigEndian(stream_data, 0xFFFF, 2);
  offsets.push_back(xref_offset);
  for (const size_t offset : offsets) {
    stream_data.push_back(0x01);
    AppendBigEndian(stream_data, offset, 4);
    AppendBigEndian(stream_data, 0, 2);
  }
  std::ostringstream dict;
  dict << xref_id << " 0 obj\n<< /Type /XRef /Size " << xref_id + 1
       << " /W [1 4 2] /Root 1 0 R /Length " << stream_data.size()
       << " >>\nstream\n";
  Append(res, dict.str());
  std::copy(stream_data.cbegin(), stream_data.cend(), std::back_inserter(res));
  Append(res, "\nendstream\nendobj\nstartxref\n" + std::to_string(xref_offset) +
                "\n%%EOF\n");
  return res;
}

size_t CountOccurrences(const BytesVector &data, const std::string &needle) {
  if (needle.empty()) {
    return 0;
  }
  size_t res = 0;
  auto it = data.cbegin();
  while (true) {
    it = std::search(it, data.cend(), needle.cbegin(), needle.cend());
    if (it == data.cend()) {
      break;
    }
    ++res;
    it += static_cast<std::ptrdiff_t>(needle.size());
  }
  return res;
}

bool StartsWith(const BytesVector &data, const BytesVector &prefix) {
  return prefix.size() <= data.size() &&
         std::equal(prefix.cbegin(), prefix.cend(), data.cbegin());
}

} // namespace dtrsign::test
