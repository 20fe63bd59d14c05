/* File: incremental_writer.hpp
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

#include <cstddef>
#include <ctime>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "pdf.hpp"
#include "pdf_defs.hpp"
#include "pdf_update_object_kit.hpp"
#include "stamp_compositor.hpp"

namespace dtrsign::pdf {

constexpr size_t kDefaultReservedBytes = 16384;

/// @brief what to put to the new signature field
struct FieldRequest {
  std::string field_name;
  std::string reason;
  std::string signer_name;
  std::time_t signing_time = 0;
  std::string app_name;
  size_t reserved_bytes = kDefaultReservedBytes;
};

/*
 * The document moves through Base -> Reserved -> Digested -> Finalized.
 * Every state holds its own immutable buffer.
 */

struct BaseDocument {
  SharedBytes bytes;
};

struct ReservedDocument {
  SharedBytes bytes;
  RangesVector byteranges;  // {0,a} {b,c}
  size_t sig_hex_offset = 0;  // first hex digit after '<'
  size_t sig_hex_length = 0;  // number of hex digits reserved
  std::string field_name;
};

struct DigestedDocument {
  ReservedDocument reserved;
  BytesVector digest;
};

struct FinalizedDocument {
  SharedBytes bytes;
  std::string field_name;

  /// @brief start the next signature from this result
  [[nodiscard]] BaseDocument AsBase() const { return BaseDocument{bytes}; }
};

/**
 * @brief Appends a signature field with an empty value as an incremental
 * update and fills the value later
 */
class IncrementalWriter {
public:
  /**
   * @brief Append the field, its widgets and a zero filled /Contents
   * @param base document to sign
   * @param request field parameters
   * @param appearances visible stamps, at least one
   * @return ReservedDocument the new buffer and the byte ranges to digest
   * @throws SignError kDocumentStructure - the input can not be parsed
   * @details an existing signature field without a value is signed in place,
   * its widgets are replaced by the appearances
   * @throws SignError kInvalidParameter - no appearances, empty field name, a
   * field of this name that is not an unsigned signature field, zero reserved
   * size
   * @throws SignError kPlacementOutOfBounds - page of an appearance not found
   * @throws SignError kReservedSpaceExhausted - ByteRange does not fit
   */
  [[nodiscard]] static ReservedDocument
  Reserve(const BaseDocument &base, const FieldRequest &request,
          const std::vector<AppearanceStream> &appearances);

  /// @throws SignError(kSigning) on empty digest
  [[nodiscard]] static DigestedDocument AttachDigest(ReservedDocument reserved,
                                                     BytesVector digest);

  /**
   * @brief Write the signature into the reserved span
   * @details the rest of the span is left as '0', the length of the document
   * does not change
   * @throws SignError kSigning - empty signature
   * @throws SignError kReservedSpaceExhausted - the signature is too large
   */
  [[nodiscard]] static FinalizedDocument
  Finalize(const DigestedDocument &digested, const BytesVector &signature);

private:
  IncrementalWriter(const BaseDocument &base, const FieldRequest &request,
                    const std::vector<AppearanceStream> &appearances);

  ReservedDocument CreateObjectKit();
  void CollectReplacedWidgets();
  void CreateImageObjs();
  void CreateFormXobjs();
  void CreateEmptySigVal();
  void CreateSignField();
  void CreateAcroForm();
  void CreateUpdatedPages();
  void CreateUpdatedRoot();
  ReservedDocument CreateXRef();

  static void AppendRaw(BytesVector &dest, const std::string &src);

  Pdf pdf_;
  const FieldRequest &request_;
  const std::vector<AppearanceStream> &appearances_;
  std::unique_ptr<PdfUpdateObjectKit> update_kit_;
  // image and page ids for every appearance
  std::vector<ObjRawId> appearance_image_ids_;
  std::vector<ObjRawId> appearance_page_ids_;
  // unsigned field signed in place, nullptr when a new field is created
  PtrPdfObjShared reused_field_;
  // widgets of the reused field, dropped from the pages
  std::set<ObjRawId> replaced_widgets_;
};

} // namespace dtrsign::pdf
