/* File: pdf_utils.hpp
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
#include <ctime>
#include <map>
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <set>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace dtrsign::pdf {
/**
 * @brief Load file to vector
 *
 * @return optional std::vector<unsigned char> - empty if fail
 */
std::optional<std::vector<unsigned char>> FileToVector(
  const std::string &path) noexcept;

/**
 * @brief Return double as string with max 10 digits after point
 * @param val
 * @return std::string
 */
std::string DoubleToString10(double val);

/**
 * @brief Return the MediaBox of page, inherited values are resolved
 * @param page obj
 * @return BBox
 */
std::optional<BBox> PageMediaBox(const PtrPdfObjShared &page_obj) noexcept;

/**
 * @brief Converts pdf dictionary to unparsed map "/Key" -> "Value"
 * @param dict object
 * @return std::map<std::string, std::string>  unparsed dictionary
 */
std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict);

/**
 * @brief Join an unparsed dictionary map to signle string
 * @param map
 * @return std::string
 */
std::string UnparsedMapToString(const std::map<std::string, std::string> &map);

/**
 * @brief Build a cross-reference table
 * @details 7.5.4 Cross-Reference Table
 * @param entries
 * @return std::string ready for embedding
 */
std::string BuildXrefRawTable(const std::vector<XRefEntry> &entries);

/**
 * @brief sorts entries, builds sections for cross-reference stream
 *
 * @param entries XRefEntry for cross reference
 * @return std::vector<std::pair<int, int>>
 * @details ISO 32000 [7.5.8 Cross-Reference Streams]
 * @throws SignError(kDocumentStructure) on duplicate ids
 */
std::vector<std::pair<int, int>> BuildXRefStreamSections(
  std::vector<XRefEntry> &entries);

/**
 * @brief Find last startxref in buffer
 * @param buf
 * @return string - offset in byres
 */
std::optional<std::string> FindXrefOffset(const BytesVector &buf);

/**
 * @brief Convert byte array to simple hex string
 * @param vec
 * @return std::string
 */
std::string ByteVectorToHexString(const BytesVector &vec);

/**
 * @brief Encode UTF-8 text as a pdf text string
 * @return std::string "(literal)" or "<FEFF...>"
 */
std::string ToPdfTextString(const std::string &utf8_text);

/// @brief "20241015123037Z" (UTC), without the "D:" prefix
std::string TimeToPdfDate(std::time_t val);

/**
 * @brief Encode UTF-8 text as a string operand for a simple font with
 * WinAnsiEncoding
 * @details characters WinAnsi does not have are replaced by '?'
 */
std::string ToWinAnsiString(const std::string &utf8_text);

/// @brief "2024-10-15 12:30:37 UTC", the date shown in the stamp
std::string TimeToStampDate(std::time_t val);

/**
 * @brief Create a Page updated with the Annots objects
 * @param p_page_original
 * @param annot_ids
 * @param removed_ids indirect annotations to drop from the page
 * @return std::string unparsed page
 * @details appends the new ids to the /Annots array of page, other existing
 * entries are kept as is
 */
std::string
CreatePageUpdateWithAnnots(const PtrPdfObjShared &p_page_original,
                           const std::vector<ObjRawId> &annot_ids,
                           const std::set<ObjRawId> &removed_ids = {});

/* This function are called from CreateXRef
 * We need to create simple table if previous table is simple,
 * create a cross-reference stream if previous table is cross-ref. stream
 */

/**
 * @brief Create a Cross Ref Stream object
 * @details ISO3200 [7.5.8] Cross-Reference Streams
 * @param old_trailer_fields
 * @param prev_x_ref_offset
 * @param [in,out] result_file_buf
 * @param [in,out] last_assigned_id  reference to the last_assigned_id
 * @param [in,out] ref_entries referenct to the XRefEntry vector
 */
void CreateCrossRefStream(
  std::map<std::string, std::string> &old_trailer_fields,
  const std::string &prev_x_ref_offset,
  std::vector<unsigned char> &result_file_buf, ObjRawId &last_assigned_id,
  std::vector<XRefEntry> &ref_entries);

/**
 * @brief Create a simple trailer and xref table
 *
 * @param[in,out] old_trailer_fields - previous trailer fields string->string
 * @param[in] prev_x_ref_offset - offset in bytes of previous x_ref (string)
 * @param[in,out] result_file_buf  - resulting signed file buffer
 * @param [in] last_assigned_id  the last id used by the update
 * @param [in,out] ref_entries referenct to the XRefEntry vector
 */
void CreateSimpleXref(std::map<std::string, std::string> &old_trailer_fields,
                      const std::string &prev_x_ref_offset,
                      std::vector<unsigned char> &result_file_buf,
                      const ObjRawId &last_assigned_id,
                      std::vector<XRefEntry> &ref_entries);

} // namespace dtrsign::pdf
