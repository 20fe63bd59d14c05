/* File: pdf_utils.cpp
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


#include "pdf_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ios>
#include <iterator>
#include <limits>
#include <optional>
#include <qpdf/QUtil.hh>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "cross_ref_stream.hpp"
#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "sign_error.hpp"

namespace dtrsign::pdf {

namespace {

void AppendFinalInfo(std::vector<unsigned char> &result_file_buf,
                     size_t xref_table_offset) {
  std::string final_info = kStartXref;
  final_info += "\n";
  final_info += std::to_string(xref_table_offset);
  final_info += "\n";
  final_info += kEof;
  final_info += "\n";
  std::copy(final_info.cbegin(), final_info.cend(),
            std::back_inserter(result_file_buf));
}

} // namespace

// read file to vector
std::optional<std::vector<unsigned char>> FileToVector(
  const std::string &path) noexcept {
  namespace fs = std::filesystem;
  std::error_code err;
  if (path.empty() || !fs::exists(path, err) || !fs::is_regular_file(path, err)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios_base::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::vector<unsigned char> res;
  try {
    const auto file_size = fs::file_size(path, err);
    if (!err && file_size > kMaxPdfFileSize) {
      return std::nullopt;
    }
    if (!err) {
      res.reserve(file_size);
    }
    for (auto it = std::istreambuf_iterator<char>(file);
         it != std::istreambuf_iterator<char>(); ++it) {
      res.push_back(*it);
    }
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[FileToVector] {} {}", path, ex.what());
    }
    file.close();
    return std::nullopt;
  }
  file.close();
  return res;
}

std::string DoubleToString10(double val) {
  std::ostringstream builder;
  builder << std::setprecision(10) << std::fixed << val;
  std::string res = builder.str();
  res.erase(res.find_last_not_of('0') + 1, std::string::npos);
  if (res.back() == '.') {
    res.pop_back();
  }
  if (res == "-0") {
    res = "0";
  }
  return res;
}

std::optional<BBox> PageMediaBox(const PtrPdfObjShared &page_obj) noexcept {
  if (!page_obj || page_obj->isNull() || !page_obj->isDictionary() ||
      !page_obj->hasKey(kTagType) ||
      page_obj->getKey(kTagType).getName() != kTagPage) {
    return std::nullopt;
  }
  try {
    QPDFPageObjectHelper page_helper(*page_obj);
    auto media_box = page_helper.getMediaBox();
    if (!media_box.isRectangle()) {
      return std::nullopt;
    }
    auto rect = media_box.getArrayAsRectangle();
    BBox res;
    res.left_bottom.x = std::min(rect.llx, rect.urx);
    res.left_bottom.y = std::min(rect.lly, rect.ury);
    res.right_top.x = std::max(rect.llx, rect.urx);
    res.right_top.y = std::max(rect.lly, rect.ury);
    return res;
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[PageMediaBox] {}", ex.what());
    }
  }
  return std::nullopt;
}

/**
 * @brief Converts pdf dictionary to unparsed map "/Key" -> "Value"
 * @param dict object
 * @return std::map<std::string, std::string>  unparsed dictionary
 */
std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict) {
  if (!dict.isDictionary()) {
    return {};
  }
  auto src_map = dict.getDictAsMap();
  std::map<std::string, std::string> unparsed_map;
  std::for_each(
    src_map.begin(), src_map.end(),
    [&unparsed_map](std::pair<const std::string, QPDFObjectHandle> &pair_val) {
      unparsed_map[pair_val.first] = pair_val.second.unparse();
    });
  return unparsed_map;
}

std::string UnparsedMapToString(const std::map<std::string, std::string> &map) {
  std::ostringstream builder;
  std::for_each(map.cbegin(), map.cend(),
                [&builder](const std::pair<std::string, std::string> &pair) {
                  builder << pair.first << " " << pair.second << "\n";
                });
  return builder.str();
}

std::string BuildXrefRawTable(const std::vector<XRefEntry> &entries) {
  auto entries_cp = entries;
  std::sort(entries_cp.begin(), entries_cp.end(),
            [](const XRefEntry &left, const XRefEntry &right) {
              return left.id.id < right.id.id;
            });
  int prev = 0;
  int counter = 0;
  int start_id = 0;
  std::ostringstream res;
  res << kXref;
  std::string tmp;
  for (size_t i = 0; i < entries_cp.size(); ++i) {
    // first iteration or current entry element id is sequentinal
    if (i == 0 || entries_cp[i].id.id == prev + 1) {
      if (counter == 0) { // store first el number
        start_id = entries_cp[i].id.id;
      }
      tmp.append(entries_cp[i].ToString());
      prev = entries_cp[i].id.id;
      ++counter;
      continue;
    }
    // not sequentinal element was encountered
    res << start_id << " " << counter << "\n" << tmp;
    counter = 1;
    tmp.clear();
    tmp.append(entries_cp[i].ToString());
    start_id = entries_cp[i].id.id;
    prev = entries_cp[i].id.id;
  }
  res << start_id << " " << counter << "\n" << tmp;
  return res.str();
}

std::vector<std::pair<int, int>> BuildXRefStreamSections(
  std::vector<XRefEntry> &entries) {
  std::vector<std::pair<int, int>> res;
  if (entries.empty()) {
    return res;
  }
  std::sort(entries.begin(), entries.end(),
            [](const XRefEntry &left, const XRefEntry &right) {
              return left.id.id < right.id.id;
            });
  int prev = 0;
  int counter = 0;
  int start_id = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const int curr_id = entries[i].id.id;
    if (i != 0 && curr_id == prev) { // duplicates found
      throw SignError(ErrorKind::kDocumentStructure,
                      "[BuildXRefStreamSections] non unique entries");
    }
    // first iteration or current entry element id is sequentinal
    if (i == 0 || curr_id == prev + 1) {
      if (counter == 0) { // store first el number
        start_id = curr_id;
      }
      ++counter;
      prev = curr_id;
      continue;
    }
    // not sequentinal element was encountered
    res.emplace_back(start_id, counter); // save section to result
    counter = 1;
    start_id = curr_id;
    prev = curr_id;
  }
  if (counter > 0) {
    res.emplace_back(start_id, counter);
  }
  return res;
}

std::optional<std::string> FindXrefOffset(const BytesVector &buf) {
  const std::string tag = kStartXref;
  const size_t tag_size = tag.size();
  if (buf.size() < tag_size + 2) {
    return std::nullopt;
  }
  size_t last = std::string::npos;
  for (size_t i = buf.size() - tag_size; (i > 1 && last == std::string::npos);
       --i) {
    for (size_t j = 0; j < tag_size; ++j) {
      if (buf[i + j] != static_cast<unsigned char>(tag[j])) {
        break;
      }
      if (j == tag_size - 1) {
        last = i;
      }
    }
  }
  if (last == std::string::npos) {
    return std::nullopt;
  }
  last += tag_size;
  while (last < buf.size() &&
         (buf[last] == '\r' || buf[last] == '\n' || buf[last] == ' ')) {
    ++last;
  }
  size_t last_end = last;
  while (last_end < buf.size() && std::isdigit(buf[last_end]) != 0) {
    ++last_end;
  }
  if (last_end > last) {
    std::string res;
    std::copy(buf.data() + last, buf.data() + last_end,
              std::back_inserter(res));
    return res;
  }
  return std::nullopt;
}

std::string ByteVectorToHexString(const BytesVector &vec) {
  std::ostringstream oss;
  for (const unsigned char byte : vec) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(byte);
  }
  return oss.str();
}

std::string ToPdfTextString(const std::string &utf8_text) {
  return QPDFObjectHandle::newUnicodeString(utf8_text).unparse();
}

std::string TimeToPdfDate(std::time_t val) {
  std::tm time_struct{};
  gmtime_r(&val, &time_struct);
  std::ostringstream builder;
  builder << std::put_time(&time_struct, "%Y%m%d%H%M%SZ");
  return builder.str();
}

std::string ToWinAnsiString(const std::string &utf8_text) {
  std::string win_ansi;
  if (!QUtil::utf8_to_win_ansi(utf8_text, win_ansi, '?')) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->debug("[ToWinAnsiString] not all characters of {} are in "
                    "WinAnsiEncoding",
                    utf8_text);
    }
  }
  return QPDFObjectHandle::newString(win_ansi).unparse();
}

std::string TimeToStampDate(std::time_t val) {
  std::tm time_struct{};
  gmtime_r(&val, &time_struct);
  std::ostringstream builder;
  builder << std::put_time(&time_struct, "%Y-%m-%d %H:%M:%S UTC");
  return builder.str();
}

std::string CreatePageUpdateWithAnnots(const PtrPdfObjShared &p_page_original,
                                       const std::vector<ObjRawId> &annot_ids,
                                       const std::set<ObjRawId> &removed_ids) {
  std::ostringstream annots_builder;
  annots_builder << "[ ";
  if (p_page_original->hasKey(kTagAnnots) &&
      p_page_original->getKey(kTagAnnots).isArray()) {
    // keep existing annotations, direct ones too
    const auto vec_annots =
      p_page_original->getKey(kTagAnnots).getArrayAsVector();
    std::for_each(vec_annots.cbegin(), vec_annots.cend(),
                  [&annots_builder,
                   &removed_ids](const QPDFObjectHandle &val) {
                    if (val.isIndirect()) {
                      const ObjRawId val_id = ObjRawId::CopyIdFromExisting(val);
                      if (removed_ids.count(val_id) > 0) {
                        return;
                      }
                      annots_builder << val_id.ToStringRef() << " ";
                    } else {
                      annots_builder << val.unparse() << " ";
                    }
                  });
  }
  std::for_each(annot_ids.cbegin(), annot_ids.cend(),
                [&annots_builder](const ObjRawId &ann) {
                  annots_builder << ann.ToStringRef() << " ";
                });
  annots_builder << "]";
  auto unparsed_map = DictToUnparsedMap(*p_page_original);
  unparsed_map.insert_or_assign(kTagAnnots, annots_builder.str());

  std::ostringstream builder;
  builder << ObjRawId::CopyIdFromExisting(*p_page_original).ToString() << " \n"
          << kDictStart << "\n";
  builder << UnparsedMapToString(unparsed_map);
  builder << kDictEnd << "\n" << kObjEnd;
  return builder.str();
}

void CreateCrossRefStream(
  std::map<std::string, std::string> &old_trailer_fields,
  const std::string &prev_x_ref_offset,
  std::vector<unsigned char> &result_file_buf, ObjRawId &last_assigned_id,
  std::vector<XRefEntry> &ref_entries) {
  CrossRefStream crs{};
  // first create xref object id
  crs.id = ++last_assigned_id;
  crs.size_val = crs.id.id + 1; // highest object number + 1
  // push the trailer itself
  ref_entries.push_back(XRefEntry{crs.id, result_file_buf.size(), 0});
  crs.entries = ref_entries;
  // sort entries and build sections
  crs.index_vec = BuildXRefStreamSections(crs.entries);
  // offset to previous xref
  crs.prev_val = prev_x_ref_offset;
  // copy fields from the previous trailer
  if (old_trailer_fields.count(kTagRoot) > 0) {
    crs.root_id = old_trailer_fields.at(kTagRoot);
  }
  if (old_trailer_fields.count(kTagInfo) > 0) {
    crs.info_id = old_trailer_fields.at(kTagInfo);
  }
  if (old_trailer_fields.count(kTagID) > 0) {
    crs.id_val = old_trailer_fields.at(kTagID);
  }
  if (old_trailer_fields.count(kTagEncrypt) > 0) {
    crs.enctypt = old_trailer_fields.at(kTagEncrypt);
  }
  // set stream length
  if (crs.entries.size() >
      static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw SignError(ErrorKind::kDocumentStructure,
                    "[CreateCrossRefStream] can not cast to int");
  }
  crs.length = (crs.w_field_0_size + crs.w_field_1_size + crs.w_field_2_size) *
               static_cast<int>(crs.entries.size());

  // complete the file
  const size_t xref_table_offset = result_file_buf.size();
  {
    auto buf = crs.ToRawData();
    std::copy(buf.cbegin(), buf.cend(), std::back_inserter(result_file_buf));
  }
  AppendFinalInfo(result_file_buf, xref_table_offset);
}

void CreateSimpleXref(std::map<std::string, std::string> &old_trailer_fields,
                      const std::string &prev_x_ref_offset,
                      std::vector<unsigned char> &result_file_buf,
                      const ObjRawId &last_assigned_id,
                      std::vector<XRefEntry> &ref_entries) {
  old_trailer_fields.insert_or_assign(kTagPrev, prev_x_ref_offset);
  // highest object number + 1
  old_trailer_fields.insert_or_assign(kTagSize,
                                      std::to_string(last_assigned_id.id + 1));
  // fields to copy from old trailer
  {
    const std::set<std::string> trailer_possible_fields{
      kTagSize, kTagPrev, kTagRoot, kTagEncrypt, kTagInfo, kTagID};
    std::map<std::string, std::string> tmp_trailer;
    std::copy_if(old_trailer_fields.cbegin(), old_trailer_fields.cend(),
                 std::inserter(tmp_trailer, tmp_trailer.end()),
                 [&trailer_possible_fields](
                   const std::pair<std::string, std::string> &pair_val) {
                   return trailer_possible_fields.count(pair_val.first) > 0;
                 });
    std::swap(old_trailer_fields, tmp_trailer);
  }
  std::string raw_trailer = "trailer\n<<\n";
  raw_trailer += UnparsedMapToString(old_trailer_fields);
  raw_trailer += ">>\n";
  // push xref_table to file
  const size_t xref_table_offset = result_file_buf.size();
  const std::string raw_xref_table = BuildXrefRawTable(ref_entries);
  std::copy(raw_xref_table.cbegin(), raw_xref_table.cend(),
            std::back_inserter(result_file_buf));
  std::copy(raw_trailer.cbegin(), raw_trailer.cend(),
            std::back_inserter(result_file_buf));
  AppendFinalInfo(result_file_buf, xref_table_offset);
}

} // namespace dtrsign::pdf
