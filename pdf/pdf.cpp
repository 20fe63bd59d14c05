/* File: pdf.cpp
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


#include "pdf.hpp"

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFFormFieldObjectHelper.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::pdf {

namespace {

constexpr int kMaxFieldsDepth = 32;

struct FieldNode {
  QPDFObjectHandle field;
  std::string full_name;
};

// walk the field tree, kids without /T are widgets and are not collected
void CollectFields(QPDFObjectHandle &node, const std::string &prefix,
                   std::vector<FieldNode> &res, std::set<ObjRawId> &visited,
                   int depth) {
  if (depth > kMaxFieldsDepth || !node.isDictionary()) {
    return;
  }
  if (node.isIndirect() &&
      !visited.insert(ObjRawId::CopyIdFromExisting(node)).second) {
    return;
  }
  if (!node.hasKey(kTagT) || !node.getKey(kTagT).isString()) {
    return;
  }
  const std::string partial = node.getKey(kTagT).getUTF8Value();
  std::string full_name = prefix.empty() ? partial : prefix + "." + partial;
  res.push_back(FieldNode{node, full_name});
  if (node.hasKey(kTagKids) && node.getKey(kTagKids).isArray()) {
    for (auto &kid : node.getKey(kTagKids).getArrayAsVector()) {
      CollectFields(kid, full_name, res, visited, depth + 1);
    }
  }
}

// the type may come from a parent, kids with /T are fields of their own
bool IsUnsignedSignatureField(QPDFObjectHandle &field) {
  if (!field.isIndirect()) {
    return false;
  }
  QPDFFormFieldObjectHelper helper(field);
  if (helper.getFieldType() != kTagSig || !helper.getValue().isNull()) {
    return false;
  }
  if (field.hasKey(kTagKids) && field.getKey(kTagKids).isArray()) {
    for (auto &kid : field.getKey(kTagKids).getArrayAsVector()) {
      if (kid.isDictionary() && kid.hasKey(kTagT)) {
        return false;
      }
    }
  }
  return true;
}

std::vector<FieldNode> AllFields(const PtrPdfObjShared &acroform) {
  std::vector<FieldNode> res;
  if (!acroform || !acroform->isDictionary() ||
      !acroform->hasKey(kTagFields) ||
      !acroform->getKey(kTagFields).isArray()) {
    return res;
  }
  std::set<ObjRawId> visited;
  for (auto &field : acroform->getKey(kTagFields).getArrayAsVector()) {
    CollectFields(field, "", res, visited, 0);
  }
  return res;
}

} // namespace

Pdf::Pdf(SharedBytes data)
    : data_(std::move(data)), qpdf_(std::make_unique<QPDF>()) {
  const std::string func_name = "[Pdf::Pdf] ";
  if (!data_ || data_->empty()) {
    throw SignError(ErrorKind::kDocumentStructure, func_name + "empty document");
  }
  if (data_->size() > kMaxPdfFileSize) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "file is too big");
  }
  {
    const std::string header = kPdfHeader;
    const auto search_end =
      data_->cbegin() +
      static_cast<std::ptrdiff_t>(
        std::min(data_->size(), kPdfHeaderSearchLimit));
    if (std::search(data_->cbegin(), search_end, header.cbegin(),
                    header.cend()) == search_end) {
      throw SignError(ErrorKind::kDocumentStructure,
                      func_name + "no pdf header");
    }
  }
  if (!FindXrefOffset(*data_)) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "no startxref found");
  }
  try {
    qpdf_->setAttemptRecovery(false);
    qpdf_->setSuppressWarnings(true);
    qpdf_->processMemoryFile("dtrsign input",
                             reinterpret_cast<const char *>( // NOLINT
                               data_->data()),
                             data_->size());
    // parse the catalog and the page tree now, the rest is lazy
    if (qpdf_->getRoot().isNull() || qpdf_->getAllPages().empty()) {
      throw SignError(ErrorKind::kDocumentStructure,
                      func_name + "document has no pages");
    }
  } catch (const SignError &) {
    throw;
  } catch (const std::exception &ex) {
    throw SignError(ErrorKind::kDocumentStructure, func_name + ex.what());
  }
  if (qpdf_->isEncrypted()) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "encrypted documents are not supported");
  }
  auto logger = logger::InitLog();
  if (logger) {
    for (const auto &warning : qpdf_->getWarnings()) {
      logger->warn("{}qpdf: {}", func_name, warning.what());
    }
    logger->debug("{}{} bytes, {} pages", func_name, data_->size(),
                  qpdf_->getAllPages().size());
  }
}

bool Pdf::FindSignatures() noexcept {
  signatures_.clear();
  auto fields = AllFields(GetAcroform());
  if (fields.empty()) {
    Log(kErrNoAcro);
    return false;
  }
  for (auto &node : fields) {
    auto signature = GetSignatureV(node.field);
    if (!signature) {
      continue;
    }
    auto byterange = signature->getKey(kTagByteRange);
    if (byterange.isNull() || !byterange.isArray()) {
      Log("No byterange is found");
      continue;
    }
    const int num_items = byterange.getArrayNItems();
    if (num_items % 2 != 0) {
      Log("Error number of items in array is not even");
      continue;
    }
    int64_t start = 0;
    RangesVector byteranges;
    bool valid = true;
    for (int i2 = 0; i2 < num_items; ++i2) {
      auto item = byterange.getArrayItem(i2);
      if (!item.isInteger() || item.getIntValue() < 0) {
        valid = false;
        break;
      }
      auto val = item.getIntValue();
      if (i2 % 2 == 0) {
        start = val;
      } else {
        byteranges.emplace_back(start, val);
      }
    }
    if (!valid) {
      Log("Invalid byterange");
      continue;
    }
    signatures_.emplace_back(SigInstance{std::move(signature), node.full_name,
                                         std::move(byteranges)});
  }
  return !signatures_.empty();
}

BytesVector Pdf::getRawSignature(unsigned int sig_index) noexcept {
  std::vector<unsigned char> res;
  if (signatures_.size() < sig_index + 1) {
    Log("No sig with such index");
    return res;
  }
  PtrPdfObj &signature = signatures_[sig_index].signature;
  if (!signature || signature->isNull()) {
    return res;
  }
  auto contents = signature->getKey(kTagContents);
  if (!contents.isString()) {
    Log("Empty signature content");
    return res;
  }
  const std::string decoded_sign_content = contents.getStringValue();
  std::copy(decoded_sign_content.cbegin(), decoded_sign_content.cend(),
            std::back_inserter(res));
  return res;
}

RangesVector Pdf::getSigByteRanges(unsigned int sig_index) const noexcept {
  if (signatures_.size() < sig_index + 1) {
    Log("No sig with such index");
    return {};
  }
  return signatures_.at(sig_index).bytes_ranges;
}

// get a Raw data from pdf (except signature) specified in byrerange_
BytesVector Pdf::getRawData(unsigned int sig_index) const noexcept {
  BytesVector res;
  if (signatures_.size() < sig_index + 1) {
    Log("No signature with such index");
    return res;
  }
  const RangesVector &byteranges = signatures_[sig_index].bytes_ranges;
  for (const auto &range : byteranges) {
    if (range.first > data_->size() ||
        range.second > data_->size() - range.first) {
      Log("Byterange is out of the document");
      return {};
    }
    const auto it_begin =
      data_->cbegin() + static_cast<std::ptrdiff_t>(range.first);
    std::copy(it_begin, it_begin + static_cast<std::ptrdiff_t>(range.second),
              std::back_inserter(res));
  }
  return res;
}

std::string Pdf::getSigFieldName(unsigned int sig_index) const {
  return signatures_.at(sig_index).field_name;
}

ObjRawId Pdf::GetLastObjID() const {
  ObjRawId res{};
  auto objects = qpdf_->getAllObjects();
  auto it_max = std::max_element(
    objects.cbegin(), objects.cend(),
    [](const QPDFObjectHandle &left, const QPDFObjectHandle &right) {
      return left.getObjectID() < right.getObjectID();
    });
  if (it_max != objects.cend()) {
    res.id = it_max->getObjectID();
    res.gen = it_max->getGeneration();
  }
  const size_t obj_count = qpdf_->getObjectCount();
  if (obj_count > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw SignError(ErrorKind::kDocumentStructure,
                    "[Pdf::GetLastObjID] object count > max int");
  }
  const int count = static_cast<int>(obj_count);
  if (res.id < count) {
    res.id = count;
    res.gen = 0;
  }
  // free entries in the xref are not reused
  auto trailer = qpdf_->getTrailer();
  if (trailer.hasKey(kTagSize) && trailer.getKey(kTagSize).isInteger()) {
    const long long size_val = trailer.getKey(kTagSize).getIntValue();
    if (size_val - 1 > res.id && size_val - 1 <= INT_MAX) {
      res.id = static_cast<int>(size_val - 1);
      res.gen = 0;
    }
  }
  return res;
}

PtrPdfObjShared Pdf::GetAcroform() const noexcept {
  const PtrPdfObjShared obj_root = GetRoot();
  if (!obj_root) {
    return nullptr;
  }
  // check if pdf has any Acroforms
  if (obj_root->hasKey(kTagAcroForm)) {
    auto res =
      std::make_shared<QPDFObjectHandle>(obj_root->getKey(kTagAcroForm));
    if (res->isNull() || !res->isDictionary()) {
      return nullptr;
    }
    return res;
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetPage(int page_index) const noexcept {
  const auto &all_pages = qpdf_->getAllPages();
  if (all_pages.empty() || page_index < 0 ||
      static_cast<size_t>(page_index) > all_pages.size() - 1) {
    return nullptr;
  }
  auto res = std::make_shared<QPDFObjectHandle>(
    all_pages[static_cast<size_t>(page_index)]);
  if (res->isNull() || !res->isPageObject()) {
    return nullptr;
  }
  return res;
}

PtrPdfObjShared Pdf::GetRoot() const noexcept {
  PtrPdfObjShared obj_root =
    std::make_shared<QPDFObjectHandle>(qpdf_->getTrailer().getKey(kTagRoot));
  if (obj_root->isNull() || !obj_root->isDictionary()) {
    return nullptr;
  }
  return obj_root;
}

PtrPdfObjShared Pdf::GetTrailer() const noexcept {
  PtrPdfObjShared obj_trailer =
    std::make_shared<QPDFObjectHandle>(qpdf_->getTrailer());
  if (obj_trailer->isNull()) {
    return nullptr;
  }
  return obj_trailer;
}

size_t Pdf::GetPagesCount() const { return qpdf_->getAllPages().size(); }

std::vector<BBox> Pdf::GetMediaBoxes() const {
  std::vector<BBox> res;
  const size_t count = GetPagesCount();
  for (size_t i = 0; i < count; ++i) {
    auto media_box = PageMediaBox(GetPage(static_cast<int>(i)));
    if (!media_box) {
      throw SignError(ErrorKind::kDocumentStructure,
                      std::string("[Pdf::GetMediaBoxes] ") + kErrPageSize +
                        " page " + std::to_string(i));
    }
    res.push_back(media_box.value());
  }
  return res;
}

std::vector<std::string> Pdf::GetFieldNames() const {
  std::vector<std::string> res;
  for (const auto &node : AllFields(GetAcroform())) {
    res.push_back(node.full_name);
  }
  return res;
}

std::vector<std::string> Pdf::GetUnsignedFieldNames() const {
  std::vector<std::string> res;
  for (auto &node : AllFields(GetAcroform())) {
    if (IsUnsignedSignatureField(node.field)) {
      res.push_back(node.full_name);
    }
  }
  return res;
}

PtrPdfObjShared Pdf::GetUnsignedField(const std::string &full_name) const {
  for (auto &node : AllFields(GetAcroform())) {
    if (node.full_name == full_name && IsUnsignedSignatureField(node.field)) {
      return std::make_shared<QPDFObjectHandle>(node.field);
    }
  }
  return nullptr;
}

std::vector<int>
Pdf::FindPagesWithAnnots(const std::set<ObjRawId> &annot_ids) const {
  std::vector<int> res;
  const auto &all_pages = qpdf_->getAllPages();
  for (size_t i = 0; i < all_pages.size(); ++i) {
    QPDFObjectHandle page = all_pages[i];
    auto annots = page.getKey(kTagAnnots);
    if (!annots.isArray()) {
      continue;
    }
    for (const auto &annot : annots.getArrayAsVector()) {
      if (annot.isIndirect() &&
          annot_ids.count(ObjRawId::CopyIdFromExisting(annot)) > 0) {
        res.push_back(static_cast<int>(i));
        break;
      }
    }
  }
  return res;
}

bool Pdf::HasXRefStream() const noexcept {
  auto trailer = GetTrailer();
  return trailer && trailer->isDictionary() && trailer->hasKey(kTagType) &&
         trailer->getKey(kTagType).isName() &&
         trailer->getKey(kTagType).getName() == kTagXref;
}

// ---------------------------------------------------
// private

void Pdf::Log(const std::string &msg) const noexcept {
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[Pdf] {}", msg);
  }
}

PtrPdfObj Pdf::GetSignatureV(QPDFObjectHandle &field) const noexcept {
  if (field.isDictionary() && field.hasKey(kTagFT) &&
      field.getKey(kTagFT).isName() && field.getKey(kTagFT).getName() == kTagSig) {
    if (!field.hasKey(kTagV)) {
      Log("No value of signature");
      return nullptr;
    }
    PtrPdfObj signature_v =
      std::make_unique<QPDFObjectHandle>(field.getKey(kTagV));
    if (!signature_v->isDictionary() || !signature_v->hasKey(kTagType) ||
        !signature_v->getKey(kTagType).isName() ||
        signature_v->getKey(kTagType).getName() != kTagSig) {
      Log("Invalid Signature");
      return nullptr;
    }
    if (!signature_v->hasKey(kTagFilter) ||
        !signature_v->getKey(kTagFilter).isName()) {
      Log("Invalid /Filter field in signature");
      return nullptr;
    }
    if (!signature_v->hasKey(kTagContents)) {
      Log("No signature content was found");
      return nullptr;
    }
    if (!signature_v->hasKey(kTagByteRange)) {
      Log("No byterange was found");
      return nullptr;
    }
    return signature_v;
  }
  return nullptr;
}

} // namespace dtrsign::pdf
