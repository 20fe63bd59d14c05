/* File: incremental_writer.cpp
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


#include "incremental_writer.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <qpdf/QPDFExc.hh>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::pdf {

ReservedDocument
IncrementalWriter::Reserve(const BaseDocument &base, const FieldRequest &request,
                           const std::vector<AppearanceStream> &appearances) {
  const std::string func_name = "[IncrementalWriter::Reserve] ";
  if (appearances.empty()) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "at least one appearance is expected");
  }
  if (std::any_of(appearances.cbegin(), appearances.cend(),
                  [](const AppearanceStream &appearance) {
                    return !appearance.image;
                  })) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "appearance without an image");
  }
  if (request.field_name.empty()) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "empty field name");
  }
  if (request.reserved_bytes == 0) {
    throw SignError(ErrorKind::kInvalidParameter,
                    func_name + "no space reserved for the signature");
  }
  if (!base.bytes) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "no document data");
  }
  try {
    IncrementalWriter writer(base, request, appearances);
    return writer.CreateObjectKit();
  } catch (const QPDFExc &ex) {
    throw SignError(ErrorKind::kDocumentStructure, func_name + ex.what());
  }
}

DigestedDocument IncrementalWriter::AttachDigest(ReservedDocument reserved,
                                                 BytesVector digest) {
  if (digest.empty()) {
    throw SignError(ErrorKind::kSigning,
                    "[IncrementalWriter::AttachDigest] empty digest");
  }
  return DigestedDocument{std::move(reserved), std::move(digest)};
}

FinalizedDocument IncrementalWriter::Finalize(const DigestedDocument &digested,
                                              const BytesVector &signature) {
  const std::string func_name = "[IncrementalWriter::Finalize] ";
  const ReservedDocument &reserved = digested.reserved;
  if (signature.empty()) {
    throw SignError(ErrorKind::kSigning, func_name + "empty signature");
  }
  if (!reserved.bytes ||
      reserved.sig_hex_offset + reserved.sig_hex_length >
        reserved.bytes->size()) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "reserved span is outside the document");
  }
  const std::string sig_hex = ByteVectorToHexString(signature);
  if (sig_hex.size() > reserved.sig_hex_length) {
    throw SignError(ErrorKind::kReservedSpaceExhausted,
                    func_name + "signature needs " +
                      std::to_string(sig_hex.size()) +
                      " hex digits, reserved " +
                      std::to_string(reserved.sig_hex_length));
  }
  BytesVector res(*reserved.bytes);
  std::copy(sig_hex.cbegin(), sig_hex.cend(),
            res.begin() + static_cast<std::ptrdiff_t>(reserved.sig_hex_offset));
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("{}field {} signature {} bytes, free {} hex digits",
                  func_name, reserved.field_name, signature.size(),
                  reserved.sig_hex_length - sig_hex.size());
  }
  return FinalizedDocument{std::make_shared<const BytesVector>(std::move(res)),
                           reserved.field_name};
}

// ---------------------------------------------------
// private

IncrementalWriter::IncrementalWriter(
  const BaseDocument &base, const FieldRequest &request,
  const std::vector<AppearanceStream> &appearances)
    : pdf_(base.bytes),
      request_(request),
      appearances_(appearances),
      update_kit_(std::make_unique<PdfUpdateObjectKit>()) {}

ReservedDocument IncrementalWriter::CreateObjectKit() {
  const std::string func_name = "[IncrementalWriter::CreateObjectKit] ";
  const auto start = std::chrono::steady_clock::now();
  {
    const auto existing_names = pdf_.GetFieldNames();
    if (std::find(existing_names.cbegin(), existing_names.cend(),
                  request_.field_name) != existing_names.cend()) {
      reused_field_ = pdf_.GetUnsignedField(request_.field_name);
      if (!reused_field_) {
        throw SignError(ErrorKind::kInvalidParameter,
                        func_name + "field " + request_.field_name +
                          " already exists");
      }
    }
  }
  // save last id of original doc
  update_kit_->original_last_id = pdf_.GetLastObjID();
  update_kit_->last_assigned_id = update_kit_->original_last_id;
  // find the target pages
  for (const auto &appearance : appearances_) {
    auto page = pdf_.GetPage(appearance.page_index);
    if (!page) {
      throw SignError(ErrorKind::kPlacementOutOfBounds,
                      func_name + "page " +
                        std::to_string(appearance.page_index) + " not found");
    }
    const ObjRawId page_id = ObjRawId::CopyIdFromExisting(*page);
    appearance_page_ids_.push_back(page_id);
    update_kit_->pages_original.emplace(page_id, std::move(page));
  }
  if (reused_field_) {
    CollectReplacedWidgets();
  }
  // image
  CreateImageObjs();
  // xobj
  CreateFormXobjs();
  // empty signature
  CreateEmptySigVal();
  // the field and its widgets
  CreateSignField();
  // create an AcroForm (or copy existing)
  CreateAcroForm();
  // update pages
  CreateUpdatedPages();
  // root
  CreateUpdatedRoot();
  // xref and trailer
  ReservedDocument res = CreateXRef();
  auto logger = logger::InitLog();
  if (logger) {
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    logger->debug("{}field {}: ids {}..{}, {} widget(s), {} -> {} bytes, "
                  "duration:{} ms",
                  func_name, request_.field_name,
                  update_kit_->original_last_id.id + 1,
                  update_kit_->last_assigned_id.id, appearances_.size(),
                  pdf_.data()->size(), res.bytes->size(), duration.count());
  }
  return res;
}

void IncrementalWriter::CollectReplacedWidgets() {
  QPDFObjectHandle &field = *reused_field_;
  if (field.hasKey(kTagRect) || field.hasKey(kTagAP)) {
    replaced_widgets_.insert(ObjRawId::CopyIdFromExisting(field));
  }
  if (field.hasKey(kTagKids) && field.getKey(kTagKids).isArray()) {
    for (const auto &kid : field.getKey(kTagKids).getArrayAsVector()) {
      if (kid.isIndirect()) {
        replaced_widgets_.insert(ObjRawId::CopyIdFromExisting(kid));
      }
    }
  }
  // pages that show the old widgets are updated too
  for (const int page_index : pdf_.FindPagesWithAnnots(replaced_widgets_)) {
    auto page = pdf_.GetPage(page_index);
    if (!page) {
      continue;
    }
    const ObjRawId page_id = ObjRawId::CopyIdFromExisting(*page);
    update_kit_->pages_original.emplace(page_id, std::move(page));
    update_kit_->page_annots[page_id];
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[IncrementalWriter] sign the existing field {}, {} old "
                  "widget(s) replaced",
                  request_.field_name, replaced_widgets_.size());
  }
}

void IncrementalWriter::CreateImageObjs() {
  // appearances may share one picture, write it once
  std::map<const StampImage *, ObjRawId> assigned;
  for (const auto &appearance : appearances_) {
    const StampImage *p_img = appearance.image.get();
    auto it_assigned = assigned.find(p_img);
    if (it_assigned == assigned.end()) {
      ImageObj img = p_img->image;
      if (!p_img->smask.data.empty()) {
        ImageObj mask = p_img->smask;
        mask.id = ++update_kit_->last_assigned_id;
        mask.smask_id = std::nullopt;
        img.smask_id = mask.id;
        update_kit_->image_objs.push_back(std::move(mask));
      }
      img.id = ++update_kit_->last_assigned_id;
      it_assigned = assigned.emplace(p_img, img.id).first;
      update_kit_->image_objs.push_back(std::move(img));
    }
    appearance_image_ids_.push_back(it_assigned->second);
  }
}

void IncrementalWriter::CreateFormXobjs() {
  for (size_t i = 0; i < appearances_.size(); ++i) {
    const AppearanceStream &appearance = appearances_[i];
    FormXObject form_x_object;
    form_x_object.id = ++update_kit_->last_assigned_id;
    form_x_object.bbox.right_top.x = appearance.rect.Width();
    form_x_object.bbox.right_top.y = appearance.rect.Height();
    form_x_object.resources_img_ref = appearance_image_ids_[i];
    form_x_object.matrix = appearance.ImageMatrix();
    if (!request_.signer_name.empty()) {
      form_x_object.text_lines.push_back("Signed by: " + request_.signer_name);
      if (request_.signing_time != 0) {
        form_x_object.text_lines.push_back(
          "Date Signed: " + TimeToStampDate(request_.signing_time));
      }
    }
    update_kit_->form_x_objects.push_back(std::move(form_x_object));
  }
}

void IncrementalWriter::CreateEmptySigVal() {
  SigVal &sig_val = update_kit_->sig_val;
  sig_val.id = ++update_kit_->last_assigned_id;
  sig_val.contents_raw.resize(request_.reserved_bytes, 0x00);
  if (request_.signing_time != 0) {
    sig_val.date = TimeToPdfDate(request_.signing_time);
  }
  if (!request_.signer_name.empty()) {
    sig_val.name = request_.signer_name;
  }
  if (!request_.reason.empty()) {
    sig_val.reason = request_.reason;
  }
  if (!request_.app_name.empty()) {
    sig_val.app_name = request_.app_name;
  }
  sig_val.CalcOffsets();
}

void IncrementalWriter::CreateSignField() {
  SigField &sig_field = update_kit_->sig_field;
  if (reused_field_) {
    sig_field.id = ObjRawId::CopyIdFromExisting(*reused_field_);
    sig_field.kept_entries = DictToUnparsedMap(*reused_field_);
    for (const char *tag : {kTagV, kTagAP, kTagRect, kTagP, kTagF, kTagKids,
                            kTagType, kTagSubType}) {
      sig_field.kept_entries.erase(tag);
    }
  } else {
    sig_field.id = ++update_kit_->last_assigned_id;
  }
  sig_field.name = request_.field_name;
  sig_field.value = update_kit_->sig_val.id;
  if (appearances_.size() == 1) {
    SigWidget widget;
    widget.page = appearance_page_ids_.front();
    widget.appearance_ref = update_kit_->form_x_objects.front().id;
    widget.rect = appearances_.front().rect;
    sig_field.merged_widget = widget;
    update_kit_->page_annots[widget.page].push_back(sig_field.id);
    return;
  }
  for (size_t i = 0; i < appearances_.size(); ++i) {
    SigWidget widget;
    widget.id = ++update_kit_->last_assigned_id;
    widget.page = appearance_page_ids_[i];
    widget.appearance_ref = update_kit_->form_x_objects[i].id;
    widget.rect = appearances_[i].rect;
    widget.parent = sig_field.id;
    sig_field.kids.push_back(widget.id);
    update_kit_->page_annots[widget.page].push_back(widget.id);
    update_kit_->widgets.push_back(std::move(widget));
  }
}

void IncrementalWriter::CreateAcroForm() {
  AcroForm &acroform = update_kit_->acroform;
  auto original_acro_form = pdf_.GetAcroform();
  if (original_acro_form) {
    // copy original
    acroform = AcroForm::ShallowCopy(original_acro_form);
  }
  if (acroform.id.id == 0) {
    // create a new acroform id
    acroform.id = ++update_kit_->last_assigned_id;
  }
  // a reused field is already in the tree
  if (!reused_field_) {
    acroform.fields.push_back(update_kit_->sig_field.id);
  }
}

void IncrementalWriter::CreateUpdatedPages() {
  for (const auto &page_pair : update_kit_->page_annots) {
    update_kit_->updated_pages[page_pair.first] = CreatePageUpdateWithAnnots(
      update_kit_->pages_original.at(page_pair.first), page_pair.second,
      replaced_widgets_);
  }
}

void IncrementalWriter::CreateUpdatedRoot() {
  auto root = pdf_.GetRoot();
  update_kit_->p_root_original = root;
  if (!root || !root->isDictionary()) {
    throw SignError(ErrorKind::kDocumentStructure, "Can't find the pdf root");
  }
  std::ostringstream builder;
  builder << ObjRawId::CopyIdFromExisting(*root).ToString() << "\n"
          << kDictStart << "\n";
  auto root_unparsed_map = DictToUnparsedMap(*root);
  root_unparsed_map.insert_or_assign(kTagAcroForm,
                                     update_kit_->acroform.id.ToStringRef());
  builder << UnparsedMapToString(root_unparsed_map);
  builder << kDictEnd << "\n" << kObjEnd;
  update_kit_->root_updated = builder.str();
}

ReservedDocument IncrementalWriter::CreateXRef() {
  const std::string func_name = "[IncrementalWriter::CreateXRef] ";
  const BytesVector &original = *pdf_.data();
  // find the previous xref
  auto prev_x_ref = FindXrefOffset(original);
  if (!prev_x_ref) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "Can't find pdf xref");
  }
  BytesVector file_buff;
  file_buff.reserve(original.size() +
                    update_kit_->sig_val.contents_raw.size() * 2 + 64000);
  file_buff.assign(original.cbegin(), original.cend());
  file_buff.push_back('\n');
  std::vector<XRefEntry> &ref_entries = update_kit_->ref_entries;
  // pages
  for (const auto &page_pair : update_kit_->updated_pages) {
    ref_entries.emplace_back(XRefEntry{page_pair.first, file_buff.size(), 0});
    AppendRaw(file_buff, page_pair.second);
  }
  // root
  ref_entries.emplace_back(
    XRefEntry{ObjRawId::CopyIdFromExisting(*update_kit_->p_root_original),
              file_buff.size(), 0});
  AppendRaw(file_buff, update_kit_->root_updated);
  // images and masks
  for (const auto &img : update_kit_->image_objs) {
    ref_entries.emplace_back(XRefEntry{img.id, file_buff.size(), 0});
    auto raw_img_obj = img.ToRawData();
    std::copy(raw_img_obj.cbegin(), raw_img_obj.cend(),
              std::back_inserter(file_buff));
  }
  // xobjects
  for (const auto &form : update_kit_->form_x_objects) {
    ref_entries.emplace_back(XRefEntry{form.id, file_buff.size(), 0});
    AppendRaw(file_buff, form.ToString());
  }
  // sig value
  SigVal &sig_val = update_kit_->sig_val;
  ref_entries.emplace_back(XRefEntry{sig_val.id, file_buff.size(), 0});
  // update offsets
  sig_val.hex_str_offset += file_buff.size();
  sig_val.byteranges_str_offset += file_buff.size();
  AppendRaw(file_buff, sig_val.ToString());
  // sig field
  ref_entries.emplace_back(
    XRefEntry{update_kit_->sig_field.id, file_buff.size(), 0});
  AppendRaw(file_buff, update_kit_->sig_field.ToString());
  for (const auto &widget : update_kit_->widgets) {
    ref_entries.emplace_back(XRefEntry{widget.id, file_buff.size(), 0});
    AppendRaw(file_buff, widget.ToString());
  }
  // the acroform
  ref_entries.emplace_back(
    XRefEntry{update_kit_->acroform.id, file_buff.size(), 0});
  AppendRaw(file_buff, update_kit_->acroform.ToString());
  // create new trailer
  auto trailer_orig = pdf_.GetTrailer();
  if (!trailer_orig || !trailer_orig->isDictionary()) {
    throw SignError(ErrorKind::kDocumentStructure,
                    func_name + "Can't find document trailer");
  }
  auto map_unparsed = DictToUnparsedMap(*trailer_orig);
  // the same kind of cross-reference as the previous section
  if (pdf_.HasXRefStream()) {
    CreateCrossRefStream(map_unparsed, prev_x_ref.value(), file_buff,
                         update_kit_->last_assigned_id, ref_entries);
  } else {
    CreateSimpleXref(map_unparsed, prev_x_ref.value(), file_buff,
                     update_kit_->last_assigned_id, ref_entries);
  }
  // finally patch byteranges
  ReservedDocument res;
  {
    std::string patch = "0 "; // file beginning
    const size_t befor_hex = sig_val.hex_str_offset;
    patch += std::to_string(befor_hex);
    patch += ' ';
    const size_t offset_hex_end =
      sig_val.hex_str_offset + sig_val.hex_str_length + 2; // 2 is <>
    const size_t after_hex = file_buff.size() - offset_hex_end;
    patch += std::to_string(offset_hex_end);
    patch += " ";
    patch += std::to_string(after_hex);
    patch += " ]";
    const size_t patch_end_offs = sig_val.byteranges_str_offset + patch.size();
    if (patch_end_offs >= file_buff.size() ||
        patch.size() >= kSizeOfSpacesReservedForByteRanges) {
      throw SignError(ErrorKind::kReservedSpaceExhausted,
                      func_name + "no space for the byte range " + patch);
    }
    std::copy(patch.begin(), patch.end(),
              file_buff.begin() +
                static_cast<std::ptrdiff_t>(sig_val.byteranges_str_offset));
    res.byteranges.emplace_back(0, befor_hex);
    res.byteranges.emplace_back(offset_hex_end, after_hex);
    res.sig_hex_offset = befor_hex + 1;
    res.sig_hex_length = sig_val.hex_str_length;
  }
  res.field_name = request_.field_name;
  res.bytes = std::make_shared<const BytesVector>(std::move(file_buff));
  return res;
}

void IncrementalWriter::AppendRaw(BytesVector &dest, const std::string &src) {
  std::copy(src.cbegin(), src.cend(), std::back_inserter(dest));
}

} // namespace dtrsign::pdf
