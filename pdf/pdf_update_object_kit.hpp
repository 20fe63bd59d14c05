/* File: pdf_update_object_kit.hpp
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

#include <map>
#include <string>
#include <vector>

#include "acro_form.hpp"
#include "form_x_object.hpp"
#include "image_obj.hpp"
#include "pdf_structs.hpp"
#include "sig_field.hpp"
#include "sig_val.hpp"

namespace dtrsign::pdf {

// everything appended to the document by one incremental update
struct PdfUpdateObjectKit {
  ObjRawId original_last_id;  /// original doc last object id
  ObjRawId last_assigned_id;  /// last used id
  PtrPdfObjShared p_root_original;

  std::vector<ImageObj> image_objs;  // masks go before their images
  std::vector<FormXObject> form_x_objects;  // one per appearance
  SigVal sig_val;
  SigField sig_field;
  std::vector<SigWidget> widgets;  // kids of sig_field, empty when merged
  AcroForm acroform;
  std::map<ObjRawId, PtrPdfObjShared> pages_original;
  std::map<ObjRawId, std::vector<ObjRawId>> page_annots;  // page -> new annots
  std::map<ObjRawId, std::string> updated_pages;  // page raw data
  std::string root_updated;                      // root object raw
  std::vector<XRefEntry> ref_entries;            // XRef
  BytesVector updated_file_data;
};

} // namespace dtrsign::pdf
