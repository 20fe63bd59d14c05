/* File: sig_field.hpp
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
#include "pdf_structs.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dtrsign::pdf {

// Widget annotation ISO32000 [12.5.6.19] showing one stamp of a field
struct SigWidget {
  ObjRawId id;
  std::string type = kTagAnnot;
  std::string subtype = kTagWidget;
  ObjRawId page;  // /P
  ObjRawId appearance_ref;
  BBox rect;  // the location of the annotation on the page in default user
              // space units.
  int flags = 0b100;  // print
  std::optional<ObjRawId> parent;  // set when the widget is a kid of a field

  /// @brief widget keys without the object header
  [[nodiscard]] std::string WidgetEntries() const;

  [[nodiscard]] std::string ToString() const;
};

// Signature field ISO32000 [12.7.4.5]
// one appearance: the field and its widget share one dictionary,
// several appearances: the field lists widgets in /Kids
struct SigField {
  ObjRawId id;
  std::string ft = kTagSig;
  std::string name;  // /T partial field name
  ObjRawId value;    // signature dictionary
  std::optional<SigWidget> merged_widget;
  std::vector<ObjRawId> kids;
  // unparsed keys of an unsigned field signed in place, written instead of
  // /FT and /T
  std::map<std::string, std::string> kept_entries;

  [[nodiscard]] std::string ToString() const;
};

} // namespace dtrsign::pdf
