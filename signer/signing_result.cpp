/* File: signing_result.cpp
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


#include "signing_result.hpp"

#include <algorithm>
#include <utility>

#include "pdf_utils.hpp"

namespace dtrsign::signer {

json::object FieldOutcome::ToJson() const {
  json::object res;
  res["field_name"] = field_name;
  res["role"] = SignerRoleToString(role);
  res["success"] = success;
  if (error) {
    res["error"] = ErrorKindToString(error.value());
  } else {
    res["error"] = nullptr;
  }
  res["message"] = message;
  res["signing_time"] = signing_time;
  res["signing_time_pdf"] = pdf::TimeToPdfDate(signing_time);
  res["signer_subject"] = signer_subject;
  res["appearances"] = appearances;
  return res;
}

bool SigningResult::Success() const noexcept {
  return !fields.empty() &&
         std::all_of(fields.cbegin(), fields.cend(),
                     [](const FieldOutcome &field) { return field.success; });
}

std::optional<ErrorKind> SigningResult::FirstError() const noexcept {
  auto it_failed =
    std::find_if(fields.cbegin(), fields.cend(),
                 [](const FieldOutcome &field) { return !field.success; });
  if (it_failed == fields.cend()) {
    return std::nullopt;
  }
  return it_failed->error;
}

json::object SigningResult::ToJson() const {
  json::object res;
  res["success"] = Success();
  const auto first_error = FirstError();
  if (first_error) {
    res["error"] = ErrorKindToString(first_error.value());
  } else {
    res["error"] = nullptr;
  }
  res["document_size"] = document ? document->size() : 0;
  json::array arr;
  for (const auto &field : fields) {
    arr.emplace_back(field.ToJson());
  }
  res["fields"] = std::move(arr);
  return res;
}

} // namespace dtrsign::signer
