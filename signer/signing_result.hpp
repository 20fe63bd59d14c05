/* File: signing_result.hpp
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

#include <boost/json.hpp>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "sign_error.hpp"
#include "signer_role.hpp"

namespace dtrsign::signer {

namespace json = boost::json;

/// @brief result of one role signing one field
struct FieldOutcome {
  std::string field_name;
  SignerRole role = SignerRole::kOwner;
  bool success = false;
  std::optional<ErrorKind> error;
  std::string message;
  std::time_t signing_time = 0;
  std::string signer_subject;
  size_t appearances = 0;

  [[nodiscard]] json::object ToJson() const;
};

/**
 * @brief What a signing call returns
 * @details document holds the last successfully finalized revision, or the
 * input bytes if nothing was signed
 */
struct SigningResult {
  pdf::SharedBytes document;
  std::vector<FieldOutcome> fields;

  /// @brief true if there is at least one field and all of them are signed
  [[nodiscard]] bool Success() const noexcept;

  /// @brief kind of the first failed field
  [[nodiscard]] std::optional<ErrorKind> FirstError() const noexcept;

  /// @brief per-field outcomes and the document size, no document bytes
  [[nodiscard]] json::object ToJson() const;
};

} // namespace dtrsign::signer
