/* File: signer_role.hpp
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

#include <optional>
#include <string>
#include <vector>

namespace dtrsign::signer {

/// Owner and InCharge sign the daily time record, the rest - leave
/// applications
enum class SignerRole { kOwner, kInCharge, kHead, kSao, kCao };

[[nodiscard]] const char *SignerRoleToString(SignerRole role) noexcept;

/// @brief accepts the SignerRoleToString values, case-insensitive
[[nodiscard]] std::optional<SignerRole>
SignerRoleFromString(const std::string &val) noexcept;

/// @brief "OwnerSignature", "InchargeSignature" ...
[[nodiscard]] const char *FieldNamePrefix(SignerRole role) noexcept;

/// @brief /Reason of the signature dictionary
[[nodiscard]] const char *ReasonText(SignerRole role) noexcept;

/**
 * @brief The first field name the role can sign
 * @param role
 * @param existing_names fully qualified names of the fields in the document
 * @param unsigned_names signature fields placed but not signed yet
 * @return std::string prefix + the smallest index starting with 1 that is
 * either not used or an unsigned signature field
 */
[[nodiscard]] std::string
NextFieldName(SignerRole role, const std::vector<std::string> &existing_names,
              const std::vector<std::string> &unsigned_names = {});

} // namespace dtrsign::signer
