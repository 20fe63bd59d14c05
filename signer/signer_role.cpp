/* File: signer_role.cpp
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


#include "signer_role.hpp"

#include <cctype>
#include <set>
#include <string>
#include <vector>

namespace dtrsign::signer {

const char *SignerRoleToString(SignerRole role) noexcept {
  switch (role) {
  case SignerRole::kOwner:
    return "owner";
  case SignerRole::kInCharge:
    return "incharge";
  case SignerRole::kHead:
    return "head";
  case SignerRole::kSao:
    return "sao";
  case SignerRole::kCao:
    return "cao";
  }
  return "unknown";
}

std::optional<SignerRole>
SignerRoleFromString(const std::string &val) noexcept {
  std::string lower;
  for (const char symbol : val) {
    if (symbol == '-' || symbol == '_') {
      continue;
    }
    lower.push_back(static_cast<char>(
      std::tolower(static_cast<unsigned char>(symbol))));
  }
  for (const auto role : {SignerRole::kOwner, SignerRole::kInCharge,
                          SignerRole::kHead, SignerRole::kSao,
                          SignerRole::kCao}) {
    if (lower == SignerRoleToString(role)) {
      return role;
    }
  }
  return std::nullopt;
}

const char *FieldNamePrefix(SignerRole role) noexcept {
  switch (role) {
  case SignerRole::kOwner:
    return "OwnerSignature";
  case SignerRole::kInCharge:
    return "InchargeSignature";
  case SignerRole::kHead:
    return "HeadSignature";
  case SignerRole::kSao:
    return "SaoSignature";
  case SignerRole::kCao:
    return "CaoSignature";
  }
  return "Signature";
}

const char *ReasonText(SignerRole role) noexcept {
  switch (role) {
  case SignerRole::kOwner:
    return "Daily time record owner";
  case SignerRole::kInCharge:
    return "Verified as prescribed by the office in charge";
  case SignerRole::kHead:
    return "Recommended by the head of office";
  case SignerRole::kSao:
    return "Certified by the administrative officer";
  case SignerRole::kCao:
    return "Approved by the chief administrative officer";
  }
  return "";
}

std::string NextFieldName(SignerRole role,
                          const std::vector<std::string> &existing_names,
                          const std::vector<std::string> &unsigned_names) {
  std::set<std::string> used(existing_names.cbegin(), existing_names.cend());
  for (const auto &name : unsigned_names) {
    used.erase(name);
  }
  const std::string prefix = FieldNamePrefix(role);
  unsigned int index = 1;
  while (used.count(prefix + std::to_string(index)) > 0) {
    ++index;
  }
  return prefix + std::to_string(index);
}

} // namespace dtrsign::signer
