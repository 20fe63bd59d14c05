/* File: sign_error.cpp
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


#include "sign_error.hpp"
#include "common_defs.hpp"
#include <array>
#include <utility>

namespace dtrsign {

namespace {

constexpr std::array<std::pair<ErrorKind, const char *>, 12> kErrorCodes{{
  {ErrorKind::kInvalidCredentials, kErrInvalidCredentials},
  {ErrorKind::kMalformedCertificate, kErrMalformedCertificate},
  {ErrorKind::kUnsupportedKeyType, kErrUnsupportedKeyType},
  {ErrorKind::kExpiredCertificate, kErrExpiredCert},
  {ErrorKind::kKeyUsage, kErrKeyUsage},
  {ErrorKind::kPlacementOutOfBounds, kErrPlacementOutOfBounds},
  {ErrorKind::kGridCapacityExceeded, kErrGridCapacityExceeded},
  {ErrorKind::kSigning, kErrSigning},
  {ErrorKind::kReservedSpaceExhausted, kErrReservedSpaceExhausted},
  {ErrorKind::kDocumentStructure, kErrDocumentStructure},
  {ErrorKind::kInvalidParameter, kErrInvalidParameter},
  {ErrorKind::kConfig, kErrConfig},
}};

} // namespace

const char *ErrorKindToString(ErrorKind kind) noexcept {
  for (const auto &code : kErrorCodes) {
    if (code.first == kind) {
      return code.second;
    }
  }
  return "UNKNOWN";
}

std::optional<ErrorKind> ErrorKindFromString(const std::string &val) noexcept {
  for (const auto &code : kErrorCodes) {
    if (val == code.second) {
      return code.first;
    }
  }
  return std::nullopt;
}

SignError::SignError(ErrorKind kind, const std::string &msg)
    : std::runtime_error(msg), kind_(kind) {}

} // namespace dtrsign
