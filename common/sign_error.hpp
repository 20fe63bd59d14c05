/* File: sign_error.hpp
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
#include <stdexcept>
#include <string>

namespace dtrsign {

enum class ErrorKind {
  kInvalidCredentials,
  kMalformedCertificate,
  kUnsupportedKeyType,
  kExpiredCertificate,
  kKeyUsage,
  kPlacementOutOfBounds,
  kGridCapacityExceeded,
  kSigning,
  kReservedSpaceExhausted,
  kDocumentStructure,
  kInvalidParameter,
  kConfig
};

/// @brief stable string identifier of the error kind
[[nodiscard]] const char *ErrorKindToString(ErrorKind kind) noexcept;

/// @brief reverse of ErrorKindToString
[[nodiscard]] std::optional<ErrorKind>
ErrorKindFromString(const std::string &val) noexcept;

/**
 * @brief Every stage of the signing pipeline reports failures with this
 * exception
 * @details what() returns the human readable message, kind() - the category
 * a caller can map to a response
 */
class SignError : public std::runtime_error {
public:
  SignError(ErrorKind kind, const std::string &msg);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const char *code() const noexcept {
    return ErrorKindToString(kind_);
  }

private:
  ErrorKind kind_;
};

} // namespace dtrsign
