/* File: common_defs.hpp
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
#include <cstdint>
#include <utility>
#include <vector>

constexpr uint64_t kMaxPdfFileSize = 2147483648; //  2GB

#define LIB_API __attribute__((visibility("default")))
#define LIB_LOCAL __attribute__((visibility("hidden")))

namespace dtrsign {

using BytesVector = std::vector<unsigned char>;
// {offset, length} pairs
using RangesVector = std::vector<std::pair<uint64_t, uint64_t>>;

// stable error identifiers, returned to callers with every failure
const char *const kErrInvalidCredentials = "INVALID_CREDENTIALS";
const char *const kErrMalformedCertificate = "MALFORMED_CERTIFICATE";
const char *const kErrUnsupportedKeyType = "UNSUPPORTED_KEY_TYPE";
const char *const kErrExpiredCert = "CERT_EXPIRED";
const char *const kErrKeyUsage = "CERT_KEY_USAGE";
const char *const kErrPlacementOutOfBounds = "PLACEMENT_OUT_OF_BOUNDS";
const char *const kErrGridCapacityExceeded = "GRID_CAPACITY_EXCEEDED";
const char *const kErrSigning = "SIGNING_FAILED";
const char *const kErrReservedSpaceExhausted = "RESERVED_SPACE_EXHAUSTED";
const char *const kErrDocumentStructure = "DOCUMENT_STRUCTURE";
const char *const kErrInvalidParameter = "INVALID_PARAMETER";
const char *const kErrConfig = "CONFIG_INVALID";

} // namespace dtrsign
