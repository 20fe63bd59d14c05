/* File: openssl_utils.cpp
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


#include "openssl_utils.hpp"

#include <openssl/err.h>

#include <array>
#include <climits>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "sign_error.hpp"

namespace dtrsign::crypto {

std::string OpenSslErrorString() {
  std::string res;
  unsigned long err = 0;
  while ((err = ERR_get_error()) != 0) {
    std::array<char, 256> buf{};
    ERR_error_string_n(err, buf.data(), buf.size());
    if (!res.empty()) {
      res += "; ";
    }
    res += buf.data();
  }
  return res;
}

PtrBio MemBioFromBytes(const unsigned char *data, size_t size) {
  if (size > INT_MAX) {
    throw std::runtime_error("[MemBioFromBytes] buffer is too big");
  }
  PtrBio res(BIO_new_mem_buf(data, static_cast<int>(size)));
  if (!res) {
    throw std::runtime_error("[MemBioFromBytes] BIO_new_mem_buf failed");
  }
  return res;
}

std::string BioToString(BIO *bio) {
  if (bio == nullptr) {
    return {};
  }
  char *p_data = nullptr;
  const long size = BIO_get_mem_data(bio, &p_data);
  if (size <= 0 || p_data == nullptr) {
    return {};
  }
  return {p_data, static_cast<size_t>(size)};
}

std::optional<std::time_t> Asn1TimeToTimeT(const ASN1_TIME *asn_time) noexcept {
  if (asn_time == nullptr) {
    return std::nullopt;
  }
  std::tm time_struct{};
  if (ASN1_TIME_to_tm(asn_time, &time_struct) != 1) {
    return std::nullopt;
  }
  return timegm(&time_struct);
}

std::string TimeTToString(std::time_t val) {
  std::tm time_struct{};
  if (gmtime_r(&val, &time_struct) == nullptr) {
    return {};
  }
  std::ostringstream builder;
  builder << std::put_time(&time_struct, "%Y-%m-%d %H:%M:%S") << " UTC";
  return builder.str();
}

const EVP_MD *GetEvpMd(HashAlgorithm algo) {
  switch (algo) {
  case HashAlgorithm::kSha256:
    return EVP_sha256();
  case HashAlgorithm::kSha384:
    return EVP_sha384();
  case HashAlgorithm::kSha512:
    return EVP_sha512();
  }
  throw SignError(ErrorKind::kSigning, "[GetEvpMd] unknown hash algorithm");
}

} // namespace dtrsign::crypto
