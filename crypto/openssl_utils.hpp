/* File: openssl_utils.hpp
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

#include <openssl/bio.h>
#include <openssl/cms.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

#include <ctime>
#include <memory>
#include <optional>
#include <string>

#include "common_defs.hpp"
#include "signer_config.hpp"

namespace dtrsign::crypto {

template <typename T, void (*FreeFunc)(T *)> struct OsslDeleter {
  void operator()(T *ptr) const noexcept { FreeFunc(ptr); }
};

struct X509StackDeleter {
  void operator()(STACK_OF(X509) * ptr) const noexcept {
    sk_X509_pop_free(ptr, X509_free);
  }
};

using PtrBio = std::unique_ptr<BIO, OsslDeleter<BIO, BIO_free_all>>;
using PtrX509 = std::unique_ptr<X509, OsslDeleter<X509, X509_free>>;
using PtrEvpPkey = std::unique_ptr<EVP_PKEY, OsslDeleter<EVP_PKEY, EVP_PKEY_free>>;
using PtrPkcs12 = std::unique_ptr<PKCS12, OsslDeleter<PKCS12, PKCS12_free>>;
using PtrCms = std::unique_ptr<CMS_ContentInfo,
                               OsslDeleter<CMS_ContentInfo, CMS_ContentInfo_free>>;
using PtrAsn1Time =
  std::unique_ptr<ASN1_TIME, OsslDeleter<ASN1_TIME, ASN1_TIME_free>>;
using PtrX509Stack = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

/**
 * @brief Drain the OpenSSL error queue to a single string
 * @return std::string "err1; err2" or empty string
 */
std::string OpenSslErrorString();

/// @brief read-only memory BIO over the buffer
/// @throws std::runtime_error
PtrBio MemBioFromBytes(const unsigned char *data, size_t size);

/// @brief copy the whole BIO content to string
std::string BioToString(BIO *bio);

/**
 * @brief Convert ASN1_TIME to time_t (UTC)
 * @return empty optional if conversion fails
 */
std::optional<std::time_t> Asn1TimeToTimeT(const ASN1_TIME *asn_time) noexcept;

/// @brief "2024-10-15 12:30:37 UTC"
std::string TimeTToString(std::time_t val);

/// @throws SignError(kSigning) on unknown algorithm
const EVP_MD *GetEvpMd(HashAlgorithm algo);

} // namespace dtrsign::crypto
