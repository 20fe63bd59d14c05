/* File: certificate_bundle.cpp
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


#include "certificate_bundle.hpp"

#include <openssl/evp.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include "sign_error.hpp"

namespace dtrsign::crypto {

const char *KeyTypeToString(KeyType key_type) noexcept {
  switch (key_type) {
  case KeyType::kRsa:
    return "RSA";
  case KeyType::kRsaPss:
    return "RSA-PSS";
  case KeyType::kEc:
    return "EC";
  }
  return "unknown";
}

CertificateBundle::CertificateBundle(PtrEvpPkey key, PtrX509 leaf,
                                     std::vector<PtrX509> intermediates)
    : key_(std::move(key)), leaf_(std::move(leaf)),
      intermediates_(std::move(intermediates)) {
  const std::string func_name = "[CertificateBundle] ";
  if (!key_ || !leaf_) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    func_name + "no private key or no certificate");
  }
  switch (EVP_PKEY_base_id(key_.get())) {
  case EVP_PKEY_RSA:
    key_type_ = KeyType::kRsa;
    break;
  case EVP_PKEY_RSA_PSS:
    key_type_ = KeyType::kRsaPss;
    break;
  case EVP_PKEY_EC:
    key_type_ = KeyType::kEc;
    break;
  default:
    throw SignError(ErrorKind::kUnsupportedKeyType,
                    func_name + "unsupported private key algorithm " +
                      std::to_string(EVP_PKEY_base_id(key_.get())));
  }
  leaf_info_ = CertCommonInfo(leaf_.get());
}

std::vector<PtrX509> OrderChain(const X509 *leaf,
                                std::vector<PtrX509> extras) {
  std::vector<PtrX509> res;
  res.reserve(extras.size());
  const X509 *current = leaf;
  while (current != nullptr && !extras.empty()) {
    // self-signed certificate ends the chain
    if (X509_check_issued(const_cast<X509 *>(current),          // NOLINT
                          const_cast<X509 *>(current)) == X509_V_OK) { // NOLINT
      break;
    }
    auto it_issuer = std::find_if(
      extras.begin(), extras.end(), [current](const PtrX509 &candidate) {
        return X509_check_issued(candidate.get(),
                                 const_cast<X509 *>(current)) == // NOLINT
               X509_V_OK;
      });
    if (it_issuer == extras.end()) {
      break;
    }
    res.push_back(std::move(*it_issuer));
    extras.erase(it_issuer);
    current = res.back().get();
  }
  std::move(extras.begin(), extras.end(), std::back_inserter(res));
  return res;
}

} // namespace dtrsign::crypto
