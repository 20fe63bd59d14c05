/* File: certificate_bundle.hpp
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

#include <vector>

#include "cert_common_info.hpp"
#include "openssl_utils.hpp"

namespace dtrsign::crypto {

enum class KeyType { kRsa, kRsaPss, kEc };

const char *KeyTypeToString(KeyType key_type) noexcept;

/**
 * @brief Private key and certificate chain taken from a PKCS#12 container
 * @details Move-only. The key is released by EVP_PKEY_free on destruction,
 * which clears the private components.
 */
class CertificateBundle {
public:
  /**
   * @brief Construct a new Certificate Bundle
   * @param key private key
   * @param leaf signer certificate
   * @param intermediates ordered from the leaf issuer upwards
   * @throws SignError(kMalformedCertificate) on empty key or leaf
   * @throws SignError(kUnsupportedKeyType)
   */
  CertificateBundle(PtrEvpPkey key, PtrX509 leaf,
                    std::vector<PtrX509> intermediates);
  CertificateBundle(const CertificateBundle &) = delete;
  CertificateBundle &operator=(const CertificateBundle &) = delete;
  CertificateBundle(CertificateBundle &&) noexcept = default;
  CertificateBundle &operator=(CertificateBundle &&) noexcept = default;
  ~CertificateBundle() = default;

  [[nodiscard]] EVP_PKEY *key() const noexcept { return key_.get(); }
  [[nodiscard]] X509 *leaf() const noexcept { return leaf_.get(); }
  [[nodiscard]] const std::vector<PtrX509> &intermediates() const noexcept {
    return intermediates_;
  }
  /// @brief leaf + intermediates
  [[nodiscard]] size_t ChainSize() const noexcept {
    return intermediates_.size() + 1;
  }
  [[nodiscard]] KeyType key_type() const noexcept { return key_type_; }
  [[nodiscard]] const CertCommonInfo &leaf_info() const noexcept {
    return leaf_info_;
  }

private:
  PtrEvpPkey key_;
  PtrX509 leaf_;
  std::vector<PtrX509> intermediates_;
  KeyType key_type_ = KeyType::kRsa;
  CertCommonInfo leaf_info_;
};

/**
 * @brief Sort certificates so that each one is followed by its issuer
 * @param leaf start of the chain
 * @param extras unordered certificates, certificates unrelated to the
 * chain are appended at the end
 */
std::vector<PtrX509> OrderChain(const X509 *leaf, std::vector<PtrX509> extras);

} // namespace dtrsign::crypto
