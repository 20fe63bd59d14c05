/* File: certificate_store.hpp
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

#include <ctime>
#include <optional>
#include <string>

#include "certificate_bundle.hpp"
#include "common_defs.hpp"

namespace dtrsign::crypto {

/**
 * @brief Loads PKCS#12 containers and checks the signer certificate
 * @details Works in memory only, nothing is written to disk.
 */
class CertificateStore {
public:
  /**
   * @brief Parse the PKCS#12 container
   * @param p12_data raw DER bytes
   * @param password container password, may be empty
   * @return CertificateBundle
   * @throws SignError kMalformedCertificate - not a PKCS#12 container,
   * no key or certificate inside, key does not match the certificate
   * @throws SignError kInvalidCredentials - wrong password
   * @throws SignError kUnsupportedKeyType - not RSA/EC key
   */
  [[nodiscard]] static CertificateBundle Load(const BytesVector &p12_data,
                                              const std::string &password);

  /**
   * @brief Check that the signer certificate can be used now
   * @param bundle
   * @param now time to use as "now", current time if empty
   * @throws SignError kExpiredCertificate - now is out of validity period
   * @throws SignError kKeyUsage - keyUsage present without digitalSignature
   */
  static void Validate(const CertificateBundle &bundle,
                       std::optional<std::time_t> now = std::nullopt);
};

} // namespace dtrsign::crypto
