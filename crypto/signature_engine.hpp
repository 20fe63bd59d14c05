/* File: signature_engine.hpp
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

#include "certificate_bundle.hpp"
#include "common_defs.hpp"
#include "signer_config.hpp"

namespace dtrsign::crypto {

/**
 * @brief Digest calculation and CMS (CAdES-BES) signature creation
 * @details Stateless apart from the algorithm choice, one instance may be
 * shared by concurrent requests.
 */
class SignatureEngine {
public:
  explicit SignatureEngine(HashAlgorithm hash_algo = HashAlgorithm::kSha256,
                           SignatureScheme scheme = SignatureScheme::kAuto);

  /**
   * @brief Hash the concatenation of byte ranges
   * @param data whole document
   * @param ranges {offset,length} pairs, ascending and non-overlapping
   * @return BytesVector hash value
   * @throws SignError(kSigning) if ranges are out of bounds or unordered
   */
  [[nodiscard]] BytesVector Digest(const BytesVector &data,
                                   const RangesVector &ranges) const;

  /**
   * @brief Create a detached CMS SignedData over a precomputed hash
   * @param hash value returned by Digest
   * @param bundle signer key and chain
   * @param signing_time value of the signingTime attribute
   * @return BytesVector DER encoded ContentInfo
   * @throws SignError(kSigning) on hash size mismatch, a scheme that does not
   * fit the key, or OpenSSL failure
   */
  [[nodiscard]] BytesVector Sign(const BytesVector &hash,
                                 const CertificateBundle &bundle,
                                 std::time_t signing_time) const;

  /**
   * @brief Check a detached signature against the signed data
   * @details checks the messageDigest and the signature value, does not build
   * a trust chain
   */
  [[nodiscard]] static bool VerifyDetached(const BytesVector &signature,
                                           const BytesVector &signed_data);

  [[nodiscard]] HashAlgorithm hash_algo() const noexcept { return hash_algo_; }
  [[nodiscard]] size_t DigestSize() const;

private:
  HashAlgorithm hash_algo_;
  SignatureScheme scheme_;
};

} // namespace dtrsign::crypto
