/* File: cert_common_info.hpp
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

#include <openssl/x509.h>

#include <boost/json.hpp>
#include <boost/json/object.hpp>
#include <cstdint>
#include <ctime>
#include <string>

namespace dtrsign::crypto {

namespace json = boost::json;

/**
 * @brief A structure with common certificate info
 * @throws SignError(kMalformedCertificate) on construct
 */
struct CertCommonInfo {
  long version = 0;
  std::string serial; // hex
  std::string sig_algo;
  std::string issuer;
  std::string issuer_common_name;
  std::string subject;
  std::string subj_common_name;
  time_t not_before = 0;
  time_t not_after = 0;
  std::string pub_key_algo;
  // X509_get_key_usage bits, UINT32_MAX if there is no keyUsage extension
  uint32_t key_usage = UINT32_MAX;
  std::string key_usage_bits_str;

  CertCommonInfo() = default;
  explicit CertCommonInfo(const X509 *cert);

  [[nodiscard]] bool HasKeyUsageExtension() const noexcept {
    return key_usage != UINT32_MAX;
  }

  /// @brief true if the "now" lays inside [not_before,not_after]
  [[nodiscard]] bool IsTimeValid(time_t now) const noexcept {
    return now >= not_before && now <= not_after;
  }

  [[nodiscard]] json::object ToJson() const noexcept;
};

} // namespace dtrsign::crypto
