/* File: signer_config.hpp
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

#include <boost/json.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace dtrsign {

namespace json = boost::json;

enum class HashAlgorithm { kSha256, kSha384, kSha512 };

/// kAuto picks PKCS#1 v1.5 for RSA keys, PSS for RSA-PSS keys, ECDSA for EC
enum class SignatureScheme { kAuto, kRsaPkcs1v15, kRsaPss, kEcdsa };

/// "whole month" stamp grid, cells are filled row by row from the top
struct GridLayout {
  unsigned int rows_per_page = 31;
  unsigned int cells_per_row = 1;

  [[nodiscard]] unsigned int Capacity() const noexcept {
    return rows_per_page * cells_per_row;
  }
};

/**
 * @brief Immutable signing configuration
 * @details Built once (defaults or LoadConfig), then shared read-only by all
 * signing requests.
 */
struct SignerConfig {
  HashAlgorithm hash_algo = HashAlgorithm::kSha256;
  SignatureScheme scheme = SignatureScheme::kAuto;
  size_t signature_reserved_bytes = 16384;
  double default_scale_factor = 0.9;
  int default_image_quality = 100;
  GridLayout grid;
  unsigned int default_day_count = 31;
  std::string app_name = "dtrsign";

  [[nodiscard]] json::object ToJson() const;
};

[[nodiscard]] const char *HashAlgorithmToString(HashAlgorithm algo) noexcept;
[[nodiscard]] std::optional<HashAlgorithm>
HashAlgorithmFromString(const std::string &val) noexcept;

[[nodiscard]] const char *
SignatureSchemeToString(SignatureScheme scheme) noexcept;
[[nodiscard]] std::optional<SignatureScheme>
SignatureSchemeFromString(const std::string &val) noexcept;

/**
 * @brief Check value ranges
 * @throws SignError(kConfig)
 */
void ValidateConfig(const SignerConfig &config);

/**
 * @brief Build a config from JSON text, missing keys keep the defaults
 * @throws SignError(kConfig) on syntax error or bad values
 */
[[nodiscard]] SignerConfig ParseConfig(const std::string &json_text);

/**
 * @brief Read and parse a JSON config file
 * @throws SignError(kConfig)
 */
[[nodiscard]] SignerConfig LoadConfig(const std::string &path);

} // namespace dtrsign
