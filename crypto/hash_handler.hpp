/* File: hash_handler.hpp
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

#include <openssl/evp.h>

#include "common_defs.hpp"
#include "signer_config.hpp"

namespace dtrsign::crypto {

///@throws SignError(kSigning) on construct
///@details owns EVP_MD_CTX
class HashHandler {
public:
  HashHandler() = delete;
  HashHandler(const HashHandler &) = delete;
  HashHandler &operator=(const HashHandler &) = delete;
  explicit HashHandler(HashAlgorithm algo);
  HashHandler(HashHandler &&other) noexcept;
  HashHandler &operator=(HashHandler &&other) noexcept;
  ~HashHandler();

  void SetData(const unsigned char *data, size_t size);
  void SetData(const BytesVector &data);

  /// @brief digest of everything passed so far, the handler stays usable
  [[nodiscard]] BytesVector GetValue() const;

  [[nodiscard]] size_t DigestSize() const noexcept;

private:
  EVP_MD_CTX *ctx_ = nullptr;
  const EVP_MD *md_ = nullptr;
};

} // namespace dtrsign::crypto
