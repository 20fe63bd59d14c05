/* File: hash_handler.cpp
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


#include "hash_handler.hpp"

#include <openssl/evp.h>

#include <string>

#include "openssl_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::crypto {

HashHandler::HashHandler(HashAlgorithm algo)
    : ctx_(EVP_MD_CTX_new()), md_(GetEvpMd(algo)) {
  if (ctx_ == nullptr) {
    throw SignError(ErrorKind::kSigning,
                    "[HashHandler] EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw SignError(ErrorKind::kSigning, "[HashHandler] EVP_DigestInit_ex " +
                                           OpenSslErrorString());
  }
}

void HashHandler::SetData(const unsigned char *data, size_t size) {
  if (ctx_ == nullptr) {
    throw SignError(ErrorKind::kSigning, "[HashHandler] moved-from handler");
  }
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw SignError(ErrorKind::kSigning, "[HashHandler] EVP_DigestUpdate " +
                                           OpenSslErrorString());
  }
}

void HashHandler::SetData(const BytesVector &data) {
  SetData(data.data(), data.size());
}

BytesVector HashHandler::GetValue() const {
  if (ctx_ == nullptr) {
    throw SignError(ErrorKind::kSigning, "[HashHandler] moved-from handler");
  }
  EVP_MD_CTX *tmp_ctx = EVP_MD_CTX_new();
  if (tmp_ctx == nullptr) {
    throw SignError(ErrorKind::kSigning, "[HashHandler] EVP_MD_CTX_new failed");
  }
  BytesVector res(EVP_MAX_MD_SIZE, 0x00);
  unsigned int res_size = 0;
  const bool success = EVP_MD_CTX_copy_ex(tmp_ctx, ctx_) == 1 &&
                       EVP_DigestFinal_ex(tmp_ctx, res.data(), &res_size) == 1;
  EVP_MD_CTX_free(tmp_ctx);
  if (!success || res_size == 0) {
    throw SignError(ErrorKind::kSigning, "[HashHandler] digest final failed " +
                                           OpenSslErrorString());
  }
  res.resize(res_size);
  return res;
}

size_t HashHandler::DigestSize() const noexcept {
  return static_cast<size_t>(EVP_MD_size(md_));
}

HashHandler::~HashHandler() {
  if (ctx_ != nullptr) {
    EVP_MD_CTX_free(ctx_);
  }
}

HashHandler::HashHandler(HashHandler &&other) noexcept
    : ctx_(other.ctx_), md_(other.md_) {
  other.ctx_ = nullptr;
}

HashHandler &HashHandler::operator=(HashHandler &&other) noexcept {
  if (this == &other) {
    return *this;
  }
  if (ctx_ != nullptr) {
    EVP_MD_CTX_free(ctx_);
  }
  ctx_ = other.ctx_;
  md_ = other.md_;
  other.ctx_ = nullptr;
  return *this;
}

} // namespace dtrsign::crypto
