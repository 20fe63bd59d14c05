/* File: signer_config.cpp
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


#include "signer_config.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

#include "logger_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign {

namespace {

constexpr const char *const kKeyHashAlgo = "hash_algorithm";
constexpr const char *const kKeyScheme = "signature_scheme";
constexpr const char *const kKeyReserved = "signature_reserved_bytes";
constexpr const char *const kKeyScale = "scale_factor";
constexpr const char *const kKeyQuality = "image_quality";
constexpr const char *const kKeyGrid = "grid";
constexpr const char *const kKeyRows = "rows_per_page";
constexpr const char *const kKeyCells = "cells_per_row";
constexpr const char *const kKeyDays = "day_count";
constexpr const char *const kKeyAppName = "app_name";

// the CMS blob of an RSA-4096 signer with a short chain fits easily
constexpr size_t kMinReservedBytes = 2048;
constexpr size_t kMaxReservedBytes = 1024 * 1024;

[[noreturn]] void ThrowConfig(const std::string &msg) {
  throw SignError(ErrorKind::kConfig, "[SignerConfig] " + msg);
}

double GetNumber(const json::value &val, const char *key) {
  if (val.is_int64()) {
    return static_cast<double>(val.as_int64());
  }
  if (val.is_uint64()) {
    return static_cast<double>(val.as_uint64());
  }
  if (val.is_double()) {
    return val.as_double();
  }
  ThrowConfig(std::string(key) + " must be a number");
}

uint64_t GetUnsigned(const json::value &val, const char *key) {
  if (val.is_int64() && val.as_int64() >= 0) {
    return static_cast<uint64_t>(val.as_int64());
  }
  if (val.is_uint64()) {
    return val.as_uint64();
  }
  ThrowConfig(std::string(key) + " must be a non-negative integer");
}

std::string GetString(const json::value &val, const char *key) {
  if (!val.is_string()) {
    ThrowConfig(std::string(key) + " must be a string");
  }
  return val.as_string().c_str();
}

unsigned int ToUInt(uint64_t val, const char *key) {
  if (val > std::numeric_limits<unsigned int>::max()) {
    ThrowConfig(std::string(key) + " is too big");
  }
  return static_cast<unsigned int>(val);
}

} // namespace

const char *HashAlgorithmToString(HashAlgorithm algo) noexcept {
  switch (algo) {
  case HashAlgorithm::kSha256:
    return "sha256";
  case HashAlgorithm::kSha384:
    return "sha384";
  case HashAlgorithm::kSha512:
    return "sha512";
  }
  return "sha256";
}

std::optional<HashAlgorithm>
HashAlgorithmFromString(const std::string &val) noexcept {
  if (val == "sha256") {
    return HashAlgorithm::kSha256;
  }
  if (val == "sha384") {
    return HashAlgorithm::kSha384;
  }
  if (val == "sha512") {
    return HashAlgorithm::kSha512;
  }
  return std::nullopt;
}

const char *SignatureSchemeToString(SignatureScheme scheme) noexcept {
  switch (scheme) {
  case SignatureScheme::kAuto:
    return "auto";
  case SignatureScheme::kRsaPkcs1v15:
    return "pkcs1v15";
  case SignatureScheme::kRsaPss:
    return "pss";
  case SignatureScheme::kEcdsa:
    return "ecdsa";
  }
  return "auto";
}

std::optional<SignatureScheme>
SignatureSchemeFromString(const std::string &val) noexcept {
  if (val == "auto") {
    return SignatureScheme::kAuto;
  }
  if (val == "pkcs1v15") {
    return SignatureScheme::kRsaPkcs1v15;
  }
  if (val == "pss") {
    return SignatureScheme::kRsaPss;
  }
  if (val == "ecdsa") {
    return SignatureScheme::kEcdsa;
  }
  return std::nullopt;
}

json::object SignerConfig::ToJson() const {
  json::object res;
  res[kKeyHashAlgo] = HashAlgorithmToString(hash_algo);
  res[kKeyScheme] = SignatureSchemeToString(scheme);
  res[kKeyReserved] = signature_reserved_bytes;
  res[kKeyScale] = default_scale_factor;
  res[kKeyQuality] = default_image_quality;
  json::object grid_obj;
  grid_obj[kKeyRows] = grid.rows_per_page;
  grid_obj[kKeyCells] = grid.cells_per_row;
  res[kKeyGrid] = std::move(grid_obj);
  res[kKeyDays] = default_day_count;
  res[kKeyAppName] = app_name;
  return res;
}

void ValidateConfig(const SignerConfig &config) {
  if (config.signature_reserved_bytes < kMinReservedBytes ||
      config.signature_reserved_bytes > kMaxReservedBytes) {
    ThrowConfig("signature_reserved_bytes is out of range");
  }
  if (!(config.default_scale_factor > 0) || config.default_scale_factor > 1) {
    ThrowConfig("scale_factor must be in (0,1]");
  }
  if (config.default_image_quality < 0 || config.default_image_quality > 100) {
    ThrowConfig("image_quality must be in [0,100]");
  }
  if (config.grid.rows_per_page == 0 || config.grid.cells_per_row == 0) {
    ThrowConfig("grid dimensions must be positive");
  }
  if (config.default_day_count == 0) {
    ThrowConfig("day_count must be positive");
  }
}

SignerConfig ParseConfig(const std::string &json_text) {
  boost::system::error_code err;
  const json::value root = json::parse(json_text, err);
  if (err) {
    ThrowConfig("parse error: " + err.message());
  }
  if (!root.is_object()) {
    ThrowConfig("root is not an object");
  }
  const json::object &obj = root.as_object();
  SignerConfig res;
  if (const auto *val = obj.if_contains(kKeyHashAlgo)) {
    const std::string str = GetString(*val, kKeyHashAlgo);
    auto algo = HashAlgorithmFromString(str);
    if (!algo) {
      ThrowConfig("unknown hash algorithm " + str);
    }
    res.hash_algo = *algo;
  }
  if (const auto *val = obj.if_contains(kKeyScheme)) {
    const std::string str = GetString(*val, kKeyScheme);
    auto scheme = SignatureSchemeFromString(str);
    if (!scheme) {
      ThrowConfig("unknown signature scheme " + str);
    }
    res.scheme = *scheme;
  }
  if (const auto *val = obj.if_contains(kKeyReserved)) {
    res.signature_reserved_bytes =
      static_cast<size_t>(GetUnsigned(*val, kKeyReserved));
  }
  if (const auto *val = obj.if_contains(kKeyScale)) {
    res.default_scale_factor = GetNumber(*val, kKeyScale);
  }
  if (const auto *val = obj.if_contains(kKeyQuality)) {
    res.default_image_quality =
      static_cast<int>(ToUInt(GetUnsigned(*val, kKeyQuality), kKeyQuality));
  }
  if (const auto *val = obj.if_contains(kKeyGrid)) {
    if (!val->is_object()) {
      ThrowConfig("grid must be an object");
    }
    const json::object &grid = val->as_object();
    if (const auto *rows = grid.if_contains(kKeyRows)) {
      res.grid.rows_per_page = ToUInt(GetUnsigned(*rows, kKeyRows), kKeyRows);
    }
    if (const auto *cells = grid.if_contains(kKeyCells)) {
      res.grid.cells_per_row =
        ToUInt(GetUnsigned(*cells, kKeyCells), kKeyCells);
    }
  }
  if (const auto *val = obj.if_contains(kKeyDays)) {
    res.default_day_count = ToUInt(GetUnsigned(*val, kKeyDays), kKeyDays);
  }
  if (const auto *val = obj.if_contains(kKeyAppName)) {
    res.app_name = GetString(*val, kKeyAppName);
  }
  ValidateConfig(res);
  return res;
}

SignerConfig LoadConfig(const std::string &path) {
  namespace fs = std::filesystem;
  std::error_code err;
  if (path.empty() || !fs::is_regular_file(path, err)) {
    ThrowConfig("config file not found " + path);
  }
  std::ifstream file(path);
  if (!file.is_open()) {
    ThrowConfig("can't open config file " + path);
  }
  std::ostringstream buf;
  buf << file.rdbuf();
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[LoadConfig] {}", path);
  }
  return ParseConfig(buf.str());
}

} // namespace dtrsign
