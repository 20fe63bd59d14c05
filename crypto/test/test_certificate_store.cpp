/* File: test_certificate_store.cpp
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


#include <openssl/evp.h>
#include <openssl/x509.h>

#include <ctime>
#include <optional>
#include <string>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "certificate_store.hpp"
#include "fixture_pki.hpp"
#include "sign_error.hpp"

using namespace dtrsign;
using namespace dtrsign::crypto;
using dtrsign::test::FixtureKey;
using dtrsign::test::MakePkcs12;
using dtrsign::test::PkiOptions;

namespace {

std::optional<ErrorKind> LoadErrorKind(const BytesVector &data,
                                       const std::string &pass) {
  try {
    [[maybe_unused]] auto bundle = CertificateStore::Load(data, pass);
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

std::optional<ErrorKind> ValidateErrorKind(const CertificateBundle &bundle,
                                           std::optional<std::time_t> now) {
  try {
    CertificateStore::Validate(bundle, now);
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

} // namespace

TEST_CASE("LoadPkcs12") {
  PkiOptions opts;
  const BytesVector p12 = MakePkcs12(opts);

  SECTION("Valid container") {
    const CertificateBundle bundle = CertificateStore::Load(p12, opts.password);
    REQUIRE(bundle.key() != nullptr);
    REQUIRE(bundle.leaf() != nullptr);
    REQUIRE(bundle.key_type() == KeyType::kRsa);
    REQUIRE(bundle.ChainSize() == 2);
    REQUIRE(bundle.leaf_info().subj_common_name == opts.common_name);
    REQUIRE(bundle.leaf_info().issuer_common_name == "Test CA 0");
    REQUIRE_NOTHROW(CertificateStore::Validate(bundle));
  }
  SECTION("Wrong password") {
    REQUIRE(LoadErrorKind(p12, "wrong") == ErrorKind::kInvalidCredentials);
    REQUIRE(LoadErrorKind(p12, "") == ErrorKind::kInvalidCredentials);
  }
  SECTION("Garbage") {
    REQUIRE(LoadErrorKind({}, "secret") == ErrorKind::kMalformedCertificate);
    REQUIRE(LoadErrorKind(BytesVector(100, 0x30), "secret") ==
            ErrorKind::kMalformedCertificate);
    BytesVector truncated(p12.cbegin(), p12.cbegin() + 40);
    REQUIRE(LoadErrorKind(truncated, "secret") ==
            ErrorKind::kMalformedCertificate);
  }
  SECTION("Empty password") {
    opts.password.clear();
    const BytesVector no_pass = MakePkcs12(opts);
    const CertificateBundle bundle = CertificateStore::Load(no_pass, "");
    REQUIRE(bundle.key() != nullptr);
  }
  SECTION("Moved bundle keeps the key") {
    CertificateBundle bundle = CertificateStore::Load(p12, opts.password);
    EVP_PKEY *key = bundle.key();
    const CertificateBundle moved(std::move(bundle));
    REQUIRE(moved.key() == key);
  }
}

TEST_CASE("KeyTypes") {
  PkiOptions opts;
  SECTION("EC") {
    opts.key = FixtureKey::kEc;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(bundle.key_type() == KeyType::kEc);
  }
  SECTION("RSA-PSS") {
    opts.key = FixtureKey::kRsaPss;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(bundle.key_type() == KeyType::kRsaPss);
    REQUIRE(EVP_PKEY_get_bits(bundle.key()) == 2048);
    REQUIRE(EVP_PKEY_is_a(bundle.key(), "RSA-PSS") == 1);
  }
  SECTION("Ed25519 is not supported") {
    opts.key = FixtureKey::kEd25519;
    REQUIRE(LoadErrorKind(MakePkcs12(opts), opts.password) ==
            ErrorKind::kUnsupportedKeyType);
  }
}

TEST_CASE("ChainOrder") {
  PkiOptions opts;
  opts.ca_levels = 2;
  SECTION("Natural order") {
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(bundle.ChainSize() == 3);
    REQUIRE(CertCommonInfo(bundle.intermediates()[0].get()).subj_common_name ==
            "Test CA 1");
    REQUIRE(CertCommonInfo(bundle.intermediates()[1].get()).subj_common_name ==
            "Test CA 0");
  }
  SECTION("Root first in the container") {
    opts.ca_reversed = true;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(bundle.ChainSize() == 3);
    REQUIRE(CertCommonInfo(bundle.intermediates()[0].get()).subj_common_name ==
            "Test CA 1");
    REQUIRE(CertCommonInfo(bundle.intermediates()[1].get()).subj_common_name ==
            "Test CA 0");
  }
  SECTION("Self-signed") {
    opts.ca_levels = 0;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(bundle.ChainSize() == 1);
    REQUIRE(bundle.intermediates().empty());
  }
}

TEST_CASE("ValidateCertificate") {
  PkiOptions opts;
  const long kDay = 24L * 3600;
  SECTION("Validity window") {
    opts.valid_from_sec = -10 * kDay;
    opts.valid_to_sec = 10 * kDay;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    const std::time_t now = std::time(nullptr);
    REQUIRE_FALSE(ValidateErrorKind(bundle, now).has_value());
    REQUIRE_FALSE(
      ValidateErrorKind(bundle, bundle.leaf_info().not_after).has_value());
    REQUIRE(ValidateErrorKind(bundle, bundle.leaf_info().not_after + 1) ==
            ErrorKind::kExpiredCertificate);
    REQUIRE(ValidateErrorKind(bundle, now + 20 * kDay) ==
            ErrorKind::kExpiredCertificate);
    REQUIRE(ValidateErrorKind(bundle, now - 20 * kDay) ==
            ErrorKind::kExpiredCertificate);
  }
  SECTION("Expired") {
    opts.valid_from_sec = -10 * kDay;
    opts.valid_to_sec = -1 * kDay;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(ValidateErrorKind(bundle, std::nullopt) ==
            ErrorKind::kExpiredCertificate);
  }
  SECTION("Key usage without digitalSignature") {
    opts.digital_signature = false;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE(ValidateErrorKind(bundle, std::nullopt) == ErrorKind::kKeyUsage);
  }
  SECTION("No key usage extension") {
    opts.key_usage_ext = false;
    auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
    REQUIRE_FALSE(bundle.leaf_info().HasKeyUsageExtension());
    REQUIRE_FALSE(ValidateErrorKind(bundle, std::nullopt).has_value());
  }
}

TEST_CASE("CertCommonInfoJson") {
  PkiOptions opts;
  auto bundle = CertificateStore::Load(MakePkcs12(opts), opts.password);
  const auto js = bundle.leaf_info().ToJson();
  REQUIRE(js.at("subject_common_name").as_string() == opts.common_name.c_str());
  REQUIRE(js.at("key_usage").as_string() == "digitalSignature,nonRepudiation");
  REQUIRE(js.at("serial").as_string() == "01");
  REQUIRE(js.at("pub_key_algo").as_string() == "rsaEncryption");
}
