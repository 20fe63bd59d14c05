/* File: test_signature_engine.cpp
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


#include <openssl/cms.h>
#include <openssl/objects.h>
#include <openssl/x509.h>

#include <catch2/catch.hpp>
#include <ctime>
#include <optional>
#include <string>

#include "certificate_store.hpp"
#include "fixture_pki.hpp"
#include "hash_handler.hpp"
#include "openssl_utils.hpp"
#include "sign_error.hpp"
#include "signature_engine.hpp"

using namespace dtrsign;
using namespace dtrsign::crypto;
using dtrsign::test::FixtureKey;
using dtrsign::test::MakePkcs12;
using dtrsign::test::PkiOptions;

namespace {

BytesVector SampleData() {
  BytesVector res;
  for (int i = 0; i < 1000; ++i) {
    res.push_back(static_cast<unsigned char>(i % 251));
  }
  return res;
}

CertificateBundle LoadBundle(FixtureKey key, int ca_levels = 1) {
  PkiOptions opts;
  opts.key = key;
  opts.ca_levels = ca_levels;
  return CertificateStore::Load(MakePkcs12(opts), opts.password);
}

BytesVector Concat(const BytesVector &data, const RangesVector &ranges) {
  BytesVector res;
  for (const auto &range : ranges) {
    res.insert(res.end(), data.cbegin() + range.first,
               data.cbegin() + range.first + range.second);
  }
  return res;
}

std::optional<ErrorKind> DigestErrorKind(const BytesVector &data,
                                         const RangesVector &ranges) {
  try {
    [[maybe_unused]] auto hash = SignatureEngine().Digest(data, ranges);
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

std::optional<ErrorKind> SignErrorKind(const SignatureEngine &engine,
                                       const BytesVector &hash,
                                       const CertificateBundle &bundle) {
  try {
    [[maybe_unused]] auto sig = engine.Sign(hash, bundle, std::time(nullptr));
  } catch (const SignError &ex) {
    return ex.kind();
  }
  return std::nullopt;
}

PtrCms ParseCms(const BytesVector &sig) {
  const unsigned char *p_sig = sig.data();
  return PtrCms(
    d2i_CMS_ContentInfo(nullptr, &p_sig, static_cast<long>(sig.size())));
}

CMS_SignerInfo *FirstSigner(CMS_ContentInfo *cms) {
  STACK_OF(CMS_SignerInfo) *infos = CMS_get0_SignerInfos(cms);
  REQUIRE(infos != nullptr);
  REQUIRE(sk_CMS_SignerInfo_num(infos) == 1);
  return sk_CMS_SignerInfo_value(infos, 0);
}

int SignatureAlgNid(CMS_SignerInfo *signer_info) {
  X509_ALGOR *p_sig_alg = nullptr;
  CMS_SignerInfo_get0_algs(signer_info, nullptr, nullptr, nullptr, &p_sig_alg);
  REQUIRE(p_sig_alg != nullptr);
  const ASN1_OBJECT *obj = nullptr;
  X509_ALGOR_get0(&obj, nullptr, nullptr, p_sig_alg);
  return OBJ_obj2nid(obj);
}

} // namespace

TEST_CASE("Digest") {
  const BytesVector data = SampleData();
  const RangesVector ranges{{0, 100}, {300, 700}};

  SECTION("Matches the hash of concatenated ranges") {
    const SignatureEngine engine;
    const BytesVector hash = engine.Digest(data, ranges);
    REQUIRE(hash.size() == 32);
    REQUIRE(hash.size() == engine.DigestSize());
    HashHandler handler(HashAlgorithm::kSha256);
    handler.SetData(Concat(data, ranges));
    REQUIRE(hash == handler.GetValue());
    REQUIRE(engine.Digest(data, ranges) == hash);
  }
  SECTION("Excluded bytes do not matter") {
    BytesVector changed = data;
    changed[150] ^= 0xFF;
    const SignatureEngine engine;
    REQUIRE(engine.Digest(changed, ranges) == engine.Digest(data, ranges));
    changed[50] ^= 0xFF;
    REQUIRE(engine.Digest(changed, ranges) != engine.Digest(data, ranges));
  }
  SECTION("Other algorithms") {
    REQUIRE(SignatureEngine(HashAlgorithm::kSha384).Digest(data, ranges).size() ==
            48);
    REQUIRE(SignatureEngine(HashAlgorithm::kSha512).Digest(data, ranges).size() ==
            64);
  }
  SECTION("Bad ranges") {
    REQUIRE(DigestErrorKind(data, {}) == ErrorKind::kSigning);
    REQUIRE(DigestErrorKind(data, {{0, 100}, {50, 10}}) == ErrorKind::kSigning);
    REQUIRE(DigestErrorKind(data, {{300, 10}, {0, 10}}) == ErrorKind::kSigning);
    REQUIRE(DigestErrorKind(data, {{0, 100}, {900, 101}}) ==
            ErrorKind::kSigning);
    REQUIRE(DigestErrorKind(data, {{UINT64_MAX, 2}}) == ErrorKind::kSigning);
    REQUIRE_FALSE(DigestErrorKind(data, {{0, 100}, {100, 900}}).has_value());
  }
}

TEST_CASE("SignAndVerify") {
  const BytesVector data = SampleData();
  const RangesVector ranges{{0, 400}, {600, 400}};
  const BytesVector signed_data = Concat(data, ranges);
  const std::time_t signing_time = std::time(nullptr);

  SECTION("RSA PKCS#1 v1.5") {
    auto bundle = LoadBundle(FixtureKey::kRsa);
    const SignatureEngine engine;
    const BytesVector sig =
      engine.Sign(engine.Digest(data, ranges), bundle, signing_time);
    REQUIRE_FALSE(sig.empty());
    REQUIRE(SignatureEngine::VerifyDetached(sig, signed_data));
    auto cms = ParseCms(sig);
    REQUIRE(cms);
    REQUIRE(OBJ_obj2nid(CMS_get0_type(cms.get())) == NID_pkcs7_signed);
    REQUIRE(CMS_get0_content(cms.get()) == nullptr);
    REQUIRE(SignatureAlgNid(FirstSigner(cms.get())) == NID_rsaEncryption);
  }
  SECTION("RSA PSS") {
    auto bundle = LoadBundle(FixtureKey::kRsa);
    const SignatureEngine engine(HashAlgorithm::kSha256,
                                 SignatureScheme::kRsaPss);
    const BytesVector sig =
      engine.Sign(engine.Digest(data, ranges), bundle, signing_time);
    REQUIRE(SignatureEngine::VerifyDetached(sig, signed_data));
    auto cms = ParseCms(sig);
    REQUIRE(cms);
    REQUIRE(SignatureAlgNid(FirstSigner(cms.get())) == NID_rsassaPss);
  }
  SECTION("RSA-PSS key") {
    auto bundle = LoadBundle(FixtureKey::kRsaPss);
    const SignatureEngine engine;
    const BytesVector sig =
      engine.Sign(engine.Digest(data, ranges), bundle, signing_time);
    REQUIRE(SignatureEngine::VerifyDetached(sig, signed_data));
  }
  SECTION("ECDSA with SHA-384") {
    auto bundle = LoadBundle(FixtureKey::kEc);
    const SignatureEngine engine(HashAlgorithm::kSha384);
    const BytesVector sig =
      engine.Sign(engine.Digest(data, ranges), bundle, signing_time);
    REQUIRE(SignatureEngine::VerifyDetached(sig, signed_data));
  }
  SECTION("Tampered data fails verification") {
    auto bundle = LoadBundle(FixtureKey::kRsa);
    const SignatureEngine engine;
    const BytesVector sig =
      engine.Sign(engine.Digest(data, ranges), bundle, signing_time);
    BytesVector tampered = signed_data;
    tampered[10] ^= 0x01;
    REQUIRE_FALSE(SignatureEngine::VerifyDetached(sig, tampered));
    REQUIRE_FALSE(SignatureEngine::VerifyDetached({}, signed_data));
    REQUIRE_FALSE(
      SignatureEngine::VerifyDetached(BytesVector(64, 0x30), signed_data));
  }
}

TEST_CASE("SignerInfo algorithm") {
  const BytesVector data = SampleData();
  const RangesVector ranges{{0, data.size()}};
  const std::time_t signing_time = std::time(nullptr);
  auto algorithm_of = [&](FixtureKey key, const SignatureEngine &engine) {
    auto bundle = LoadBundle(key);
    const BytesVector sig =
      engine.Sign(engine.Digest(data, ranges), bundle, signing_time);
    auto cms = ParseCms(sig);
    REQUIRE(cms);
    // the parsed structure encodes back to the same bytes
    REQUIRE(i2d_CMS_ContentInfo(cms.get(), nullptr) ==
            static_cast<int>(sig.size()));
    return SignatureAlgNid(FirstSigner(cms.get()));
  };

  SECTION("PKCS#1 v1.5") {
    REQUIRE(algorithm_of(FixtureKey::kRsa,
                         SignatureEngine(HashAlgorithm::kSha256,
                                         SignatureScheme::kRsaPkcs1v15)) ==
            NID_rsaEncryption);
  }
  SECTION("PSS with an RSA key") {
    REQUIRE(algorithm_of(FixtureKey::kRsa,
                         SignatureEngine(HashAlgorithm::kSha512,
                                         SignatureScheme::kRsaPss)) ==
            NID_rsassaPss);
  }
  SECTION("RSA-PSS key") {
    REQUIRE(algorithm_of(FixtureKey::kRsaPss, SignatureEngine()) ==
            NID_rsassaPss);
  }
  SECTION("ECDSA") {
    REQUIRE(algorithm_of(FixtureKey::kEc,
                         SignatureEngine(HashAlgorithm::kSha384)) ==
            NID_ecdsa_with_SHA384);
  }
}

TEST_CASE("SignedAttributes") {
  auto bundle = LoadBundle(FixtureKey::kRsa, 2);
  const SignatureEngine engine;
  const BytesVector data = SampleData();
  const BytesVector hash = engine.Digest(data, {{0, data.size()}});
  const std::time_t signing_time = 1700000000;
  const BytesVector sig = engine.Sign(hash, bundle, signing_time);
  auto cms = ParseCms(sig);
  REQUIRE(cms);
  CMS_SignerInfo *signer_info = FirstSigner(cms.get());

  SECTION("Message digest") {
    const auto *digest = static_cast<ASN1_OCTET_STRING *>(
      CMS_signed_get0_data_by_OBJ(signer_info,
                                  OBJ_nid2obj(NID_pkcs9_messageDigest), -3,
                                  V_ASN1_OCTET_STRING));
    REQUIRE(digest != nullptr);
    const BytesVector value(
      ASN1_STRING_get0_data(digest),
      ASN1_STRING_get0_data(digest) + ASN1_STRING_length(digest));
    REQUIRE(value == hash);
  }
  SECTION("Signing time") {
    REQUIRE(CMS_signed_get_attr_by_NID(signer_info, NID_pkcs9_signingTime,
                                       -1) >= 0);
    const auto *p_time = static_cast<ASN1_TIME *>(CMS_signed_get0_data_by_OBJ(
      signer_info, OBJ_nid2obj(NID_pkcs9_signingTime), -3, V_ASN1_UTCTIME));
    REQUIRE(p_time != nullptr);
    REQUIRE(Asn1TimeToTimeT(p_time) == signing_time);
  }
  SECTION("Content type") {
    REQUIRE(CMS_signed_get_attr_by_NID(signer_info, NID_pkcs9_contentType,
                                       -1) >= 0);
  }
  SECTION("Whole chain is embedded") {
    PtrX509Stack certs(CMS_get1_certs(cms.get()));
    REQUIRE(certs);
    REQUIRE(sk_X509_num(certs.get()) == 3);
  }
}

TEST_CASE("SignErrors") {
  const BytesVector data = SampleData();
  SECTION("Hash size mismatch") {
    auto bundle = LoadBundle(FixtureKey::kRsa);
    const SignatureEngine engine;
    REQUIRE(SignErrorKind(engine, BytesVector(20, 0x01), bundle) ==
            ErrorKind::kSigning);
    REQUIRE(SignErrorKind(engine, {}, bundle) == ErrorKind::kSigning);
    const BytesVector sha512 =
      SignatureEngine(HashAlgorithm::kSha512).Digest(data, {{0, 10}});
    REQUIRE(SignErrorKind(engine, sha512, bundle) == ErrorKind::kSigning);
  }
  SECTION("Scheme does not fit the key") {
    auto rsa = LoadBundle(FixtureKey::kRsa);
    auto ec = LoadBundle(FixtureKey::kEc);
    auto rsa_pss = LoadBundle(FixtureKey::kRsaPss);
    const SignatureEngine ecdsa(HashAlgorithm::kSha256, SignatureScheme::kEcdsa);
    const SignatureEngine pss(HashAlgorithm::kSha256, SignatureScheme::kRsaPss);
    const SignatureEngine pkcs1(HashAlgorithm::kSha256,
                                SignatureScheme::kRsaPkcs1v15);
    const BytesVector hash = ecdsa.Digest(data, {{0, 10}});
    REQUIRE(SignErrorKind(ecdsa, hash, rsa) == ErrorKind::kSigning);
    REQUIRE(SignErrorKind(pss, hash, ec) == ErrorKind::kSigning);
    REQUIRE(SignErrorKind(pkcs1, hash, ec) == ErrorKind::kSigning);
    REQUIRE(SignErrorKind(pkcs1, hash, rsa_pss) == ErrorKind::kSigning);
    REQUIRE_FALSE(SignErrorKind(ecdsa, hash, ec).has_value());
    REQUIRE_FALSE(SignErrorKind(pkcs1, hash, rsa).has_value());
  }
}
