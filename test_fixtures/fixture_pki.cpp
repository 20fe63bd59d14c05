/* File: fixture_pki.cpp
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


#include "fixture_pki.hpp"

#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <memory>
#include <stdexcept>
#include <vector>

namespace dtrsign::test {

namespace {

using PtrKey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PtrCert = std::unique_ptr<X509, decltype(&X509_free)>;

using PtrKeyCtx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

/// EVP_PKEY_Q_keygen takes the bits argument for "RSA" only
EVP_PKEY *GenerateRsaPss(unsigned int bits) {
  const PtrKeyCtx ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA-PSS", nullptr),
                      EVP_PKEY_CTX_free);
  EVP_PKEY *res = nullptr;
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(bits)) <=
        0 ||
      EVP_PKEY_generate(ctx.get(), &res) <= 0) {
    return nullptr;
  }
  return res;
}

PtrKey GenerateKey(FixtureKey key_type) {
  EVP_PKEY *res = nullptr;
  switch (key_type) {
  case FixtureKey::kRsa:
    res = EVP_RSA_gen(2048);
    break;
  case FixtureKey::kRsaPss:
    res = GenerateRsaPss(2048);
    break;
  case FixtureKey::kEc:
    res = EVP_EC_gen("P-256");
    break;
  case FixtureKey::kEd25519:
    res = EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519");
    break;
  }
  if (res == nullptr) {
    throw std::runtime_error("[GenerateKey] key generation failed");
  }
  return {res, EVP_PKEY_free};
}

void AddExt(X509 *cert, X509 *issuer, int nid, const char *value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
  X509_EXTENSION *ext =
    X509V3_EXT_conf_nid(nullptr, &ctx, nid, const_cast<char *>(value)); // NOLINT
  if (ext == nullptr) {
    throw std::runtime_error("[AddExt] X509V3_EXT_conf_nid failed");
  }
  X509_add_ext(cert, ext, -1);
  X509_EXTENSION_free(ext);
}

PtrCert MakeCert(EVP_PKEY *subject_key, const std::string &common_name,
                 long serial, long from_sec, long to_sec, X509 *issuer,
                 EVP_PKEY *issuer_key, bool is_ca, const char *key_usage) {
  PtrCert cert(X509_new(), X509_free);
  if (!cert) {
    throw std::runtime_error("[MakeCert] X509_new failed");
  }
  X509_set_version(cert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial);
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), from_sec);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), to_sec);
  X509_set_pubkey(cert.get(), subject_key);
  X509_NAME *name = X509_get_subject_name(cert.get());
  X509_NAME_add_entry_by_txt(name, "C", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char *>("PH"), // NOLINT
                             -1, -1, 0);
  X509_NAME_add_entry_by_txt(
    name, "CN", MBSTRING_UTF8,
    reinterpret_cast<const unsigned char *>(common_name.c_str()), // NOLINT
    -1, -1, 0);
  X509 *real_issuer = issuer != nullptr ? issuer : cert.get();
  X509_set_issuer_name(cert.get(), X509_get_subject_name(real_issuer));
  if (is_ca) {
    AddExt(cert.get(), real_issuer, NID_basic_constraints, "critical,CA:TRUE");
  }
  if (key_usage != nullptr) {
    AddExt(cert.get(), real_issuer, NID_key_usage, key_usage);
  }
  EVP_PKEY *sign_key = issuer_key != nullptr ? issuer_key : subject_key;
  const EVP_MD *p_md =
    EVP_PKEY_base_id(sign_key) == EVP_PKEY_ED25519 ? nullptr : EVP_sha256();
  if (X509_sign(cert.get(), sign_key, p_md) == 0) {
    throw std::runtime_error("[MakeCert] X509_sign failed");
  }
  return cert;
}

} // namespace

BytesVector MakePkcs12(const PkiOptions &opts) {
  const long kDay = 24L * 3600;
  std::vector<PtrKey> ca_keys;
  std::vector<PtrCert> ca_certs;
  for (int i = 0; i < opts.ca_levels; ++i) {
    ca_keys.push_back(GenerateKey(FixtureKey::kRsa));
    X509 *parent = i == 0 ? nullptr : ca_certs.back().get();
    EVP_PKEY *parent_key = i == 0 ? nullptr : ca_keys[i - 1].get();
    ca_certs.push_back(MakeCert(ca_keys.back().get(),
                                "Test CA " + std::to_string(i), 100 + i,
                                -10 * kDay, 3650 * kDay, parent, parent_key,
                                true, "critical,keyCertSign,cRLSign"));
  }
  PtrKey leaf_key = GenerateKey(opts.key);
  const char *key_usage = nullptr;
  if (opts.key_usage_ext) {
    key_usage = opts.digital_signature ? "critical,digitalSignature,nonRepudiation"
                                       : "critical,keyEncipherment";
  }
  PtrCert leaf = MakeCert(
    leaf_key.get(), opts.common_name, 1, opts.valid_from_sec, opts.valid_to_sec,
    ca_certs.empty() ? nullptr : ca_certs.back().get(),
    ca_keys.empty() ? nullptr : ca_keys.back().get(), false, key_usage);

  STACK_OF(X509) *ca_stack = sk_X509_new_null();
  if (ca_stack == nullptr) {
    throw std::runtime_error("[MakePkcs12] sk_X509_new_null failed");
  }
  for (size_t i = 0; i < ca_certs.size(); ++i) {
    const size_t index = opts.ca_reversed ? i : ca_certs.size() - 1 - i;
    sk_X509_push(ca_stack, ca_certs[index].get());
  }
  PKCS12 *p12 = PKCS12_create(opts.password.c_str(), "signer", leaf_key.get(),
                              leaf.get(), ca_stack, 0, 0, 0, 0, 0);
  // the stack does not own the certificates
  sk_X509_free(ca_stack);
  if (p12 == nullptr) {
    throw std::runtime_error("[MakePkcs12] PKCS12_create failed");
  }
  const int der_size = i2d_PKCS12(p12, nullptr);
  BytesVector res(der_size > 0 ? static_cast<size_t>(der_size) : 0, 0x00);
  unsigned char *p_out = res.data();
  const int written = i2d_PKCS12(p12, &p_out);
  PKCS12_free(p12);
  if (der_size <= 0 || written != der_size) {
    throw std::runtime_error("[MakePkcs12] i2d_PKCS12 failed");
  }
  return res;
}

} // namespace dtrsign::test
