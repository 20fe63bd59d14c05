/* File: cert_common_info.cpp
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


#include "cert_common_info.hpp"

#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

#include <array>
#include <string>
#include <utility>

#include "openssl_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::crypto {

namespace {

std::string NameToString(const X509_NAME *name) {
  PtrBio bio(BIO_new(BIO_s_mem()));
  if (!bio || name == nullptr) {
    return {};
  }
  X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB);
  return BioToString(bio.get());
}

std::string CommonName(const X509_NAME *name) {
  if (name == nullptr) {
    return {};
  }
  const int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
  if (index < 0) {
    return {};
  }
  const X509_NAME_ENTRY *entry = X509_NAME_get_entry(name, index);
  const ASN1_STRING *data = X509_NAME_ENTRY_get_data(entry);
  unsigned char *utf8 = nullptr;
  const int len = ASN1_STRING_to_UTF8(&utf8, data);
  if (len < 0 || utf8 == nullptr) {
    return {};
  }
  std::string res(reinterpret_cast<const char *>(utf8), // NOLINT
                  static_cast<size_t>(len));
  OPENSSL_free(utf8);
  return res;
}

std::string KeyUsageToString(uint32_t bits) {
  if (bits == UINT32_MAX) {
    return "any";
  }
  constexpr std::array<std::pair<uint32_t, const char *>, 9> kNames{{
    {KU_DIGITAL_SIGNATURE, "digitalSignature"},
    {KU_NON_REPUDIATION, "nonRepudiation"},
    {KU_KEY_ENCIPHERMENT, "keyEncipherment"},
    {KU_DATA_ENCIPHERMENT, "dataEncipherment"},
    {KU_KEY_AGREEMENT, "keyAgreement"},
    {KU_KEY_CERT_SIGN, "keyCertSign"},
    {KU_CRL_SIGN, "cRLSign"},
    {KU_ENCIPHER_ONLY, "encipherOnly"},
    {KU_DECIPHER_ONLY, "decipherOnly"},
  }};
  std::string res;
  for (const auto &name : kNames) {
    if ((bits & name.first) != 0) {
      if (!res.empty()) {
        res += ",";
      }
      res += name.second;
    }
  }
  return res;
}

std::string ObjToName(const ASN1_OBJECT *obj) {
  if (obj == nullptr) {
    return {};
  }
  const int nid = OBJ_obj2nid(obj);
  if (nid != NID_undef) {
    return OBJ_nid2ln(nid);
  }
  std::array<char, 128> buf{};
  OBJ_obj2txt(buf.data(), static_cast<int>(buf.size()), obj, 1);
  return buf.data();
}

} // namespace

CertCommonInfo::CertCommonInfo(const X509 *cert) {
  if (cert == nullptr) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    "[CertCommonInfo] cert = nullptr");
  }
  // X509_get_key_usage and a few other getters take non-const pointer
  X509 *p_cert = const_cast<X509 *>(cert); // NOLINT
  version = X509_get_version(cert) + 1;
  // serial
  {
    const ASN1_INTEGER *asn_serial = X509_get0_serialNumber(cert);
    BIGNUM *bn_serial = ASN1_INTEGER_to_BN(asn_serial, nullptr);
    if (bn_serial != nullptr) {
      char *hex = BN_bn2hex(bn_serial);
      if (hex != nullptr) {
        serial = hex;
        OPENSSL_free(hex);
      }
      BN_free(bn_serial);
    }
  }
  // signature algorithm
  {
    const X509_ALGOR *alg = nullptr;
    X509_get0_signature(nullptr, &alg, cert);
    if (alg != nullptr) {
      const ASN1_OBJECT *alg_obj = nullptr;
      X509_ALGOR_get0(&alg_obj, nullptr, nullptr, alg);
      sig_algo = ObjToName(alg_obj);
    }
  }
  // public key algorithm
  {
    X509_PUBKEY *pub_key = X509_get_X509_PUBKEY(cert);
    ASN1_OBJECT *key_obj = nullptr;
    if (pub_key != nullptr && X509_PUBKEY_get0_param(&key_obj, nullptr,
                                                     nullptr, nullptr,
                                                     pub_key) == 1) {
      pub_key_algo = ObjToName(key_obj);
    }
  }
  issuer = NameToString(X509_get_issuer_name(cert));
  issuer_common_name = CommonName(X509_get_issuer_name(cert));
  subject = NameToString(X509_get_subject_name(cert));
  subj_common_name = CommonName(X509_get_subject_name(cert));
  // validity
  auto begin = Asn1TimeToTimeT(X509_get0_notBefore(cert));
  auto end = Asn1TimeToTimeT(X509_get0_notAfter(cert));
  if (!begin || !end) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    "[CertCommonInfo] can't decode the validity period");
  }
  not_before = begin.value();
  not_after = end.value();
  // keyUsage
  key_usage = X509_get_key_usage(p_cert);
  key_usage_bits_str = KeyUsageToString(key_usage);
}

json::object CertCommonInfo::ToJson() const noexcept {
  json::object res;
  res["version"] = version;
  res["serial"] = serial;
  res["sig_algo"] = sig_algo;
  res["pub_key_algo"] = pub_key_algo;
  res["issuer"] = issuer;
  res["issuer_common_name"] = issuer_common_name;
  res["subject"] = subject;
  res["subject_common_name"] = subj_common_name;
  res["not_before"] = not_before;
  res["not_before_readable"] = TimeTToString(not_before);
  res["not_after"] = not_after;
  res["not_after_readable"] = TimeTToString(not_after);
  res["key_usage"] = key_usage_bits_str;
  return res;
}

} // namespace dtrsign::crypto
