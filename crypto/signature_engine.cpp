/* File: signature_engine.cpp
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


#include "signature_engine.hpp"

#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <chrono>
#include <climits>
#include <limits>
#include <memory>
#include <string>

#include "hash_handler.hpp"
#include "logger_utils.hpp"
#include "openssl_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::crypto {

namespace {

enum class Padding { kPkcs1, kPss, kNone };

/// pick the padding for the key, throw if the requested scheme does not fit
Padding ResolvePadding(SignatureScheme scheme, KeyType key_type) {
  const std::string func_name = "[SignatureEngine::Sign] ";
  switch (key_type) {
  case KeyType::kRsa:
    if (scheme == SignatureScheme::kEcdsa) {
      break;
    }
    return scheme == SignatureScheme::kRsaPss ? Padding::kPss : Padding::kPkcs1;
  case KeyType::kRsaPss:
    if (scheme == SignatureScheme::kAuto || scheme == SignatureScheme::kRsaPss) {
      return Padding::kPss;
    }
    break;
  case KeyType::kEc:
    if (scheme == SignatureScheme::kAuto || scheme == SignatureScheme::kEcdsa) {
      return Padding::kNone;
    }
    break;
  }
  throw SignError(ErrorKind::kSigning,
                  func_name + "signature scheme " +
                    SignatureSchemeToString(scheme) + " can't be used with " +
                    KeyTypeToString(key_type) + " key");
}

[[noreturn]] void ThrowSigning(const std::string &msg) {
  throw SignError(ErrorKind::kSigning,
                  "[SignatureEngine::Sign] " + msg + " " + OpenSslErrorString());
}

using PtrPssParams =
  std::unique_ptr<RSA_PSS_PARAMS, OsslDeleter<RSA_PSS_PARAMS, RSA_PSS_PARAMS_free>>;
using PtrAlgor =
  std::unique_ptr<X509_ALGOR, OsslDeleter<X509_ALGOR, X509_ALGOR_free>>;

/// RSASSA-PSS AlgorithmIdentifier, MGF1 over the same digest, salt length is
/// the digest size
void SetPssAlgorithm(X509_ALGOR *sig_alg, const EVP_MD *p_md) {
  const PtrPssParams params(RSA_PSS_PARAMS_new());
  const PtrAlgor mgf1_md(X509_ALGOR_new());
  if (!params || !mgf1_md) {
    ThrowSigning("can't allocate PSS parameters");
  }
  params->hashAlgorithm = X509_ALGOR_new();
  params->maskGenAlgorithm = X509_ALGOR_new();
  params->saltLength = ASN1_INTEGER_new();
  if (params->hashAlgorithm == nullptr || params->maskGenAlgorithm == nullptr ||
      params->saltLength == nullptr) {
    ThrowSigning("can't allocate PSS parameters");
  }
  X509_ALGOR_set_md(params->hashAlgorithm, p_md);
  X509_ALGOR_set_md(mgf1_md.get(), p_md);
  ASN1_STRING *mgf1_param = nullptr;
  if (ASN1_item_pack(mgf1_md.get(), ASN1_ITEM_rptr(X509_ALGOR), &mgf1_param) ==
        nullptr ||
      X509_ALGOR_set0(params->maskGenAlgorithm, OBJ_nid2obj(NID_mgf1),
                      V_ASN1_SEQUENCE, mgf1_param) != 1) {
    ASN1_STRING_free(mgf1_param);
    ThrowSigning("can't encode MGF1 parameters");
  }
  if (ASN1_INTEGER_set(params->saltLength, EVP_MD_size(p_md)) != 1) {
    ThrowSigning("can't set PSS salt length");
  }
  ASN1_STRING *encoded = nullptr;
  if (ASN1_item_pack(params.get(), ASN1_ITEM_rptr(RSA_PSS_PARAMS), &encoded) ==
        nullptr ||
      X509_ALGOR_set0(sig_alg, OBJ_nid2obj(NID_rsassaPss), V_ASN1_SEQUENCE,
                      encoded) != 1) {
    ASN1_STRING_free(encoded);
    ThrowSigning("can't encode PSS parameters");
  }
}

/// PSS needs the key parameters set before signing, OpenSSL 3 leaves the
/// signatureAlgorithm of such a SignerInfo unset
void EnsurePssAlgorithm(CMS_SignerInfo *signer_info, const EVP_MD *p_md) {
  X509_ALGOR *sig_alg = nullptr;
  CMS_SignerInfo_get0_algs(signer_info, nullptr, nullptr, nullptr, &sig_alg);
  if (sig_alg == nullptr) {
    ThrowSigning("no signature algorithm");
  }
  const ASN1_OBJECT *alg_obj = nullptr;
  X509_ALGOR_get0(&alg_obj, nullptr, nullptr, sig_alg);
  const int nid = alg_obj == nullptr ? NID_undef : OBJ_obj2nid(alg_obj);
  if (nid == NID_undef) {
    SetPssAlgorithm(sig_alg, p_md);
    return;
  }
  if (nid != NID_rsassaPss) {
    ThrowSigning(std::string("signature algorithm ") + OBJ_nid2sn(nid) +
                 " is not RSASSA-PSS");
  }
}

} // namespace

SignatureEngine::SignatureEngine(HashAlgorithm hash_algo,
                                 SignatureScheme scheme)
    : hash_algo_(hash_algo), scheme_(scheme) {}

size_t SignatureEngine::DigestSize() const {
  return static_cast<size_t>(EVP_MD_size(GetEvpMd(hash_algo_)));
}

BytesVector SignatureEngine::Digest(const BytesVector &data,
                                    const RangesVector &ranges) const {
  const std::string func_name = "[SignatureEngine::Digest] ";
  if (ranges.empty()) {
    throw SignError(ErrorKind::kSigning, func_name + "no byte ranges");
  }
  uint64_t prev_end = 0;
  for (const auto &range : ranges) {
    if (range.first < prev_end) {
      throw SignError(ErrorKind::kSigning,
                      func_name + "byte ranges overlap or are not sorted");
    }
    if (range.second > std::numeric_limits<uint64_t>::max() - range.first ||
        range.first + range.second > data.size()) {
      throw SignError(ErrorKind::kSigning,
                      func_name + "byte range is out of the document");
    }
    prev_end = range.first + range.second;
  }
  HashHandler hash(hash_algo_);
  for (const auto &range : ranges) {
    hash.SetData(data.data() + range.first, range.second); // NOLINT
  }
  return hash.GetValue();
}

BytesVector SignatureEngine::Sign(const BytesVector &hash,
                                  const CertificateBundle &bundle,
                                  std::time_t signing_time) const {
  auto logger = logger::InitLog();
  const auto start = std::chrono::steady_clock::now();
  const EVP_MD *p_md = GetEvpMd(hash_algo_);
  if (hash.size() != static_cast<size_t>(EVP_MD_size(p_md)) ||
      hash.size() > INT_MAX) {
    throw SignError(ErrorKind::kSigning,
                    "[SignatureEngine::Sign] hash size " +
                      std::to_string(hash.size()) + " does not match " +
                      HashAlgorithmToString(hash_algo_));
  }
  const Padding padding = ResolvePadding(scheme_, bundle.key_type());
  ERR_clear_error();
  constexpr unsigned int kCmsFlags = CMS_BINARY | CMS_DETACHED | CMS_PARTIAL;
  const PtrCms cms(CMS_sign(nullptr, nullptr, nullptr, nullptr, kCmsFlags));
  if (!cms) {
    ThrowSigning("CMS_sign failed");
  }
  // CMS_CADES adds ESS signing-certificate-v2
  unsigned int signer_flags = kCmsFlags | CMS_NOSMIMECAP | CMS_CADES;
  if (padding == Padding::kPss) {
    signer_flags |= CMS_KEY_PARAM;
  }
  CMS_SignerInfo *signer_info = CMS_add1_signer(
    cms.get(), bundle.leaf(), bundle.key(), p_md, signer_flags);
  if (signer_info == nullptr) {
    ThrowSigning("CMS_add1_signer failed");
  }
  if (padding == Padding::kPss) {
    EVP_PKEY_CTX *pkey_ctx = CMS_SignerInfo_get0_pkey_ctx(signer_info);
    if (pkey_ctx == nullptr) {
      ThrowSigning("no key context");
    }
    if (EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pkey_ctx, RSA_PSS_SALTLEN_DIGEST) <=
          0) {
      ThrowSigning("can't set PSS padding");
    }
  }
  // signed attributes
  {
    const PtrAsn1Time asn_time(ASN1_TIME_set(nullptr, signing_time));
    if (!asn_time ||
        CMS_signed_add1_attr_by_NID(signer_info, NID_pkcs9_signingTime,
                                    asn_time->type, asn_time.get(), -1) != 1) {
      ThrowSigning("can't add signingTime");
    }
  }
  if (CMS_signed_add1_attr_by_NID(signer_info, NID_pkcs9_contentType,
                                  V_ASN1_OBJECT, OBJ_nid2obj(NID_pkcs7_data),
                                  -1) != 1) {
    ThrowSigning("can't add contentType");
  }
  if (CMS_signed_add1_attr_by_NID(signer_info, NID_pkcs9_messageDigest,
                                  V_ASN1_OCTET_STRING, hash.data(),
                                  static_cast<int>(hash.size())) != 1) {
    ThrowSigning("can't add messageDigest");
  }
  if (CMS_SignerInfo_sign(signer_info) != 1) {
    ThrowSigning("CMS_SignerInfo_sign failed");
  }
  if (padding == Padding::kPss) {
    EnsurePssAlgorithm(signer_info, p_md);
  }
  for (const auto &ca_cert : bundle.intermediates()) {
    if (CMS_add1_cert(cms.get(), ca_cert.get()) != 1) {
      ThrowSigning("CMS_add1_cert failed");
    }
  }
  const int der_size = i2d_CMS_ContentInfo(cms.get(), nullptr);
  if (der_size <= 0) {
    ThrowSigning("i2d_CMS_ContentInfo failed");
  }
  BytesVector res(static_cast<size_t>(der_size), 0x00);
  unsigned char *p_out = res.data();
  if (i2d_CMS_ContentInfo(cms.get(), &p_out) != der_size) {
    ThrowSigning("i2d_CMS_ContentInfo failed");
  }
  if (logger) {
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    logger->debug("[SignatureEngine::Sign] {} bytes, {} ms", res.size(),
                  duration.count());
  }
  return res;
}

bool SignatureEngine::VerifyDetached(const BytesVector &signature,
                                     const BytesVector &signed_data) {
  if (signature.empty()) {
    return false;
  }
  const unsigned char *p_sig = signature.data();
  const PtrCms cms(
    d2i_CMS_ContentInfo(nullptr, &p_sig, static_cast<long>(signature.size())));
  if (!cms) {
    ERR_clear_error();
    return false;
  }
  PtrBio data_bio = MemBioFromBytes(signed_data.data(), signed_data.size());
  const bool res = CMS_verify(cms.get(), nullptr, nullptr, data_bio.get(),
                              nullptr,
                              CMS_BINARY | CMS_NO_SIGNER_CERT_VERIFY) == 1;
  if (!res) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->debug("[SignatureEngine::VerifyDetached] {}",
                    OpenSslErrorString());
    }
  }
  ERR_clear_error();
  return res;
}

} // namespace dtrsign::crypto
