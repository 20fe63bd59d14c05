/* File: certificate_store.cpp
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


#include "certificate_store.hpp"

#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/x509v3.h>

#include <utility>
#include <vector>

#include "logger_utils.hpp"
#include "openssl_utils.hpp"
#include "sign_error.hpp"

namespace dtrsign::crypto {

namespace {

/// password copy that is cleansed on every exit path
class ScopedPassword {
public:
  explicit ScopedPassword(const std::string &src) : val_(src) {}
  ScopedPassword(const ScopedPassword &) = delete;
  ScopedPassword &operator=(const ScopedPassword &) = delete;
  ScopedPassword(ScopedPassword &&) = delete;
  ScopedPassword &operator=(ScopedPassword &&) = delete;
  ~ScopedPassword() {
    if (!val_.empty()) {
      OPENSSL_cleanse(val_.data(), val_.size());
    }
  }
  [[nodiscard]] const std::string &get() const noexcept { return val_; }

private:
  std::string val_;
};

bool VerifyMac(PKCS12 *p12, const std::string &password) {
  if (PKCS12_mac_present(p12) != 1) {
    return true;
  }
  if (!password.empty()) {
    return PKCS12_verify_mac(p12, password.c_str(),
                             static_cast<int>(password.size())) == 1;
  }
  // an empty password may be encoded both ways
  return PKCS12_verify_mac(p12, nullptr, 0) == 1 ||
         PKCS12_verify_mac(p12, "", 0) == 1;
}

} // namespace

CertificateBundle CertificateStore::Load(const BytesVector &p12_data,
                                         const std::string &password) {
  const std::string func_name = "[CertificateStore::Load] ";
  auto logger = logger::InitLog();
  const ScopedPassword pass(password);
  ERR_clear_error();
  if (p12_data.empty()) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    func_name + "empty PKCS#12 data");
  }
  PtrBio bio = MemBioFromBytes(p12_data.data(), p12_data.size());
  const PtrPkcs12 p12(d2i_PKCS12_bio(bio.get(), nullptr));
  if (!p12) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    func_name + "not a PKCS#12 container " +
                      OpenSslErrorString());
  }
  if (!VerifyMac(p12.get(), pass.get())) {
    ERR_clear_error();
    throw SignError(ErrorKind::kInvalidCredentials,
                    func_name + "MAC verification failed, wrong password");
  }
  EVP_PKEY *raw_key = nullptr;
  X509 *raw_cert = nullptr;
  STACK_OF(X509) *raw_ca = nullptr;
  if (PKCS12_parse(p12.get(), pass.get().c_str(), &raw_key, &raw_cert,
                   &raw_ca) != 1) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    func_name + "PKCS12_parse failed " + OpenSslErrorString());
  }
  PtrEvpPkey key(raw_key);
  PtrX509 cert(raw_cert);
  const PtrX509Stack ca_stack(raw_ca);
  if (!key || !cert) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    func_name + "no private key or no certificate found");
  }
  // X509_check_private_key does not know some algorithms,
  // check the key type first
  const int key_id = EVP_PKEY_base_id(key.get());
  if (key_id != EVP_PKEY_RSA && key_id != EVP_PKEY_RSA_PSS &&
      key_id != EVP_PKEY_EC) {
    throw SignError(ErrorKind::kUnsupportedKeyType,
                    func_name + "unsupported private key algorithm " +
                      std::string(OBJ_nid2sn(key_id)));
  }
  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    throw SignError(ErrorKind::kMalformedCertificate,
                    func_name + "private key does not match the certificate " +
                      OpenSslErrorString());
  }
  std::vector<PtrX509> extras;
  if (ca_stack) {
    const int count = sk_X509_num(ca_stack.get());
    for (int i = 0; i < count; ++i) {
      X509 *ca_cert = sk_X509_value(ca_stack.get(), i);
      // some tools put the leaf into the ca list too
      if (X509_cmp(ca_cert, cert.get()) == 0) {
        continue;
      }
      if (X509_up_ref(ca_cert) == 1) {
        extras.emplace_back(ca_cert);
      }
    }
  }
  auto chain = OrderChain(cert.get(), std::move(extras));
  CertificateBundle res(std::move(key), std::move(cert), std::move(chain));
  if (logger) {
    logger->debug("{}loaded {} key, chain of {} for {}", func_name,
                  KeyTypeToString(res.key_type()), res.ChainSize(),
                  res.leaf_info().subj_common_name);
  }
  return res;
}

void CertificateStore::Validate(const CertificateBundle &bundle,
                                std::optional<std::time_t> now) {
  const std::string func_name = "[CertificateStore::Validate] ";
  const CertCommonInfo &info = bundle.leaf_info();
  const std::time_t time_now = now.value_or(std::time(nullptr));
  if (time_now > info.not_after) {
    throw SignError(ErrorKind::kExpiredCertificate,
                    func_name + "certificate expired at " +
                      TimeTToString(info.not_after));
  }
  if (time_now < info.not_before) {
    throw SignError(ErrorKind::kExpiredCertificate,
                    func_name + "certificate is not valid before " +
                      TimeTToString(info.not_before));
  }
  if (info.HasKeyUsageExtension() &&
      (info.key_usage & KU_DIGITAL_SIGNATURE) == 0) {
    throw SignError(ErrorKind::kKeyUsage,
                    func_name + "key usage does not allow digital signature: " +
                      info.key_usage_bits_str);
  }
}

} // namespace dtrsign::crypto
