// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/ecdsa.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <openssl/bio.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/pem.h>

#include <stdexcept>
#include <vector>

namespace ziacoin {
namespace crypto {

namespace {

constexpr const char *kCurveName = "secp256k1";

[[noreturn]] void throw_openssl_error(const std::string &context) {
  char err_buf[256]{0};
  ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
  throw std::runtime_error(context + ": " + err_buf);
}

using EVP_PKEY_Ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EVP_PKEY_CTX_Ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using BIO_Ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

// nullptr if the bytes are not a point on the curve
EVP_PKEY_Ptr import_public_key(std::vector<uint8_t> &point) {
  EVP_PKEY_CTX_Ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr),
                       &EVP_PKEY_CTX_free);
  if (!ctx) {
    throw_openssl_error("EVP_PKEY_CTX_new_from_name");
  }
  if (EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
    throw_openssl_error("EVP_PKEY_fromdata_init");
  }

  OSSL_PARAM params[3] = {
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                       const_cast<char *>(kCurveName), 0),
      OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(),
                                        point.size()),
      OSSL_PARAM_construct_end()};

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) <= 0) {
    ERR_clear_error();
    return EVP_PKEY_Ptr(nullptr, &EVP_PKEY_free);
  }
  return EVP_PKEY_Ptr(raw, &EVP_PKEY_free);
}

} // namespace

bool VerifySignature(const std::string &pubkey_hex, const std::string &message,
                     const std::string &signature_hex) {
  auto point = util::ParseHex(pubkey_hex);
  auto signature = util::ParseHex(signature_hex);
  if (!point || point->empty() || !signature || signature->empty()) {
    return false;
  }

  EVP_PKEY_Ptr key = import_public_key(*point);
  if (!key) {
    LOG_CRYPTO_DEBUG("Rejecting public key that is not a {} point", kCurveName);
    return false;
  }

  EVP_MD_CTX_Ptr verify_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!verify_ctx) {
    throw_openssl_error("EVP_MD_CTX_new");
  }
  if (EVP_DigestVerifyInit(verify_ctx.get(), nullptr, EVP_sha256(), nullptr,
                           key.get()) <= 0) {
    ERR_clear_error();
    return false;
  }

  const int result = EVP_DigestVerify(
      verify_ctx.get(), signature->data(), signature->size(),
      reinterpret_cast<const unsigned char *>(message.data()), message.size());
  if (result != 1) {
    ERR_clear_error();
  }
  return result == 1;
}

void PrivateKey::PKeyDeleter::operator()(EVP_PKEY *key) const {
  EVP_PKEY_free(key);
}

PrivateKey PrivateKey::Generate() {
  EVP_PKEY_CTX_Ptr keygen_ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr),
                              &EVP_PKEY_CTX_free);
  if (!keygen_ctx) {
    throw_openssl_error("EVP_PKEY_CTX_new_from_name");
  }
  if (EVP_PKEY_keygen_init(keygen_ctx.get()) <= 0) {
    throw_openssl_error("EVP_PKEY_keygen_init");
  }

  OSSL_PARAM params[2] = {
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                       const_cast<char *>(kCurveName), 0),
      OSSL_PARAM_construct_end()};
  if (EVP_PKEY_CTX_set_params(keygen_ctx.get(), params) <= 0) {
    throw_openssl_error("EVP_PKEY_CTX_set_params");
  }

  EVP_PKEY *generated = nullptr;
  if (EVP_PKEY_keygen(keygen_ctx.get(), &generated) <= 0) {
    throw_openssl_error("EVP_PKEY_keygen");
  }
  return PrivateKey(generated);
}

std::optional<PrivateKey> PrivateKey::FromPem(const std::string &pem) {
  BIO_Ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
              &BIO_free);
  if (!bio) {
    throw_openssl_error("BIO_new_mem_buf");
  }
  EVP_PKEY *raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!raw) {
    ERR_clear_error();
    return std::nullopt;
  }
  return PrivateKey(raw);
}

std::string PrivateKey::ToPem() const {
  BIO_Ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio) {
    throw_openssl_error("BIO_new");
  }
  if (PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0,
                               nullptr, nullptr) != 1) {
    throw_openssl_error("PEM_write_bio_PrivateKey");
  }
  char *data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);
  if (len <= 0) {
    throw_openssl_error("BIO_get_mem_data");
  }
  return std::string(data, static_cast<size_t>(len));
}

std::string PrivateKey::GetPublicKeyHex() const {
  unsigned char buf[133];
  size_t len = 0;
  if (EVP_PKEY_get_octet_string_param(key_.get(), OSSL_PKEY_PARAM_PUB_KEY, buf,
                                      sizeof(buf), &len) != 1) {
    throw_openssl_error("EVP_PKEY_get_octet_string_param(pub)");
  }
  return util::HexStr(buf, len);
}

std::string PrivateKey::Sign(const std::string &message) const {
  EVP_MD_CTX_Ptr sign_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!sign_ctx) {
    throw_openssl_error("EVP_MD_CTX_new");
  }
  if (EVP_DigestSignInit(sign_ctx.get(), nullptr, EVP_sha256(), nullptr,
                         key_.get()) <= 0) {
    throw_openssl_error("EVP_DigestSignInit");
  }

  const auto *msg = reinterpret_cast<const unsigned char *>(message.data());
  size_t sig_len = 0;
  if (EVP_DigestSign(sign_ctx.get(), nullptr, &sig_len, msg, message.size()) <=
      0) {
    throw_openssl_error("EVP_DigestSign (length)");
  }
  std::vector<uint8_t> signature(sig_len);
  if (EVP_DigestSign(sign_ctx.get(), signature.data(), &sig_len, msg,
                     message.size()) <= 0) {
    throw_openssl_error("EVP_DigestSign");
  }
  signature.resize(sig_len);
  return util::HexStr(signature);
}

} // namespace crypto
} // namespace ziacoin
