#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/ec.h>
#include <openssl/x509.h>

#include "../../src/base64.hpp"

namespace reqsign::test
{

using KeyPtr = std::shared_ptr<EVP_PKEY>;

/**
 * Fresh P-256 key pair.
 */
inline KeyPtr generateKey(char const* curve = "P-256")
{
    KeyPtr key(EVP_EC_gen(curve), EVP_PKEY_free);
    if (!key)
        throw std::runtime_error("EVP_EC_gen failed");
    return key;
}

/**
 * Base64 of the PKCS#8 DER encoding of the private key.
 */
inline std::string pkcs8Base64(KeyPtr const& key)
{
    std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)> info(
        EVP_PKEY2PKCS8(key.get()), PKCS8_PRIV_KEY_INFO_free);
    if (!info)
        throw std::runtime_error("EVP_PKEY2PKCS8 failed");

    unsigned char* der = nullptr;
    auto len = i2d_PKCS8_PRIV_KEY_INFO(info.get(), &der);
    if (len <= 0)
        throw std::runtime_error("i2d_PKCS8_PRIV_KEY_INFO failed");
    auto result = reqsign::base64_encode(der, static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return result;
}

/**
 * Base64 of the SEC1 (type-specific) DER encoding of the private key.
 */
inline std::string sec1Base64(KeyPtr const& key)
{
    unsigned char* der = nullptr;
    auto len = i2d_PrivateKey(key.get(), &der);
    if (len <= 0)
        throw std::runtime_error("i2d_PrivateKey failed");
    auto result = reqsign::base64_encode(der, static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return result;
}

/**
 * Verify a base64 DER ECDSA-SHA256 signature over a message.
 */
inline bool verify(KeyPtr const& key, std::string const& message, std::string const& signatureBase64)
{
    auto signature = reqsign::base64_decode(signatureBase64);
    if (!signature)
        return false;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1)
        return false;

    return EVP_DigestVerify(
        ctx.get(),
        reinterpret_cast<unsigned char const*>(signature->data()), signature->size(),
        reinterpret_cast<unsigned char const*>(message.data()), message.size()) == 1;
}

}
