#include "signing-strategy.hpp"
#include "error.hpp"
#include "base64.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <cstring>
#include <vector>

namespace reqsign
{

namespace
{

using Kind = Error::Kind;

std::string opensslError()
{
    auto code = ERR_get_error();
    ERR_clear_error();
    if (code == 0)
        return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

std::string stripKeyPrefix(std::string const& keyMaterial)
{
    static const std::size_t prefixLength = std::strlen(KEY_MATERIAL_PREFIX);
    if (keyMaterial.compare(0, prefixLength, KEY_MATERIAL_PREFIX) == 0)
        return keyMaterial.substr(prefixLength);
    return keyMaterial;
}

std::shared_ptr<EVP_PKEY> parsePrivateKey(std::string const& keyMaterial)
{
    auto der = base64_decode(stripKeyPrefix(keyMaterial));
    if (!der)
        throw Error(Kind::InvalidKeyMaterial, "Key material is not valid base64");

    auto const* p = reinterpret_cast<unsigned char const*>(der->data());
    std::shared_ptr<EVP_PKEY> key(
        d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(der->size())),
        EVP_PKEY_free);
    if (!key)
        throw Error(Kind::InvalidKeyMaterial, "Could not parse private key: " + opensslError());

    if (EVP_PKEY_get_base_id(key.get()) != EVP_PKEY_EC)
        throw Error(Kind::InvalidKeyMaterial, "Private key is not an elliptic-curve key");

    char group[64] = {};
    std::size_t groupLength = 0;
    if (EVP_PKEY_get_group_name(key.get(), group, sizeof(group), &groupLength) != 1 ||
        std::strcmp(group, "prime256v1") != 0)
        throw Error(Kind::InvalidKeyMaterial, "Private key is not on curve P-256");

    return key;
}

}

PrivateKeySigner::PrivateKeySigner(std::string const& keyMaterial)
    : key_(parsePrivateKey(keyMaterial))
{}

SignatureResult PrivateKeySigner::sign(SignablePayload const&, std::string const& message) const
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1)
        throw Error(Kind::SigningFailed, "Could not initialize ECDSA signing: " + opensslError());

    std::size_t sigLength = 0;
    auto const* data = reinterpret_cast<unsigned char const*>(message.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLength, data, message.size()) != 1)
        throw Error(Kind::SigningFailed, "Could not size ECDSA signature: " + opensslError());

    std::vector<unsigned char> signature(sigLength);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLength, data, message.size()) != 1)
        throw Error(Kind::SigningFailed, "ECDSA signing failed: " + opensslError());

    return {base64_encode(signature.data(), sigLength), std::nullopt};
}

}
