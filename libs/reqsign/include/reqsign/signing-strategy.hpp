#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "signable-payload.hpp"

// Avoid pulling the OpenSSL headers into every client.
typedef struct evp_pkey_st EVP_PKEY;

namespace reqsign
{

/** Label prefix which upstream credential formats put before key material. */
constexpr char const* KEY_MATERIAL_PREFIX = "wallet-auth:";

struct SignatureResult
{
    std::string signature;
    std::optional<std::string> signerPublicKey;
};

/**
 * Caller-supplied signing function, e.g. a remote KMS/HSM call.
 * Arguments: method, url, parsed body, app id.
 */
using CustomSignFunction = std::function<SignatureResult(
    std::string const& /* method */,
    std::string const& /* url */,
    nlohmann::json const& /* body */,
    std::string const& /* appId */)>;

/**
 * Signs with a static P-256 authorization key: ECDSA over SHA-256 of
 * the canonical payload, DER signature, base64 encoded.
 */
class PrivateKeySigner
{
public:
    /**
     * Parse key material: optional KEY_MATERIAL_PREFIX, then base64 of a
     * DER encoded (PKCS#8 or SEC1) P-256 private key.
     * Throws reqsign::Error (InvalidKeyMaterial).
     */
    explicit PrivateKeySigner(std::string const& keyMaterial);

    /**
     * No public key is returned; it is not derived on this path.
     */
    SignatureResult sign(SignablePayload const& payload, std::string const& canonical) const;

private:
    std::shared_ptr<EVP_PKEY> key_;
};

/**
 * Delegates signing to a CustomSignFunction and validates its result.
 */
class CustomFunctionSigner
{
public:
    explicit CustomFunctionSigner(CustomSignFunction fun);

    SignatureResult sign(SignablePayload const& payload, std::string const& canonical) const;

private:
    CustomSignFunction fun_;
};

/**
 * A signature computed out of band; returned unchanged for any payload.
 */
class PrecomputedSignature
{
public:
    explicit PrecomputedSignature(std::string signature,
                                  std::optional<std::string> signerPublicKey = {});

    SignatureResult sign(SignablePayload const& payload, std::string const& canonical) const;

private:
    SignatureResult result_;
};

/**
 * Signing through a user credential (JWT) that would first have to be
 * exchanged for a short-lived signing key. The exchange is not
 * available, so sign() always fails with NotImplemented.
 */
class DeferredCredentialSigner
{
public:
    explicit DeferredCredentialSigner(std::string token);

    SignatureResult sign(SignablePayload const& payload, std::string const& canonical) const;

private:
    std::string token_;
};

using SigningStrategy = std::variant<
    PrivateKeySigner,
    CustomFunctionSigner,
    PrecomputedSignature,
    DeferredCredentialSigner>;

/**
 * Dispatch sign() to the active strategy. `canonical` must be
 * payload.canonicalize().
 */
SignatureResult sign(SigningStrategy const& strategy,
                     SignablePayload const& payload,
                     std::string const& canonical);

/**
 * Name of the active strategy kind, for logging.
 */
char const* strategyName(SigningStrategy const& strategy);

}
