#pragma once

#include <optional>
#include <vector>
#include <string>
#include <regex>
#include <shared_mutex>
#include <atomic>
#include <chrono>
#include <deque>

#include "request.hpp"

namespace signhttp
{

/**
 * Request settings for all URLs matching a scope:
 *   - App-Id the requests are sent (and signed) for
 *   - Extra headers
 *   - Request signing material
 */
struct Config
{
    Config() = default;
    Config(std::string const& yamlConf);

    /**
     * Authorization key entry. Either the key material is given inline,
     * or it is read from the system keychain service `keychain` under
     * the account `user`.
     */
    struct AuthorizationKey {
        std::string key;
        std::string keychain;
        std::string user;
    };

    struct PrecomputedSignature {
        std::string signature;
        std::optional<std::string> publicKey;
    };

    struct Signing {
        std::vector<AuthorizationKey> authorizationKeys;
        std::vector<std::string> userJwts;
        std::vector<PrecomputedSignature> signatures;

        bool empty() const;
    };

    std::optional<std::string> scope;
    std::regex urlPattern;
    std::string urlPatternString;

    std::optional<std::string> appId;
    std::optional<Signing> signing;
    Headers headers;

    /**
     * Merge another configuration into this one. The app id of `other`
     * wins, headers are added and signing material is appended.
     */
    Config& operator |= (Config const& other);

    /**
     * Human-readable summary for logging. Key material, JWTs and
     * signatures are masked.
     */
    std::string toSafeString() const;
};

/**
 * Scoped configs read from the YAML file named by REQSIGN_SETTINGS_FILE.
 */
struct Settings
{
    Settings();

    /**
     * (Re-)read the settings file. Parse errors are logged and leave
     * the settings empty.
     */
    void load();

    /**
     * Merge of all configs whose scope matches the URL, in file order.
     */
    Config operator[](const std::string& url) const;

    std::deque<Config> settings;
    mutable std::shared_mutex mutex;
    std::chrono::steady_clock::time_point lastRead;

    /**
     * Make all Settings instances re-read the file on their next
     * lookup, by passing std::chrono::steady_clock::now().
     */
    static void updateTimestamp(std::chrono::steady_clock::time_point time);
    static std::atomic<std::chrono::steady_clock::time_point> lastUpdated;
};

struct secret
{
    /**
     * Read key material from the system keychain. Returns an empty
     * string if the keychain does not answer in time.
     * Throws if reqsign was built without keychain support.
     */
    static std::string load(
        const std::string& service,
        const std::string& user);
};

}
