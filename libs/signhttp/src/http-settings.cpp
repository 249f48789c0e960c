#include "http-settings.hpp"
#include "log.hpp"

#ifdef REQSIGN_KEYCHAIN_SUPPORT
#include <keychain/keychain.h>
#endif
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstring>
#include <future>
#include <sstream>
#include <filesystem>

using namespace signhttp;

namespace YAML
{

template <>
struct convert<Config::AuthorizationKey>
{
    /* Accepts `<material>`, `{key: <material>}` or `{keychain: <service>, user: <account>}`. */
    static bool decode(const Node& node, Config::AuthorizationKey& k)
    {
        if (node.IsScalar()) {
            k.key = node.as<std::string>();
            return true;
        }
        if (!node.IsMap())
            return false;

        if (auto key = node["key"]) {
            k.key = key.as<std::string>();
            return true;
        }

        auto service = node["keychain"];
        auto account = node["user"];
        if (!service || !account)
            return false;

        k.keychain = service.as<std::string>();
        k.user = account.as<std::string>();
        return true;
    }
};

template <>
struct convert<Config::PrecomputedSignature>
{
    /* Accepts `<signature>` or `{signature: ..., public-key: ...}`. */
    static bool decode(const Node& node, Config::PrecomputedSignature& s)
    {
        if (node.IsScalar()) {
            s.signature = node.as<std::string>();
            return true;
        }
        if (!node.IsMap() || !node["signature"])
            return false;

        s.signature = node["signature"].as<std::string>();
        if (auto publicKey = node["public-key"])
            s.publicKey = publicKey.as<std::string>();
        return true;
    }
};

}

namespace
{

/**
 * Turn a URL glob (`https://*.example.com/v1`) into a prefix regex.
 */
std::string scopeToRegex(std::string const& scope)
{
    static const std::string special = ".^$|()[]{}?+\\";

    std::string pattern = "^";
    for (char c : scope) {
        if (c == '*')
            pattern += ".*";
        else {
            if (special.find(c) != std::string::npos)
                pattern += '\\';
            pattern += c;
        }
    }
    return pattern + ".*$";
}

Config::Signing signingFromNode(YAML::Node const& node)
{
    Config::Signing signing;
    if (auto keys = node["authorization-keys"])
        signing.authorizationKeys = keys.as<std::vector<Config::AuthorizationKey>>();
    if (auto jwts = node["user-jwts"])
        signing.userJwts = jwts.as<std::vector<std::string>>();
    if (auto signatures = node["signatures"])
        signing.signatures = signatures.as<std::vector<Config::PrecomputedSignature>>();
    return signing;
}

Config configFromNode(YAML::Node const& node)
{
    Config conf;

    if (auto url = node["url"])
        conf.urlPatternString = url.as<std::string>();
    else {
        conf.scope = node["scope"] ? node["scope"].as<std::string>() : std::string("*");
        conf.urlPatternString = scopeToRegex(*conf.scope);
    }
    conf.urlPattern = std::regex(conf.urlPatternString);

    if (auto appId = node["app-id"])
        conf.appId = appId.as<std::string>();

    if (auto headers = node["headers"]) {
        for (auto const& entry : headers)
            conf.headers.emplace(entry.first.as<std::string>(), entry.second.as<std::string>());
    }

    if (auto signing = node["signing"])
        conf.signing = signingFromNode(signing);

    return conf;
}

/**
 * Parse a settings document: either a list of scopes at the root, or
 * a map whose `http-settings` entry holds that list.
 */
std::deque<Config> readSettingsFile(std::string const& path)
{
    auto document = YAML::LoadFile(path);
    auto scopes = document.IsMap() ? document["http-settings"] : document;

    std::deque<Config> result;
    if (!scopes.IsDefined() || scopes.IsNull()) {
        log().debug("No settings found in '{}'.", path);
        return result;
    }
    if (!scopes.IsSequence())
        throw std::runtime_error("Expected a list of settings scopes");

    for (auto const& scope : scopes)
        result.push_back(configFromNode(scope));
    return result;
}

std::string mask(std::string const& value)
{
    return value.empty() ? "[MISSING]" : fmt::format("[PRESENT] (length: {})", value.size());
}

}

Config::Config(const std::string& yamlConf)
    : Config(configFromNode(YAML::Load(yamlConf)))
{}

bool Config::Signing::empty() const
{
    return authorizationKeys.empty() && userJwts.empty() && signatures.empty();
}

Config& Config::operator |= (Config const& other)
{
    if (other.appId)
        appId = other.appId;
    headers.insert(other.headers.begin(), other.headers.end());

    if (!other.signing)
        return *this;
    if (!signing)
        signing = Signing{};

    auto append = [](auto& into, auto const& from) {
        into.insert(into.end(), from.begin(), from.end());
    };
    append(signing->authorizationKeys, other.signing->authorizationKeys);
    append(signing->userJwts, other.signing->userJwts);
    append(signing->signatures, other.signing->signatures);
    return *this;
}

std::string Config::toSafeString() const
{
    std::stringstream out;
    out << "Config(";
    if (scope)
        out << "scope=" << *scope;
    else
        out << "url=" << urlPatternString;

    if (appId)
        out << ", app-id=" << *appId;

    for (auto const& [name, value] : headers)
        out << ", header " << name << "=" << value;

    if (signing) {
        out << ", signing(";
        for (auto const& key : signing->authorizationKeys) {
            if (!key.keychain.empty())
                out << "key(keychain=" << key.keychain << ", user=" << key.user << ") ";
            else
                out << "key=" << mask(key.key) << " ";
        }
        for (auto const& jwt : signing->userJwts)
            out << "user-jwt=" << mask(jwt) << " ";
        for (auto const& sig : signing->signatures)
            out << "signature=" << mask(sig.signature) << " ";
        out << ")";
    }

    out << ")";
    return out.str();
}

std::atomic<std::chrono::steady_clock::time_point> Settings::lastUpdated{std::chrono::steady_clock::now()};

void Settings::updateTimestamp(std::chrono::steady_clock::time_point time)
{
    lastUpdated.store(time, std::memory_order_relaxed);
}

Settings::Settings()
{
    load();
}

void Settings::load()
{
    std::deque<Config> loaded;

    std::string path;
    if (auto env = std::getenv("REQSIGN_SETTINGS_FILE"))
        path = env;

    if (path.empty())
        log().debug("REQSIGN_SETTINGS_FILE is not set, no request settings loaded.");
    else if (!std::filesystem::is_regular_file(path))
        log().warn("REQSIGN_SETTINGS_FILE '{}' is not a file, no request settings loaded.", path);
    else {
        try {
            loaded = readSettingsFile(path);
            log().debug("Loaded {} settings scope(s) from '{}'.", loaded.size(), path);
        }
        catch (std::exception const& e) {
            log().error("Could not read request settings from '{}': {}", path, e.what());
            loaded.clear();
        }
    }

    std::unique_lock lock(mutex);
    settings = std::move(loaded);
    lastRead = std::chrono::steady_clock::now();
}

Config Settings::operator[] (const std::string &url) const
{
    if (lastRead < lastUpdated.load(std::memory_order_relaxed))
        const_cast<Settings*>(this)->load();

    std::shared_lock lock(mutex);
    Config result;
    for (auto const& config : settings) {
        if (std::regex_match(url, config.urlPattern))
            result |= config;
    }
    return result;
}

std::string secret::load(
        const std::string &service,
        const std::string &user)
{
#ifdef REQSIGN_KEYCHAIN_SUPPORT
    static const auto timeout = std::chrono::seconds(60);

    // The keychain may show an unlock prompt, so the lookup runs detached.
    auto lookup = std::async(std::launch::async, [service, user]() {
        keychain::Error error;
        auto material = keychain::getPassword("lib.reqsign.client", service, user, error);
        if (error)
            throw std::runtime_error(fmt::format("Keychain lookup of '{}' failed: {}", service, error.message));
        return material;
    });

    if (lookup.wait_for(timeout) != std::future_status::ready) {
        log().warn("Keychain lookup of '{}' (user '{}') timed out.", service, user);
        return {};
    }
    return lookup.get();
#else
    throw logRuntimeError(fmt::format(
        "[secret::load] Cannot read '{}' from the keychain: reqsign was built with REQSIGN_KEYCHAIN_SUPPORT OFF.",
        service));
#endif
}
