#include "error.hpp"

#include "spdlog/fmt/fmt.h"

namespace reqsign
{

namespace
{

std::string describe(Error::Kind kind, std::string const& message, std::optional<std::size_t> strategyIndex)
{
    if (strategyIndex)
        return fmt::format("{} (strategy {}): {}", Error::kindName(kind), *strategyIndex, message);
    return fmt::format("{}: {}", Error::kindName(kind), message);
}

}

Error::Error(Kind kind, std::string const& message, std::optional<std::size_t> strategyIndex)
    : std::runtime_error(describe(kind, message, strategyIndex))
    , kind(kind)
    , strategyIndex(strategyIndex)
    , detail_(message)
{}

Error Error::withStrategyIndex(std::size_t index) const
{
    return Error(kind, detail_, index);
}

char const* Error::kindName(Kind kind)
{
    switch (kind) {
    case Kind::InvalidKeyMaterial: return "InvalidKeyMaterial";
    case Kind::SigningFailed: return "SigningFailed";
    case Kind::InvalidSignerResult: return "InvalidSignerResult";
    case Kind::NotImplemented: return "NotImplemented";
    case Kind::CanonicalizationError: return "CanonicalizationError";
    }
    return "Unknown";
}

}
