#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace reqsign
{

/**
 * Failure of request authorization. Strategy-level failures raised
 * while generating signatures carry the zero-based index of the
 * strategy that failed.
 */
struct Error : std::runtime_error
{
    enum class Kind {
        InvalidKeyMaterial,
        SigningFailed,
        InvalidSignerResult,
        NotImplemented,
        CanonicalizationError
    };

    Kind kind;
    std::optional<std::size_t> strategyIndex;

    Error(Kind kind, std::string const& message, std::optional<std::size_t> strategyIndex = {});

    /**
     * Copy of this error, tagged with the given strategy index.
     */
    Error withStrategyIndex(std::size_t index) const;

    static char const* kindName(Kind kind);

private:
    std::string detail_;
};

}
