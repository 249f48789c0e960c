#pragma once

#include "spdlog/spdlog.h"

namespace signhttp
{

/**
 * Obtain the global request-signing logger, which is initialized
 * from the following environment variables:
 *  - REQSIGN_LOG_LEVEL
 *  - REQSIGN_LOG_FILE
 *  - REQSIGN_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Log a runtime error and return the throwable object.
 * @param what Runtime error message.
 * @return Error object to throw.
 */
template<typename error_t = std::runtime_error>
error_t logRuntimeError(std::string const& what) {
    log().error(what);
    return error_t(what);
}

}
