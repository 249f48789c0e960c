#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace reqsign
{

/**
 * RFC 8785 JSON Canonicalization Scheme (JCS).
 *
 * Serializes a JSON value such that structurally equal values always
 * produce identical bytes:
 *  - object members sorted by the UTF-16 code units of their keys,
 *    at every nesting level
 *  - no insignificant whitespace
 *  - numbers in the ECMAScript Number.prototype.toString form
 *  - strings with minimal escaping, raw UTF-8 otherwise
 *
 * Throws reqsign::Error (CanonicalizationError) for non-finite
 * numbers, integers beyond +/-(2^53 - 1) (a double-based verifier
 * would round them), invalid UTF-8, binary values and discarded values.
 */
std::string canonicalize(nlohmann::json const& value);

/**
 * Format a finite double per ECMAScript Number.prototype.toString.
 */
std::string formatNumber(double value);

}
