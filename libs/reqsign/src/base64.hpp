#pragma once

#include <optional>
#include <string>

namespace reqsign
{

std::string base64_encode(unsigned char const* bytes_to_encode,
                          std::size_t in_len);

/**
 * Strict standard-alphabet decode. Returns nullopt for malformed
 * input (bad characters, bad length or padding).
 */
std::optional<std::string> base64_decode(std::string const& encoded_string);

}
