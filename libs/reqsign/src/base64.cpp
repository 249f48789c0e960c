#include "base64.hpp"

#include <openssl/evp.h>

#include <vector>

namespace reqsign
{

std::string base64_encode(unsigned char const* bytes_to_encode,
                          std::size_t in_len)
{
    std::string result(4 * ((in_len + 2) / 3), '\0');
    auto written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(result.data()),
        bytes_to_encode,
        static_cast<int>(in_len));
    result.resize(static_cast<std::size_t>(written));
    return result;
}

std::optional<std::string> base64_decode(std::string const& encoded_string)
{
    if (encoded_string.empty() || encoded_string.size() % 4 != 0)
        return {};

    // Padding only in the last two positions, and "X=Y=" style is malformed.
    auto firstPad = encoded_string.find('=');
    if (firstPad != std::string::npos) {
        if (firstPad < encoded_string.size() - 2)
            return {};
        if (encoded_string.back() != '=')
            return {};
    }

    std::vector<unsigned char> decoded(encoded_string.size() / 4 * 3);
    auto len = EVP_DecodeBlock(
        decoded.data(),
        reinterpret_cast<unsigned char const*>(encoded_string.data()),
        static_cast<int>(encoded_string.size()));
    if (len < 0)
        return {};

    // EVP_DecodeBlock keeps the zero bytes standing in for padding.
    std::size_t padding = 0;
    if (encoded_string[encoded_string.size() - 1] == '=')
        ++padding;
    if (encoded_string[encoded_string.size() - 2] == '=')
        ++padding;

    return std::string(reinterpret_cast<char*>(decoded.data()),
                       static_cast<std::size_t>(len) - padding);
}

}
