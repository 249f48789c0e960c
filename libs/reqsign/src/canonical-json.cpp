#include "canonical-json.hpp"
#include "error.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <vector>

namespace reqsign
{

namespace
{

using Kind = Error::Kind;

// 2^53 - 1: integers up to this magnitude print the same as their double.
constexpr std::int64_t MAX_SAFE_INTEGER = 9007199254740991;

/**
 * Decode UTF-8 into UTF-16 code units, rejecting malformed input.
 */
std::u16string toUtf16(std::string const& str)
{
    std::u16string result;
    result.reserve(str.size());

    for (std::size_t i = 0; i < str.size();) {
        auto lead = static_cast<unsigned char>(str[i]);
        std::uint32_t cp = 0;
        std::size_t len = 0;

        if (lead < 0x80) { cp = lead; len = 1; }
        else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; len = 2; }
        else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; len = 3; }
        else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; len = 4; }
        else
            throw Error(Kind::CanonicalizationError, "Invalid UTF-8 lead byte in string");

        if (i + len > str.size())
            throw Error(Kind::CanonicalizationError, "Truncated UTF-8 sequence in string");

        for (std::size_t j = 1; j < len; ++j) {
            auto cont = static_cast<unsigned char>(str[i + j]);
            if ((cont & 0xC0) != 0x80)
                throw Error(Kind::CanonicalizationError, "Invalid UTF-8 continuation byte in string");
            cp = (cp << 6) | (cont & 0x3F);
        }

        static const std::uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < minimum[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            throw Error(Kind::CanonicalizationError, "Invalid UTF-8 code point in string");

        if (cp >= 0x10000) {
            cp -= 0x10000;
            result.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            result.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        }
        else
            result.push_back(static_cast<char16_t>(cp));

        i += len;
    }
    return result;
}

void writeString(std::string const& str, std::string& out)
{
    static const char hex[] = "0123456789abcdef";

    // Validates the encoding; the output itself stays UTF-8.
    toUtf16(str);

    out.push_back('"');
    for (char ch : str) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20) {
                out += "\\u00";
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0xF]);
            }
            else
                out.push_back(ch);
        }
    }
    out.push_back('"');
}

void writeValue(nlohmann::json const& value, std::string& out);

void writeObject(nlohmann::json const& obj, std::string& out)
{
    std::vector<std::pair<std::u16string, nlohmann::json::const_iterator>> members;
    members.reserve(obj.size());
    for (auto it = obj.begin(); it != obj.end(); ++it)
        members.emplace_back(toUtf16(it.key()), it);

    std::sort(members.begin(), members.end(), [](auto const& a, auto const& b) {
        return a.first < b.first;
    });

    out.push_back('{');
    bool first = true;
    for (auto const& [sortKey, it] : members) {
        if (!first)
            out.push_back(',');
        first = false;
        writeString(it.key(), out);
        out.push_back(':');
        writeValue(it.value(), out);
    }
    out.push_back('}');
}

void writeValue(nlohmann::json const& value, std::string& out)
{
    using value_t = nlohmann::json::value_t;

    switch (value.type()) {
    case value_t::null:
        out += "null";
        break;
    case value_t::boolean:
        out += value.get<bool>() ? "true" : "false";
        break;
    case value_t::number_integer: {
        auto number = value.get<std::int64_t>();
        if (number > MAX_SAFE_INTEGER || number < -MAX_SAFE_INTEGER)
            throw Error(Kind::CanonicalizationError,
                        "Integer " + std::to_string(number) + " cannot be represented exactly as a double");
        out += std::to_string(number);
        break;
    }
    case value_t::number_unsigned: {
        auto number = value.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(MAX_SAFE_INTEGER))
            throw Error(Kind::CanonicalizationError,
                        "Integer " + std::to_string(number) + " cannot be represented exactly as a double");
        out += std::to_string(number);
        break;
    }
    case value_t::number_float:
        out += formatNumber(value.get<double>());
        break;
    case value_t::string:
        writeString(value.get_ref<std::string const&>(), out);
        break;
    case value_t::array: {
        out.push_back('[');
        bool first = true;
        for (auto const& element : value) {
            if (!first)
                out.push_back(',');
            first = false;
            writeValue(element, out);
        }
        out.push_back(']');
        break;
    }
    case value_t::object:
        writeObject(value, out);
        break;
    case value_t::binary:
        throw Error(Kind::CanonicalizationError, "Binary values cannot be represented in JSON");
    case value_t::discarded:
        throw Error(Kind::CanonicalizationError, "Discarded JSON value cannot be serialized");
    }
}

}

std::string formatNumber(double value)
{
    if (!std::isfinite(value))
        throw Error(Kind::CanonicalizationError, "Non-finite numbers are not allowed in canonical JSON");

    // Covers negative zero as well.
    if (value == 0.0)
        return "0";

    // Shortest round-trip digits in scientific notation: d[.ddd]e±XX
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    if (ec != std::errc{})
        throw Error(Kind::CanonicalizationError, "Failed to format number");

    std::string sci(buf, end);
    std::string sign;
    if (sci.front() == '-') {
        sign = "-";
        sci.erase(0, 1);
    }

    auto ePos = sci.find('e');
    std::string digits;
    for (std::size_t i = 0; i < ePos; ++i) {
        if (sci[i] != '.')
            digits.push_back(sci[i]);
    }
    while (digits.size() > 1 && digits.back() == '0')
        digits.pop_back();

    // n: position of the decimal point relative to the digit string
    int n = std::stoi(sci.substr(ePos + 1)) + 1;
    int k = static_cast<int>(digits.size());

    std::string result;
    if (k <= n && n <= 21) {
        result = digits + std::string(static_cast<std::size_t>(n - k), '0');
    }
    else if (0 < n && n <= 21) {
        result = digits.substr(0, static_cast<std::size_t>(n)) + "." + digits.substr(static_cast<std::size_t>(n));
    }
    else if (-6 < n && n <= 0) {
        result = "0." + std::string(static_cast<std::size_t>(-n), '0') + digits;
    }
    else {
        int exponent = n - 1;
        result = digits.substr(0, 1);
        if (k > 1)
            result += "." + digits.substr(1);
        result += exponent < 0 ? "e-" : "e+";
        result += std::to_string(std::abs(exponent));
    }

    return sign + result;
}

std::string canonicalize(nlohmann::json const& value)
{
    std::string out;
    writeValue(value, out);
    return out;
}

}
