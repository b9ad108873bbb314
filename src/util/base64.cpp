#include "taskmcp/util/base64.hpp"

#include "taskmcp/exceptions.hpp"

#include <cctype>

namespace taskmcp::util::base64
{

static const std::string kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::vector<std::uint8_t> decode(const std::string& input)
{
    std::vector<std::uint8_t> decoded;
    decoded.reserve(input.size() * 3 / 4);
    int val = 0, valb = -8;
    for (char c : input)
    {
        if (c == '=')
            break;
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        auto pos = kAlphabet.find(c);
        if (pos == std::string::npos)
            throw ValidationError(std::string("invalid base64 character: ") + c);
        val = ((val << 6) + static_cast<int>(pos)) & 0xFFFF;
        valb += 6;
        if (valb >= 0)
        {
            decoded.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return decoded;
}

std::string encode(const std::vector<std::uint8_t>& data)
{
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    int val = 0, valb = -6;
    for (std::uint8_t c : data)
    {
        val = ((val << 8) + c) & 0xFFFF;
        valb += 8;
        while (valb >= 0)
        {
            out.push_back(kAlphabet[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6)
        out.push_back(kAlphabet[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4)
        out.push_back('=');
    return out;
}

std::string encode(const std::string& data)
{
    return encode(std::vector<std::uint8_t>(data.begin(), data.end()));
}

} // namespace taskmcp::util::base64
