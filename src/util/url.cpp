#include "taskmcp/util/url.hpp"

#include "taskmcp/exceptions.hpp"

#include <stdexcept>

namespace taskmcp::util
{

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
        throw TransportError("Unsupported URL scheme: " + result.scheme +
                             " (only http and https are allowed)");

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
    {
        result.path = remaining.substr(slash_pos);
        remaining = remaining.substr(0, slash_pos);
    }

    const int default_port = result.scheme == "https" ? 443 : 80;
    auto colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos)
    {
        result.host = remaining.substr(0, colon_pos);
        try
        {
            result.port = std::stoi(remaining.substr(colon_pos + 1));
        }
        catch (const std::logic_error&)
        {
            result.port = default_port;
        }
    }
    else
    {
        result.host = remaining;
        result.port = default_port;
    }
    if (result.host.empty())
        throw TransportError("URL has no host: " + url);
    return result;
}

} // namespace taskmcp::util
