#pragma once
#include <string>

namespace taskmcp::util
{

struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port{80};
    std::string path{"/"}; // includes leading '/', query kept

    /// scheme://host:port, as taken by httplib::Client
    std::string origin() const
    {
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};

/// Split an http(s) URL. A missing scheme means http, a missing port the
/// scheme's default. Throws TransportError for any other scheme.
ParsedUrl parse_url(const std::string& url);

} // namespace taskmcp::util
