#include "taskmcp/client/transports.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"
#include "taskmcp/mcp/handler.hpp"
#include "taskmcp/util/url.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <exception>
#include <httplib.h>

namespace taskmcp::client
{

namespace
{
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool is_server_request(const Json& msg)
{
    return msg.contains("method") && msg.contains("id") && !msg["id"].is_null();
}

bool is_notification(const Json& msg)
{
    return msg.contains("method") && (!msg.contains("id") || msg["id"].is_null());
}

/// State shared with the libcurl callbacks for one POST.
struct StreamState
{
    std::function<void(const Json&)> on_message;
    std::string content_type;
    std::string session_id;
    std::string buffer;
    std::exception_ptr failure;
};

/// Split complete SSE events off the buffer and hand each data payload on.
void drain_sse(StreamState& st, bool flush_all)
{
    auto emit = [&](const std::string& chunk)
    {
        std::string data;
        size_t line_start = 0;
        while (line_start <= chunk.size())
        {
            size_t line_end = chunk.find('\n', line_start);
            std::string line = chunk.substr(line_start, line_end == std::string::npos
                                                            ? std::string::npos
                                                            : line_end - line_start);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.rfind("data:", 0) == 0)
            {
                std::string part = line.substr(5);
                if (!part.empty() && part[0] == ' ')
                    part.erase(0, 1);
                if (!data.empty())
                    data.push_back('\n');
                data += part;
            }
            if (line_end == std::string::npos)
                break;
            line_start = line_end + 1;
        }
        if (data.empty())
            return;
        Json msg;
        try
        {
            msg = Json::parse(data);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            log::get()->warn("ignoring malformed SSE event: {}", e.what());
            return;
        }
        st.on_message(msg);
    };

    // Normalise CRLF event separators.
    size_t crlf;
    while ((crlf = st.buffer.find("\r\n")) != std::string::npos)
        st.buffer.erase(crlf, 1);

    size_t pos = 0;
    while (true)
    {
        size_t sep = st.buffer.find("\n\n", pos);
        if (sep == std::string::npos)
            break;
        emit(st.buffer.substr(pos, sep - pos));
        pos = sep + 2;
    }
    st.buffer.erase(0, pos);
    if (flush_all && !trim(st.buffer).empty())
    {
        emit(st.buffer);
        st.buffer.clear();
    }
}

size_t on_header(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* st = static_cast<StreamState*>(userdata);
    std::string line(ptr, size * nmemb);
    auto colon = line.find(':');
    if (colon != std::string::npos)
    {
        auto name = lower(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));
        if (name == "content-type")
            st->content_type = value;
        else if (name == "mcp-session-id")
            st->session_id = value;
    }
    return size * nmemb;
}

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* st = static_cast<StreamState*>(userdata);
    st->buffer.append(ptr, size * nmemb);
    if (st->content_type.find("text/event-stream") == std::string::npos)
        return size * nmemb;
    try
    {
        drain_sse(*st, false);
    }
    catch (const std::exception&)
    {
        st->failure = std::current_exception();
        return 0; // aborts the transfer
    }
    return size * nmemb;
}

class CurlGlobal
{
  public:
    CurlGlobal()
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobal()
    {
        curl_global_cleanup();
    }
};

void ensure_curl_initialized()
{
    static CurlGlobal global;
}

} // namespace

Json ITransport::answer_server_request(const Json& request) const
{
    const Json id = request.value("id", Json());
    if (server_request_handler_)
        return server_request_handler_(request);
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error",
                 {{"code", error_code::MethodNotFound},
                  {"message", "Client does not handle " + request.value("method", std::string())}}}};
}

void ITransport::dispatch_notification(const Json& notification) const
{
    if (notification_handler_)
        notification_handler_(notification);
}

// ---------------------------------------------------------------------------
// InProcessTransport
// ---------------------------------------------------------------------------

Json InProcessTransport::request(const std::string& method, const Json& params,
                                 std::chrono::milliseconds /*timeout*/)
{
    Json message = make_request(method, params);
    server::OutboundFn outbound = [this](const Json& msg)
    {
        if (is_server_request(msg))
        {
            Json answer = answer_server_request(msg);
            if (!handler_.deliver_response(answer))
                log::get()->warn("in-process answer to {} was not awaited", msg["id"].dump());
        }
        else if (is_notification(msg))
        {
            dispatch_notification(msg);
        }
    };
    Json response = handler_.handle(message, outbound);
    if (response.is_null())
        throw TransportError("No response to " + method);
    return response;
}

void InProcessTransport::send_response(const Json& response)
{
    if (!handler_.deliver_response(response))
        throw TransportError("Unknown response ID: " + response.value("id", Json()).dump());
}

// ---------------------------------------------------------------------------
// StreamableHttpTransport
// ---------------------------------------------------------------------------

StreamableHttpTransport::StreamableHttpTransport(std::string url, std::string bearer_token)
    : url_(std::move(url)), bearer_token_(std::move(bearer_token))
{
    auto parsed = util::parse_url(url_);
    base_ = parsed.origin();
    path_ = parsed.path;
}

StreamableHttpTransport::~StreamableHttpTransport()
{
    close_session();
}

void StreamableHttpTransport::close_session() noexcept
{
    std::string session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session.swap(session_id_);
    }
    if (session.empty())
        return;

    try
    {
        httplib::Client cli(base_.c_str());
        cli.set_connection_timeout(2, 0);
        cli.set_read_timeout(5, 0);

        httplib::Headers headers = {{"Mcp-Session-Id", session}};
        if (!bearer_token_.empty())
            headers.emplace("Authorization", "Bearer " + bearer_token_);

        auto res = cli.Delete(path_.c_str(), headers);
        if (!res)
            log::get()->debug("session {} not closed: {}", session, httplib::to_string(res.error()));
        else if (res->status >= 300)
            log::get()->debug("session {} not closed: HTTP {}", session, res->status);
    }
    catch (const std::exception& e)
    {
        log::get()->warn("closing session {} failed: {}", session, e.what());
    }
}

void StreamableHttpTransport::remember_session(const std::string& id)
{
    if (id.empty())
        return;
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = id;
}

Json StreamableHttpTransport::request(const std::string& method, const Json& params,
                                      std::chrono::milliseconds timeout)
{
    ensure_curl_initialized();

    Json message = make_request(method, params);
    const Json request_id = message["id"];

    CURL* curl = curl_easy_init();
    if (!curl)
        throw TransportError("libcurl init failed");

    const std::string body = message.dump();
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json, text/event-stream");
    if (!bearer_token_.empty())
        headers = curl_slist_append(headers, ("Authorization: Bearer " + bearer_token_).c_str());
    const std::string session = session_id();
    if (!session.empty())
        headers = curl_slist_append(headers, ("Mcp-Session-Id: " + session).c_str());

    Json response;
    StreamState st;
    st.on_message = [&](const Json& msg)
    {
        if (is_server_request(msg))
        {
            // Session must be known before answering mid-stream.
            remember_session(st.session_id);
            send_response(answer_server_request(msg));
        }
        else if (is_notification(msg))
        {
            dispatch_notification(msg);
        }
        else if (msg.contains("id") && msg["id"] == request_id)
        {
            response = msg;
        }
    };

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

    CURLcode code = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (st.failure)
        std::rethrow_exception(st.failure);
    if (code == CURLE_OPERATION_TIMEDOUT)
        throw RequestTimeoutError(method + " timed out after " + std::to_string(timeout.count()) +
                                  "ms");
    if (code != CURLE_OK && code != CURLE_PARTIAL_FILE)
        throw TransportError(method + " failed: " + curl_easy_strerror(code));
    if (status == 401)
        throw TransportError("Unauthorized (401): check the bearer token");
    if (status < 200 || status >= 300)
        throw TransportError(method + " failed with HTTP " + std::to_string(status) + ": " +
                             st.buffer.substr(0, 500));

    remember_session(st.session_id);

    if (st.content_type.find("text/event-stream") != std::string::npos)
        drain_sse(st, true);
    else if (!trim(st.buffer).empty())
    {
        try
        {
            response = Json::parse(st.buffer);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw TransportError("Malformed response to " + method + ": " + e.what());
        }
    }

    if (!response.is_object())
        throw TransportError("No response to " + method);
    return response;
}

void StreamableHttpTransport::send_response(const Json& response)
{
    httplib::Client cli(base_.c_str());
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(30, 0);

    httplib::Headers headers = {{"Accept", "application/json, text/event-stream"}};
    if (!bearer_token_.empty())
        headers.emplace("Authorization", "Bearer " + bearer_token_);
    const std::string session = session_id();
    if (!session.empty())
        headers.emplace("Mcp-Session-Id", session);

    auto res = cli.Post(path_.c_str(), headers, response.dump(), "application/json");
    if (!res)
        throw TransportError("Failed to deliver response: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw TransportError("Response rejected with HTTP " + std::to_string(res->status) + ": " +
                             res->body);
}

ProbeResult StreamableHttpTransport::probe(const Json& payload) const
{
    ProbeResult out;
    httplib::Client cli(base_.c_str());
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(30, 0);

    httplib::Headers headers = {{"Accept", "application/json, text/event-stream"}};
    if (!bearer_token_.empty())
        headers.emplace("Authorization", "Bearer " + bearer_token_);

    auto res = cli.Post(path_.c_str(), headers, payload.dump(), "application/json");
    if (!res)
    {
        out.error = httplib::to_string(res.error());
        return out;
    }
    out.status = res->status;
    for (const auto& h : res->headers)
        out.headers.emplace_back(h.first, h.second);
    out.body_prefix = res->body.substr(0, 500);
    return out;
}

} // namespace taskmcp::client
