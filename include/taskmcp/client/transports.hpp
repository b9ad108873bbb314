#pragma once
#include "taskmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace taskmcp::mcp
{
class McpHandler;
}

namespace taskmcp::client
{

/// Produces the JSON-RPC response to a server-initiated request.
using ServerRequestHandler = std::function<Json(const Json& request)>;
using NotificationHandler = std::function<void(const Json& notification)>;

class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Send one JSON-RPC request and return the response message (with
    /// `result` or `error`). Server-initiated requests arriving before the
    /// response are answered through the server request handler.
    /// Throws TransportError, or RequestTimeoutError when `timeout` (non-zero)
    /// elapses first.
    virtual Json request(const std::string& method, const Json& params,
                         std::chrono::milliseconds timeout) = 0;

    /// Deliver a client response to a server-initiated request outside of any
    /// open call (e.g. an elicitation exposed through tasks/get).
    virtual void send_response(const Json& response) = 0;

    void set_server_request_handler(ServerRequestHandler handler)
    {
        server_request_handler_ = std::move(handler);
    }
    void set_notification_handler(NotificationHandler handler)
    {
        notification_handler_ = std::move(handler);
    }

  protected:
    Json make_request(const std::string& method, const Json& params)
    {
        return Json{{"jsonrpc", "2.0"},
                    {"id", next_id_.fetch_add(1, std::memory_order_relaxed)},
                    {"method", method},
                    {"params", params}};
    }

    /// Answer a server request, or report it as unsupported.
    Json answer_server_request(const Json& request) const;
    void dispatch_notification(const Json& notification) const;

    ServerRequestHandler server_request_handler_;
    NotificationHandler notification_handler_;

  private:
    std::atomic<int64_t> next_id_{1};
};

/// Calls an McpHandler in the same process. Server-initiated requests are
/// answered synchronously on the handler's thread. Timeouts are not enforced.
class InProcessTransport : public ITransport
{
  public:
    explicit InProcessTransport(mcp::McpHandler& handler) : handler_(handler) {}

    Json request(const std::string& method, const Json& params,
                 std::chrono::milliseconds timeout) override;
    void send_response(const Json& response) override;

  private:
    mcp::McpHandler& handler_;
};

/// Raw view of one HTTP exchange, for debugging proxies and auth.
struct ProbeResult
{
    int status{0};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body_prefix; ///< First 500 characters of the body
    std::string error;       ///< Set when no HTTP response arrived
};

/// Streamable HTTP client.
///
/// Requests are POSTed with libcurl and the SSE response is parsed as it
/// arrives, so elicitation requests can be answered while the call is open.
/// Answers and probes use cpp-httplib.
class StreamableHttpTransport : public ITransport
{
  public:
    /// `url` is the full endpoint, e.g. http://127.0.0.1:1338/mcp
    explicit StreamableHttpTransport(std::string url, std::string bearer_token = "");
    /// Ends the session on the server (see close_session()).
    ~StreamableHttpTransport() override;

    Json request(const std::string& method, const Json& params,
                 std::chrono::milliseconds timeout) override;
    void send_response(const Json& response) override;

    /// POST `payload` as-is and report status, headers and the body prefix.
    /// Never throws on HTTP status or connection failure.
    ProbeResult probe(const Json& payload) const;

    /// DELETE the current session and forget it. Best effort: failures are
    /// logged, never thrown.
    void close_session() noexcept;

    std::string session_id() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return session_id_;
    }

    const std::string& url() const
    {
        return url_;
    }

  private:
    void remember_session(const std::string& id);

    std::string url_;
    std::string base_;  // scheme://host:port
    std::string path_;  // /mcp
    std::string bearer_token_;

    std::string session_id_;
    mutable std::mutex session_mutex_;
};

} // namespace taskmcp::client
