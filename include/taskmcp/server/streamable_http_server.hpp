#pragma once
#include "taskmcp/mcp/handler.hpp"
#include "taskmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace taskmcp::server
{

/**
 * Streamable HTTP transport for an McpHandler.
 *
 * - Single POST endpoint (default: /mcp); GET answers 405.
 * - `Authorization: Bearer <token>` checked when a token is configured (401 otherwise).
 * - `Mcp-Session-Id` issued on initialize and required afterwards; DELETE
 *   with the header ends the session. When the session table is full,
 *   sessions idle for longer than the idle timeout are dropped.
 * - tools/call with `Accept: text/event-stream` is answered as an SSE stream
 *   carrying elicitation requests and progress notifications before the final
 *   response. The client POSTs its answers to elicitation requests on the
 *   same session. Closing the stream fails the call's pending and future
 *   elicitations with TransportError.
 *
 * Usage:
 *   taskmcp::mcp::McpHandler handler(app);
 *   StreamableHttpServer server(handler, "127.0.0.1", 1338, "/mcp", token);
 *   server.start();  // Non-blocking - runs in background thread
 *   server.stop();
 */
class StreamableHttpServer
{
  public:
    StreamableHttpServer(mcp::McpHandler& handler, std::string host = "127.0.0.1",
                         int port = 1338, std::string mcp_path = "/mcp",
                         std::string auth_token = "");
    ~StreamableHttpServer();

    /// Start listening on a background thread. Returns false if already running
    /// or the address cannot be bound. Port 0 binds any free port; port()
    /// reports it afterwards.
    bool start();

    /// Stop listening and join the server thread. Safe to call multiple times.
    void stop();

    /// Block until the server stops.
    void wait();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    const std::string& mcp_path() const
    {
        return mcp_path_;
    }

    size_t session_count() const
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return sessions_.size();
    }

  private:
    struct CallStream;

    bool authorized(const httplib::Request& req, httplib::Response& res) const;
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);
    void stream_tool_call(const Json& message, const std::string& session_id,
                          httplib::Response& res);
    std::string generate_session_id();
    bool check_auth(const std::string& auth_header) const;

    mcp::McpHandler& handler_;
    std::string host_;
    int port_;
    std::string mcp_path_;
    std::string auth_token_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    static constexpr size_t MAX_SESSIONS = 1000;
    static constexpr std::chrono::minutes SESSION_IDLE_TIMEOUT{30};

    // session id -> last request time
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> sessions_;
    mutable std::mutex sessions_mutex_;
};

} // namespace taskmcp::server
