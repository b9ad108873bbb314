#include "taskmcp/server/streamable_http_server.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <random>
#include <sstream>

namespace taskmcp::server
{

/// Event queue between the worker running one tools/call and the SSE writer.
struct StreamableHttpServer::CallStream
{
    std::mutex m;
    std::condition_variable cv;
    std::deque<Json> queue;
    bool done{false};
    bool closed{false}; // client went away; outbound messages fail
    std::string invocation_id;
    std::thread worker;
};

namespace
{

Json error_response(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

bool accepts_event_stream(const httplib::Request& req)
{
    auto it = req.headers.find("Accept");
    return it != req.headers.end() && it->second.find("text/event-stream") != std::string::npos;
}

} // namespace

StreamableHttpServer::StreamableHttpServer(mcp::McpHandler& handler, std::string host, int port,
                                           std::string mcp_path, std::string auth_token)
    : handler_(handler), host_(std::move(host)), port_(port), mcp_path_(std::move(mcp_path)),
      auth_token_(std::move(auth_token))
{
}

StreamableHttpServer::~StreamableHttpServer()
{
    stop();
}

bool StreamableHttpServer::check_auth(const std::string& auth_header) const
{
    if (auth_token_.empty())
        return true;
    if (auth_header.rfind("Bearer ", 0) != 0)
        return false;
    return auth_header.substr(7) == auth_token_;
}

std::string StreamableHttpServer::generate_session_id()
{
    // 128 random bits as 32 hex chars
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

void StreamableHttpServer::stream_tool_call(const Json& message, const std::string& session_id,
                                            httplib::Response& res)
{
    auto call = std::make_shared<CallStream>();
    call->invocation_id = handler_.next_invocation_id();
    std::weak_ptr<CallStream> weak_call = call;

    OutboundFn outbound = [weak_call](const Json& msg)
    {
        auto c = weak_call.lock();
        if (!c)
            throw TransportError("Client stream closed");
        std::lock_guard<std::mutex> lock(c->m);
        if (c->closed)
            throw TransportError("Client stream closed");
        c->queue.push_back(msg);
        c->cv.notify_one();
    };

    call->worker = std::thread(
        [this, call_raw = call.get(), message, outbound]()
        {
            Json response;
            try
            {
                response = handler_.handle(message, outbound, call_raw->invocation_id);
            }
            catch (const std::exception& e)
            {
                log::get()->error("tools/call stream failed: {}", e.what());
                response = error_response(message.value("id", Json()), error_code::InternalError,
                                          e.what());
            }
            std::lock_guard<std::mutex> lock(call_raw->m);
            call_raw->queue.push_back(std::move(response));
            call_raw->done = true;
            call_raw->cv.notify_one();
        });

    res.status = 200;
    res.set_header("Mcp-Session-Id", session_id);
    res.set_header("Cache-Control", "no-cache, no-transform");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, call](size_t /*offset*/, httplib::DataSink& sink)
        {
            std::unique_lock<std::mutex> lock(call->m);
            call->cv.wait_for(lock, std::chrono::milliseconds(250),
                              [&] { return !call->queue.empty() || !running_; });
            if (!running_)
                return false;

            while (!call->queue.empty())
            {
                auto event = std::move(call->queue.front());
                call->queue.pop_front();
                lock.unlock();
                std::string sse = "event: message\ndata: " + event.dump() + "\n\n";
                if (!sink.write(sse.data(), sse.size()))
                    return false;
                lock.lock();
            }
            if (call->done)
                sink.done();
            return true;
        },
        [this, call](bool success)
        {
            {
                std::lock_guard<std::mutex> lock(call->m);
                call->closed = true;
                call->queue.clear();
            }
            if (!success)
            {
                log::get()->info("client closed the stream of {}", call->invocation_id);
                handler_.abandon_invocation(call->invocation_id, "Client stream closed");
            }
            if (call->worker.joinable())
                call->worker.join();
        });
}

bool StreamableHttpServer::authorized(const httplib::Request& req, httplib::Response& res) const
{
    if (auth_token_.empty())
        return true;
    auto auth_it = req.headers.find("Authorization");
    if (auth_it != req.headers.end() && check_auth(auth_it->second))
        return true;
    log::get()->warn("rejected unauthenticated request from {}", req.remote_addr);
    res.status = 401;
    res.set_header("WWW-Authenticate", "Bearer");
    res.set_content("{\"error\":\"Unauthorized\"}", "application/json");
    return false;
}

void StreamableHttpServer::handle_delete(const httplib::Request& req, httplib::Response& res)
{
    if (!authorized(req, res))
        return;

    const std::string session_id = req.get_header_value("Mcp-Session-Id");
    if (session_id.empty())
    {
        res.status = 400;
        res.set_content("{\"error\":\"Mcp-Session-Id header required\"}", "application/json");
        return;
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.erase(session_id) == 0)
    {
        res.status = 404;
        res.set_content("{\"error\":\"Invalid or expired session\"}", "application/json");
        return;
    }
    log::get()->debug("session {} closed by client", session_id);
    res.status = 204;
}

void StreamableHttpServer::handle_post(const httplib::Request& req, httplib::Response& res)
{
    if (!authorized(req, res))
        return;

    Json message;
    try
    {
        message = Json::parse(req.body);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        res.status = 400;
        res.set_content(error_response(Json(), error_code::ParseError, e.what()).dump(),
                        "application/json");
        return;
    }
    if (!message.is_object())
    {
        res.status = 400;
        res.set_content(
            error_response(Json(), error_code::InvalidRequest, "Invalid Request").dump(),
            "application/json");
        return;
    }

    std::string session_id = req.get_header_value("Mcp-Session-Id");
    const std::string method = message.value("method", std::string());

    if (method == "initialize")
    {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.size() >= MAX_SESSIONS)
        {
            for (auto it = sessions_.begin(); it != sessions_.end();)
            {
                if (now - it->second > SESSION_IDLE_TIMEOUT)
                    it = sessions_.erase(it);
                else
                    ++it;
            }
        }
        if (sessions_.size() >= MAX_SESSIONS)
        {
            res.status = 503;
            res.set_content("{\"error\":\"Maximum sessions reached\"}", "application/json");
            return;
        }
        session_id = generate_session_id();
        sessions_.emplace(session_id, now);
    }
    else if (session_id.empty())
    {
        res.status = 400;
        res.set_content("{\"error\":\"Mcp-Session-Id header required\"}", "application/json");
        return;
    }
    else
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            res.status = 404;
            res.set_content("{\"error\":\"Invalid or expired session\"}", "application/json");
            return;
        }
        it->second = std::chrono::steady_clock::now();
    }

    res.set_header("Mcp-Session-Id", session_id);

    // Answer to a server-initiated request (elicitation).
    if (method.empty() && (message.contains("result") || message.contains("error")))
    {
        if (handler_.deliver_response(message))
        {
            res.status = 202;
            return;
        }
        res.status = 400;
        res.set_content("{\"error\":\"Unknown response ID\"}", "application/json");
        return;
    }

    if (method == "tools/call" && message.contains("id") && accepts_event_stream(req))
    {
        stream_tool_call(message, session_id, res);
        return;
    }

    Json response = handler_.handle(message);
    if (response.is_null())
    {
        res.status = 202;
        return;
    }
    res.status = 200;
    res.set_content(response.dump(), "application/json");
}

bool StreamableHttpServer::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();
    svr_->set_payload_max_length(10 * 1024 * 1024);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    svr_->Post(mcp_path_,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   try
                   {
                       handle_post(req, res);
                   }
                   catch (const std::exception& e)
                   {
                       log::get()->error("POST {} failed: {}", mcp_path_, e.what());
                       res.status = 500;
                       res.set_content(
                           error_response(Json(), error_code::InternalError, e.what()).dump(),
                           "application/json");
                   }
               });

    svr_->Delete(mcp_path_,
                 [this](const httplib::Request& req, httplib::Response& res)
                 { handle_delete(req, res); });

    svr_->Get(mcp_path_,
              [](const httplib::Request&, httplib::Response& res)
              {
                  res.status = 405;
                  res.set_header("Allow", "POST, DELETE");
                  Json error = {{"error", "Method Not Allowed"},
                                {"message", "The MCP endpoint only supports POST requests."}};
                  res.set_content(error.dump(), "application/json");
              });

    if (port_ == 0)
    {
        int bound = svr_->bind_to_any_port(host_);
        if (bound < 0)
        {
            log::get()->error("cannot bind {} on any port", host_);
            svr_.reset();
            return false;
        }
        port_ = bound;
    }
    else if (!svr_->bind_to_port(host_, port_))
    {
        log::get()->error("cannot bind {}:{}", host_, port_);
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    log::get()->info("listening on http://{}:{}{}", host_, port_, mcp_path_);
    return true;
}

void StreamableHttpServer::wait()
{
    if (thread_.joinable())
        thread_.join();
}

void StreamableHttpServer::stop()
{
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.clear();
    }
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
}

} // namespace taskmcp::server
