/// @file tests/client/test_helpers.hpp
/// @brief Demo server wired to an in-process client
#pragma once

#include "taskmcp/app.hpp"
#include "taskmcp/client/client.hpp"
#include "taskmcp/client/transports.hpp"
#include "taskmcp/elicitation.hpp"
#include "taskmcp/exceptions.hpp"
#include "taskmcp/mcp/handler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace taskmcp;

inline Settings fast_settings()
{
    Settings s;
    s.log_level = "WARNING";
    s.upload_dir = "/tmp/taskmcp_test_uploads";
    s.elicitation_timeout_ms = 5000;
    return s;
}

/// Demo app with 10ms slow_task steps, served in-process.
struct DemoFixture
{
    App app;
    mcp::McpHandler handler;
    client::Client client;

    explicit DemoFixture(Settings settings = fast_settings())
        : app(make_demo_app(settings, std::chrono::milliseconds(10))), handler(app),
          client(std::make_unique<client::InProcessTransport>(handler))
    {
    }
};

/// Elicitation handler that records what it was asked and replies from a script.
class ScriptedElicitation
{
  public:
    explicit ScriptedElicitation(std::vector<ElicitationResponse> replies)
        : replies_(std::move(replies))
    {
    }

    client::ElicitationHandler handler()
    {
        return [this](const std::string& message, const ExpectedShape& shape)
        {
            std::lock_guard<std::mutex> lock(m_);
            messages_.push_back(message);
            shapes_.push_back(shape);
            if (replies_.empty())
                return ElicitationResponse::cancel();
            auto reply = replies_.front();
            replies_.erase(replies_.begin());
            return reply;
        };
    }

    std::vector<std::string> messages() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return messages_;
    }
    std::vector<ExpectedShape> shapes() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return shapes_;
    }

  private:
    mutable std::mutex m_;
    std::vector<ElicitationResponse> replies_;
    std::vector<std::string> messages_;
    std::vector<ExpectedShape> shapes_;
};
