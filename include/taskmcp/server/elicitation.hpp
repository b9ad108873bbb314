#pragma once
#include "taskmcp/elicitation.hpp"
#include "taskmcp/types.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace taskmcp::server
{

/// Validate that a JSON schema follows MCP elicitation requirements.
///
/// - Root must be an object schema (`type == "object"`).
/// - Properties must only use primitive types: string, number, integer, boolean.
/// - Schema must be flat: no nested objects or arrays of objects.
/// - const and enum fields are always allowed.
/// - oneOf/anyOf branches must also be primitive (or const/enum) types.
///
/// Throws taskmcp::ValidationError on violation.
void validate_elicitation_json_schema(const Json& schema);

/// Normalize a base schema for elicitation: forces `"type": "object"`, treats
/// fields with a default or a nullable type as optional, then validates.
Json get_elicitation_schema(const Json& base_schema);

/// Sends one server-initiated JSON-RPC request to the client.
using ElicitationSender = std::function<void(const Json& request_message)>;

/// Per-invocation pause-for-input channels.
///
/// A handler thread calls request(), which publishes an `elicitation/create`
/// message and blocks until the client's answer is delivered, the channel is
/// abandoned, or the timeout elapses. At most one request may be outstanding
/// per invocation.
class ElicitationBroker
{
  public:
    /// Called with the pending request message when a channel opens and with
    /// std::nullopt when it closes.
    using Observer =
        std::function<void(const std::string& invocation_id, const std::optional<Json>& pending)>;

    static std::string request_id_for(const std::string& invocation_id)
    {
        return "elicit:" + invocation_id;
    }

    void set_observer(Observer observer);

    /// Throws ShapeMismatchError when the accepted data does not fit the shape
    /// (or the client answered with an error), TransportError when abandoned,
    /// RequestTimeoutError on timeout.
    ElicitationResponse request(const std::string& invocation_id, const ElicitationRequest& req,
                                const ElicitationSender& send, std::chrono::milliseconds timeout);

    /// Route a JSON-RPC response from the client. Returns false when no
    /// channel is waiting on its id.
    bool deliver(const Json& response_message);

    /// The outstanding request message for an invocation, if any.
    std::optional<Json> pending(const std::string& invocation_id) const;

    /// Fail the outstanding request, if any, with TransportError(reason).
    void abandon(const std::string& invocation_id, const std::string& reason);

    /// Abandon every open channel and refuse new requests.
    void shutdown(const std::string& reason);

  private:
    struct Channel
    {
        ExpectedShape shape;
        Json request_message;
        std::promise<ElicitationResponse> promise;
        bool settled{false};
    };

    void notify(const std::string& invocation_id, const std::optional<Json>& pending);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
    Observer observer_;
    bool closed_{false};
};

} // namespace taskmcp::server
