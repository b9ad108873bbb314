#include "taskmcp/server/elicitation.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"
#include "taskmcp/util/json_schema.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace taskmcp::server
{
namespace
{

const std::set<std::string>& allowed_primitive_types()
{
    static const std::set<std::string> allowed = {"string", "number", "integer", "boolean"};
    return allowed;
}

bool type_list_allows_null(const Json& type_field)
{
    if (!type_field.is_array())
        return false;
    for (const auto& t : type_field)
        if (t.is_string() && t.get<std::string>() == "null")
            return true;
    return false;
}

bool union_allows_null(const Json& schema)
{
    if (!schema.is_object())
        return false;
    for (const char* key : {"oneOf", "anyOf"})
    {
        if (!schema.contains(key) || !schema[key].is_array())
            continue;
        for (const auto& branch : schema[key])
        {
            if (!branch.is_object() || !branch.contains("type"))
                continue;
            const auto& t = branch["type"];
            if ((t.is_string() && t.get<std::string>() == "null") || type_list_allows_null(t))
                return true;
        }
    }
    return false;
}

void check_union(const std::string& prop_name, const Json& prop_schema)
{
    const auto& allowed = allowed_primitive_types();
    for (const char* key : {"oneOf", "anyOf"})
    {
        if (!prop_schema.contains(key) || !prop_schema[key].is_array())
            continue;
        for (const auto& branch : prop_schema[key])
        {
            if (!branch.is_object() || branch.contains("const") || branch.contains("enum"))
                continue;
            if (!branch.contains("type") || !branch["type"].is_string())
                throw ValidationError("Elicitation schema field '" + prop_name +
                                      "' has union type with missing 'type' which is not allowed.");
            auto union_type = branch["type"].get<std::string>();
            if (union_type != "null" && allowed.count(union_type) == 0)
                throw ValidationError("Elicitation schema field '" + prop_name +
                                      "' has union type '" + union_type +
                                      "' which is not a primitive type.");
        }
    }
}

} // namespace

void validate_elicitation_json_schema(const Json& schema)
{
    if (!schema.is_object() || !schema.contains("type") || !schema["type"].is_string() ||
        schema["type"].get<std::string>() != "object")
    {
        std::string got_type;
        if (schema.is_object() && schema.contains("type") && schema["type"].is_string())
            got_type = schema["type"].get<std::string>();
        throw ValidationError("Elicitation schema must be an object schema, got type '" +
                              got_type + "'.");
    }

    if (!schema.contains("properties") || !schema["properties"].is_object())
        return;

    const auto& allowed = allowed_primitive_types();
    for (const auto& [prop_name, prop_schema] : schema["properties"].items())
    {
        if (!prop_schema.is_object())
            throw ValidationError("Elicitation schema field '" + prop_name +
                                  "' must be a schema object.");
        if (prop_schema.contains("const") || prop_schema.contains("enum"))
            continue;
        if (prop_schema.contains("oneOf") || prop_schema.contains("anyOf"))
        {
            check_union(prop_name, prop_schema);
            continue;
        }

        Json prop_type = prop_schema.contains("type") ? prop_schema["type"] : Json();
        // type: ["string", "null"] -> "string"
        if (prop_type.is_array())
        {
            std::vector<std::string> filtered;
            for (const auto& t : prop_type)
                if (t.is_string() && t.get<std::string>() != "null")
                    filtered.push_back(t.get<std::string>());
            if (filtered.size() == 1)
                prop_type = filtered.front();
        }

        std::string type_str = prop_type.is_string() ? prop_type.get<std::string>() : "";
        if (type_str == "object")
            throw ValidationError("Elicitation schema field '" + prop_name +
                                  "' is an object, but nested objects are not allowed.");
        if (type_str == "array")
            throw ValidationError("Elicitation schema field '" + prop_name +
                                  "' is an array, but only primitive fields are allowed.");
        if (allowed.count(type_str) == 0)
            throw ValidationError("Elicitation schema field '" + prop_name + "' has type '" +
                                  type_str + "' which is not a primitive type.");
    }
}

Json get_elicitation_schema(const Json& base_schema)
{
    Json schema = base_schema.is_object() ? base_schema : Json::object();
    if (!schema.contains("type") || !schema["type"].is_string())
        schema["type"] = "object";

    // Fields with defaults or nullable types are optional.
    if (schema.contains("properties") && schema["properties"].is_object())
    {
        Json required = Json::array();
        for (const auto& [name, prop_schema] : schema["properties"].items())
        {
            bool has_default = prop_schema.contains("default");
            bool is_nullable = prop_schema.value("nullable", false);
            bool type_allows_null =
                (prop_schema.contains("type") && type_list_allows_null(prop_schema["type"])) ||
                union_allows_null(prop_schema);
            if (!has_default && !is_nullable && !type_allows_null)
                required.push_back(name);
        }
        if (!required.empty())
            schema["required"] = required;
        else
            schema.erase("required");
    }

    validate_elicitation_json_schema(schema);
    return schema;
}

void ElicitationBroker::set_observer(Observer observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

void ElicitationBroker::notify(const std::string& invocation_id,
                               const std::optional<Json>& pending)
{
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observer = observer_;
    }
    if (observer)
        observer(invocation_id, pending);
}

ElicitationResponse ElicitationBroker::request(const std::string& invocation_id,
                                               const ElicitationRequest& req,
                                               const ElicitationSender& send,
                                               std::chrono::milliseconds timeout)
{
    auto channel = std::make_shared<Channel>();
    channel->shape = req.shape;
    channel->request_message = Json{
        {"jsonrpc", "2.0"},
        {"id", request_id_for(invocation_id)},
        {"method", "elicitation/create"},
        {"params",
         {{"message", req.message},
          {"shape", req.shape},
          {"requestedSchema", requested_schema(req.shape)}}}};
    auto future = channel->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            throw TransportError("Elicitation unavailable: server shutting down");
        if (channels_.count(invocation_id))
            throw Error("Elicitation already pending for invocation " + invocation_id);
        channels_[invocation_id] = channel;
    }

    auto close = [this, &invocation_id]()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            channels_.erase(invocation_id);
        }
        notify(invocation_id, std::nullopt);
    };

    log::get()->debug("elicitation {} opened: {}", invocation_id, req.message);
    notify(invocation_id, channel->request_message);

    try
    {
        if (send)
            send(channel->request_message);
    }
    catch (const std::exception& e)
    {
        close();
        throw TransportError(std::string("Failed to send elicitation request: ") + e.what());
    }

    if (future.wait_for(timeout) != std::future_status::ready)
    {
        close();
        throw RequestTimeoutError("Elicitation for invocation " + invocation_id +
                                  " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    close();
    return future.get();
}

bool ElicitationBroker::deliver(const Json& response_message)
{
    if (!response_message.contains("id") || !response_message["id"].is_string())
        return false;
    const auto id = response_message["id"].get<std::string>();
    static const std::string prefix = "elicit:";
    if (id.rfind(prefix, 0) != 0)
        return false;
    const auto invocation_id = id.substr(prefix.size());

    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(invocation_id);
        if (it == channels_.end() || it->second->settled)
            return false;
        channel = it->second;
        channel->settled = true;
    }
    notify(invocation_id, std::nullopt);

    if (response_message.contains("error"))
    {
        const auto& err = response_message["error"];
        std::string msg = err.is_object() ? err.value("message", std::string("client error"))
                                          : err.dump();
        channel->promise.set_exception(
            std::make_exception_ptr(ShapeMismatchError("Client could not answer elicitation: " + msg)));
        return true;
    }

    try
    {
        const Json result = response_message.value("result", Json::object());
        ElicitationResponse response;
        response.action = elicit_action_from_string(result.value("action", std::string("cancel")));
        if (response.action == ElicitAction::Accept)
        {
            Json content = result.contains("content") ? result["content"] : Json();
            switch (channel->shape.kind)
            {
            case ExpectedShape::Kind::Options:
            {
                // Options are a suggestion: the answer may be any text, or nothing.
                if (content.is_object() && content.contains("value") &&
                    content["value"].is_string())
                    response.data = content["value"];
                else if (content.is_string())
                    response.data = content;
                break;
            }
            case ExpectedShape::Kind::Schema:
            {
                if (!content.is_object())
                    throw ShapeMismatchError("Accepted elicitation carries no data");
                try
                {
                    util::schema::validate(channel->shape.schema, content);
                }
                catch (const ValidationError& e)
                {
                    throw ShapeMismatchError(std::string("Accepted data does not fit schema: ") +
                                             e.what());
                }
                response.data = content;
                break;
            }
            case ExpectedShape::Kind::None:
                break;
            }
        }
        channel->promise.set_value(std::move(response));
    }
    catch (const Error&)
    {
        channel->promise.set_exception(std::current_exception());
    }
    return true;
}

std::optional<Json> ElicitationBroker::pending(const std::string& invocation_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(invocation_id);
    if (it == channels_.end() || it->second->settled)
        return std::nullopt;
    return it->second->request_message;
}

void ElicitationBroker::abandon(const std::string& invocation_id, const std::string& reason)
{
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(invocation_id);
        if (it == channels_.end() || it->second->settled)
            return;
        channel = it->second;
        channel->settled = true;
    }
    notify(invocation_id, std::nullopt);
    log::get()->debug("elicitation {} abandoned: {}", invocation_id, reason);
    channel->promise.set_exception(std::make_exception_ptr(TransportError(reason)));
}

void ElicitationBroker::shutdown(const std::string& reason)
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (const auto& kv : channels_)
            ids.push_back(kv.first);
    }
    for (const auto& id : ids)
        abandon(id, reason);
}

} // namespace taskmcp::server
