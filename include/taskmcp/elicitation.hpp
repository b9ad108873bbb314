#pragma once
#include "taskmcp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskmcp
{

enum class ElicitAction
{
    Accept,
    Decline,
    Cancel
};

std::string to_string(ElicitAction action);

/// Parses "accept", "decline" or "cancel". Throws ValidationError otherwise.
ElicitAction elicit_action_from_string(const std::string& s);

/// What a handler expects back from an elicitation.
///
/// - None: a bare confirmation, accepted data is ignored.
/// - Options: a list of suggested strings; accepted data is the selection or
///   free text, and may be absent.
/// - Schema: a flat object JSON Schema; accepted data is an object satisfying it.
struct ExpectedShape
{
    enum class Kind
    {
        None,
        Options,
        Schema
    };

    Kind kind{Kind::None};
    std::vector<std::string> options;
    Json schema;

    static ExpectedShape none()
    {
        return {};
    }

    static ExpectedShape one_of(std::vector<std::string> choices)
    {
        ExpectedShape s;
        s.kind = Kind::Options;
        s.options = std::move(choices);
        return s;
    }

    static ExpectedShape typed(Json object_schema)
    {
        ExpectedShape s;
        s.kind = Kind::Schema;
        s.schema = std::move(object_schema);
        return s;
    }

    bool is_typed() const
    {
        return kind == Kind::Schema;
    }
};

void to_json(Json& j, const ExpectedShape& shape);
void from_json(const Json& j, ExpectedShape& shape);

/// The MCP `requestedSchema` for a shape. Options become a single optional
/// string property `value` listing the choices in `enum`.
Json requested_schema(const ExpectedShape& shape);

struct ElicitationRequest
{
    std::string message;
    ExpectedShape shape;
};

struct ElicitationResponse
{
    ElicitAction action{ElicitAction::Decline};
    std::optional<Json> data;

    static ElicitationResponse accept(Json value)
    {
        return {ElicitAction::Accept, std::move(value)};
    }
    static ElicitationResponse decline()
    {
        return {ElicitAction::Decline, std::nullopt};
    }
    static ElicitationResponse cancel()
    {
        return {ElicitAction::Cancel, std::nullopt};
    }
};

/// Build an object matching `schema` from one line of raw user input.
///
/// Strategies:
/// - named: `{"value": raw}`, requires a `value` property.
/// - positional: `{<prop>: raw}` for a schema with exactly one property.
/// The schema may pin a strategy with `"x-construct": "named"|"positional"`;
/// otherwise named is tried first, then positional. The raw text is coerced
/// to the property's primitive type and checked against its enum.
///
/// Throws ShapeMismatchError when no strategy yields a valid object.
Json construct_shape_value(const Json& schema, const std::string& raw);

} // namespace taskmcp
