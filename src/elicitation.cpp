#include "taskmcp/elicitation.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/util/json_schema.hpp"

#include <algorithm>
#include <cctype>

namespace taskmcp
{

std::string to_string(ElicitAction action)
{
    switch (action)
    {
    case ElicitAction::Accept:
        return "accept";
    case ElicitAction::Decline:
        return "decline";
    case ElicitAction::Cancel:
        return "cancel";
    }
    return "decline";
}

ElicitAction elicit_action_from_string(const std::string& s)
{
    if (s == "accept")
        return ElicitAction::Accept;
    if (s == "decline")
        return ElicitAction::Decline;
    if (s == "cancel")
        return ElicitAction::Cancel;
    throw ValidationError("Unexpected elicitation action: " + s);
}

void to_json(Json& j, const ExpectedShape& shape)
{
    switch (shape.kind)
    {
    case ExpectedShape::Kind::None:
        j = Json{{"kind", "none"}};
        break;
    case ExpectedShape::Kind::Options:
        j = Json{{"kind", "options"}, {"options", shape.options}};
        break;
    case ExpectedShape::Kind::Schema:
        j = Json{{"kind", "schema"}, {"schema", shape.schema}};
        break;
    }
}

void from_json(const Json& j, ExpectedShape& shape)
{
    std::string kind = j.value("kind", std::string("none"));
    if (kind == "options")
        shape = ExpectedShape::one_of(j.value("options", std::vector<std::string>{}));
    else if (kind == "schema")
        shape = ExpectedShape::typed(j.value("schema", Json::object()));
    else if (kind == "none")
        shape = ExpectedShape::none();
    else
        throw ValidationError("Unknown elicitation shape kind: " + kind);
}

Json requested_schema(const ExpectedShape& shape)
{
    switch (shape.kind)
    {
    case ExpectedShape::Kind::Options:
        return Json{{"type", "object"},
                    {"properties", {{"value", {{"type", "string"}, {"enum", shape.options}}}}}};
    case ExpectedShape::Kind::Schema:
        return shape.schema;
    case ExpectedShape::Kind::None:
        break;
    }
    return Json{{"type", "object"}, {"properties", Json::object()}};
}

namespace
{

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Json coerce(const Json& prop_schema, const std::string& raw, const std::string& prop)
{
    std::string type = prop_schema.value("type", std::string("string"));
    Json value;
    if (type == "integer")
    {
        size_t pos = 0;
        long long parsed = 0;
        try
        {
            parsed = std::stoll(raw, &pos);
        }
        catch (const std::logic_error&)
        {
            throw ShapeMismatchError("'" + raw + "' is not an integer for field '" + prop + "'");
        }
        if (pos != raw.size())
            throw ShapeMismatchError("'" + raw + "' is not an integer for field '" + prop + "'");
        value = parsed;
    }
    else if (type == "number")
    {
        size_t pos = 0;
        double parsed = 0;
        try
        {
            parsed = std::stod(raw, &pos);
        }
        catch (const std::logic_error&)
        {
            throw ShapeMismatchError("'" + raw + "' is not a number for field '" + prop + "'");
        }
        if (pos != raw.size())
            throw ShapeMismatchError("'" + raw + "' is not a number for field '" + prop + "'");
        value = parsed;
    }
    else if (type == "boolean")
    {
        auto l = lower(raw);
        if (l == "true" || l == "yes" || l == "y" || l == "1")
            value = true;
        else if (l == "false" || l == "no" || l == "n" || l == "0")
            value = false;
        else
            throw ShapeMismatchError("'" + raw + "' is not a boolean for field '" + prop + "'");
    }
    else if (type == "string")
    {
        value = raw;
    }
    else
    {
        throw ShapeMismatchError("Field '" + prop + "' has non-primitive type '" + type + "'");
    }

    if (prop_schema.contains("enum") && prop_schema["enum"].is_array())
    {
        const auto& options = prop_schema["enum"];
        if (std::find(options.begin(), options.end(), value) == options.end())
            throw ShapeMismatchError("'" + raw + "' is not one of " + options.dump() +
                                     " for field '" + prop + "'");
    }
    return value;
}

Json finish(const Json& schema, Json candidate)
{
    try
    {
        util::schema::validate(schema, candidate);
    }
    catch (const ValidationError& e)
    {
        throw ShapeMismatchError(std::string("Constructed value does not fit schema: ") +
                                 e.what());
    }
    return candidate;
}

Json construct_named(const Json& schema, const std::string& raw)
{
    const auto& props = schema.contains("properties") ? schema["properties"] : Json::object();
    if (!props.is_object() || !props.contains("value"))
        throw ShapeMismatchError("Schema has no 'value' field for named construction");
    return finish(schema, Json{{"value", coerce(props["value"], raw, "value")}});
}

Json construct_positional(const Json& schema, const std::string& raw)
{
    const auto& props = schema.contains("properties") ? schema["properties"] : Json::object();
    if (!props.is_object() || props.size() != 1)
        throw ShapeMismatchError("Positional construction needs exactly one field, schema has " +
                                 std::to_string(props.is_object() ? props.size() : 0));
    auto it = props.begin();
    return finish(schema, Json{{it.key(), coerce(it.value(), raw, it.key())}});
}

} // namespace

Json construct_shape_value(const Json& schema, const std::string& raw)
{
    if (!schema.is_object())
        throw ShapeMismatchError("Typed elicitation requires an object schema");

    if (schema.contains("x-construct"))
    {
        std::string strategy = schema["x-construct"].is_string()
                                   ? schema["x-construct"].get<std::string>()
                                   : std::string();
        if (strategy == "named")
            return construct_named(schema, raw);
        if (strategy == "positional")
            return construct_positional(schema, raw);
        throw ShapeMismatchError("Unknown x-construct strategy: '" + strategy + "'");
    }

    try
    {
        return construct_named(schema, raw);
    }
    catch (const ShapeMismatchError& named_error)
    {
        try
        {
            return construct_positional(schema, raw);
        }
        catch (const ShapeMismatchError& positional_error)
        {
            throw ShapeMismatchError(std::string(named_error.what()) + "; " +
                                     positional_error.what());
        }
    }
}

} // namespace taskmcp
