#include "taskmcp/util/json_schema.hpp"

#include <algorithm>

namespace taskmcp::util::schema
{

static bool is_type(const Json& inst, const std::string& type)
{
    if (type == "object")
        return inst.is_object();
    if (type == "array")
        return inst.is_array();
    if (type == "string")
        return inst.is_string();
    if (type == "number")
        return inst.is_number();
    if (type == "integer")
        return inst.is_number_integer() ||
               (inst.is_number_float() && inst.get<double>() == static_cast<long long>(inst.get<double>()));
    if (type == "boolean")
        return inst.is_boolean();
    if (type == "null")
        return inst.is_null();
    return true; // unknown treated as pass-through
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path);

static void validate_object(const Json& schema, const Json& inst, const std::string& path)
{
    if (schema.contains("required") && schema["required"].is_array())
    {
        for (const auto& req : schema["required"])
        {
            auto key = req.get<std::string>();
            if (!inst.contains(key))
                throw ValidationError("missing required: " + path + key);
        }
    }
    const bool has_props = schema.contains("properties") && schema["properties"].is_object();
    if (has_props)
    {
        for (const auto& [name, subschema] : schema["properties"].items())
            if (inst.contains(name))
                validate_at(subschema, inst[name], path + name + ".");
    }
    if (schema.contains("additionalProperties") && schema["additionalProperties"].is_boolean() &&
        !schema["additionalProperties"].get<bool>())
    {
        for (const auto& [name, _] : inst.items())
            if (!has_props || !schema["properties"].contains(name))
                throw ValidationError("unexpected property: " + path + name);
    }
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path)
{
    if (!schema.is_object())
        return;
    const std::string where = path.empty() ? "root" : path.substr(0, path.size() - 1);
    if (schema.contains("type") && schema["type"].is_string())
    {
        auto t = schema["type"].get<std::string>();
        if (!is_type(inst, t))
            throw ValidationError("type mismatch for " + where + ": expected " + t);
    }
    if (schema.contains("enum") && schema["enum"].is_array())
    {
        const auto& options = schema["enum"];
        if (std::find(options.begin(), options.end(), inst) == options.end())
            throw ValidationError("value for " + where + " is not one of " + options.dump());
    }
    if (inst.is_object())
        validate_object(schema, inst, path);
}

void validate(const Json& schema, const Json& instance)
{
    validate_at(schema, instance, "");
}

} // namespace taskmcp::util::schema
