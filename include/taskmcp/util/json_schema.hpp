#pragma once
#include "taskmcp/exceptions.hpp"
#include "taskmcp/types.hpp"

namespace taskmcp::util::schema
{

// Minimal JSON Schema validator supporting:
// - type: object, array, string, number, integer, boolean
// - required: [..]
// - properties: { name: { type, enum } }, checked recursively for objects
// - additionalProperties: false

void validate(const Json& schema, const Json& instance);

} // namespace taskmcp::util::schema
