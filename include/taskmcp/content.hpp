#pragma once
#include "taskmcp/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskmcp
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

struct ImageContent
{
    std::string type{"image"};
    std::string data;     // base64-encoded image bytes
    std::string mimeType; // e.g., "image/png"
};

/// Embedded resource carried inline in a tool argument or result.
/// Exactly one of `text` / `blob` (base64) is set.
struct EmbeddedResourceContent
{
    std::string type{"resource"};
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResourceContent>;

inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", c.type}, {"data", c.data}, {"mimeType", c.mimeType}};
}

inline void to_json(Json& j, const EmbeddedResourceContent& c)
{
    Json resource = {{"uri", c.uri}};
    if (c.mimeType)
        resource["mimeType"] = *c.mimeType;
    if (c.text)
        resource["text"] = *c.text;
    if (c.blob)
        resource["blob"] = *c.blob;
    j = Json{{"type", c.type}, {"resource", resource}};
}

inline Json content_to_json(const ContentBlock& block)
{
    return std::visit([](const auto& c) { return Json(c); }, block);
}

/// Parses one MCP content block. Unknown types throw ValidationError.
ContentBlock parse_content_block(const Json& j);

} // namespace taskmcp
