#include "taskmcp/content.hpp"

#include "taskmcp/exceptions.hpp"

namespace taskmcp
{

ContentBlock parse_content_block(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("content block must be an object");
    std::string type = j.value("type", std::string());
    if (type == "text")
    {
        TextContent tc;
        tc.text = j.value("text", std::string());
        return tc;
    }
    if (type == "image")
    {
        ImageContent ic;
        ic.data = j.value("data", std::string());
        ic.mimeType = j.value("mimeType", std::string());
        return ic;
    }
    if (type == "resource")
    {
        if (!j.contains("resource") || !j["resource"].is_object())
            throw ValidationError("resource content block without 'resource' object");
        const auto& res = j["resource"];
        EmbeddedResourceContent erc;
        erc.uri = res.value("uri", std::string());
        if (res.contains("mimeType") && res["mimeType"].is_string())
            erc.mimeType = res["mimeType"].get<std::string>();
        if (res.contains("text") && res["text"].is_string())
            erc.text = res["text"].get<std::string>();
        if (res.contains("blob") && res["blob"].is_string())
            erc.blob = res["blob"].get<std::string>();
        return erc;
    }
    throw ValidationError("unsupported content block type: " + type);
}

} // namespace taskmcp
