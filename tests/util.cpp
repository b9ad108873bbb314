#include "taskmcp/content.hpp"
#include "taskmcp/exceptions.hpp"
#include "taskmcp/util/base64.hpp"
#include "taskmcp/util/json_schema.hpp"
#include "taskmcp/util/url.hpp"

#include <cassert>
#include <string>

using namespace taskmcp;

template <typename E, typename F> static bool throws(F&& f)
{
    try
    {
        f();
    }
    catch (const E&)
    {
        return true;
    }
    return false;
}

static void check_schema()
{
    Json schema = {{"type", "object"},
                   {"required", Json::array({"a", "mode"})},
                   {"properties",
                    {{"a", Json{{"type", "integer"}}},
                     {"mode", Json{{"type", "string"}, {"enum", Json::array({"fast", "slow"})}}}}},
                   {"additionalProperties", false}};
    util::schema::validate(schema, Json{{"a", 2}, {"mode", "fast"}});
    util::schema::validate(schema, Json{{"a", 2.0}, {"mode", "slow"}});

    assert(throws<ValidationError>([&] { util::schema::validate(schema, Json{{"a", "x"}}); }));
    assert(throws<ValidationError>(
        [&] { util::schema::validate(schema, Json{{"a", 1}, {"mode", "medium"}}); }));
    assert(throws<ValidationError>(
        [&] { util::schema::validate(schema, Json{{"a", 1}, {"mode", "fast"}, {"b", 0}}); }));
    assert(throws<ValidationError>([&] { util::schema::validate(schema, Json::array()); }));
}

static void check_url()
{
    auto u = util::parse_url("http://127.0.0.1:1338/mcp");
    assert(u.host == "127.0.0.1");
    assert(u.port == 1338);
    assert(u.path == "/mcp");
    assert(u.origin() == "http://127.0.0.1:1338");

    auto s = util::parse_url("https://example.test/execute?x=1");
    assert(s.port == 443);
    assert(s.path == "/execute?x=1");

    auto bare = util::parse_url("localhost:8080");
    assert(bare.scheme == "http");
    assert(bare.path == "/");

    assert(throws<TransportError>([] { util::parse_url("ftp://host/file"); }));
    assert(throws<TransportError>([] { util::parse_url("http:///mcp"); }));
}

static void check_base64()
{
    assert(util::base64::encode(std::string("hello")) == "aGVsbG8=");
    auto decoded = util::base64::decode("aGVs\nbG8=");
    assert(std::string(decoded.begin(), decoded.end()) == "hello");

    std::string large(10000, '\x7f');
    auto round = util::base64::decode(util::base64::encode(large));
    assert(std::string(round.begin(), round.end()) == large);

    assert(throws<ValidationError>([] { util::base64::decode("ab$d"); }));
}

static void check_content()
{
    TextContent t;
    t.text = "Hello";
    Json jt = t;
    assert(jt.at("type") == "text");
    assert(jt.at("text") == "Hello");

    EmbeddedResourceContent r;
    r.uri = "file:///tmp/a.txt";
    r.text = "abc";
    Json jr = content_to_json(r);
    assert(jr["resource"]["uri"] == "file:///tmp/a.txt");
    assert(!jr["resource"].contains("blob"));

    auto parsed = parse_content_block(jr);
    auto* back = std::get_if<EmbeddedResourceContent>(&parsed);
    assert(back && back->text && *back->text == "abc");
    assert(!back->mimeType);

    assert(throws<ValidationError>([] { parse_content_block(Json{{"type", "audio"}}); }));
    assert(throws<ValidationError>([] { parse_content_block(Json{{"type", "resource"}}); }));
}

int main()
{
    check_schema();
    check_url();
    check_base64();
    check_content();
    return 0;
}
