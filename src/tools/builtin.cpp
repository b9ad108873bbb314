#include "taskmcp/tools/builtin.hpp"

#include "taskmcp/content.hpp"
#include "taskmcp/exceptions.hpp"
#include "taskmcp/server/context.hpp"
#include "taskmcp/util/base64.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

namespace taskmcp::tools
{

Tool make_slow_task(std::chrono::milliseconds step)
{
    Json schema = {
        {"type", "object"},
        {"properties",
         {{"duration", {{"type", "integer"}, {"description", "How many seconds to run"}}}}},
        {"required", Json::array({"duration"})}};

    Tool tool("slow_task", schema,
              [step](const Json& args, server::Context& ctx) -> Json
              {
                  const int duration = args.at("duration").get<int>();
                  if (duration < 0)
                      throw ValidationError("duration must not be negative");

                  ctx.set_total(duration);
                  for (int i = 0; i < duration; ++i)
                  {
                      if (ctx.cancel_requested())
                      {
                          ctx.info("stopping at step " + std::to_string(i) + ": cancelled");
                          return "Cancelled after " + std::to_string(i) + " of " +
                                 std::to_string(duration) + " steps";
                      }
                      ctx.set_message("Working... step " + std::to_string(i + 1) + "/" +
                                      std::to_string(duration));
                      ctx.increment();
                      std::this_thread::sleep_for(step);
                  }
                  return "Finished a " + std::to_string(duration) + "-second task over HTTP";
              },
              TaskSupport::Required);
    tool.set_description("Sleep for `duration` seconds while reporting progress.");
    return tool;
}

Tool make_choose_action()
{
    Tool tool("choose_action", Json{{"type", "object"}, {"properties", Json::object()}},
              [](const Json&, server::Context& ctx) -> Json
              {
                  auto result = ctx.elicit(
                      "Choose an action", std::vector<std::string>{"accept", "decline", "cancel"});
                  if (auto* accepted = std::get_if<server::AcceptedElicitation>(&result))
                  {
                      std::string selection;
                      if (accepted->data.is_string())
                          selection = accepted->data.get<std::string>();
                      return "Accepted: " +
                             (selection.empty() ? std::string("no selection provided") : selection);
                  }
                  if (std::holds_alternative<server::DeclinedElicitation>(result))
                      return "Declined!";
                  return "Cancelled!";
              });
    tool.set_description("Ask the client to pick an action via elicitation.");
    return tool;
}

Tool make_hello_name()
{
    Json schema = {{"type", "object"},
                   {"properties", {{"name", {{"type", "string"}, {"description", "Who to greet"}}}}},
                   {"required", Json::array({"name"})}};
    Tool tool("hello_name", schema,
              [](const Json& args, server::Context&) -> Json
              { return "Hello, " + args.at("name").get<std::string>() + "!"; },
              TaskSupport::Optional);
    tool.set_description("Greet someone by name.");
    tool.set_expected_duration(std::chrono::milliseconds(1));
    return tool;
}

std::string upload_file_name(const std::string& uri)
{
    std::string path = uri;
    auto scheme = path.find("://");
    if (scheme != std::string::npos)
    {
        path = path.substr(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    else if (auto colon = path.find(':'); colon != std::string::npos &&
                                          path.find('/') > colon)
    {
        path = path.substr(colon + 1);
    }
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos)
        path.erase(cut);

    auto last = path.find_last_of("/\\");
    std::string name = last == std::string::npos ? path : path.substr(last + 1);
    if (name.empty() || name == "." || name == "..")
        return "uploaded.bin";
    return name;
}

Tool make_receive_file(std::string upload_dir)
{
    Json schema = {{"type", "object"},
                   {"properties",
                    {{"uploaded_file",
                      {{"type", "object"}, {"description", "File uploaded by the client"}}}}},
                   {"required", Json::array({"uploaded_file"})}};

    Tool tool("receive_file", schema,
              [upload_dir](const Json& args, server::Context& ctx) -> Json
              {
                  ContentBlock block;
                  try
                  {
                      block = parse_content_block(args.at("uploaded_file"));
                  }
                  catch (const ValidationError& e)
                  {
                      throw UploadUnsupportedResourceError(e.what());
                  }
                  auto* resource = std::get_if<EmbeddedResourceContent>(&block);
                  if (!resource)
                      throw UploadUnsupportedResourceError(
                          "Unsupported resource type: expected an embedded resource");

                  std::string data;
                  if (resource->text)
                  {
                      data = *resource->text;
                  }
                  else if (resource->blob)
                  {
                      auto bytes = util::base64::decode(*resource->blob);
                      data.assign(bytes.begin(), bytes.end());
                  }
                  else
                  {
                      throw UploadUnsupportedResourceError(
                          "Unsupported resource type: neither text nor blob contents");
                  }

                  namespace fs = std::filesystem;
                  fs::path dir(upload_dir);
                  fs::create_directories(dir);
                  fs::path destination = dir / upload_file_name(resource->uri);
                  {
                      std::ofstream out(destination, std::ios::binary | std::ios::trunc);
                      if (!out)
                          throw Error("Cannot open " + destination.string() + " for writing");
                      out.write(data.data(), static_cast<std::streamsize>(data.size()));
                      if (!out)
                          throw Error("Failed writing " + destination.string());
                  }
                  auto size = fs::file_size(destination);
                  ctx.info("stored upload at " + destination.string());
                  return "Saved " + destination.string() + " (" +
                         resource->mimeType.value_or("None") + ", " + std::to_string(size) +
                         " bytes)";
              });
    tool.set_description("Store an uploaded file and report where it was saved.");
    return tool;
}

void register_builtin_tools(ToolRegistry& registry, const std::string& upload_dir,
                            std::chrono::milliseconds slow_task_step)
{
    registry.register_tool(make_slow_task(slow_task_step));
    registry.register_tool(make_choose_action());
    registry.register_tool(make_hello_name());
    registry.register_tool(make_receive_file(upload_dir));
}

} // namespace taskmcp::tools
