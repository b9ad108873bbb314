#include "taskmcp/client/elicitation_handlers.hpp"

#include "taskmcp/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace taskmcp::client::handlers
{

namespace
{
std::string trim(const std::string& s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

ElicitationResponse decide_elicitation(const ExpectedShape& shape, const std::string& input)
{
    const std::string raw = trim(input);
    const std::string word = lower(raw);

    if (word == "decline" || word == "reject" || word == "no")
        return ElicitationResponse::decline();
    if (word == "cancel" || word == "exit")
        return ElicitationResponse::cancel();

    switch (shape.kind)
    {
    case ExpectedShape::Kind::None:
        return ElicitationResponse::accept(Json());
    case ExpectedShape::Kind::Options:
        if (raw.empty())
            return ElicitationResponse::decline();
        return ElicitationResponse::accept(raw);
    case ExpectedShape::Kind::Schema:
        if (raw.empty())
            return ElicitationResponse::decline();
        return ElicitationResponse::accept(construct_shape_value(shape.schema, raw));
    }
    return ElicitationResponse::cancel();
}

ElicitationHandler create_console_elicitation_handler(std::istream& in, std::ostream& out)
{
    return [&in, &out](const std::string& message, const ExpectedShape& shape)
    {
        out << "Server asks: " << message << "\n";
        if (shape.kind == ExpectedShape::Kind::Options)
        {
            out << "Options:";
            for (const auto& option : shape.options)
                out << " " << option;
            out << "\n";
        }
        out << "Your response: " << std::flush;

        std::string line;
        if (!std::getline(in, line))
            return ElicitationResponse::cancel();
        return decide_elicitation(shape, line);
    };
}

} // namespace taskmcp::client::handlers
