#pragma once
#include "taskmcp/client/client.hpp"
#include "taskmcp/elicitation.hpp"

#include <iosfwd>
#include <string>

namespace taskmcp::client::handlers
{

/// Turn one line of user input into an elicitation answer.
///
/// "decline", "reject" and "no" decline; "cancel" and "exit" cancel (case
/// insensitive). Empty input declines an options or typed request and accepts
/// a bare confirmation. Anything else is accepted: as the selection for an
/// options request, or as the object built by construct_shape_value for a
/// typed one. Throws ShapeMismatchError when the input fits neither.
ElicitationResponse decide_elicitation(const ExpectedShape& shape, const std::string& input);

/// Handler that prints the question to `out` and reads one line from `in`.
/// End of input cancels. Both streams must outlive the handler.
ElicitationHandler create_console_elicitation_handler(std::istream& in, std::ostream& out);

} // namespace taskmcp::client::handlers
