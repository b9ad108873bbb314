#pragma once
#include "taskmcp/types.hpp"

#include <stdexcept>
#include <string>

namespace taskmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct UnknownToolError : public Error
{
    explicit UnknownToolError(const std::string& tool)
        : Error("Unknown tool: " + tool), tool_(tool)
    {
    }

    const std::string& tool() const
    {
        return tool_;
    }

  private:
    std::string tool_;
};

struct DuplicateNameError : public Error
{
    explicit DuplicateNameError(const std::string& name)
        : Error("Tool already registered: " + name)
    {
    }
};

/// A tool call refused by the server (unknown tool, argument validation,
/// task-mode conflict, or the handler itself raising).
class ToolRejectedError : public Error
{
  public:
    ToolRejectedError(std::string tool, std::string kind, std::string detail,
                      int code = error_code::InternalError)
        : Error("Tool '" + tool + "' rejected (" + kind + "): " + detail), tool_(std::move(tool)),
          kind_(std::move(kind)), detail_(std::move(detail)), code_(code)
    {
    }

    const std::string& tool() const
    {
        return tool_;
    }
    const std::string& kind() const
    {
        return kind_;
    }
    const std::string& detail() const
    {
        return detail_;
    }
    int code() const
    {
        return code_;
    }

  private:
    std::string tool_;
    std::string kind_;
    std::string detail_;
    int code_;
};

/// Task state machine violation. Indicates a defect in the caller.
struct IllegalTransitionError : public Error
{
    using Error::Error;
};

struct NotReadyError : public Error
{
    using Error::Error;
};

struct UnknownTaskError : public Error
{
    explicit UnknownTaskError(const std::string& task_id) : Error("Unknown task: " + task_id) {}
};

/// Elicitation answer that does not fit the requested shape.
struct ShapeMismatchError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Transport call that exceeded its deadline. The remote operation may still be running.
struct RequestTimeoutError : public TransportError
{
    using TransportError::TransportError;
};

struct UploadUnsupportedResourceError : public Error
{
    using Error::Error;
};

} // namespace taskmcp
