#pragma once
#include <stdexcept>
#include <string>

namespace leapmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Unknown method, tool, resource or prompt.
struct NotFoundError : public Error
{
    using Error::Error;
};

/// Missing or mistyped params and arguments.
struct ValidationError : public Error
{
    using Error::Error;
};

/// Input line that is not a JSON-RPC request envelope.
struct ParseError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

} // namespace leapmcp
