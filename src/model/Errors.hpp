#pragma once

#include <stdexcept>
#include <string>

namespace tr
{

// The daemon answered with a shape that cannot be interpreted.
class ProtocolError : public std::runtime_error
{
  public:
    explicit ProtocolError(std::string const &message)
        : std::runtime_error(message)
    {
    }
};

// Malformed filter text handed to a filter compiler.
class FilterError : public std::runtime_error
{
  public:
    explicit FilterError(std::string const &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace tr
