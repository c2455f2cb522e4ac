#pragma once
#include <stdexcept>
#include <string>

namespace TideSim
{

/**
 * Raised when a simulator is built or reconfigured with settings it cannot run with
 * (non-positive smoothing radius, empty spawn data, missing boundary, ...)
 */
class ConfigurationError : public std::runtime_error
{
  public:
    explicit ConfigurationError(const std::string &what) : std::runtime_error("Configuration error: " + what)
    {
    }
};

} // namespace TideSim
